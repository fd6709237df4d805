#pragma once
#include "http.hpp"
#include "offline.hpp"
#include "partition.hpp"
#include "store.hpp"
#include "task_runner.hpp"
#include <optional>
#include <string>

namespace netstash {

// Runs one caching strategy per request over an injected Store and
// HttpClient. Stateless apart from its collaborators, so a single
// instance serves every concurrent request.
class StrategyExecutor {
public:
    StrategyExecutor(Store& store, HttpClient& http, const OfflineResponder& offline,
                     TaskRunner& tasks, long http_timeout_seconds = 30);

    // Dispatch on partition.strategy. Never throws.
    HttpResponse execute(const Partition& partition, const std::string& storage,
                         const HttpRequest& request);

    HttpResponse cache_first(const Partition& partition, const std::string& storage,
                             const HttpRequest& request);
    HttpResponse network_first(const Partition& partition, const std::string& storage,
                               const HttpRequest& request);
    HttpResponse stale_while_revalidate(const Partition& partition,
                                        const std::string& storage,
                                        const HttpRequest& request);

    // Fetch and store without any fallback (warming, precaching).
    // Returns true when a 2xx response was stored.
    bool prefetch(const Partition& partition, const std::string& storage,
                  const HttpRequest& request);

    // Cached entry for the request, or nullopt on miss or store failure.
    std::optional<CacheEntry> lookup(const std::string& storage, const HttpRequest& request);

    // Shape a stored entry as a response. `offline_fallback` adds x-offline.
    static HttpResponse from_entry(const CacheEntry& entry, const HttpRequest& request,
                                   bool offline_fallback);

private:
    // Throws NetworkError when nothing came back.
    HttpResponse fetch(const HttpRequest& request);

    // Throws TimeoutError when the race is lost; the fetch keeps running
    // in the background and still stores its result.
    HttpResponse fetch_with_timeout(const Partition& partition, const std::string& storage,
                                    const HttpRequest& request);

    // Store a 2xx GET response and trim the partition. Store failures are
    // logged; the response is returned either way.
    HttpResponse store_response(const Partition& partition, const std::string& storage,
                                const HttpRequest& request, HttpResponse response);

    // Cached copy if any, else the server's own non-2xx reply, else the
    // offline envelope.
    HttpResponse fallback(const std::optional<CacheEntry>& cached,
                          const std::optional<HttpResponse>& network_reply,
                          const HttpRequest& request) const;

    Store& store_;
    HttpClient& http_;
    const OfflineResponder& offline_;
    TaskRunner& tasks_;
    long http_timeout_seconds_;
};

} // namespace netstash
