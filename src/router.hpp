#pragma once
#include "config.hpp"
#include "http.hpp"
#include "lifecycle.hpp"
#include "offline.hpp"
#include "partition.hpp"
#include "strategy.hpp"
#include <regex>
#include <vector>

namespace netstash {

class RetryQueue;

// The single interception boundary: every request goes in, exactly one
// response comes out.
class Router {
public:
    // Throws ConfigError when a queue rule is not a valid regex.
    Router(const Config& config, const PartitionRegistry& registry,
           StrategyExecutor& executor, const Lifecycle& lifecycle,
           const OfflineResponder& offline, HttpClient& http, RetryQueue* queue = nullptr);

    // Never throws. Any failure ends in a cached copy or an offline envelope.
    HttpResponse handle(const HttpRequest& request);

    // Mutating request whose path matches a configured queue rule.
    bool is_queueable(const HttpRequest& request) const;

private:
    HttpResponse route(const HttpRequest& request);
    HttpResponse handle_navigation(const HttpRequest& request);
    HttpResponse handle_mutation(const HttpRequest& request);
    HttpResponse passthrough(const HttpRequest& request);

    // Cached offline page from the navigation or static partition.
    std::optional<HttpResponse> cached_offline_page();

    const Config& config_;
    const PartitionRegistry& registry_;
    StrategyExecutor& executor_;
    const Lifecycle& lifecycle_;
    const OfflineResponder& offline_;
    HttpClient& http_;
    RetryQueue* queue_;
    std::vector<std::regex> queue_rules_;
};

} // namespace netstash
