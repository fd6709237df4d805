#include "strategy.hpp"
#include "errors.hpp"
#include "request_key.hpp"
#include "util.hpp"
#include <chrono>
#include <future>
#include <iostream>
#include <memory>

namespace netstash {

StrategyExecutor::StrategyExecutor(Store& store, HttpClient& http,
                                   const OfflineResponder& offline, TaskRunner& tasks,
                                   long http_timeout_seconds)
    : store_(store), http_(http), offline_(offline), tasks_(tasks),
      http_timeout_seconds_(http_timeout_seconds) {}

HttpResponse StrategyExecutor::execute(const Partition& partition, const std::string& storage,
                                       const HttpRequest& request) {
    switch (partition.strategy) {
        case Strategy::CacheFirst:
            return cache_first(partition, storage, request);
        case Strategy::NetworkFirst:
            return network_first(partition, storage, request);
        case Strategy::StaleWhileRevalidate:
            return stale_while_revalidate(partition, storage, request);
    }
    return offline_.build_fallback(request);
}

// ── Shared helpers ──────────────────────────────────────────────

std::optional<CacheEntry> StrategyExecutor::lookup(const std::string& storage,
                                                   const HttpRequest& request) {
    try {
        return store_.get(storage, request_key(request));
    } catch (const StoreError& e) {
        std::cerr << "[strategy] Cache read failed for " << request.url
                  << ": " << e.what() << '\n';
        return std::nullopt;
    }
}

HttpResponse StrategyExecutor::from_entry(const CacheEntry& entry, const HttpRequest& request,
                                          bool offline_fallback) {
    HttpResponse resp;
    resp.status_code = entry.status_code;
    resp.headers = entry.headers;
    if (request.method != "HEAD") resp.body = entry.body;
    set_header(resp.headers, "x-served-by", "netstash-cache");
    set_header(resp.headers, "x-cache-date", timestamp_from_millis(entry.stored_at));
    if (offline_fallback) set_header(resp.headers, "x-offline", "true");
    return resp;
}

HttpResponse StrategyExecutor::fetch(const HttpRequest& request) {
    HttpResponse resp;
    try {
        resp = http_.send(request, http_timeout_seconds_);
    } catch (const std::exception& e) {
        throw NetworkError(std::string("Request failed: ") + e.what());
    }
    if (resp.status_code == 0) {
        throw NetworkError("No response from " + request.url);
    }
    return resp;
}

HttpResponse StrategyExecutor::store_response(const Partition& partition,
                                              const std::string& storage,
                                              const HttpRequest& request,
                                              HttpResponse response) {
    // HEAD replies carry no body and would poison the GET entry.
    if (!is_success(response.status_code) || request.method != "GET") return response;

    CacheEntry entry;
    entry.request_key = request_key(request);
    entry.url = request.url;
    entry.status_code = response.status_code;
    entry.headers = response.headers;
    entry.body = response.body;
    entry.stored_at = epoch_millis();

    try {
        size_t removed = store_.put_bounded(storage, entry.request_key, entry,
                                            partition.max_entries);
        if (removed > 0) {
            std::cerr << "[strategy] Trimmed " << removed << " entries from "
                      << storage << '\n';
        }
    } catch (const StoreError& e) {
        std::cerr << "[strategy] Cache write failed for " << request.url
                  << ": " << e.what() << '\n';
    }

    set_header(response.headers, "x-served-by", "network");
    set_header(response.headers, "x-cache-date", timestamp_from_millis(entry.stored_at));
    return response;
}

HttpResponse StrategyExecutor::fallback(const std::optional<CacheEntry>& cached,
                                        const std::optional<HttpResponse>& network_reply,
                                        const HttpRequest& request) const {
    if (cached) return from_entry(*cached, request, true);
    if (network_reply) return *network_reply;
    return offline_.build_fallback(request);
}

// ── CacheFirst ──────────────────────────────────────────────────

HttpResponse StrategyExecutor::cache_first(const Partition& partition,
                                           const std::string& storage,
                                           const HttpRequest& request) {
    auto cached = lookup(storage, request);
    if (cached && partition.is_fresh(cached->stored_at, epoch_millis())) {
        return from_entry(*cached, request, false);
    }

    std::optional<HttpResponse> network_reply;
    try {
        HttpResponse resp = fetch(request);
        if (is_success(resp.status_code)) {
            return store_response(partition, storage, request, std::move(resp));
        }
        network_reply = std::move(resp);
    } catch (const NetworkError& e) {
        std::cerr << "[strategy] " << partition.name << ": " << e.what() << '\n';
    }
    return fallback(cached, network_reply, request);
}

// ── NetworkFirst ────────────────────────────────────────────────

HttpResponse StrategyExecutor::fetch_with_timeout(const Partition& partition,
                                                  const std::string& storage,
                                                  const HttpRequest& request) {
    auto outcome = std::make_shared<std::promise<HttpResponse>>();
    std::future<HttpResponse> result = outcome->get_future();

    // The task owns copies of everything it touches; a lost race must
    // still be able to finish and warm the cache.
    tasks_.spawn("fetch " + request.url,
                 [this, partition, storage, request, outcome]() {
        try {
            HttpResponse resp = fetch(request);
            outcome->set_value(store_response(partition, storage, request, std::move(resp)));
        } catch (const NetworkError&) {
            outcome->set_exception(std::current_exception());
        }
    });

    auto timeout = std::chrono::milliseconds(partition.effective_timeout_ms());
    if (result.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutError("No response from " + request.url + " within " +
                           std::to_string(partition.effective_timeout_ms()) + "ms");
    }
    return result.get();
}

HttpResponse StrategyExecutor::network_first(const Partition& partition,
                                             const std::string& storage,
                                             const HttpRequest& request) {
    std::optional<HttpResponse> network_reply;
    try {
        HttpResponse resp = fetch_with_timeout(partition, storage, request);
        if (is_success(resp.status_code)) return resp;
        network_reply = std::move(resp);
    } catch (const TimeoutError& e) {
        std::cerr << "[strategy] " << partition.name << ": " << e.what() << '\n';
    } catch (const NetworkError& e) {
        std::cerr << "[strategy] " << partition.name << ": " << e.what() << '\n';
    }
    return fallback(lookup(storage, request), network_reply, request);
}

// ── StaleWhileRevalidate ────────────────────────────────────────

HttpResponse StrategyExecutor::stale_while_revalidate(const Partition& partition,
                                                      const std::string& storage,
                                                      const HttpRequest& request) {
    auto cached = lookup(storage, request);
    if (cached) {
        tasks_.spawn("revalidate " + request.url,
                     [this, partition, storage, request]() {
            try {
                HttpResponse resp = fetch(request);
                if (!is_success(resp.status_code)) {
                    std::cerr << "[strategy] Revalidation of " << request.url
                              << " returned " << resp.status_code << '\n';
                    return;
                }
                store_response(partition, storage, request, std::move(resp));
            } catch (const NetworkError& e) {
                std::cerr << "[strategy] Revalidation of " << request.url
                          << " failed: " << e.what() << '\n';
            }
        });
        return from_entry(*cached, request, false);
    }

    std::optional<HttpResponse> network_reply;
    try {
        HttpResponse resp = fetch(request);
        if (is_success(resp.status_code)) {
            return store_response(partition, storage, request, std::move(resp));
        }
        network_reply = std::move(resp);
    } catch (const NetworkError& e) {
        std::cerr << "[strategy] " << partition.name << ": " << e.what() << '\n';
    }
    return fallback(std::nullopt, network_reply, request);
}

// ── Warming ─────────────────────────────────────────────────────

bool StrategyExecutor::prefetch(const Partition& partition, const std::string& storage,
                                const HttpRequest& request) {
    try {
        HttpResponse resp = fetch(request);
        if (!is_success(resp.status_code)) {
            std::cerr << "[strategy] Prefetch of " << request.url << " returned "
                      << resp.status_code << '\n';
            return false;
        }
        store_response(partition, storage, request, std::move(resp));
        return true;
    } catch (const NetworkError& e) {
        std::cerr << "[strategy] Prefetch of " << request.url << " failed: "
                  << e.what() << '\n';
        return false;
    }
}

} // namespace netstash
