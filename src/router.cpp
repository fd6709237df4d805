#include "router.hpp"
#include "errors.hpp"
#include "retry_queue.hpp"
#include "url.hpp"
#include <iostream>

namespace netstash {

Router::Router(const Config& config, const PartitionRegistry& registry,
               StrategyExecutor& executor, const Lifecycle& lifecycle,
               const OfflineResponder& offline, HttpClient& http, RetryQueue* queue)
    : config_(config), registry_(registry), executor_(executor), lifecycle_(lifecycle),
      offline_(offline), http_(http), queue_(queue) {
    for (const auto& rule : config_.queue_rules) {
        try {
            queue_rules_.emplace_back(rule, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ConfigError("Invalid queue rule '" + rule + "': " + e.what());
        }
    }
}

bool Router::is_queueable(const HttpRequest& request) const {
    if (is_safe_method(request.method)) return false;
    std::string path = parse_url(request.url).path;
    for (const auto& rule : queue_rules_) {
        if (std::regex_search(path, rule)) return true;
    }
    return false;
}

HttpResponse Router::handle(const HttpRequest& request) {
    try {
        return route(request);
    } catch (const std::exception& e) {
        std::cerr << "[router] " << request.method << " " << request.url
                  << " failed: " << e.what() << '\n';
        return offline_.build_fallback(request);
    }
}

HttpResponse Router::route(const HttpRequest& request) {
    if (!is_safe_method(request.method)) return handle_mutation(request);

    if (const Partition* partition = registry_.resolve(request)) {
        HttpResponse resp =
            executor_.execute(*partition, lifecycle_.storage_for(partition->name), request);
        if (is_navigation(request) && is_offline_envelope(resp)) {
            if (auto page = cached_offline_page()) return *page;
        }
        return resp;
    }
    if (is_navigation(request)) return handle_navigation(request);
    return passthrough(request);
}

HttpResponse Router::handle_navigation(const HttpRequest& request) {
    HttpResponse resp;
    if (const Partition* nav = registry_.find(config_.navigation_partition)) {
        resp = executor_.network_first(*nav, lifecycle_.storage_for(nav->name), request);
    } else {
        resp = passthrough(request);
    }
    if (!is_offline_envelope(resp)) return resp;

    if (auto page = cached_offline_page()) return *page;
    return resp;
}

std::optional<HttpResponse> Router::cached_offline_page() {
    HttpRequest page;
    page.url = resolve_url(config_.origin, config_.offline_page);
    for (const auto& name : {config_.navigation_partition, config_.static_partition}) {
        if (!registry_.find(name)) continue;
        if (auto entry = executor_.lookup(lifecycle_.storage_for(name), page)) {
            return StrategyExecutor::from_entry(*entry, page, true);
        }
    }
    return std::nullopt;
}

HttpResponse Router::passthrough(const HttpRequest& request) {
    HttpResponse resp;
    try {
        resp = http_.send(request, config_.http_timeout_seconds);
    } catch (const std::exception& e) {
        std::cerr << "[router] " << request.url << ": " << e.what() << '\n';
        resp.status_code = 0;
    }
    if (resp.status_code == 0) return offline_.build_fallback(request);
    return resp;
}

HttpResponse Router::handle_mutation(const HttpRequest& request) {
    if (!queue_ || !is_queueable(request)) return passthrough(request);

    HttpResponse resp;
    try {
        resp = http_.send(request, config_.http_timeout_seconds);
    } catch (const std::exception& e) {
        std::cerr << "[router] " << request.url << ": " << e.what() << '\n';
        resp.status_code = 0;
    }
    if (resp.status_code != 0) return resp;

    try {
        uint64_t id = queue_->enqueue(request);
        return offline_.build_queued(request, id);
    } catch (const StoreError& e) {
        std::cerr << "[router] Could not queue " << request.url << ": " << e.what() << '\n';
        return offline_.build_fallback(request);
    }
}

} // namespace netstash
