#pragma once
#include "http.hpp"
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace netstash {

enum class Strategy { CacheFirst, NetworkFirst, StaleWhileRevalidate };

constexpr uint32_t kDefaultNetworkTimeoutMs = 3000;

struct Partition {
    std::string name;
    std::vector<std::string> match_rules; // ECMAScript regular expressions
    Strategy strategy = Strategy::NetworkFirst;
    uint64_t max_age_ms = 0;              // 0 = entries never go stale
    uint32_t max_entries = 0;
    std::optional<uint32_t> network_timeout_ms;
    std::vector<std::string> warm_urls;   // prefetched by warm_partition()

    uint32_t effective_timeout_ms() const {
        return network_timeout_ms.value_or(kDefaultNetworkTimeoutMs);
    }

    bool is_fresh(uint64_t stored_at_ms, uint64_t now_ms) const {
        if (max_age_ms == 0) return true;
        if (now_ms < stored_at_ms) return true;
        return (now_ms - stored_at_ms) < max_age_ms;
    }
};

// "cache-first" / "network-first" / "stale-while-revalidate"
std::string strategy_to_string(Strategy strategy);

// Throws ConfigError for unknown names.
Strategy strategy_from_string(const std::string& s);

// Ordered set of partitions; first registered match wins.
// Registration happens at startup, lookups are read-only afterwards.
class PartitionRegistry {
public:
    // origin: "https://shop.example"; requests to that origin (or relative
    // URLs) are matched on their path, all others on the full URL.
    explicit PartitionRegistry(std::string origin = "");

    // Validates and appends. Throws ConfigError on an empty name, duplicate
    // name, empty or malformed match rules, or max_entries == 0.
    void register_partition(const Partition& partition);

    // First partition whose rules match, or nullptr. Only safe methods
    // (GET/HEAD) resolve; everything else goes to default handling.
    const Partition* resolve(const HttpRequest& request) const;

    const Partition* find(const std::string& name) const;
    std::vector<const Partition*> partitions() const;
    std::vector<std::string> names() const;
    size_t size() const { return entries_.size(); }
    const std::string& origin() const { return origin_; }

private:
    struct Compiled {
        Partition partition;
        std::vector<std::regex> rules;
    };

    std::string origin_;
    std::vector<Compiled> entries_;
};

} // namespace netstash
