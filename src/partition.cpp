#include "partition.hpp"
#include "errors.hpp"
#include "url.hpp"

namespace netstash {

std::string strategy_to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::CacheFirst:           return "cache-first";
        case Strategy::NetworkFirst:         return "network-first";
        case Strategy::StaleWhileRevalidate: return "stale-while-revalidate";
    }
    return "network-first";
}

Strategy strategy_from_string(const std::string& s) {
    if (s == "cache-first")            return Strategy::CacheFirst;
    if (s == "network-first")          return Strategy::NetworkFirst;
    if (s == "stale-while-revalidate") return Strategy::StaleWhileRevalidate;
    throw ConfigError("Unknown caching strategy: " + s);
}

PartitionRegistry::PartitionRegistry(std::string origin) {
    origin_ = url_origin(parse_url(origin));
}

void PartitionRegistry::register_partition(const Partition& partition) {
    if (partition.name.empty()) {
        throw ConfigError("Partition name must not be empty");
    }
    if (find(partition.name) != nullptr) {
        throw ConfigError("Duplicate partition: " + partition.name);
    }
    if (partition.match_rules.empty()) {
        throw ConfigError("Partition " + partition.name + " has no match rules");
    }
    if (partition.max_entries == 0) {
        throw ConfigError("Partition " + partition.name + " needs max_entries > 0");
    }

    Compiled compiled{partition, {}};
    compiled.rules.reserve(partition.match_rules.size());
    for (const auto& rule : partition.match_rules) {
        if (rule.empty()) {
            throw ConfigError("Partition " + partition.name + " has an empty match rule");
        }
        try {
            compiled.rules.emplace_back(rule, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw ConfigError("Partition " + partition.name + ": invalid rule '" +
                              rule + "': " + e.what());
        }
    }
    entries_.push_back(std::move(compiled));
}

const Partition* PartitionRegistry::resolve(const HttpRequest& request) const {
    if (request.method != "GET" && request.method != "HEAD") return nullptr;

    ParsedUrl url = parse_url(request.url);
    std::string origin = url_origin(url);
    bool same_origin = origin.empty() || origin_.empty() || origin == origin_;
    std::string subject = same_origin ? url.path : normalize_url(request.url);

    for (const auto& entry : entries_) {
        for (const auto& rule : entry.rules) {
            if (std::regex_search(subject, rule)) return &entry.partition;
        }
    }
    return nullptr;
}

const Partition* PartitionRegistry::find(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.partition.name == name) return &entry.partition;
    }
    return nullptr;
}

std::vector<const Partition*> PartitionRegistry::partitions() const {
    std::vector<const Partition*> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(&entry.partition);
    return out;
}

std::vector<std::string> PartitionRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(entry.partition.name);
    return out;
}

} // namespace netstash
