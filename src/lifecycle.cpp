#include "lifecycle.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "url.hpp"
#include <iostream>
#include <set>

namespace netstash {

static const char* kGenerationMetaKey = "generation";

std::string storage_name(const std::string& prefix, const std::string& partition,
                         uint32_t generation) {
    return prefix + "-" + partition + "-v" + std::to_string(generation);
}

Lifecycle::Lifecycle(const Config& config, const PartitionRegistry& registry, Store& store,
                     StrategyExecutor& executor, EventBus* bus)
    : config_(config), registry_(registry), store_(store), executor_(executor),
      bus_(bus), generation_(config.generation) {}

std::string Lifecycle::storage_for(const std::string& partition) const {
    return storage_name(config_.cache_prefix, partition, generation_);
}

PrecacheReport Lifecycle::precache(const std::string& partition,
                                   const std::vector<std::string>& urls) {
    PrecacheReport report;
    const Partition* target = registry_.find(partition);
    if (!target) {
        std::cerr << "[lifecycle] No partition named " << partition << ", skipping "
                  << urls.size() << " URLs\n";
        report.attempted = urls.size();
        report.failed = urls.size();
        return report;
    }

    std::string storage = storage_for(partition);
    for (const auto& url : urls) {
        ++report.attempted;
        HttpRequest req;
        req.url = resolve_url(config_.origin, url);
        if (executor_.prefetch(*target, storage, req)) {
            ++report.stored;
            if (bus_) {
                EntryStoredEvent ev;
                ev.storage = storage;
                ev.url = req.url;
                bus_->publish(ev);
            }
        } else {
            ++report.failed;
        }
    }
    return report;
}

PrecacheReport Lifecycle::install() {
    PrecacheReport report;
    report += precache(config_.static_partition, config_.precache.static_assets);
    report += precache(config_.api_partition, config_.precache.essential_apis);
    report += precache(config_.navigation_partition, config_.precache.critical_pages);
    std::cerr << "[lifecycle] Installed generation " << generation_ << ": "
              << report.stored << "/" << report.attempted << " precached\n";
    return report;
}

PrecacheReport Lifecycle::preload_critical() {
    return precache(config_.navigation_partition, config_.precache.critical_pages);
}

std::optional<uint32_t> Lifecycle::persisted_generation() {
    auto value = store_.get_meta(kGenerationMetaKey);
    if (!value) return std::nullopt;
    try {
        return static_cast<uint32_t>(std::stoul(*value));
    } catch (const std::logic_error&) {
        throw StoreError("Corrupt generation marker: " + *value);
    }
}

ActivationReport Lifecycle::activate() {
    auto previous = persisted_generation();
    if (previous && *previous > generation_) {
        throw ConfigError("Refusing to activate generation " + std::to_string(generation_) +
                          " over newer generation " + std::to_string(*previous));
    }

    ActivationReport report;
    report.generation = generation_;

    std::set<std::string> current;
    for (const auto* p : registry_.partitions()) {
        current.insert(storage_for(p->name));
    }

    for (const auto& storage : store_.list_partitions()) {
        if (current.count(storage)) continue;
        if (store_.delete_partition(storage)) {
            ++report.storages_deleted;
            std::cerr << "[lifecycle] Deleted old storage " << storage << '\n';
        }
    }

    for (const auto* p : registry_.partitions()) {
        report.entries_trimmed += store_.trim(storage_for(p->name), p->max_entries);
    }

    store_.set_meta(kGenerationMetaKey, std::to_string(generation_));

    std::cerr << "[lifecycle] Activated generation " << generation_ << " ("
              << report.storages_deleted << " old storages removed)\n";
    if (bus_) {
        GenerationActivatedEvent ev;
        ev.generation = generation_;
        ev.storages_deleted = report.storages_deleted;
        bus_->publish(ev);
    }
    return report;
}

} // namespace netstash
