#pragma once
#include "config.hpp"
#include "partition.hpp"
#include "store.hpp"
#include "strategy.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netstash {

class EventBus;

// "<prefix>-<partition>-v<generation>", e.g. "netstash-api-v3".
std::string storage_name(const std::string& prefix, const std::string& partition,
                         uint32_t generation);

struct PrecacheReport {
    size_t attempted = 0;
    size_t stored = 0;
    size_t failed = 0;

    PrecacheReport& operator+=(const PrecacheReport& other) {
        attempted += other.attempted;
        stored += other.stored;
        failed += other.failed;
        return *this;
    }
};

struct ActivationReport {
    uint32_t generation = 0;
    size_t storages_deleted = 0;
    size_t entries_trimmed = 0;
};

// Install / activate transitions of one cache generation.
class Lifecycle {
public:
    Lifecycle(const Config& config, const PartitionRegistry& registry, Store& store,
              StrategyExecutor& executor, EventBus* bus = nullptr);

    uint32_t generation() const { return generation_; }

    // Storage name of a partition in the current generation.
    std::string storage_for(const std::string& partition) const;

    // Precache static assets, essential APIs and critical pages into their
    // partitions. Individual failures are logged and counted.
    PrecacheReport install();

    // Critical pages only, into the navigation partition.
    PrecacheReport preload_critical();

    // Fetch and store each URL (relative ones resolved against the origin)
    // into the named partition.
    PrecacheReport precache(const std::string& partition, const std::vector<std::string>& urls);

    // Delete every storage outside the current generation, trim current
    // partitions and persist the generation. Throws ConfigError when the
    // persisted generation is newer than ours.
    ActivationReport activate();

    // Generation recorded by the last activate(), if any.
    std::optional<uint32_t> persisted_generation();

private:
    const Config& config_;
    const PartitionRegistry& registry_;
    Store& store_;
    StrategyExecutor& executor_;
    EventBus* bus_;
    uint32_t generation_;
};

} // namespace netstash
