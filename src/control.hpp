#pragma once
#include "lifecycle.hpp"
#include "retry_queue.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace netstash {

class EventBus;

namespace control {

// Clear one partition (by partition or storage name) or, when empty, all.
// With a url only that entry is removed, from `partition` or from every
// current partition.
struct Invalidate {
    std::optional<std::string> partition;
    std::optional<std::string> url;
};
struct Status {};
struct Warm {
    std::vector<std::string> urls;
};
struct WarmPartition {
    std::string name;
};
struct PreloadCritical {};
struct ForceActivate {};
struct ReplayQueue {};

} // namespace control

using ControlMessage = std::variant<control::Invalidate, control::Status, control::Warm,
                                    control::WarmPartition, control::PreloadCritical,
                                    control::ForceActivate, control::ReplayQueue>;

// {"type": "INVALIDATE", "partition": "api"} and friends. Legacy host
// names (CLEAR_CACHE, GET_CACHE_STATUS, CACHE_URLS, CACHE_VEHICLE,
// SKIP_WAITING) are accepted too. Throws std::invalid_argument for
// unknown types or missing fields.
ControlMessage parse_control_message(const nlohmann::json& j);

// "INVALIDATE", "STATUS", ...
std::string control_message_type(const ControlMessage& message);

struct PartitionStatus {
    std::string name;
    std::string storage;
    size_t count = 0;
    uint64_t approx_bytes = 0; // extrapolated from a sample of up to 10 entries
};

struct CacheStatus {
    uint32_t generation = 0;
    std::vector<PartitionStatus> partitions;
    size_t queued_submissions = 0;

    nlohmann::json to_json() const;
};

// Host-facing commands. Every command is idempotent and safe to run
// alongside live traffic.
class ControlChannel {
public:
    ControlChannel(const Config& config, const PartitionRegistry& registry, Store& store,
                   Lifecycle& lifecycle, RetryQueue* queue = nullptr,
                   EventBus* bus = nullptr);

    // Run a parsed message; the reply is a JSON object with "type" and "ok".
    nlohmann::json dispatch(const ControlMessage& message);

    // Parse and dispatch. Malformed messages get {"ok": false, "error": ...}.
    nlohmann::json handle(const nlohmann::json& message);

    CacheStatus cache_status();

    // Returns the number of storages deleted.
    size_t clear_partition(const std::optional<std::string>& name);

    // Drop the cached GET for `url`. Returns the number of entries removed.
    size_t invalidate_url(const std::string& url,
                          const std::optional<std::string>& partition);

    // Each URL goes to the partition that would serve it, else the
    // navigation partition.
    PrecacheReport warm(const std::vector<std::string>& urls);

    // Prefetch the partition's configured warm URLs. Throws
    // std::invalid_argument for unknown partitions.
    PrecacheReport warm_partition(const std::string& name);

    PrecacheReport preload_critical();
    ActivationReport force_activate();
    ReplayReport replay_queue();

private:
    const Config& config_;
    const PartitionRegistry& registry_;
    Store& store_;
    Lifecycle& lifecycle_;
    RetryQueue* queue_;
    EventBus* bus_;
};

} // namespace netstash
