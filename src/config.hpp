#pragma once
#include "offline.hpp"
#include "partition.hpp"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace netstash {

// URLs fetched by Lifecycle::install(), one list per target partition.
struct PrecacheConfig {
    std::vector<std::string> static_assets;  // -> static_partition
    std::vector<std::string> essential_apis; // -> api_partition
    std::vector<std::string> critical_pages; // -> navigation_partition
};

struct OfflineConfig {
    uint32_t retry_after_seconds = 30;
    std::vector<EndpointFamily> families;
};

struct Config {
    std::string origin;                  // "" = every request is same-origin
    uint32_t generation = 1;
    std::string cache_prefix = "netstash";
    std::string data_dir;                // expanded; holds cache.db and queue.db
    std::string store_backend = "sqlite";
    long http_timeout_seconds = 30;

    std::vector<Partition> partitions;   // registration order = match priority
    std::string navigation_partition = "pages";
    std::string static_partition = "static";
    std::string api_partition = "api";
    std::string offline_page = "/offline";

    PrecacheConfig precache;
    std::vector<std::string> queue_rules; // regexes over the request path
    OfflineConfig offline;

    // Load from `path` (default ~/.netstash/config.json), creating it with
    // defaults when missing and merging in new default keys otherwise.
    // Environment variables override the file. Throws ConfigError when the
    // file parses but describes an invalid setup.
    static Config load(const std::string& path = default_path());

    // Parse an already merged JSON document. No environment overrides.
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_path();

    // NETSTASH_ORIGIN, NETSTASH_DATA_DIR, NETSTASH_GENERATION,
    // NETSTASH_STORE_BACKEND
    void apply_env_overrides();
};

// Partition <-> JSON object used in the "partitions" array.
Partition partition_from_json(const nlohmann::json& j);
nlohmann::json partition_to_json(const Partition& partition);

} // namespace netstash
