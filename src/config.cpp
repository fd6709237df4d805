#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace netstash {

using json = nlohmann::json;

static constexpr uint64_t kMinuteMs = 60ULL * 1000;
static constexpr uint64_t kHourMs = 60 * kMinuteMs;
static constexpr uint64_t kDayMs = 24 * kHourMs;

json Config::defaults_json() {
    return {
        {"origin", ""},
        {"generation", 1},
        {"cache_prefix", "netstash"},
        {"data_dir", "~/.netstash/data"},
        {"store", {{"backend", "sqlite"}}},
        {"http", {{"timeout_seconds", 30}}},
        {"partitions", json::array({
            {{"name", "static"}, {"strategy", "cache-first"},
             {"match", {"/_next/static/",
                        "\\.(?:js|css|woff2?|png|jpg|jpeg|webp|avif|svg|ico)$"}},
             {"max_age_ms", 365 * kDayMs}, {"max_entries", 200}},
            {{"name", "images"}, {"strategy", "cache-first"},
             {"match", {"/images/", "/uploads/", "cloudinary\\.com"}},
             {"max_age_ms", 30 * kDayMs}, {"max_entries", 100}},
            {{"name", "api"}, {"strategy", "network-first"},
             {"match", json::array({"/api/"})},
             {"max_age_ms", 5 * kMinuteMs}, {"max_entries", 30},
             {"network_timeout_ms", 3000},
             {"warm_urls", {"/api/vehicles/featured", "/api/vehicles/count"}}},
            {{"name", "pages"}, {"strategy", "stale-while-revalidate"},
             {"match", {"/vehicles/", "/services/", "/about", "/financing"}},
             {"max_age_ms", kDayMs}, {"max_entries", 50}},
            {{"name", "fonts"}, {"strategy", "stale-while-revalidate"},
             {"match", {"fonts\\.googleapis\\.com", "fonts\\.gstatic\\.com"}},
             {"max_age_ms", 365 * kDayMs}, {"max_entries", 30}}
        })},
        {"navigation_partition", "pages"},
        {"static_partition", "static"},
        {"api_partition", "api"},
        {"offline_page", "/offline"},
        {"precache", {
            {"static_assets", {"/", "/vehicles", "/contact", "/services", "/about",
                               "/financing", "/offline", "/manifest.json", "/favicon.ico",
                               "/icons/icon-192x192.png", "/icons/icon-512x512.png"}},
            {"essential_apis", {"/api/vehicles/featured", "/api/vehicles/count",
                                "/api/config/business-info"}},
            {"critical_pages", {"/", "/vehicles", "/contact", "/offline"}}
        }},
        {"queue", {{"rules", json::array({"^/api/contact"})}}},
        {"offline", {
            {"retry_after_seconds", 30},
            {"families", json::array({
                {{"name", "inventory"}, {"path_prefix", "/api/vehicles"}, {"kind", "listing"}},
                {{"name", "contact"}, {"path_prefix", "/api/contact"}, {"kind", "submission"}}
            })}
        }}
    };
}

std::string Config::default_path() {
    return expand_home("~/.netstash/config.json");
}

static json merge_defaults(const json& existing, const json& defaults) {
    json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Integers written by hand parse as unsigned, defaults_json() literals as
// signed; accept both when non-negative.
static bool is_uint(const json& v) {
    return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

// Non-negative integer that must fit `limit`. Throws ConfigError naming
// the field instead of letting the value wrap.
static uint64_t bounded_uint(const json& v, const char* field, uint64_t limit) {
    uint64_t n = v.get<uint64_t>();
    if (n > limit) {
        throw ConfigError(std::string(field) + " is out of range: " + v.dump() +
                          " (max " + std::to_string(limit) + ")");
    }
    return n;
}

static uint32_t uint32_field(const json& v, const char* field) {
    return static_cast<uint32_t>(
        bounded_uint(v, field, std::numeric_limits<uint32_t>::max()));
}

static std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& item : j[key]) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

Partition partition_from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("Partition entry must be an object");

    Partition p;
    if (j.contains("name") && j["name"].is_string())
        p.name = j["name"].get<std::string>();
    if (p.name.empty()) throw ConfigError("Partition entry without a name");

    if (j.contains("strategy") && j["strategy"].is_string())
        p.strategy = strategy_from_string(j["strategy"].get<std::string>());
    p.match_rules = string_list(j, "match");
    p.warm_urls = string_list(j, "warm_urls");
    if (j.contains("max_age_ms") && is_uint(j["max_age_ms"]))
        p.max_age_ms = j["max_age_ms"].get<uint64_t>();
    if (j.contains("max_entries") && is_uint(j["max_entries"]))
        p.max_entries = uint32_field(j["max_entries"], "max_entries");
    if (j.contains("network_timeout_ms") && is_uint(j["network_timeout_ms"]))
        p.network_timeout_ms = uint32_field(j["network_timeout_ms"], "network_timeout_ms");
    return p;
}

json partition_to_json(const Partition& p) {
    json j = {
        {"name", p.name},
        {"strategy", strategy_to_string(p.strategy)},
        {"match", p.match_rules},
        {"max_age_ms", p.max_age_ms},
        {"max_entries", p.max_entries}
    };
    if (p.network_timeout_ms) j["network_timeout_ms"] = *p.network_timeout_ms;
    if (!p.warm_urls.empty()) j["warm_urls"] = p.warm_urls;
    return j;
}

Config Config::from_json(const json& j) {
    Config cfg;

    if (j.contains("origin") && j["origin"].is_string())
        cfg.origin = j["origin"].get<std::string>();
    if (j.contains("generation") && is_uint(j["generation"]))
        cfg.generation = uint32_field(j["generation"], "generation");
    if (j.contains("cache_prefix") && j["cache_prefix"].is_string())
        cfg.cache_prefix = j["cache_prefix"].get<std::string>();
    if (j.contains("data_dir") && j["data_dir"].is_string())
        cfg.data_dir = expand_home(j["data_dir"].get<std::string>());

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("backend") && s["backend"].is_string())
            cfg.store_backend = s["backend"].get<std::string>();
    }
    if (j.contains("http") && j["http"].is_object()) {
        auto& h = j["http"];
        if (h.contains("timeout_seconds") && is_uint(h["timeout_seconds"]))
            cfg.http_timeout_seconds = static_cast<long>(bounded_uint(
                h["timeout_seconds"], "http.timeout_seconds",
                static_cast<uint64_t>(std::numeric_limits<long>::max())));
    }

    if (j.contains("partitions") && j["partitions"].is_array()) {
        for (const auto& item : j["partitions"]) {
            cfg.partitions.push_back(partition_from_json(item));
        }
    }

    if (j.contains("navigation_partition") && j["navigation_partition"].is_string())
        cfg.navigation_partition = j["navigation_partition"].get<std::string>();
    if (j.contains("static_partition") && j["static_partition"].is_string())
        cfg.static_partition = j["static_partition"].get<std::string>();
    if (j.contains("api_partition") && j["api_partition"].is_string())
        cfg.api_partition = j["api_partition"].get<std::string>();
    if (j.contains("offline_page") && j["offline_page"].is_string())
        cfg.offline_page = j["offline_page"].get<std::string>();

    if (j.contains("precache") && j["precache"].is_object()) {
        auto& p = j["precache"];
        cfg.precache.static_assets = string_list(p, "static_assets");
        cfg.precache.essential_apis = string_list(p, "essential_apis");
        cfg.precache.critical_pages = string_list(p, "critical_pages");
    }

    if (j.contains("queue") && j["queue"].is_object())
        cfg.queue_rules = string_list(j["queue"], "rules");

    if (j.contains("offline") && j["offline"].is_object()) {
        auto& o = j["offline"];
        if (o.contains("retry_after_seconds") && is_uint(o["retry_after_seconds"]))
            cfg.offline.retry_after_seconds =
                uint32_field(o["retry_after_seconds"], "offline.retry_after_seconds");
        if (o.contains("families") && o["families"].is_array()) {
            for (const auto& f : o["families"]) {
                if (!f.is_object()) continue;
                EndpointFamily family;
                if (f.contains("name") && f["name"].is_string())
                    family.name = f["name"].get<std::string>();
                if (f.contains("path_prefix") && f["path_prefix"].is_string())
                    family.path_prefix = f["path_prefix"].get<std::string>();
                if (f.contains("kind") && f["kind"].is_string())
                    family.kind = family_kind_from_string(f["kind"].get<std::string>());
                if (family.name.empty() || family.path_prefix.empty()) {
                    throw ConfigError("Endpoint family needs a name and a path_prefix");
                }
                cfg.offline.families.push_back(std::move(family));
            }
        }
    }

    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = std::getenv("NETSTASH_ORIGIN"))
        origin = v;
    if (const char* v = std::getenv("NETSTASH_DATA_DIR"))
        data_dir = expand_home(v);
    if (const char* v = std::getenv("NETSTASH_STORE_BACKEND"))
        store_backend = v;
    if (const char* v = std::getenv("NETSTASH_GENERATION")) {
        try {
            size_t used = 0;
            unsigned long g = std::stoul(v, &used);
            if (used != std::string(v).size() || std::string(v).find('-') != std::string::npos ||
                g > std::numeric_limits<uint32_t>::max()) {
                throw std::invalid_argument(v);
            }
            generation = static_cast<uint32_t>(g);
        } catch (const std::logic_error&) {
            throw ConfigError(std::string("NETSTASH_GENERATION is not a valid generation: ") + v);
        }
    }
}

Config Config::load(const std::string& path) {
    json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            json original = json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const json::exception& e) {
            std::cerr << "[config] Malformed " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env_overrides();
    return cfg;
}

} // namespace netstash
