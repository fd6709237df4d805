#include "store.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "store/memory_store.hpp"
#include "store/sqlite_store.hpp"
#include "util.hpp"

namespace netstash {

size_t CacheEntry::approx_bytes() const {
    size_t total = body.size() + url.size();
    for (const auto& h : headers) total += h.first.size() + h.second.size();
    return total;
}

std::unique_ptr<Store> create_store(const Config& config) {
    if (config.store_backend == "memory") {
        return std::make_unique<MemoryStore>();
    }
    if (config.store_backend == "sqlite") {
        return std::make_unique<SqliteStore>(path_join(config.data_dir, "cache.db"));
    }
    throw ConfigError("Unknown store backend: " + config.store_backend);
}

} // namespace netstash
