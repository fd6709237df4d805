#pragma once
#include "http.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netstash {

struct Config; // forward declaration

// Immutable snapshot of a cached response. Updates replace the whole entry.
struct CacheEntry {
    std::string request_key;
    std::string url;
    long status_code = 200;
    std::vector<Header> headers;
    std::string body;
    uint64_t stored_at = 0; // epoch milliseconds

    size_t approx_bytes() const;
};

// Partitioned response store. `storage` is a full storage name
// (generation + partition); the store itself knows nothing about either.
// All implementations are safe to call from multiple threads, and every
// failure is reported as StoreError.
class Store {
public:
    virtual ~Store() = default;

    virtual std::string backend_name() const = 0;

    virtual std::optional<CacheEntry> get(const std::string& storage,
                                          const std::string& key) = 0;

    // Insert or replace. A replaced key moves to the newest position.
    virtual void put(const std::string& storage, const std::string& key,
                     const CacheEntry& entry) = 0;

    // Drop a whole storage. Returns false if it did not exist.
    virtual bool delete_partition(const std::string& storage) = 0;

    // Remove one entry. Returns false if it did not exist.
    virtual bool remove(const std::string& storage, const std::string& key) = 0;

    // Keys in insertion order, oldest first.
    virtual std::vector<std::string> list_keys(const std::string& storage) = 0;

    // Delete oldest entries until at most max_entries remain.
    // Returns the number of entries removed.
    virtual size_t trim(const std::string& storage, uint32_t max_entries) = 0;

    // put() followed by trim() as one step: other callers never see the
    // storage above max_entries, and a failure leaves it unchanged.
    // Returns the number of entries evicted.
    virtual size_t put_bounded(const std::string& storage, const std::string& key,
                               const CacheEntry& entry, uint32_t max_entries) = 0;

    virtual size_t count(const std::string& storage) = 0;

    // Every storage name holding at least one entry.
    virtual std::vector<std::string> list_partitions() = 0;

    // Total approximate bytes of the first `sample` entries (oldest first)
    // together with how many entries were actually sampled.
    virtual std::pair<uint64_t, size_t> sample_bytes(const std::string& storage,
                                                     size_t sample) = 0;

    // Small key/value area for bookkeeping (e.g. the active generation).
    virtual std::optional<std::string> get_meta(const std::string& key) = 0;
    virtual void set_meta(const std::string& key, const std::string& value) = 0;
};

// Build the backend named by config.store_backend ("sqlite" or "memory").
// Throws ConfigError for unknown names, StoreError when opening fails.
std::unique_ptr<Store> create_store(const Config& config);

} // namespace netstash
