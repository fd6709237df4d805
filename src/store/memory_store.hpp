#pragma once
#include "../store.hpp"
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

namespace netstash {

// Volatile backend: nothing survives the process. Used by tests and by
// hosts that only want request-level caching.
class MemoryStore : public Store {
public:
    std::string backend_name() const override { return "memory"; }

    std::optional<CacheEntry> get(const std::string& storage,
                                  const std::string& key) override;
    void put(const std::string& storage, const std::string& key,
             const CacheEntry& entry) override;
    bool delete_partition(const std::string& storage) override;
    bool remove(const std::string& storage, const std::string& key) override;
    std::vector<std::string> list_keys(const std::string& storage) override;
    size_t trim(const std::string& storage, uint32_t max_entries) override;
    size_t put_bounded(const std::string& storage, const std::string& key,
                       const CacheEntry& entry, uint32_t max_entries) override;
    size_t count(const std::string& storage) override;
    std::vector<std::string> list_partitions() override;
    std::pair<uint64_t, size_t> sample_bytes(const std::string& storage,
                                             size_t sample) override;
    std::optional<std::string> get_meta(const std::string& key) override;
    void set_meta(const std::string& key, const std::string& value) override;

private:
    // Insertion-ordered map: list holds order, index points into it.
    struct Bucket {
        std::list<CacheEntry> order;
        std::unordered_map<std::string, std::list<CacheEntry>::iterator> index;
    };

    static void insert(Bucket& bucket, CacheEntry entry);
    static size_t evict_oldest(Bucket& bucket, uint32_t max_entries);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
    std::unordered_map<std::string, std::string> meta_;
};

} // namespace netstash
