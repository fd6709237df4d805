#include "memory_store.hpp"
#include <algorithm>
#include <iterator>

namespace netstash {

std::optional<CacheEntry> MemoryStore::get(const std::string& storage,
                                           const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bit = buckets_.find(storage);
    if (bit == buckets_.end()) return std::nullopt;
    auto it = bit->second.index.find(key);
    if (it == bit->second.index.end()) return std::nullopt;
    return *it->second;
}

void MemoryStore::insert(Bucket& bucket, CacheEntry entry) {
    auto it = bucket.index.find(entry.request_key);
    if (it != bucket.index.end()) {
        bucket.order.erase(it->second);
    }
    std::string key = entry.request_key;
    bucket.order.push_back(std::move(entry));
    bucket.index[key] = std::prev(bucket.order.end());
}

size_t MemoryStore::evict_oldest(Bucket& bucket, uint32_t max_entries) {
    size_t removed = 0;
    while (bucket.order.size() > max_entries) {
        bucket.index.erase(bucket.order.front().request_key);
        bucket.order.pop_front();
        ++removed;
    }
    return removed;
}

void MemoryStore::put(const std::string& storage, const std::string& key,
                      const CacheEntry& entry) {
    CacheEntry copy = entry;
    copy.request_key = key;

    std::lock_guard<std::mutex> lock(mutex_);
    insert(buckets_[storage], std::move(copy));
}

size_t MemoryStore::put_bounded(const std::string& storage, const std::string& key,
                                const CacheEntry& entry, uint32_t max_entries) {
    CacheEntry copy = entry;
    copy.request_key = key;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& bucket = buckets_[storage];
    insert(bucket, std::move(copy));
    size_t removed = evict_oldest(bucket, max_entries);
    if (bucket.order.empty()) buckets_.erase(storage);
    return removed;
}

bool MemoryStore::delete_partition(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.erase(storage) > 0;
}

bool MemoryStore::remove(const std::string& storage, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bit = buckets_.find(storage);
    if (bit == buckets_.end()) return false;
    auto it = bit->second.index.find(key);
    if (it == bit->second.index.end()) return false;
    bit->second.order.erase(it->second);
    bit->second.index.erase(it);
    if (bit->second.order.empty()) buckets_.erase(bit);
    return true;
}

std::vector<std::string> MemoryStore::list_keys(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    auto bit = buckets_.find(storage);
    if (bit == buckets_.end()) return keys;
    keys.reserve(bit->second.order.size());
    for (const auto& entry : bit->second.order) keys.push_back(entry.request_key);
    return keys;
}

size_t MemoryStore::trim(const std::string& storage, uint32_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bit = buckets_.find(storage);
    if (bit == buckets_.end()) return 0;

    size_t removed = evict_oldest(bit->second, max_entries);
    if (bit->second.order.empty()) buckets_.erase(bit);
    return removed;
}

size_t MemoryStore::count(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bit = buckets_.find(storage);
    return bit == buckets_.end() ? 0 : bit->second.order.size();
}

std::vector<std::string> MemoryStore::list_partitions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(buckets_.size());
    for (const auto& [name, bucket] : buckets_) {
        if (!bucket.order.empty()) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::pair<uint64_t, size_t> MemoryStore::sample_bytes(const std::string& storage,
                                                      size_t sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bit = buckets_.find(storage);
    if (bit == buckets_.end()) return {0, 0};

    uint64_t bytes = 0;
    size_t seen = 0;
    for (const auto& entry : bit->second.order) {
        if (seen == sample) break;
        bytes += entry.approx_bytes();
        ++seen;
    }
    return {bytes, seen};
}

std::optional<std::string> MemoryStore::get_meta(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = meta_.find(key);
    if (it == meta_.end()) return std::nullopt;
    return it->second;
}

void MemoryStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    meta_[key] = value;
}

} // namespace netstash
