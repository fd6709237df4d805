#pragma once
#include "../store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace netstash {

// Durable backend. One table keyed by (storage, request_key); a global
// monotonic `seq` column records insertion order for FIFO eviction.
class SqliteStore : public Store {
public:
    explicit SqliteStore(const std::string& path);
    ~SqliteStore() override;

    // Non-copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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

    const std::string& path() const { return path_; }

private:
    void init_schema();
    // Callers hold mutex_.
    void insert_locked(const std::string& storage, const std::string& key,
                       const CacheEntry& entry);
    size_t trim_locked(const std::string& storage, uint32_t max_entries);

    sqlite3* db_ = nullptr;
    std::string path_;
    int64_t next_seq_ = 1;
    mutable std::mutex mutex_;
};

} // namespace netstash
