#include "sqlite_store.hpp"
#include "sqlite_support.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace netstash {

static std::string headers_to_json(const std::vector<Header>& headers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& h : headers) {
        arr.push_back({h.first, h.second});
    }
    return arr.dump();
}

static std::vector<Header> headers_from_json(const std::string& text) {
    std::vector<Header> headers;
    nlohmann::json arr = nlohmann::json::parse(text, nullptr, false);
    if (arr.is_discarded() || !arr.is_array()) {
        throw StoreError("sqlite store: corrupt header column");
    }
    for (const auto& pair : arr) {
        if (pair.is_array() && pair.size() == 2 &&
            pair[0].is_string() && pair[1].is_string()) {
            headers.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
        }
    }
    return headers;
}

SqliteStore::SqliteStore(const std::string& path) : path_(path) {
    db_ = sqlite_open(path_, "store");
    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteStore::init_schema() {
    sqlite_exec(db_,
        "CREATE TABLE IF NOT EXISTS cache_entries ("
        "  storage     TEXT    NOT NULL,"
        "  request_key TEXT    NOT NULL,"
        "  url         TEXT    NOT NULL,"
        "  status      INTEGER NOT NULL,"
        "  headers     TEXT    NOT NULL,"
        "  body        BLOB    NOT NULL,"
        "  stored_at   INTEGER NOT NULL,"
        "  seq         INTEGER NOT NULL,"
        "  PRIMARY KEY (storage, request_key)"
        ");");
    sqlite_exec(db_,
        "CREATE INDEX IF NOT EXISTS cache_entries_order ON cache_entries (storage, seq);");
    sqlite_exec(db_,
        "CREATE TABLE IF NOT EXISTS store_meta ("
        "  key   TEXT PRIMARY KEY,"
        "  value TEXT NOT NULL"
        ");");

    StmtGuard g;
    sqlite_prepare(db_, "SELECT COALESCE(MAX(seq), 0) FROM cache_entries;", g);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        next_seq_ = sqlite3_column_int64(g.stmt, 0) + 1;
    }
}

std::optional<CacheEntry> SqliteStore::get(const std::string& storage,
                                           const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "SELECT url, status, headers, body, stored_at FROM cache_entries"
        " WHERE storage = ? AND request_key = ?;", g);
    sqlite3_bind_text(g.stmt, 1, storage.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, key.c_str(),     -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) {
        throw StoreError("sqlite store: read failed: " + std::string(sqlite3_errmsg(db_)));
    }

    CacheEntry entry;
    entry.request_key = key;
    entry.url         = sqlite_column_string(g.stmt, 0);
    entry.status_code = static_cast<long>(sqlite3_column_int64(g.stmt, 1));
    entry.headers     = headers_from_json(sqlite_column_string(g.stmt, 2));
    entry.body        = sqlite_column_string(g.stmt, 3);
    entry.stored_at   = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 4));
    return entry;
}

void SqliteStore::put(const std::string& storage, const std::string& key,
                      const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    insert_locked(storage, key, entry);
}

size_t SqliteStore::put_bounded(const std::string& storage, const std::string& key,
                                const CacheEntry& entry, uint32_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);

    SqliteTransaction tx(db_);
    insert_locked(storage, key, entry);
    size_t removed = trim_locked(storage, max_entries);
    tx.commit();
    return removed;
}

void SqliteStore::insert_locked(const std::string& storage, const std::string& key,
                                const CacheEntry& entry) {
    std::string headers = headers_to_json(entry.headers);

    // INSERT OR REPLACE deletes the old row first, so the new seq moves a
    // replaced key to the newest position.
    StmtGuard g;
    sqlite_prepare(db_,
        "INSERT OR REPLACE INTO cache_entries"
        " (storage, request_key, url, status, headers, body, stored_at, seq)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?);", g);
    sqlite3_bind_text(g.stmt,  1, storage.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt,  2, key.c_str(),       -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt,  3, entry.url.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 4, entry.status_code);
    sqlite3_bind_text(g.stmt,  5, headers.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_blob(g.stmt,  6, entry.body.data(), static_cast<int>(entry.body.size()),
                      SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 7, static_cast<int64_t>(entry.stored_at));
    sqlite3_bind_int64(g.stmt, 8, next_seq_);
    sqlite_step_done(db_, g.stmt);
    ++next_seq_;
}

bool SqliteStore::delete_partition(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_, "DELETE FROM cache_entries WHERE storage = ?;", g);
    sqlite3_bind_text(g.stmt, 1, storage.c_str(), -1, SQLITE_STATIC);
    sqlite_step_done(db_, g.stmt);
    return sqlite3_changes(db_) > 0;
}

bool SqliteStore::remove(const std::string& storage, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "DELETE FROM cache_entries WHERE storage = ? AND request_key = ?;", g);
    sqlite3_bind_text(g.stmt, 1, storage.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, key.c_str(),     -1, SQLITE_STATIC);
    sqlite_step_done(db_, g.stmt);
    return sqlite3_changes(db_) > 0;
}

std::vector<std::string> SqliteStore::list_keys(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "SELECT request_key FROM cache_entries WHERE storage = ? ORDER BY seq ASC;", g);
    sqlite3_bind_text(g.stmt, 1, storage.c_str(), -1, SQLITE_STATIC);

    std::vector<std::string> keys;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        keys.push_back(sqlite_column_string(g.stmt, 0));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError("sqlite store: list failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return keys;
}

size_t SqliteStore::trim(const std::string& storage, uint32_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    return trim_locked(storage, max_entries);
}

size_t SqliteStore::trim_locked(const std::string& storage, uint32_t max_entries) {
    // SQLite treats a negative LIMIT as "no limit", hence the MAX(0, ...).
    StmtGuard g;
    sqlite_prepare(db_,
        "DELETE FROM cache_entries WHERE storage = ?1 AND seq IN ("
        "  SELECT seq FROM cache_entries WHERE storage = ?1 ORDER BY seq ASC"
        "  LIMIT MAX(0, (SELECT COUNT(*) FROM cache_entries WHERE storage = ?1) - ?2)"
        ");", g);
    sqlite3_bind_text(g.stmt,  1, storage.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, max_entries);
    sqlite_step_done(db_, g.stmt);
    return static_cast<size_t>(sqlite3_changes(db_));
}

size_t SqliteStore::count(const std::string& storage) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_, "SELECT COUNT(*) FROM cache_entries WHERE storage = ?;", g);
    sqlite3_bind_text(g.stmt, 1, storage.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError("sqlite store: count failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

std::vector<std::string> SqliteStore::list_partitions() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "SELECT DISTINCT storage FROM cache_entries ORDER BY storage ASC;", g);
    std::vector<std::string> names;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        names.push_back(sqlite_column_string(g.stmt, 0));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError("sqlite store: list failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return names;
}

std::pair<uint64_t, size_t> SqliteStore::sample_bytes(const std::string& storage,
                                                      size_t sample) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "SELECT LENGTH(body) + LENGTH(url) + LENGTH(headers) FROM cache_entries"
        " WHERE storage = ? ORDER BY seq ASC LIMIT ?;", g);
    sqlite3_bind_text(g.stmt,  1, storage.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 2, static_cast<int64_t>(sample));

    uint64_t bytes = 0;
    size_t seen = 0;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        bytes += static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
        ++seen;
    }
    return {bytes, seen};
}

std::optional<std::string> SqliteStore::get_meta(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_, "SELECT value FROM store_meta WHERE key = ?;", g);
    sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;
    return sqlite_column_string(g.stmt, 0);
}

void SqliteStore::set_meta(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    sqlite_prepare(db_,
        "INSERT OR REPLACE INTO store_meta (key, value) VALUES (?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, key.c_str(),   -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, value.c_str(), -1, SQLITE_STATIC);
    sqlite_step_done(db_, g.stmt);
}

} // namespace netstash
