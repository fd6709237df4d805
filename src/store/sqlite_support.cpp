#include "sqlite_support.hpp"
#include "../errors.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>

namespace netstash {

StmtGuard::~StmtGuard() {
    if (stmt) sqlite3_finalize(stmt);
}

static std::string last_error(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "unknown error";
}

sqlite3* sqlite_open(const std::string& path, const std::string& component) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StoreError(component + ": cannot create " + parent.string() +
                             ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = last_error(db);
        if (db) sqlite3_close(db);
        throw StoreError(component + ": failed to open database: " + err);
    }

    // Pragmas are tuning only; a failure here leaves a usable connection.
    if (sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        std::cerr << "[" << component << "] WAL unavailable: " << last_error(db) << '\n';
    }
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db, 5000);
    return db;
}

void sqlite_exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : last_error(db);
        sqlite3_free(err);
        throw StoreError("sqlite: " + msg);
    }
}

void sqlite_prepare(sqlite3* db, const char* sql, StmtGuard& guard) {
    if (sqlite3_prepare_v2(db, sql, -1, &guard.stmt, nullptr) != SQLITE_OK) {
        throw StoreError("sqlite: prepare failed: " + last_error(db));
    }
}

void sqlite_step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw StoreError("sqlite: step failed: " + last_error(db));
    }
}

std::string sqlite_column_string(sqlite3_stmt* stmt, int col) {
    const void* data = sqlite3_column_blob(stmt, col);
    int bytes = sqlite3_column_bytes(stmt, col);
    if (!data || bytes <= 0) return {};
    return std::string(static_cast<const char*>(data), static_cast<size_t>(bytes));
}

SqliteTransaction::SqliteTransaction(sqlite3* db) : db_(db) {
    sqlite_exec(db_, "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
    if (!done_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void SqliteTransaction::commit() {
    sqlite_exec(db_, "COMMIT;");
    done_ = true;
}

} // namespace netstash
