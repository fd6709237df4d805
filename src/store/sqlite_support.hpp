#pragma once
#include <string>

struct sqlite3;      // forward declare
struct sqlite3_stmt; // forward declare

namespace netstash {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    StmtGuard() = default;
    ~StmtGuard();
    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
};

// Open (creating parent directories) with WAL + NORMAL sync.
// Throws StoreError tagged with `component` on failure.
sqlite3* sqlite_open(const std::string& path, const std::string& component);

void sqlite_exec(sqlite3* db, const char* sql);
void sqlite_prepare(sqlite3* db, const char* sql, StmtGuard& guard);

// Step a statement that returns no rows; throws unless SQLITE_DONE.
void sqlite_step_done(sqlite3* db, sqlite3_stmt* stmt);

std::string sqlite_column_string(sqlite3_stmt* stmt, int col);

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
class SqliteTransaction {
public:
    explicit SqliteTransaction(sqlite3* db);
    ~SqliteTransaction();
    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    bool done_ = false;
};

} // namespace netstash
