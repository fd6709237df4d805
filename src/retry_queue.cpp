#include "retry_queue.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "store/sqlite_support.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <iostream>

namespace netstash {

bool is_retryable_status(long status_code) {
    return status_code == 408 || status_code == 429 || status_code >= 500;
}

namespace {

// Clears the running flag however the pass ends.
struct RunningGuard {
    std::atomic<bool>& flag;
    ~RunningGuard() { flag.store(false); }
};

std::string encode_headers(const std::vector<Header>& headers) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& h : headers) arr.push_back({h.first, h.second});
    return arr.dump();
}

std::vector<Header> decode_headers(const std::string& text) {
    std::vector<Header> headers;
    auto arr = nlohmann::json::parse(text, nullptr, false);
    if (arr.is_discarded() || !arr.is_array()) {
        throw StoreError("queue: corrupt header column");
    }
    for (const auto& pair : arr) {
        if (pair.is_array() && pair.size() == 2 &&
            pair[0].is_string() && pair[1].is_string()) {
            headers.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
        }
    }
    return headers;
}

} // namespace

RetryQueue::RetryQueue(const std::string& path, HttpClient& http, long timeout_seconds)
    : path_(path), http_(http), timeout_seconds_(timeout_seconds) {
    db_ = sqlite_open(path_, "queue");
    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

RetryQueue::~RetryQueue() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void RetryQueue::init_schema() {
    sqlite_exec(db_,
        "CREATE TABLE IF NOT EXISTS submissions ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  method      TEXT    NOT NULL,"
        "  url         TEXT    NOT NULL,"
        "  headers     TEXT    NOT NULL,"
        "  body        BLOB    NOT NULL,"
        "  enqueued_at INTEGER NOT NULL,"
        "  attempts    INTEGER NOT NULL DEFAULT 0"
        ");");
}

uint64_t RetryQueue::enqueue(const HttpRequest& request) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        sqlite_prepare(db_,
            "INSERT INTO submissions (method, url, headers, body, enqueued_at) "
            "VALUES (?, ?, ?, ?, ?);", g);

        std::string headers = encode_headers(request.headers);
        sqlite3_bind_text(g.stmt, 1, request.method.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, request.url.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 3, headers.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(g.stmt, 4, request.body.data(),
                          static_cast<int>(request.body.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(g.stmt, 5, static_cast<sqlite3_int64>(epoch_millis()));
        sqlite_step_done(db_, g.stmt);
        id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db_));
    }

    std::cerr << "[queue] Queued " << request.method << " " << request.url
              << " as #" << id << '\n';
    if (bus_) {
        SubmissionQueuedEvent ev;
        ev.submission_id = id;
        ev.url = request.url;
        bus_->publish(ev);
    }
    return id;
}

std::vector<QueuedSubmission> RetryQueue::pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    sqlite_prepare(db_,
        "SELECT id, method, url, headers, body, enqueued_at, attempts "
        "FROM submissions ORDER BY id ASC;", g);

    std::vector<QueuedSubmission> out;
    int rc;
    while ((rc = sqlite3_step(g.stmt)) == SQLITE_ROW) {
        QueuedSubmission s;
        s.id = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 0));
        s.request.method = sqlite_column_string(g.stmt, 1);
        s.request.url = sqlite_column_string(g.stmt, 2);
        s.request.headers = decode_headers(sqlite_column_string(g.stmt, 3));
        s.request.body = sqlite_column_string(g.stmt, 4);
        s.enqueued_at = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 5));
        s.attempts = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 6));
        out.push_back(std::move(s));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("queue: read failed: ") + sqlite3_errmsg(db_));
    }
    return out;
}

size_t RetryQueue::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    sqlite_prepare(db_, "SELECT COUNT(*) FROM submissions;", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError(std::string("queue: count failed: ") + sqlite3_errmsg(db_));
    }
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

void RetryQueue::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    sqlite_prepare(db_, "DELETE FROM submissions WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    sqlite_step_done(db_, g.stmt);
}

void RetryQueue::bump_attempts(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    sqlite_prepare(db_, "UPDATE submissions SET attempts = attempts + 1 WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    sqlite_step_done(db_, g.stmt);
}

ReplayReport RetryQueue::replay_all() {
    ReplayReport report;
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        report.already_running = true;
        return report;
    }
    RunningGuard guard{running_};

    for (const auto& submission : pending()) {
        ++report.attempted;

        HttpResponse resp;
        try {
            resp = http_.send(submission.request, timeout_seconds_);
        } catch (const std::exception& e) {
            std::cerr << "[queue] #" << submission.id << " send failed: " << e.what() << '\n';
            resp.status_code = 0;
        }

        if (is_success(resp.status_code)) {
            remove(submission.id);
            ++report.delivered;
            std::cerr << "[queue] Delivered #" << submission.id << " ("
                      << resp.status_code << ")\n";
            continue;
        }

        // Any other answer leaves the submission at the head of the queue.
        // Order is preserved, so the pass cannot skip past it.
        bump_attempts(submission.id);
        if (resp.status_code == 0 || is_retryable_status(resp.status_code)) {
            std::cerr << "[queue] #" << submission.id << " not delivered ("
                      << (resp.status_code == 0 ? std::string("no connection")
                                                : std::to_string(resp.status_code))
                      << "), stopping replay\n";
        } else {
            report.rejected = true;
            std::cerr << "[queue] #" << submission.id << " " << submission.request.method
                      << " " << submission.request.url << " rejected by server ("
                      << resp.status_code << "), kept for a later replay\n";
        }
        break;
    }

    report.remaining = size();
    if (bus_) {
        QueueReplayedEvent ev;
        ev.delivered = report.delivered;
        ev.rejected = report.rejected;
        ev.remaining = report.remaining;
        bus_->publish(ev);
    }
    return report;
}

} // namespace netstash
