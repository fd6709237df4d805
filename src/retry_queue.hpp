#pragma once
#include "http.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3; // forward declare

namespace netstash {

class EventBus;

struct QueuedSubmission {
    uint64_t id = 0;
    HttpRequest request;
    uint64_t enqueued_at = 0; // epoch milliseconds
    uint32_t attempts = 0;
};

struct ReplayReport {
    size_t attempted = 0;
    size_t delivered = 0;
    size_t remaining = 0;
    bool rejected = false;   // head submission answered with a final 4xx
    bool already_running = false;
};

// 408, 429 and 5xx: the server may accept the same submission later.
bool is_retryable_status(long status_code);

// Durable FIFO of mutating requests that could not reach the network.
// Backed by its own SQLite database so submissions survive restart.
class RetryQueue {
public:
    // Throws StoreError when the database cannot be opened.
    RetryQueue(const std::string& path, HttpClient& http, long timeout_seconds = 30);
    ~RetryQueue();

    RetryQueue(const RetryQueue&) = delete;
    RetryQueue& operator=(const RetryQueue&) = delete;

    void set_event_bus(EventBus* bus) { bus_ = bus; }

    // Persist before returning. Throws StoreError on failure.
    uint64_t enqueue(const HttpRequest& request);

    // Oldest first.
    std::vector<QueuedSubmission> pending();
    size_t size();

    // Deliver queued submissions in enqueue order. Only a 2xx removes a
    // submission; any other outcome stops the pass without skipping ahead.
    // A second caller while a pass is running returns already_running.
    ReplayReport replay_all();

    bool replay_running() const { return running_.load(); }

private:
    void init_schema();
    void remove(uint64_t id);
    void bump_attempts(uint64_t id);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
    HttpClient& http_;
    long timeout_seconds_;
    EventBus* bus_ = nullptr;
    std::atomic<bool> running_{false};
};

} // namespace netstash
