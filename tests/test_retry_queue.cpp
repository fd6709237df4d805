#include <catch2/catch.hpp>
#include "retry_queue.hpp"
#include "event_bus.hpp"
#include "mock_http_client.hpp"
#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace netstash;

static std::string queue_test_path() {
    return "/tmp/netstash_test_queue_" + std::to_string(getpid()) + ".db";
}

static void remove_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

struct QueueFixture {
    std::string path = queue_test_path();
    MockHttpClient http;
    RetryQueue queue{path, http};

    ~QueueFixture() { remove_db(path); }
};

static HttpRequest post(const std::string& url, const std::string& body) {
    HttpRequest r;
    r.method = "POST";
    r.url = url;
    r.headers = {{"Content-Type", "application/json"}};
    r.body = body;
    return r;
}

// ── enqueue / pending ───────────────────────────────────────────

TEST_CASE("RetryQueue: enqueue assigns increasing ids", "[retry_queue]") {
    QueueFixture f;
    auto a = f.queue.enqueue(post("https://shop.example/api/contact", "{\"n\":1}"));
    auto b = f.queue.enqueue(post("https://shop.example/api/contact", "{\"n\":2}"));

    REQUIRE(b > a);
    REQUIRE(f.queue.size() == 2);

    auto pending = f.queue.pending();
    REQUIRE(pending.size() == 2);
    REQUIRE(pending[0].id == a);
    REQUIRE(pending[0].request.method == "POST");
    REQUIRE(pending[0].request.body == "{\"n\":1}");
    REQUIRE(find_header(pending[0].request.headers, "content-type") == "application/json");
    REQUIRE(pending[0].attempts == 0);
}

TEST_CASE("RetryQueue: submissions survive reopen", "[retry_queue]") {
    std::string path = queue_test_path() + ".reopen";
    MockHttpClient http;
    {
        RetryQueue queue(path, http);
        queue.enqueue(post("https://shop.example/api/contact", "kept"));
    }
    {
        RetryQueue queue(path, http);
        REQUIRE(queue.size() == 1);
        REQUIRE(queue.pending()[0].request.body == "kept");
    }
    remove_db(path);
}

// ── replay ──────────────────────────────────────────────────────

TEST_CASE("RetryQueue: replay delivers in enqueue order", "[retry_queue]") {
    QueueFixture f;
    f.queue.enqueue(post("https://shop.example/api/contact", "A"));
    f.queue.enqueue(post("https://shop.example/api/contact", "B"));

    auto report = f.queue.replay_all();

    REQUIRE(report.attempted == 2);
    REQUIRE(report.delivered == 2);
    REQUIRE(report.remaining == 0);
    auto calls = f.http.calls();
    REQUIRE(calls.size() == 2);
    REQUIRE(calls[0].body == "A");
    REQUIRE(calls[1].body == "B");
}

TEST_CASE("RetryQueue: connectivity failure stops without skipping", "[retry_queue]") {
    QueueFixture f;
    f.queue.enqueue(post("https://shop.example/api/contact", "A"));
    f.queue.enqueue(post("https://shop.example/api/contact", "B"));
    f.http.set_offline(true);

    auto report = f.queue.replay_all();

    REQUIRE(report.attempted == 1);
    REQUIRE(report.delivered == 0);
    REQUIRE(report.remaining == 2);
    auto pending = f.queue.pending();
    REQUIRE(pending[0].attempts == 1);
    REQUIRE(pending[1].attempts == 0);
}

TEST_CASE("RetryQueue: retryable status stops the pass", "[retry_queue]") {
    QueueFixture f;
    f.queue.enqueue(post("https://shop.example/api/contact", "A"));
    f.queue.enqueue(post("https://shop.example/api/contact", "B"));
    f.http.queue_response(status_response(503));

    auto report = f.queue.replay_all();

    REQUIRE(report.delivered == 0);
    REQUIRE(report.remaining == 2);
    REQUIRE(f.http.call_count() == 1);
}

TEST_CASE("RetryQueue: final 4xx keeps the submission and stops", "[retry_queue]") {
    QueueFixture f;
    f.queue.enqueue(post("https://shop.example/api/contact", "bad"));
    f.queue.enqueue(post("https://shop.example/api/contact", "good"));
    f.http.queue_response(status_response(422, "{\"error\":\"invalid email\"}"));

    auto report = f.queue.replay_all();

    REQUIRE(report.rejected);
    REQUIRE(report.delivered == 0);
    REQUIRE(report.remaining == 2);
    REQUIRE(f.http.call_count() == 1);
    auto pending = f.queue.pending();
    REQUIRE(pending[0].request.body == "bad");
    REQUIRE(pending[0].attempts == 1);

    // Once the server accepts it, both go out in order.
    auto second = f.queue.replay_all();
    REQUIRE_FALSE(second.rejected);
    REQUIRE(second.delivered == 2);
    REQUIRE(f.queue.size() == 0);
    auto calls = f.http.calls();
    REQUIRE(calls.size() == 3);
    REQUIRE(calls[1].body == "bad");
    REQUIRE(calls[2].body == "good");
}

TEST_CASE("RetryQueue: delivered exactly once across passes", "[retry_queue]") {
    QueueFixture f;
    f.queue.enqueue(post("https://shop.example/api/contact", "once"));

    f.queue.replay_all();
    f.queue.replay_all();

    REQUIRE(f.http.call_count() == 1);
    REQUIRE(f.queue.size() == 0);
}

TEST_CASE("RetryQueue: concurrent replays match a single replay", "[retry_queue]") {
    QueueFixture f;
    for (int i = 0; i < 3; i++) {
        f.queue.enqueue(post("https://shop.example/api/contact", std::to_string(i)));
    }
    f.http.set_delay(std::chrono::milliseconds(20));

    ReplayReport r1, r2;
    std::thread t1([&]() { r1 = f.queue.replay_all(); });
    std::thread t2([&]() { r2 = f.queue.replay_all(); });
    t1.join();
    t2.join();

    REQUIRE(f.queue.size() == 0);
    REQUIRE(f.http.call_count() == 3);
    REQUIRE(r1.delivered + r2.delivered == 3);
}

TEST_CASE("RetryQueue: publishes queue events", "[retry_queue]") {
    QueueFixture f;
    EventBus bus;
    f.queue.set_event_bus(&bus);

    uint64_t queued_id = 0;
    size_t delivered = 0;
    subscribe<SubmissionQueuedEvent>(bus, [&](const SubmissionQueuedEvent& ev) {
        queued_id = ev.submission_id;
    });
    subscribe<QueueReplayedEvent>(bus, [&](const QueueReplayedEvent& ev) {
        delivered = ev.delivered;
    });

    auto id = f.queue.enqueue(post("https://shop.example/api/contact", "x"));
    f.queue.replay_all();

    REQUIRE(queued_id == id);
    REQUIRE(delivered == 1);
}

TEST_CASE("is_retryable_status", "[retry_queue]") {
    REQUIRE(is_retryable_status(408));
    REQUIRE(is_retryable_status(429));
    REQUIRE(is_retryable_status(500));
    REQUIRE(is_retryable_status(503));
    REQUIRE_FALSE(is_retryable_status(400));
    REQUIRE_FALSE(is_retryable_status(404));
    REQUIRE_FALSE(is_retryable_status(422));
}
