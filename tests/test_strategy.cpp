#include <catch2/catch.hpp>
#include "strategy.hpp"
#include "errors.hpp"
#include "request_key.hpp"
#include "store/memory_store.hpp"
#include "util.hpp"
#include "mock_http_client.hpp"
#include <chrono>

using namespace netstash;

static constexpr uint64_t kMinute = 60 * 1000;

static Partition partition(const std::string& name, Strategy strategy,
                           uint64_t max_age_ms, uint32_t max_entries) {
    Partition p;
    p.name = name;
    p.match_rules = {"/"};
    p.strategy = strategy;
    p.max_age_ms = max_age_ms;
    p.max_entries = max_entries;
    return p;
}

static HttpRequest get(const std::string& url) {
    HttpRequest r;
    r.url = url;
    return r;
}

struct StrategyFixture {
    MemoryStore store;
    MockHttpClient http;
    OfflineResponder offline{{{"inventory", "/api/vehicles", FamilyKind::Listing}}, 30};
    TaskRunner tasks;
    StrategyExecutor executor{store, http, offline, tasks};

    ~StrategyFixture() { tasks.wait_idle(); }

    void seed(const std::string& storage, const HttpRequest& req, const std::string& body,
              uint64_t age_ms) {
        CacheEntry e;
        e.url = req.url;
        e.body = body;
        e.headers = {{"Content-Type", "application/json"}};
        e.stored_at = epoch_millis() - age_ms;
        store.put(storage, request_key(req), e);
    }

    std::string cached_body(const std::string& storage, const HttpRequest& req) {
        auto e = store.get(storage, request_key(req));
        return e ? e->body : std::string();
    }
};

// Every call fails, as if the database file went away.
class BrokenStore : public Store {
public:
    std::string backend_name() const override { return "broken"; }
    std::optional<CacheEntry> get(const std::string&, const std::string&) override { fail(); }
    void put(const std::string&, const std::string&, const CacheEntry&) override { fail(); }
    bool delete_partition(const std::string&) override { fail(); }
    bool remove(const std::string&, const std::string&) override { fail(); }
    std::vector<std::string> list_keys(const std::string&) override { fail(); }
    size_t trim(const std::string&, uint32_t) override { fail(); }
    size_t put_bounded(const std::string&, const std::string&, const CacheEntry&,
                       uint32_t) override { fail(); }
    size_t count(const std::string&) override { fail(); }
    std::vector<std::string> list_partitions() override { fail(); }
    std::pair<uint64_t, size_t> sample_bytes(const std::string&, size_t) override { fail(); }
    std::optional<std::string> get_meta(const std::string&) override { fail(); }
    void set_meta(const std::string&, const std::string&) override { fail(); }

private:
    [[noreturn]] static void fail() { throw StoreError("disk I/O error"); }
};

// ── CacheFirst ──────────────────────────────────────────────────

TEST_CASE("CacheFirst: fresh entry served without network", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, 60 * kMinute, 10);
    auto req = get("https://shop.example/app.js");
    f.seed("static-v1", req, "cached", kMinute);

    auto resp = f.executor.execute(p, "static-v1", req);

    REQUIRE(f.http.call_count() == 0);
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "cached");
    REQUIRE(find_header(resp.headers, "x-served-by") == "netstash-cache");
    REQUIRE_FALSE(find_header(resp.headers, "x-cache-date").empty());
    REQUIRE(find_header(resp.headers, "x-offline").empty());
}

TEST_CASE("CacheFirst: stale entry is refreshed from network", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, kMinute, 10);
    auto req = get("https://shop.example/app.js");
    f.seed("static-v1", req, "old", 10 * kMinute);
    f.http.route(req.url, ok_response("new"));

    auto resp = f.executor.execute(p, "static-v1", req);

    REQUIRE(f.http.call_count() == 1);
    REQUIRE(resp.body == "new");
    REQUIRE(find_header(resp.headers, "x-served-by") == "network");
    REQUIRE(f.cached_body("static-v1", req) == "new");
}

TEST_CASE("CacheFirst: network failure falls back to stale entry", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, kMinute, 10);
    auto req = get("https://shop.example/app.js");
    f.seed("static-v1", req, "old", 10 * kMinute);
    f.http.set_offline(true);

    auto resp = f.executor.execute(p, "static-v1", req);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "old");
    REQUIRE(find_header(resp.headers, "x-offline") == "true");
}

TEST_CASE("CacheFirst: miss while offline gives the offline envelope", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, kMinute, 10);
    f.http.set_offline(true);

    auto resp = f.executor.execute(p, "static-v1", get("https://shop.example/app.js"));

    REQUIRE(resp.status_code == 503);
    REQUIRE(is_offline_envelope(resp));
}

TEST_CASE("CacheFirst: non-2xx is passed through and never stored", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, kMinute, 10);
    auto req = get("https://shop.example/missing.js");
    f.http.route(req.url, status_response(404, "not found"));

    auto resp = f.executor.execute(p, "static-v1", req);

    REQUIRE(resp.status_code == 404);
    REQUIRE(resp.body == "not found");
    REQUIRE(f.store.count("static-v1") == 0);
}

TEST_CASE("CacheFirst: server error prefers the cached entry", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, kMinute, 10);
    auto req = get("https://shop.example/app.js");
    f.seed("static-v1", req, "old", 10 * kMinute);
    f.http.route(req.url, status_response(500));

    auto resp = f.executor.execute(p, "static-v1", req);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "old");
}

TEST_CASE("CacheFirst: sixth key evicts the oldest", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, 0, 5);

    for (int i = 0; i < 6; i++) {
        f.executor.execute(p, "static-v1", get("https://shop.example/" + std::to_string(i) + ".js"));
    }

    REQUIRE(f.store.count("static-v1") == 5);
    REQUIRE(f.cached_body("static-v1", get("https://shop.example/0.js")).empty());
    REQUIRE_FALSE(f.cached_body("static-v1", get("https://shop.example/5.js")).empty());
}

TEST_CASE("CacheFirst: HEAD is answered from cache without a body", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, 0, 10);
    auto req = get("https://shop.example/app.js");
    f.seed("static-v1", req, "body", 0);

    HttpRequest head = req;
    head.method = "HEAD";
    auto resp = f.executor.execute(p, "static-v1", head);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body.empty());
    REQUIRE(f.http.call_count() == 0);
}

// ── NetworkFirst ────────────────────────────────────────────────

TEST_CASE("NetworkFirst: network success is stored", "[strategy]") {
    StrategyFixture f;
    auto p = partition("api", Strategy::NetworkFirst, 5 * kMinute, 30);
    auto req = get("https://shop.example/api/vehicles");
    f.http.route(req.url, ok_response("{\"items\":[1]}"));

    auto resp = f.executor.execute(p, "api-v1", req);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "{\"items\":[1]}");
    REQUIRE(find_header(resp.headers, "x-served-by") == "network");
    REQUIRE(f.cached_body("api-v1", req) == "{\"items\":[1]}");
}

TEST_CASE("NetworkFirst: offline with a 10-minute-old entry serves it", "[strategy]") {
    StrategyFixture f;
    auto p = partition("api", Strategy::NetworkFirst, 5 * kMinute, 30);
    p.network_timeout_ms = 3000;
    auto req = get("https://shop.example/inventory");
    f.seed("api-v1", req, "stale inventory", 10 * kMinute);
    f.http.set_offline(true);

    auto resp = f.executor.execute(p, "api-v1", req);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "stale inventory");
    REQUIRE(find_header(resp.headers, "x-offline") == "true");
}

TEST_CASE("NetworkFirst: timeout returns stored entry, loser still stores", "[strategy]") {
    StrategyFixture f;
    auto p = partition("api", Strategy::NetworkFirst, 5 * kMinute, 30);
    p.network_timeout_ms = 50;
    auto req = get("https://shop.example/api/vehicles");
    f.seed("api-v1", req, "stored", 10 * kMinute);
    f.http.route(req.url, ok_response("late"));
    f.http.set_delay(std::chrono::milliseconds(300));

    auto start = std::chrono::steady_clock::now();
    auto resp = f.executor.execute(p, "api-v1", req);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(resp.body == "stored");
    REQUIRE(elapsed < std::chrono::milliseconds(250));

    f.tasks.wait_idle();
    REQUIRE(f.cached_body("api-v1", req) == "late");
}

TEST_CASE("NetworkFirst: timeout with empty store gives the envelope", "[strategy]") {
    StrategyFixture f;
    auto p = partition("api", Strategy::NetworkFirst, 5 * kMinute, 30);
    p.network_timeout_ms = 30;
    f.http.set_delay(std::chrono::milliseconds(200));

    auto resp = f.executor.execute(p, "api-v1", get("https://shop.example/api/vehicles"));

    REQUIRE(resp.status_code == 503);
    REQUIRE(find_header(resp.headers, "x-api-type") == "inventory");
}

TEST_CASE("NetworkFirst: server error uses the cached entry", "[strategy]") {
    StrategyFixture f;
    auto p = partition("api", Strategy::NetworkFirst, 5 * kMinute, 30);
    auto req = get("https://shop.example/api/vehicles");
    f.seed("api-v1", req, "cached", kMinute);
    f.http.route(req.url, status_response(502));

    auto resp = f.executor.execute(p, "api-v1", req);

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "cached");
}

// ── StaleWhileRevalidate ────────────────────────────────────────

TEST_CASE("StaleWhileRevalidate: cached entry returned, refreshed later", "[strategy]") {
    StrategyFixture f;
    auto p = partition("pages", Strategy::StaleWhileRevalidate, kMinute, 50);
    auto req = get("https://shop.example/about");
    f.seed("pages-v1", req, "old page", 10 * kMinute);
    f.http.route(req.url, ok_response("new page"));

    auto resp = f.executor.execute(p, "pages-v1", req);
    REQUIRE(resp.body == "old page");
    REQUIRE(find_header(resp.headers, "x-served-by") == "netstash-cache");

    f.tasks.wait_idle();
    REQUIRE(f.http.calls_for(req.url) == 1);
    REQUIRE(f.cached_body("pages-v1", req) == "new page");
}

TEST_CASE("StaleWhileRevalidate: failed refresh keeps the entry", "[strategy]") {
    StrategyFixture f;
    auto p = partition("pages", Strategy::StaleWhileRevalidate, kMinute, 50);
    auto req = get("https://shop.example/about");
    f.seed("pages-v1", req, "old page", 10 * kMinute);
    f.http.set_offline(true);

    auto resp = f.executor.execute(p, "pages-v1", req);
    f.tasks.wait_idle();

    REQUIRE(resp.body == "old page");
    REQUIRE(f.cached_body("pages-v1", req) == "old page");
}

TEST_CASE("StaleWhileRevalidate: miss goes to the network", "[strategy]") {
    StrategyFixture f;
    auto p = partition("pages", Strategy::StaleWhileRevalidate, kMinute, 50);
    auto req = get("https://shop.example/about");

    auto resp = f.executor.execute(p, "pages-v1", req);

    REQUIRE(resp.body == "network:" + req.url);
    REQUIRE(f.cached_body("pages-v1", req) == resp.body);
}

// ── Store failures ──────────────────────────────────────────────

TEST_CASE("StrategyExecutor: broken store degrades to network only", "[strategy]") {
    BrokenStore store;
    MockHttpClient http;
    OfflineResponder offline;
    TaskRunner tasks;
    StrategyExecutor executor(store, http, offline, tasks);

    auto p = partition("static", Strategy::CacheFirst, 0, 5);
    auto resp = executor.execute(p, "static-v1", get("https://shop.example/app.js"));

    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "network:https://shop.example/app.js");
    tasks.wait_idle();
}

// ── prefetch ────────────────────────────────────────────────────

TEST_CASE("StrategyExecutor: prefetch stores only successes", "[strategy]") {
    StrategyFixture f;
    auto p = partition("static", Strategy::CacheFirst, 0, 5);
    f.http.route("https://shop.example/gone", status_response(404));

    REQUIRE(f.executor.prefetch(p, "static-v1", get("https://shop.example/ok")));
    REQUIRE_FALSE(f.executor.prefetch(p, "static-v1", get("https://shop.example/gone")));
    REQUIRE(f.store.count("static-v1") == 1);
}
