#include <catch2/catch.hpp>
#include "router.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "request_key.hpp"
#include "retry_queue.hpp"
#include "store/memory_store.hpp"
#include "mock_http_client.hpp"
#include <nlohmann/json.hpp>

using namespace netstash;
using json = nlohmann::json;

static const std::string kOrigin = "https://shop.example";

static Partition make_partition(const std::string& name, const std::string& rule,
                                Strategy strategy) {
    Partition p;
    p.name = name;
    p.match_rules = {rule};
    p.strategy = strategy;
    p.max_entries = 20;
    p.network_timeout_ms = 500;
    return p;
}

static Config router_config() {
    Config cfg;
    cfg.origin = kOrigin;
    cfg.cache_prefix = "shop";
    cfg.partitions = {make_partition("static", "\\.css$", Strategy::CacheFirst),
                      make_partition("api", "^/api/vehicles", Strategy::NetworkFirst),
                      make_partition("pages", "^/vehicles", Strategy::StaleWhileRevalidate)};
    cfg.queue_rules = {"^/api/contact"};
    cfg.offline.families = {{"inventory", "/api/vehicles", FamilyKind::Listing},
                            {"contact", "/api/contact", FamilyKind::Submission}};
    return cfg;
}

struct RouterFixture {
    Config config = router_config();
    PartitionRegistry registry{config.origin};
    MemoryStore store;
    MockHttpClient http;
    OfflineResponder offline{config.offline.families};
    TaskRunner tasks;
    StrategyExecutor executor{store, http, offline, tasks};
    Lifecycle lifecycle{config, registry, store, executor};
    RetryQueue queue{":memory:", http};
    Router router{config, registry, executor, lifecycle, offline, http, &queue};

    RouterFixture() {
        for (const auto& p : config.partitions) registry.register_partition(p);
    }

    ~RouterFixture() { tasks.wait_idle(); }

    void seed(const std::string& partition, const std::string& path, const std::string& body) {
        HttpRequest req;
        req.url = kOrigin + path;
        CacheEntry e;
        e.request_key = request_key(req);
        e.url = req.url;
        e.headers = {{"Content-Type", "text/html"}};
        e.body = body;
        store.put(lifecycle.storage_for(partition), e.request_key, e);
    }
};

static HttpRequest get(const std::string& path) {
    HttpRequest req;
    req.url = kOrigin + path;
    return req;
}

static HttpRequest navigate(const std::string& path) {
    HttpRequest req = get(path);
    req.headers = {{"Accept", "text/html,application/xhtml+xml"}};
    return req;
}

static HttpRequest post(const std::string& path, const std::string& body) {
    HttpRequest req;
    req.method = "POST";
    req.url = kOrigin + path;
    req.headers = {{"Content-Type", "application/json"}};
    req.body = body;
    return req;
}

// ── Partition dispatch ──────────────────────────────────────────

TEST_CASE("Router: matching partition serves from cache after first fetch", "[router]") {
    RouterFixture f;
    auto first = f.router.handle(get("/app.css"));
    auto second = f.router.handle(get("/app.css"));

    REQUIRE(first.status_code == 200);
    REQUIRE(find_header(second.headers, "x-served-by") == "netstash-cache");
    REQUIRE(second.body == first.body);
    REQUIRE(f.http.calls_for(kOrigin + "/app.css") == 1);
}

TEST_CASE("Router: network-first partition falls back to cache offline", "[router]") {
    RouterFixture f;
    f.router.handle(get("/api/vehicles?page=1"));
    f.http.set_offline(true);

    auto resp = f.router.handle(get("/api/vehicles?page=1"));
    REQUIRE(resp.status_code == 200);
    REQUIRE(find_header(resp.headers, "x-offline") == "true");
    REQUIRE(resp.body == "network:" + kOrigin + "/api/vehicles?page=1");
}

TEST_CASE("Router: uncached listing offline gets the listing envelope", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);

    auto resp = f.router.handle(get("/api/vehicles?make=volvo"));
    REQUIRE(resp.status_code == 503);
    REQUIRE(find_header(resp.headers, "x-api-type") == "inventory");
    auto body = json::parse(resp.body);
    REQUIRE(body["items"].empty());
    REQUIRE(body["offline"] == true);
}

// ── Navigation ──────────────────────────────────────────────────

TEST_CASE("Router: navigation online goes to the network", "[router]") {
    RouterFixture f;
    auto resp = f.router.handle(navigate("/contact"));
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "network:" + kOrigin + "/contact");
}

TEST_CASE("Router: navigation offline serves the cached offline page", "[router]") {
    RouterFixture f;
    f.seed("static", "/offline", "<h1>You are offline</h1>");
    f.http.set_offline(true);

    auto resp = f.router.handle(navigate("/contact"));
    REQUIRE(resp.status_code == 200);
    REQUIRE(resp.body == "<h1>You are offline</h1>");
    REQUIRE(find_header(resp.headers, "x-offline") == "true");
}

TEST_CASE("Router: navigation offline prefers the cached page itself", "[router]") {
    RouterFixture f;
    f.seed("static", "/offline", "offline page");
    f.router.handle(navigate("/contact"));
    f.http.set_offline(true);

    auto resp = f.router.handle(navigate("/contact"));
    REQUIRE(resp.body == "network:" + kOrigin + "/contact");
}

TEST_CASE("Router: navigation matching a partition uses that partition", "[router]") {
    RouterFixture f;
    f.seed("pages", "/vehicles/7", "cached vehicle");

    auto resp = f.router.handle(navigate("/vehicles/7"));
    REQUIRE(resp.body == "cached vehicle");
    REQUIRE(find_header(resp.headers, "x-served-by") == "netstash-cache");
}

TEST_CASE("Router: partition miss offline during navigation gets offline page", "[router]") {
    RouterFixture f;
    f.seed("static", "/offline", "offline page");
    f.http.set_offline(true);

    auto resp = f.router.handle(navigate("/vehicles/99"));
    REQUIRE(resp.body == "offline page");
}

TEST_CASE("Router: navigation offline without offline page gets envelope", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);

    auto resp = f.router.handle(navigate("/contact"));
    REQUIRE(resp.status_code == 503);
    REQUIRE(is_offline_envelope(resp));
}

// ── Passthrough ─────────────────────────────────────────────────

TEST_CASE("Router: unmatched request passes straight through", "[router]") {
    RouterFixture f;
    f.http.route(kOrigin + "/robots.txt", status_response(404, "nope"));

    auto resp = f.router.handle(get("/robots.txt"));
    REQUIRE(resp.status_code == 404);
    REQUIRE(resp.body == "nope");
    REQUIRE(f.store.list_partitions().empty());
}

TEST_CASE("Router: unmatched request offline gets generic envelope", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);

    auto resp = f.router.handle(get("/robots.txt"));
    REQUIRE(resp.status_code == 503);
    REQUIRE(is_offline_envelope(resp));
    REQUIRE(find_header(resp.headers, "x-api-type").empty());
}

// ── Mutations ───────────────────────────────────────────────────

TEST_CASE("Router: queueable POST offline is queued", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);

    auto resp = f.router.handle(post("/api/contact", R"({"name":"Ada"})"));
    REQUIRE(resp.status_code == 202);
    auto body = json::parse(resp.body);
    REQUIRE(body["queued"] == true);
    REQUIRE(body["submissionId"] == 1);
    REQUIRE(f.queue.size() == 1);
    REQUIRE(f.queue.pending()[0].request.body == R"({"name":"Ada"})");
}

TEST_CASE("Router: queued POST is delivered exactly once after reconnect", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);
    f.router.handle(post("/api/contact", R"({"name":"Ada"})"));

    f.http.set_offline(false);
    auto first = f.queue.replay_all();
    auto second = f.queue.replay_all();

    REQUIRE(first.delivered == 1);
    REQUIRE(second.attempted == 0);
    REQUIRE(f.queue.size() == 0);
    // One failed attempt while offline, one successful delivery.
    REQUIRE(f.http.calls_for(kOrigin + "/api/contact") == 2);
}

TEST_CASE("Router: queueable POST online goes through untouched", "[router]") {
    RouterFixture f;
    f.http.route(kOrigin + "/api/contact", status_response(201, R"({"ok":true})"));

    auto resp = f.router.handle(post("/api/contact", "{}"));
    REQUIRE(resp.status_code == 201);
    REQUIRE(f.queue.size() == 0);
}

TEST_CASE("Router: server errors on mutations are not queued", "[router]") {
    RouterFixture f;
    f.http.route(kOrigin + "/api/contact", status_response(500));

    auto resp = f.router.handle(post("/api/contact", "{}"));
    REQUIRE(resp.status_code == 500);
    REQUIRE(f.queue.size() == 0);
}

TEST_CASE("Router: non-queueable POST offline gets envelope", "[router]") {
    RouterFixture f;
    f.http.set_offline(true);

    auto resp = f.router.handle(post("/api/orders", "{}"));
    REQUIRE(resp.status_code == 503);
    REQUIRE(f.queue.size() == 0);
}

TEST_CASE("Router: mutations never touch the cache", "[router]") {
    RouterFixture f;
    f.router.handle(post("/api/vehicles", "{}"));
    REQUIRE(f.store.list_partitions().empty());
}

TEST_CASE("Router: is_queueable checks method and path", "[router]") {
    RouterFixture f;
    REQUIRE(f.router.is_queueable(post("/api/contact", "")));
    REQUIRE(f.router.is_queueable(post("/api/contact/dealer", "")));
    REQUIRE_FALSE(f.router.is_queueable(post("/api/orders", "")));
    REQUIRE_FALSE(f.router.is_queueable(get("/api/contact")));
}

TEST_CASE("Router: invalid queue rule is a config error", "[router]") {
    RouterFixture f;
    Config bad = f.config;
    bad.queue_rules = {"^/api/(contact"};
    REQUIRE_THROWS_AS(Router(bad, f.registry, f.executor, f.lifecycle, f.offline, f.http),
                      ConfigError);
}
