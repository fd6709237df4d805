#include <catch2/catch.hpp>
#include "request_key.hpp"

using namespace netstash;

static HttpRequest get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

TEST_CASE("sha256_hex: known digest", "[request_key]") {
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("request_key: deterministic and hex encoded", "[request_key]") {
    auto a = request_key(get("https://shop.example/api/vehicles"));
    auto b = request_key(get("https://shop.example/api/vehicles"));
    REQUIRE(a == b);
    REQUIRE(a.size() == 64);
}

TEST_CASE("request_key: normalized URL spellings share a key", "[request_key]") {
    REQUIRE(request_key(get("HTTPS://SHOP.example:443/a#x")) ==
            request_key(get("https://shop.example/a")));
}

TEST_CASE("request_key: query distinguishes requests", "[request_key]") {
    REQUIRE(request_key(get("https://shop.example/a?page=1")) !=
            request_key(get("https://shop.example/a?page=2")));
}

TEST_CASE("request_key: HEAD shares identity with GET", "[request_key]") {
    auto head = get("https://shop.example/a");
    head.method = "HEAD";
    REQUIRE(request_key(head) == request_key(get("https://shop.example/a")));

    auto post = get("https://shop.example/a");
    post.method = "POST";
    REQUIRE(request_key(post) != request_key(get("https://shop.example/a")));
}

TEST_CASE("request_key: vary headers participate, others do not", "[request_key]") {
    auto en = get("https://shop.example/a");
    en.headers = {{"Accept-Language", "en"}};
    auto fi = get("https://shop.example/a");
    fi.headers = {{"accept-language", "fi"}};
    REQUIRE(request_key(en) != request_key(fi));

    auto traced = get("https://shop.example/a");
    traced.headers = {{"X-Trace-Id", "123"}};
    REQUIRE(request_key(traced) == request_key(get("https://shop.example/a")));
}

TEST_CASE("request_key: custom vary list", "[request_key]") {
    auto a = get("https://shop.example/a");
    a.headers = {{"Authorization", "one"}};
    auto b = get("https://shop.example/a");
    b.headers = {{"Authorization", "two"}};
    REQUIRE(request_key(a) == request_key(b));
    REQUIRE(request_key(a, {"authorization"}) != request_key(b, {"authorization"}));
}
