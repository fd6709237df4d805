#pragma once
#include <string>
#include <vector>
#include <utility>
#include <atomic>

namespace netstash {

// Initialize HTTP subsystem (call once at startup).
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

// Set a global abort flag checked by all in-flight transfers (~1s granularity).
// When the flag becomes true, in-flight HTTP requests abort promptly.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<Header> headers;
    std::string body;
};

struct HttpResponse {
    long status_code = 0; // 0 = transport failure, nothing was received
    std::vector<Header> headers;
    std::string body;
};

// Case-insensitive header lookup. Returns "" when absent.
std::string find_header(const std::vector<Header>& headers, const std::string& name);

// Replace (or append) a header, matching names case-insensitively.
void set_header(std::vector<Header>& headers, const std::string& name,
                const std::string& value);

// GET, HEAD and OPTIONS: never mutate server state, eligible for caching.
bool is_safe_method(const std::string& method);

// Accept header asks for an HTML document.
bool is_navigation(const HttpRequest& request);

inline bool is_success(long status_code) {
    return status_code >= 200 && status_code < 300;
}

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request,
                              long timeout_seconds = 30) = 0;
};

// libcurl-backed client. Thread-safe: each call owns its easy handle.
class CurlHttpClient : public HttpClient {
public:
    HttpResponse send(const HttpRequest& request,
                      long timeout_seconds = 30) override;
};

} // namespace netstash
