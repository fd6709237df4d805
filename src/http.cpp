#include "http.hpp"
#include "util.hpp"

#include <curl/curl.h>
#include <string>

namespace netstash {

static const std::atomic<bool>* g_http_abort_flag = nullptr;

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_http_abort_flag = flag;
}

std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    std::string wanted = to_lower(name);
    for (const auto& h : headers) {
        if (to_lower(h.first) == wanted) return h.second;
    }
    return "";
}

void set_header(std::vector<Header>& headers, const std::string& name,
                const std::string& value) {
    std::string wanted = to_lower(name);
    for (auto& h : headers) {
        if (to_lower(h.first) == wanted) {
            h.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

bool is_safe_method(const std::string& method) {
    return method == "GET" || method == "HEAD" || method == "OPTIONS";
}

bool is_navigation(const HttpRequest& request) {
    if (request.method != "GET") return false;
    return to_lower(find_header(request.headers, "Accept")).find("text/html")
           != std::string::npos;
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int abort_progress_cb(void* /*clientp*/,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    if (g_http_abort_flag && g_http_abort_flag->load(std::memory_order_relaxed))
        return 1;
    return 0;
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Collects "Name: value" lines. A new status line (redirects, 100-continue)
// resets what was gathered so only the final response's headers remain.
static size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* headers = static_cast<std::vector<Header>*>(userdata);
    std::string line(ptr, total);

    if (line.rfind("HTTP/", 0) == 0) {
        headers->clear();
        return total;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        headers->emplace_back(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return total;
}

// ── RAII curl handle ──────────────────────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static void apply_method(CURL* curl, const HttpRequest& request) {
    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        return;
    }
    if (request.method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        return;
    }
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    if (!request.body.empty() || request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }
}

HttpResponse CurlHttpClient::send(const HttpRequest& request, long timeout_seconds) {
    CurlRequest req;
    if (!req) return {};

    for (const auto& h : request.headers) {
        std::string entry = h.first + ": " + h.second;
        req.hlist = curl_slist_append(req.hlist, entry.c_str());
    }

    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(req.curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(req.curl, CURLOPT_HEADERDATA, &response.headers);
    if (g_http_abort_flag) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, abort_progress_cb);
    }
    apply_method(req.curl, request);

    CURLcode res = curl_easy_perform(req.curl);
    if (res != CURLE_OK) return {};
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace netstash
