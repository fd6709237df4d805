#include "url.hpp"
#include "util.hpp"

namespace netstash {

static bool is_default_port(const std::string& scheme, const std::string& port) {
    return (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
}

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;

    std::string rest = url;
    auto hash = rest.find('#');
    if (hash != std::string::npos) rest = rest.substr(0, hash);

    size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        result.scheme = to_lower(rest.substr(0, scheme_end));
        size_t host_start = scheme_end + 3;
        size_t path_start = rest.find_first_of("/?", host_start);
        std::string host_port = (path_start == std::string::npos)
            ? rest.substr(host_start)
            : rest.substr(host_start, path_start - host_start);
        rest = (path_start == std::string::npos) ? "" : rest.substr(path_start);

        size_t colon = host_port.rfind(':');
        if (colon != std::string::npos && host_port.find(']', colon) == std::string::npos) {
            result.host = to_lower(host_port.substr(0, colon));
            result.port = host_port.substr(colon + 1);
            if (is_default_port(result.scheme, result.port)) result.port.clear();
        } else {
            result.host = to_lower(host_port);
        }
    }

    auto qpos = rest.find('?');
    if (qpos != std::string::npos) {
        result.query = rest.substr(qpos + 1);
        rest = rest.substr(0, qpos);
    }
    result.path = rest.empty() ? "/" : rest;
    if (result.path[0] != '/') result.path = "/" + result.path;
    return result;
}

std::string url_origin(const ParsedUrl& url) {
    if (url.scheme.empty()) return "";
    std::string origin = url.scheme + "://" + url.host;
    if (!url.port.empty()) origin += ":" + url.port;
    return origin;
}

std::string normalize_url(const std::string& url) {
    ParsedUrl p = parse_url(url);
    std::string out = url_origin(p) + p.path;
    if (!p.query.empty()) out += "?" + p.query;
    return out;
}

std::string resolve_url(const std::string& origin, const std::string& url) {
    if (origin.empty() || url.find("://") != std::string::npos) return url;
    std::string base = origin;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (url.empty() || url[0] != '/') return base + "/" + url;
    return base + url;
}

} // namespace netstash
