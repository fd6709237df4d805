#pragma once
#include <string>

namespace netstash {

struct ParsedUrl {
    std::string scheme; // lowercased, empty for relative URLs
    std::string host;   // lowercased
    std::string port;   // empty when the scheme default applies
    std::string path;   // always starts with '/'
    std::string query;  // without the leading '?'
};

// Split an absolute ("https://host:port/path?q") or origin-relative
// ("/path?q") URL. Fragments are dropped. Never throws.
ParsedUrl parse_url(const std::string& url);

// "scheme://host[:port]" or "" for relative URLs. Default ports are elided.
std::string url_origin(const ParsedUrl& url);

// Canonical form used for request identity: lowercased scheme and host,
// default port removed, fragment dropped, path and query kept verbatim.
std::string normalize_url(const std::string& url);

// Resolve an origin-relative URL against an origin ("https://example.com").
// Absolute URLs and an empty origin return the input unchanged.
std::string resolve_url(const std::string& origin, const std::string& url);

} // namespace netstash
