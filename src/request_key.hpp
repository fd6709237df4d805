#pragma once
#include "http.hpp"
#include <string>
#include <vector>

namespace netstash {

// Request headers whose values take part in request identity.
const std::vector<std::string>& default_vary_headers();

// Deterministic identity of a request: SHA-256 (hex) over the method, the
// normalized URL and the values of the vary headers, each field separated
// so that ("a", "bc") and ("ab", "c") never collide.
std::string request_key(const HttpRequest& request,
                        const std::vector<std::string>& vary_headers = default_vary_headers());

std::string sha256_hex(const std::string& data);

} // namespace netstash
