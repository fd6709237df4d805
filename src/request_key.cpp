#include "request_key.hpp"
#include "url.hpp"
#include "util.hpp"

#include <openssl/sha.h>

namespace netstash {

const std::vector<std::string>& default_vary_headers() {
    static const std::vector<std::string> headers = {"accept-encoding", "accept-language"};
    return headers;
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char byte : hash) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0f]);
    }
    return out;
}

std::string request_key(const HttpRequest& request,
                        const std::vector<std::string>& vary_headers) {
    // HEAD shares identity with GET: both address the same representation.
    std::string method = request.method == "HEAD" ? "GET" : request.method;

    std::string material = method;
    material += '\x01';
    material += normalize_url(request.url);
    for (const auto& name : vary_headers) {
        material += '\x01';
        material += to_lower(name);
        material += '=';
        material += find_header(request.headers, name);
    }
    return sha256_hex(material);
}

} // namespace netstash
