#pragma once
#include "http.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace netstash {

enum class FamilyKind { Listing, Submission };

// A group of endpoints whose callers understand a richer offline envelope.
struct EndpointFamily {
    std::string name;        // reported in x-api-type
    std::string path_prefix; // e.g. "/api/vehicles"
    FamilyKind kind = FamilyKind::Listing;
};

// "listing" / "submission"; throws ConfigError for anything else.
FamilyKind family_kind_from_string(const std::string& s);
std::string family_kind_to_string(FamilyKind kind);

// True for replies produced by OfflineResponder (x-served-by marker).
bool is_offline_envelope(const HttpResponse& response);

// Synthesizes machine-readable replies for requests nothing else could
// satisfy. Every method is noexcept in spirit: a failure while building
// the rich envelope degrades to a fixed literal body.
class OfflineResponder {
public:
    explicit OfflineResponder(std::vector<EndpointFamily> families = {},
                              uint32_t retry_after_seconds = 30);

    // 503 envelope, content-aware for known families.
    HttpResponse build_fallback(const HttpRequest& request) const;

    // 202 envelope telling the caller the submission was queued for replay.
    HttpResponse build_queued(const HttpRequest& request, uint64_t submission_id) const;

    // Family whose prefix matches the request path, or nullptr.
    const EndpointFamily* family_for(const HttpRequest& request) const;

    uint32_t retry_after_seconds() const { return retry_after_seconds_; }

private:
    std::vector<EndpointFamily> families_;
    uint32_t retry_after_seconds_;
};

} // namespace netstash
