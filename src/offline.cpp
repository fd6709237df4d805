#include "offline.hpp"
#include "errors.hpp"
#include "url.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace netstash {

using json = nlohmann::json;

FamilyKind family_kind_from_string(const std::string& s) {
    if (s == "listing")    return FamilyKind::Listing;
    if (s == "submission") return FamilyKind::Submission;
    throw ConfigError("Unknown endpoint family kind: " + s);
}

std::string family_kind_to_string(FamilyKind kind) {
    return kind == FamilyKind::Submission ? "submission" : "listing";
}

static const char* kServedBy = "netstash-offline";

bool is_offline_envelope(const HttpResponse& response) {
    return find_header(response.headers, "x-served-by") == kServedBy;
}

static const char* kLastResortBody =
    "{\"ok\":false,\"offline\":true,\"error\":\"Offline\","
    "\"message\":\"Resource not available offline\",\"retryAfterSeconds\":30}";

static HttpResponse envelope(long status, const std::string& body,
                             uint32_t retry_after, const EndpointFamily* family) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = body;
    resp.headers = {
        {"Content-Type", "application/json"},
        {"Cache-Control", "no-cache"},
        {"Retry-After", std::to_string(retry_after)},
        {"x-served-by", kServedBy},
        {"x-offline", "true"},
    };
    if (family) resp.headers.emplace_back("x-api-type", family->name);
    return resp;
}

OfflineResponder::OfflineResponder(std::vector<EndpointFamily> families,
                                   uint32_t retry_after_seconds)
    : families_(std::move(families)), retry_after_seconds_(retry_after_seconds) {}

const EndpointFamily* OfflineResponder::family_for(const HttpRequest& request) const {
    std::string path = parse_url(request.url).path;
    for (const auto& family : families_) {
        if (!family.path_prefix.empty() && path.rfind(family.path_prefix, 0) == 0) {
            return &family;
        }
    }
    return nullptr;
}

HttpResponse OfflineResponder::build_fallback(const HttpRequest& request) const {
    const EndpointFamily* family = nullptr;
    try {
        family = family_for(request);

        json body = {
            {"ok", false},
            {"offline", true},
            {"error", "Offline"},
            {"retryAfterSeconds", retry_after_seconds_},
            {"timestamp", timestamp_now()}
        };

        if (family && family->kind == FamilyKind::Listing) {
            body["message"] = "Data is not available offline. Please check your "
                              "internet connection to see the latest results.";
            body["items"] = json::array();
            body["total"] = 0;
            body["page"] = 1;
            body["totalPages"] = 0;
            body["hasMore"] = false;
            body["cacheInfo"] = {{"lastUpdate", nullptr}, {"nextUpdate", "When online"}};
        } else if (family && family->kind == FamilyKind::Submission) {
            body["message"] = "Your submission cannot be sent while offline.";
            body["success"] = false;
            body["queued"] = false;
        } else {
            body["message"] = "Resource not available offline";
        }

        return envelope(503, body.dump(), retry_after_seconds_, family);
    } catch (const std::exception& e) {
        std::cerr << "[offline] Envelope build failed: " << e.what() << '\n';
        return envelope(503, kLastResortBody, retry_after_seconds_, nullptr);
    }
}

HttpResponse OfflineResponder::build_queued(const HttpRequest& request,
                                            uint64_t submission_id) const {
    const EndpointFamily* family = nullptr;
    try {
        family = family_for(request);

        json body = {
            {"ok", false},
            {"offline", true},
            {"queued", true},
            {"submissionId", submission_id},
            {"message", "Your submission was saved and will be sent when your "
                        "connection is restored."},
            {"retryAfterSeconds", retry_after_seconds_},
            {"timestamp", timestamp_now()}
        };
        if (family && family->kind == FamilyKind::Submission) body["success"] = false;

        return envelope(202, body.dump(), retry_after_seconds_, family);
    } catch (const std::exception& e) {
        std::cerr << "[offline] Envelope build failed: " << e.what() << '\n';
        return envelope(202, "{\"ok\":false,\"offline\":true,\"queued\":true}",
                        retry_after_seconds_, nullptr);
    }
}

} // namespace netstash
