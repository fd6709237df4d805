#include "commands.hpp"
#include "interceptor.hpp"
#include "url.hpp"

namespace netstash {

std::string format_response(const HttpResponse& response) {
    std::string out = "HTTP " + std::to_string(response.status_code) + "\n";
    for (const auto& h : response.headers) {
        out += h.first + ": " + h.second + "\n";
    }
    out += "\n" + response.body;
    if (!response.body.empty() && response.body.back() != '\n') out += "\n";
    return out;
}

static HttpRequest make_request(const Interceptor& interceptor, const std::string& method,
                                const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = resolve_url(interceptor.config().origin, url);
    return req;
}

std::string cmd_get(Interceptor& interceptor, const std::string& url) {
    HttpRequest req = make_request(interceptor, "GET", url);
    return format_response(interceptor.handle(req));
}

std::string cmd_post(Interceptor& interceptor, const std::string& url,
                     const std::string& body) {
    HttpRequest req = make_request(interceptor, "POST", url);
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = body;
    return format_response(interceptor.handle(req));
}

std::string cmd_status(Interceptor& interceptor) {
    auto reply = interceptor.control(ControlMessage{control::Status{}});
    return reply["status"].dump(2) + "\n";
}

std::string cmd_clear(Interceptor& interceptor, const std::string& name) {
    control::Invalidate msg;
    if (!name.empty()) msg.partition = name;
    auto reply = interceptor.control(ControlMessage{msg});
    return "Cleared " + reply["cleared"].dump() + " storages.\n";
}

std::string cmd_invalidate(Interceptor& interceptor, const std::string& url) {
    control::Invalidate msg;
    msg.url = url;
    auto reply = interceptor.control(ControlMessage{msg});
    return "Removed " + reply["removed"].dump() + " cached entries.\n";
}

std::string cmd_warm(Interceptor& interceptor, const std::vector<std::string>& urls) {
    if (urls.empty()) return "Usage: warm URL...\n";
    auto reply = interceptor.control(ControlMessage{control::Warm{urls}});
    return "Warmed " + reply["stored"].dump() + "/" + reply["attempted"].dump() + " URLs.\n";
}

std::string cmd_preload(Interceptor& interceptor) {
    auto reply = interceptor.control(ControlMessage{control::PreloadCritical{}});
    return "Preloaded " + reply["stored"].dump() + "/" + reply["attempted"].dump() +
           " critical pages.\n";
}

std::string cmd_activate(Interceptor& interceptor) {
    auto installed = interceptor.install();
    auto activated = interceptor.activate();
    return "Generation " + std::to_string(activated.generation) + " active: " +
           std::to_string(installed.stored) + "/" + std::to_string(installed.attempted) +
           " precached, " + std::to_string(activated.storages_deleted) +
           " old storages removed.\n";
}

std::string cmd_replay(Interceptor& interceptor) {
    auto reply = interceptor.control(ControlMessage{control::ReplayQueue{}});
    if (reply["alreadyRunning"].get<bool>()) return "Replay already running.\n";
    std::string out = "Delivered " + reply["delivered"].dump() + ", " +
                      reply["remaining"].dump() + " still queued.\n";
    if (reply["rejected"].get<bool>()) {
        out += "The oldest submission was rejected by the server and is kept at the head of the queue.\n";
    }
    return out;
}

} // namespace netstash
