#include "control.hpp"
#include "event_bus.hpp"
#include "request_key.hpp"
#include "url.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace netstash {

using json = nlohmann::json;

static constexpr size_t kStatusSampleSize = 10;

// ── Parsing ─────────────────────────────────────────────────────

static std::vector<std::string> url_list(const json& j) {
    std::vector<std::string> urls;
    if (j.contains("urls")) {
        if (!j["urls"].is_array()) throw std::invalid_argument("'urls' must be an array");
        for (const auto& u : j["urls"]) {
            if (!u.is_string()) throw std::invalid_argument("'urls' must hold strings");
            urls.push_back(u.get<std::string>());
        }
    }
    if (j.contains("url") && j["url"].is_string()) urls.push_back(j["url"].get<std::string>());
    if (urls.empty()) throw std::invalid_argument("WARM needs 'urls' or 'url'");
    return urls;
}

ControlMessage parse_control_message(const json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw std::invalid_argument("Control message needs a string 'type'");
    }
    std::string type = j["type"].get<std::string>();

    if (type == "INVALIDATE" || type == "CLEAR_CACHE") {
        control::Invalidate msg;
        for (const char* key : {"partition", "cacheName"}) {
            if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
                msg.partition = j[key].get<std::string>();
            }
        }
        if (j.contains("url")) {
            if (!j["url"].is_string() || j["url"].get<std::string>().empty()) {
                throw std::invalid_argument("INVALIDATE 'url' must be a non-empty string");
            }
            msg.url = j["url"].get<std::string>();
        }
        return msg;
    }
    if (type == "STATUS" || type == "GET_CACHE_STATUS") return control::Status{};
    if (type == "WARM" || type == "CACHE_URLS" || type == "CACHE_VEHICLE") {
        return control::Warm{url_list(j)};
    }
    if (type == "WARM_PARTITION") {
        if (!j.contains("partition") || !j["partition"].is_string()) {
            throw std::invalid_argument("WARM_PARTITION needs 'partition'");
        }
        return control::WarmPartition{j["partition"].get<std::string>()};
    }
    if (type == "PRELOAD_CRITICAL") return control::PreloadCritical{};
    if (type == "FORCE_ACTIVATE" || type == "SKIP_WAITING") return control::ForceActivate{};
    if (type == "REPLAY_QUEUE") return control::ReplayQueue{};

    throw std::invalid_argument("Unknown control message type: " + type);
}

namespace {

struct TypeName {
    std::string operator()(const control::Invalidate&) const { return "INVALIDATE"; }
    std::string operator()(const control::Status&) const { return "STATUS"; }
    std::string operator()(const control::Warm&) const { return "WARM"; }
    std::string operator()(const control::WarmPartition&) const { return "WARM_PARTITION"; }
    std::string operator()(const control::PreloadCritical&) const { return "PRELOAD_CRITICAL"; }
    std::string operator()(const control::ForceActivate&) const { return "FORCE_ACTIVATE"; }
    std::string operator()(const control::ReplayQueue&) const { return "REPLAY_QUEUE"; }
};

json precache_json(const PrecacheReport& r) {
    return {{"attempted", r.attempted}, {"stored", r.stored}, {"failed", r.failed}};
}

} // namespace

std::string control_message_type(const ControlMessage& message) {
    return std::visit(TypeName{}, message);
}

json CacheStatus::to_json() const {
    json parts = json::object();
    for (const auto& p : partitions) {
        parts[p.name] = {{"storage", p.storage}, {"count", p.count}, {"size", p.approx_bytes}};
    }
    return {
        {"generation", generation},
        {"partitions", parts},
        {"queuedSubmissions", queued_submissions}
    };
}

// ── Commands ────────────────────────────────────────────────────

ControlChannel::ControlChannel(const Config& config, const PartitionRegistry& registry,
                               Store& store, Lifecycle& lifecycle, RetryQueue* queue,
                               EventBus* bus)
    : config_(config), registry_(registry), store_(store), lifecycle_(lifecycle),
      queue_(queue), bus_(bus) {}

CacheStatus ControlChannel::cache_status() {
    CacheStatus status;
    status.generation = lifecycle_.generation();
    for (const auto* p : registry_.partitions()) {
        PartitionStatus ps;
        ps.name = p->name;
        ps.storage = lifecycle_.storage_for(p->name);
        ps.count = store_.count(ps.storage);
        auto [bytes, sampled] = store_.sample_bytes(ps.storage, kStatusSampleSize);
        if (sampled > 0) {
            double per_entry = static_cast<double>(bytes) / static_cast<double>(sampled);
            ps.approx_bytes = static_cast<uint64_t>(std::llround(per_entry * ps.count));
        }
        status.partitions.push_back(std::move(ps));
    }
    if (queue_) status.queued_submissions = queue_->size();
    return status;
}

size_t ControlChannel::clear_partition(const std::optional<std::string>& name) {
    std::vector<std::string> targets;
    if (!name) {
        targets = store_.list_partitions();
    } else if (registry_.find(*name)) {
        targets.push_back(lifecycle_.storage_for(*name));
    } else {
        targets.push_back(*name);
    }

    size_t deleted = 0;
    for (const auto& storage : targets) {
        if (!store_.delete_partition(storage)) continue;
        ++deleted;
        std::cerr << "[control] Cleared " << storage << '\n';
        if (bus_) {
            PartitionClearedEvent ev;
            ev.storage = storage;
            bus_->publish(ev);
        }
    }
    return deleted;
}

size_t ControlChannel::invalidate_url(const std::string& url,
                                      const std::optional<std::string>& partition) {
    HttpRequest req;
    req.url = resolve_url(config_.origin, url);
    std::string key = request_key(req);

    std::vector<std::string> targets;
    if (!partition) {
        for (const auto* p : registry_.partitions()) {
            targets.push_back(lifecycle_.storage_for(p->name));
        }
    } else if (registry_.find(*partition)) {
        targets.push_back(lifecycle_.storage_for(*partition));
    } else {
        targets.push_back(*partition);
    }

    size_t removed = 0;
    for (const auto& storage : targets) {
        if (store_.remove(storage, key)) ++removed;
    }
    if (removed > 0) {
        std::cerr << "[control] Invalidated " << req.url << " (" << removed << " entries)\n";
    }
    return removed;
}

PrecacheReport ControlChannel::warm(const std::vector<std::string>& urls) {
    PrecacheReport report;
    for (const auto& url : urls) {
        HttpRequest req;
        req.url = resolve_url(config_.origin, url);
        const Partition* target = registry_.resolve(req);
        std::string name = target ? target->name : config_.navigation_partition;
        report += lifecycle_.precache(name, {req.url});
    }
    std::cerr << "[control] Warmed " << report.stored << "/" << report.attempted << " URLs\n";
    return report;
}

PrecacheReport ControlChannel::warm_partition(const std::string& name) {
    const Partition* p = registry_.find(name);
    if (!p) throw std::invalid_argument("Unknown partition: " + name);
    return lifecycle_.precache(name, p->warm_urls);
}

PrecacheReport ControlChannel::preload_critical() {
    return lifecycle_.preload_critical();
}

ActivationReport ControlChannel::force_activate() {
    return lifecycle_.activate();
}

ReplayReport ControlChannel::replay_queue() {
    if (!queue_) return ReplayReport{};
    return queue_->replay_all();
}

// ── Dispatch ────────────────────────────────────────────────────

namespace {

struct Dispatcher {
    ControlChannel& channel;

    json operator()(const control::Invalidate& msg) const {
        if (msg.url) return {{"removed", channel.invalidate_url(*msg.url, msg.partition)}};
        size_t deleted = channel.clear_partition(msg.partition);
        return {{"cleared", deleted}};
    }
    json operator()(const control::Status&) const {
        return {{"status", channel.cache_status().to_json()}};
    }
    json operator()(const control::Warm& msg) const {
        return precache_json(channel.warm(msg.urls));
    }
    json operator()(const control::WarmPartition& msg) const {
        json out = precache_json(channel.warm_partition(msg.name));
        out["partition"] = msg.name;
        return out;
    }
    json operator()(const control::PreloadCritical&) const {
        return precache_json(channel.preload_critical());
    }
    json operator()(const control::ForceActivate&) const {
        auto r = channel.force_activate();
        return {{"generation", r.generation}, {"storagesDeleted", r.storages_deleted},
                {"entriesTrimmed", r.entries_trimmed}};
    }
    json operator()(const control::ReplayQueue&) const {
        auto r = channel.replay_queue();
        return {{"attempted", r.attempted}, {"delivered", r.delivered},
                {"remaining", r.remaining}, {"rejected", r.rejected},
                {"alreadyRunning", r.already_running}};
    }
};

} // namespace

json ControlChannel::dispatch(const ControlMessage& message) {
    json reply = std::visit(Dispatcher{*this}, message);
    reply["type"] = control_message_type(message);
    reply["ok"] = true;
    return reply;
}

json ControlChannel::handle(const json& message) {
    try {
        return dispatch(parse_control_message(message));
    } catch (const std::exception& e) {
        std::cerr << "[control] " << e.what() << '\n';
        std::string type = message.is_object() && message.contains("type") &&
                           message["type"].is_string()
                               ? message["type"].get<std::string>()
                               : std::string();
        return {{"type", type}, {"ok", false}, {"error", e.what()}};
    }
}

} // namespace netstash
