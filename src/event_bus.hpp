#pragma once
#include "event.hpp"
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace netstash {

using EventHandler = std::function<void(const Event&)>;

// Synchronous in-process notifications between the interceptor's parts
// (connectivity -> queue replay, activation -> host log).
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Returns false if `id` is unknown or already removed.
    bool unsubscribe(uint64_t id);

    // Handlers for the event's tag run in registration order on the calling
    // thread, outside the lock, against a snapshot taken at entry. A handler
    // that throws is logged and skipped. Returns how many completed.
    size_t publish(const Event& event);

    void clear();
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Listener {
        uint64_t id;
        std::string tag;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Listener> listeners_;
    uint64_t next_id_ = 1;
};

// Unsubscribes on destruction. Must not outlive its bus.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
        }
        return *this;
    }
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_) bus_->unsubscribe(id_);
        bus_ = nullptr;
    }

    bool active() const { return bus_ != nullptr; }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

// Typed subscribe: the handler sees the concrete event struct.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Typed subscribe tied to the lifetime of the returned guard.
template<typename E>
ScopedSubscription listen(EventBus& bus, std::function<void(const E&)> handler) {
    return ScopedSubscription(bus, subscribe<E>(bus, std::move(handler)));
}

} // namespace netstash
