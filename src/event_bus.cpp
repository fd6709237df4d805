#include "event_bus.hpp"
#include <algorithm>
#include <iostream>

namespace netstash {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    listeners_.push_back(Listener{id, tag, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const Listener& l) { return l.id == id; });
    if (it == listeners_.end()) return false;
    listeners_.erase(it);
    return true;
}

size_t EventBus::publish(const Event& event) {
    std::vector<EventHandler> matched;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& l : listeners_) {
            if (l.tag == event.type_tag) matched.push_back(l.handler);
        }
    }

    size_t completed = 0;
    for (const auto& handler : matched) {
        try {
            handler(event);
            ++completed;
        } catch (const std::exception& e) {
            std::cerr << "[events] " << event.type_tag << " handler failed: "
                      << e.what() << '\n';
        }
    }
    return completed;
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.clear();
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
                                             [&tag](const Listener& l) { return l.tag == tag; }));
}

} // namespace netstash
