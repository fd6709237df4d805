#include "interceptor.hpp"
#include "util.hpp"
#include <iostream>

namespace netstash {

PartitionRegistry build_registry(const Config& config) {
    PartitionRegistry registry(config.origin);
    for (const auto& partition : config.partitions) {
        registry.register_partition(partition);
    }
    return registry;
}

static std::string queue_path(const Config& config) {
    if (config.data_dir.empty()) return ":memory:";
    return path_join(config.data_dir, "queue.db");
}

Interceptor::Interceptor(Config config, HttpClient& http, std::unique_ptr<Store> store)
    : config_(std::move(config)),
      store_(store ? std::move(store) : create_store(config_)),
      offline_(config_.offline.families, config_.offline.retry_after_seconds),
      registry_(build_registry(config_)),
      queue_(std::make_unique<RetryQueue>(queue_path(config_), http,
                                          config_.http_timeout_seconds)),
      executor_(*store_, http, offline_, tasks_, config_.http_timeout_seconds),
      lifecycle_(config_, registry_, *store_, executor_, &bus_),
      router_(config_, registry_, executor_, lifecycle_, offline_, http, queue_.get()),
      control_(config_, registry_, *store_, lifecycle_, queue_.get(), &bus_) {
    queue_->set_event_bus(&bus_);

    connectivity_ = listen<ConnectivityChangedEvent>(bus_,
        [this](const ConnectivityChangedEvent& ev) {
            if (!ev.online) {
                online_.store(false);
                return;
            }
            bool was_online = online_.exchange(true);
            // Submissions left by an earlier process or a missed offline
            // signal still need a pass.
            if (was_online && queue_->size() == 0) return;
            std::cerr << "[interceptor] Connectivity restored, replaying queue\n";
            tasks_.spawn("replay", [this]() { queue_->replay_all(); });
        });

    // A submission only lands in the queue when the network failed.
    queued_ = listen<SubmissionQueuedEvent>(bus_,
        [this](const SubmissionQueuedEvent&) { online_.store(false); });

    std::cerr << "[interceptor] Generation " << config_.generation << ", "
              << registry_.size() << " partitions, store: " << store_->backend_name() << '\n';
}

Interceptor::~Interceptor() {
    // Background tasks reference the members below; finish them first.
    tasks_.wait_idle();
}

void Interceptor::set_online(bool online) {
    ConnectivityChangedEvent ev;
    ev.online = online;
    bus_.publish(ev);
}

} // namespace netstash
