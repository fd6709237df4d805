#pragma once
#include "config.hpp"
#include "control.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "lifecycle.hpp"
#include "offline.hpp"
#include "partition.hpp"
#include "retry_queue.hpp"
#include "router.hpp"
#include "store.hpp"
#include "strategy.hpp"
#include "task_runner.hpp"
#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>

namespace netstash {

// Build the registry described by config.partitions, in order.
// Throws ConfigError on the first invalid partition.
PartitionRegistry build_registry(const Config& config);

// One cache generation wired together: registry, store, strategies,
// retry queue, lifecycle and control channel behind a single router.
class Interceptor {
public:
    // `store` defaults to create_store(config). Throws ConfigError or
    // StoreError when the setup is unusable.
    Interceptor(Config config, HttpClient& http, std::unique_ptr<Store> store = nullptr);
    ~Interceptor();

    Interceptor(const Interceptor&) = delete;
    Interceptor& operator=(const Interceptor&) = delete;

    HttpResponse handle(const HttpRequest& request) { return router_.handle(request); }

    nlohmann::json control(const nlohmann::json& message) { return control_.handle(message); }
    nlohmann::json control(const ControlMessage& message) { return control_.dispatch(message); }

    PrecacheReport install() { return lifecycle_.install(); }
    ActivationReport activate() { return lifecycle_.activate(); }

    // Host connectivity signal. An online signal starts a background
    // replay when the interceptor was offline or the queue is not empty.
    // Queueing a submission marks the interceptor offline.
    void set_online(bool online);
    bool online() const { return online_.load(); }

    // Block until background work (revalidation, replay) has finished.
    void wait_idle() { tasks_.wait_idle(); }

    const Config& config() const { return config_; }
    const PartitionRegistry& registry() const { return registry_; }
    Store& store() { return *store_; }
    RetryQueue& queue() { return *queue_; }
    EventBus& bus() { return bus_; }
    Lifecycle& lifecycle() { return lifecycle_; }
    ControlChannel& control_channel() { return control_; }

private:
    Config config_;
    EventBus bus_;
    TaskRunner tasks_;
    std::unique_ptr<Store> store_;
    OfflineResponder offline_;
    PartitionRegistry registry_;
    std::unique_ptr<RetryQueue> queue_;
    StrategyExecutor executor_;
    Lifecycle lifecycle_;
    Router router_;
    ControlChannel control_;
    std::atomic<bool> online_{true};
    ScopedSubscription connectivity_;
    ScopedSubscription queued_;
};

} // namespace netstash
