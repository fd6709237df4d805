#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace netstash {

// Owns detached-in-spirit background work (revalidation, timed-out fetches,
// queue replay). Each task runs on its own thread; finished threads are
// reaped on the next spawn and everything is joined on destruction, so no
// task can outlive the objects it captured by reference.
class TaskRunner {
public:
    TaskRunner() = default;
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // Run `task` in the background. Exceptions escaping the task are caught
    // and logged under `label`.
    void spawn(const std::string& label, std::function<void()> task);

    // Block until every spawned task has finished.
    void wait_idle();

    size_t active() const;

private:
    struct Worker {
        std::thread thread;
        bool finished = false;
    };

    void reap_locked();

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::list<Worker> workers_;
    size_t active_ = 0;
};

} // namespace netstash
