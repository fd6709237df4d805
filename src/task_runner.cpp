#include "task_runner.hpp"
#include <iostream>

namespace netstash {

TaskRunner::~TaskRunner() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void TaskRunner::reap_locked() {
    for (auto it = workers_.begin(); it != workers_.end(); ) {
        if (it->finished) {
            // The thread already left its body; join returns immediately.
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void TaskRunner::spawn(const std::string& label, std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    reap_locked();

    workers_.emplace_back();
    Worker* worker = &workers_.back();
    ++active_;

    // list nodes are stable, so the worker pointer stays valid until reaped,
    // and reaping only happens after `finished` is set under the mutex.
    worker->thread = std::thread([this, worker, label, task = std::move(task)]() {
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[tasks] " << label << " failed: " << e.what() << '\n';
        }
        std::lock_guard<std::mutex> done(mutex_);
        worker->finished = true;
        --active_;
        idle_cv_.notify_all();
    });
}

void TaskRunner::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return active_ == 0; });
    reap_locked();
}

size_t TaskRunner::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

} // namespace netstash
