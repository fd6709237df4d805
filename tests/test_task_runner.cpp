#include <catch2/catch.hpp>
#include "task_runner.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace netstash;

TEST_CASE("TaskRunner: runs spawned tasks", "[task_runner]") {
    TaskRunner runner;
    std::atomic<int> ran{0};
    for (int i = 0; i < 5; i++) {
        runner.spawn("inc", [&ran]() { ran++; });
    }
    runner.wait_idle();
    REQUIRE(ran.load() == 5);
    REQUIRE(runner.active() == 0);
}

TEST_CASE("TaskRunner: exceptions are contained", "[task_runner]") {
    TaskRunner runner;
    std::atomic<bool> after{false};
    runner.spawn("boom", []() { throw std::runtime_error("boom"); });
    runner.spawn("fine", [&after]() { after = true; });
    runner.wait_idle();
    REQUIRE(after.load());
}

TEST_CASE("TaskRunner: wait_idle blocks until slow task ends", "[task_runner]") {
    TaskRunner runner;
    std::atomic<bool> done{false};
    runner.spawn("slow", [&done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        done = true;
    });
    runner.wait_idle();
    REQUIRE(done.load());
}

TEST_CASE("TaskRunner: destructor joins outstanding work", "[task_runner]") {
    std::atomic<bool> done{false};
    {
        TaskRunner runner;
        runner.spawn("slow", [&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            done = true;
        });
    }
    REQUIRE(done.load());
}
