#include "fetchkit/activity_tracker.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace fetchkit;
using namespace std::chrono_literals;

TEST_CASE("ActivityTracker: idle time", "[activity]") {
    ActivityTracker tracker;
    const auto start = tracker.lastActivity();

    CHECK(tracker.idleFor(start + 2s) == 2s);
    CHECK(tracker.idleFor(start - 1s) == ActivityTracker::Clock::duration::zero());

    std::this_thread::sleep_for(2ms);
    tracker.touch();
    CHECK(tracker.lastActivity() > start);
}

TEST_CASE("IdleWatchdog: fires once after the idle limit", "[activity]") {
    ActivityTracker tracker;
    std::atomic<int> calls{0};
    IdleWatchdog watchdog(tracker, 50ms, 10ms, [&calls] { ++calls; });
    watchdog.start();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!watchdog.fired() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE(watchdog.fired());
    std::this_thread::sleep_for(50ms);
    watchdog.stop();
    CHECK(calls.load() == 1);
}

TEST_CASE("IdleWatchdog: activity keeps it quiet", "[activity]") {
    ActivityTracker tracker;
    std::atomic<int> calls{0};
    IdleWatchdog watchdog(tracker, 200ms, 10ms, [&calls] { ++calls; });
    watchdog.start();

    for (int i = 0; i < 20; ++i) {
        tracker.touch();
        std::this_thread::sleep_for(10ms);
    }
    watchdog.stop();
    CHECK_FALSE(watchdog.fired());
    CHECK(calls.load() == 0);
}

TEST_CASE("IdleWatchdog: stop without start", "[activity]") {
    ActivityTracker tracker;
    IdleWatchdog watchdog(tracker, 1h, 1s, {});
    REQUIRE_NOTHROW(watchdog.stop());
    CHECK_FALSE(watchdog.fired());
}
