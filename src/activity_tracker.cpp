#include "fetchkit/activity_tracker.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace fetchkit {

ActivityTracker::ActivityTracker() : last_ticks_(Clock::now().time_since_epoch().count()) {}

void ActivityTracker::touch() noexcept {
    last_ticks_.store(Clock::now().time_since_epoch().count());
}

ActivityTracker::Clock::time_point ActivityTracker::lastActivity() const noexcept {
    return Clock::time_point{Clock::duration{last_ticks_.load()}};
}

ActivityTracker::Clock::duration ActivityTracker::idleFor(Clock::time_point now) const noexcept {
    const auto idle = now - lastActivity();
    return idle < Clock::duration::zero() ? Clock::duration::zero() : idle;
}

IdleWatchdog::IdleWatchdog(const ActivityTracker& tracker,
                           std::chrono::milliseconds idle_limit,
                           std::chrono::milliseconds check_interval,
                           std::function<void()> on_idle)
    : tracker_(tracker),
      idle_limit_(idle_limit),
      check_interval_(check_interval),
      on_idle_(std::move(on_idle)) {}

IdleWatchdog::~IdleWatchdog() {
    stop();
}

void IdleWatchdog::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    stopping_ = false;
    thread_ = std::thread(&IdleWatchdog::loop, this);
}

void IdleWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    wakeup_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void IdleWatchdog::loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        wakeup_.wait_for(lock, check_interval_, [this] { return stopping_; });
        if (stopping_) {
            break;
        }
        if (tracker_.idleFor() >= idle_limit_) {
            spdlog::info("No activity for {} s, shutting down",
                         std::chrono::duration_cast<std::chrono::seconds>(idle_limit_).count());
            fired_.store(true);
            lock.unlock();
            if (on_idle_) {
                on_idle_();
            }
            return;
        }
    }
}

} // namespace fetchkit
