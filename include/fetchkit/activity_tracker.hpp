#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace fetchkit {

class ActivityTracker {
public:
    using Clock = std::chrono::steady_clock;

    ActivityTracker();

    void touch() noexcept;
    [[nodiscard]] Clock::time_point lastActivity() const noexcept;
    [[nodiscard]] Clock::duration idleFor(Clock::time_point now = Clock::now()) const noexcept;

private:
    std::atomic<Clock::rep> last_ticks_;
};

// Calls on_idle once when the tracker has seen no activity for idle_limit.
class IdleWatchdog {
public:
    IdleWatchdog(const ActivityTracker& tracker,
                 std::chrono::milliseconds idle_limit,
                 std::chrono::milliseconds check_interval,
                 std::function<void()> on_idle);
    ~IdleWatchdog();

    IdleWatchdog(const IdleWatchdog&) = delete;
    IdleWatchdog& operator=(const IdleWatchdog&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool fired() const noexcept { return fired_.load(); }

private:
    void loop();

    const ActivityTracker& tracker_;
    std::chrono::milliseconds idle_limit_;
    std::chrono::milliseconds check_interval_;
    std::function<void()> on_idle_;

    std::mutex mutex_;
    std::condition_variable wakeup_;
    bool stopping_{false};
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

} // namespace fetchkit
