#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace fetchkit {

// Cancellation scoped to a whole transfer: an explicit flag plus an optional deadline.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;
    explicit CancellationToken(std::chrono::milliseconds timeout);

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Safe to call from a signal handler.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const;
    [[nodiscard]] bool cancelRequested() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] bool deadlineExpired() const;

    // Time left before the deadline rounded up, nullopt when there is none.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

} // namespace fetchkit
