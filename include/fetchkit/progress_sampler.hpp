#pragma once

#include <chrono>

namespace fetchkit {

inline constexpr std::chrono::milliseconds kDefaultSampleInterval{200};

// Turns "a chunk was written" into "notify observers" at a bounded rate.
// Not thread-safe; owned by the loop of a single transfer.
class ProgressSampler {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressSampler(std::chrono::milliseconds interval = kDefaultSampleInterval);

    void start(Clock::time_point now);
    void recordChunk() noexcept { dirty_ = true; }

    // True when a tick has elapsed and data arrived since the last emission.
    [[nodiscard]] bool poll(Clock::time_point now);
    // True exactly once: the forced emission at stream end.
    [[nodiscard]] bool finish() noexcept;

    [[nodiscard]] bool finished() const noexcept { return finished_; }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds interval_;
    Clock::time_point next_tick_{};
    bool started_{false};
    bool dirty_{false};
    bool finished_{false};
};

} // namespace fetchkit
