#include "fetchkit/progress_sampler.hpp"

#include <algorithm>

namespace fetchkit {

ProgressSampler::ProgressSampler(std::chrono::milliseconds interval)
    : interval_(std::max(interval, std::chrono::milliseconds{0})) {}

void ProgressSampler::start(Clock::time_point now) {
    next_tick_ = now + interval_;
    started_ = true;
    dirty_ = false;
    finished_ = false;
}

bool ProgressSampler::poll(Clock::time_point now) {
    if (!started_ || finished_ || now < next_tick_) {
        return false;
    }

    // Missed ticks collapse into one, like a ticker with a one-slot channel.
    if (interval_.count() > 0) {
        const auto behind = (now - next_tick_) / interval_;
        next_tick_ += interval_ * (behind + 1);
    } else {
        next_tick_ = now;
    }

    if (!dirty_) {
        return false;
    }
    dirty_ = false;
    return true;
}

bool ProgressSampler::finish() noexcept {
    if (finished_) {
        return false;
    }
    finished_ = true;
    dirty_ = false;
    return true;
}

} // namespace fetchkit
