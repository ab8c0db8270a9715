#include "fetchkit/cancellation.hpp"

#include <algorithm>

namespace fetchkit {

CancellationToken::CancellationToken(std::chrono::milliseconds timeout) {
    if (timeout.count() > 0) {
        deadline_ = Clock::now() + timeout;
    }
}

bool CancellationToken::isCancelled() const {
    return cancelRequested() || deadlineExpired();
}

bool CancellationToken::deadlineExpired() const {
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }
    const auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return std::max(left, std::chrono::milliseconds{0});
}

} // namespace fetchkit
