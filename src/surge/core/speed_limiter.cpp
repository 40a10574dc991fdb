// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/speed_limiter.hpp>
#include <algorithm>

namespace surge::core {

SpeedLimiter::SpeedLimiter(std::uint64_t bytes_per_second) noexcept
    : rate_(bytes_per_second)
    , tokens_(static_cast<double>(bytes_per_second))
    , last_refill_(Clock::now()) {}

void SpeedLimiter::refill(Clock::time_point now) noexcept {
    if (now <= last_refill_) return;
    const double elapsed = std::chrono::duration<double>(now - last_refill_).count();
    tokens_ = std::min(static_cast<double>(rate_), tokens_ + elapsed * static_cast<double>(rate_));
    last_refill_ = now;
}

std::chrono::microseconds SpeedLimiter::reserve(std::uint64_t bytes, Clock::time_point now) noexcept {
    if (rate_ == 0) return std::chrono::microseconds{0};

    std::lock_guard lock(mutex_);
    refill(now);
    tokens_ -= static_cast<double>(bytes);
    if (tokens_ >= 0.0) {
        return std::chrono::microseconds{0};
    }
    const double seconds = -tokens_ / static_cast<double>(rate_);
    return std::chrono::microseconds{static_cast<std::int64_t>(seconds * 1'000'000.0)};
}

bool SpeedLimiter::acquire(std::uint64_t bytes, std::stop_token stop) {
    auto wait = reserve(bytes, Clock::now());
    if (wait.count() == 0) {
        return !stop.stop_requested();
    }

    std::unique_lock lock(mutex_);
    // Only a stop request ends the wait early
    cv_.wait_for(lock, stop, wait, [] { return false; });
    return !stop.stop_requested();
}

} // namespace surge::core
