// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace surge::core {

// Token bucket shared by all workers of one task.
// Holds at most one second worth of tokens; a large block may drive the
// bucket negative and the caller then sleeps off the debt.
class SpeedLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit SpeedLimiter(std::uint64_t bytes_per_second) noexcept;

    SpeedLimiter(const SpeedLimiter&) = delete;
    SpeedLimiter& operator=(const SpeedLimiter&) = delete;

    // Charge bytes and wait until the rate allows them.
    // Returns false if stop was requested while waiting.
    bool acquire(std::uint64_t bytes, std::stop_token stop);

    // Time the caller would have to wait for bytes at the given instant
    [[nodiscard]] std::chrono::microseconds reserve(std::uint64_t bytes, Clock::time_point now) noexcept;

    // Largest single charge worth about 100 ms at the configured rate
    [[nodiscard]] std::size_t slice() const noexcept {
        return rate_ >= 10 ? static_cast<std::size_t>(rate_ / 10) : 1;
    }

    [[nodiscard]] std::uint64_t rate() const noexcept { return rate_; }
    [[nodiscard]] bool unlimited() const noexcept { return rate_ == 0; }

private:
    void refill(Clock::time_point now) noexcept;

    const std::uint64_t rate_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    double tokens_;
    Clock::time_point last_refill_;
};

} // namespace surge::core
