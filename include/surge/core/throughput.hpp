// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>

namespace surge::core {

// Trailing window of aggregate speed samples (bytes per second)
class ThroughputWindow {
public:
    explicit ThroughputWindow(std::size_t capacity) noexcept;

    void push(double bytes_per_second);
    void clear() noexcept { samples_.clear(); }

    [[nodiscard]] bool full() const noexcept { return samples_.size() >= capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
    [[nodiscard]] double mean() const noexcept;

private:
    std::size_t capacity_;
    std::deque<double> samples_;
};

// Dynamic chunk concurrency.
//
// Each decision compares the window mean with the mean seen at the previous
// decision. A rise of more than epsilon adds a worker, a fall of more than
// epsilon removes one, and a flat result right after growing removes the
// worker that bought nothing. Decisions need a full window of fresh samples
// and the cooldown since the last change.
class ConcurrencyController {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double DEFAULT_EPSILON = 0.10;

    ConcurrencyController(std::uint32_t min_workers,
                          std::uint32_t max_workers,
                          std::uint32_t initial_workers,
                          std::size_t window,
                          std::chrono::milliseconds cooldown,
                          double epsilon = DEFAULT_EPSILON) noexcept;

    // Feed one sample; returns the (possibly changed) target
    std::uint32_t observe(double bytes_per_second, Clock::time_point now);

    [[nodiscard]] std::uint32_t target() const noexcept { return target_; }
    [[nodiscard]] std::optional<double> baseline() const noexcept { return baseline_; }

private:
    enum class Action : std::uint8_t { none, grow, shrink };

    std::uint32_t min_;
    std::uint32_t max_;
    std::uint32_t target_;
    ThroughputWindow window_;
    std::chrono::milliseconds cooldown_;
    double epsilon_;
    std::optional<double> baseline_;
    std::optional<Clock::time_point> last_decision_;
    Action last_action_{Action::none};
};

} // namespace surge::core
