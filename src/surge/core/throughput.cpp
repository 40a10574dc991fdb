// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/throughput.hpp>
#include <algorithm>
#include <numeric>

namespace surge::core {

//=============================================================================
// ThroughputWindow
//=============================================================================

ThroughputWindow::ThroughputWindow(std::size_t capacity) noexcept
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ThroughputWindow::push(double bytes_per_second) {
    samples_.push_back(std::max(0.0, bytes_per_second));
    while (samples_.size() > capacity_) {
        samples_.pop_front();
    }
}

double ThroughputWindow::mean() const noexcept {
    if (samples_.empty()) return 0.0;
    return std::accumulate(samples_.begin(), samples_.end(), 0.0)
         / static_cast<double>(samples_.size());
}

//=============================================================================
// ConcurrencyController
//=============================================================================

ConcurrencyController::ConcurrencyController(std::uint32_t min_workers,
                                             std::uint32_t max_workers,
                                             std::uint32_t initial_workers,
                                             std::size_t window,
                                             std::chrono::milliseconds cooldown,
                                             double epsilon) noexcept
    : min_(std::max<std::uint32_t>(min_workers, 1))
    , max_(std::max(max_workers, min_))
    , target_(std::clamp(initial_workers, min_, max_))
    , window_(window)
    , cooldown_(cooldown)
    , epsilon_(epsilon) {}

std::uint32_t ConcurrencyController::observe(double bytes_per_second, Clock::time_point now) {
    window_.push(bytes_per_second);

    if (!window_.full()) return target_;
    if (last_decision_ && now - *last_decision_ < cooldown_) return target_;

    const double mean = window_.mean();
    window_.clear();
    last_decision_ = now;

    if (!baseline_) {
        baseline_ = mean;
        return target_;
    }

    const double previous = *baseline_;
    baseline_ = mean;

    Action action = Action::none;
    if (mean > previous * (1.0 + epsilon_)) {
        action = Action::grow;
    } else if (mean < previous * (1.0 - epsilon_)) {
        action = Action::shrink;
    } else if (last_action_ == Action::grow) {
        action = Action::shrink;
    }

    if (action == Action::grow && target_ < max_) {
        ++target_;
    } else if (action == Action::shrink && target_ > min_) {
        --target_;
    } else {
        action = Action::none;
    }
    last_action_ = action;
    return target_;
}

} // namespace surge::core
