// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/retry_policy.hpp>
#include <algorithm>
#include <cmath>

namespace surge::core {

RetryPolicy::RetryPolicy(RetrySettings settings, std::uint64_t seed)
    : settings_(std::move(settings))
    , rng_(seed) {}

bool RetryPolicy::is_retryable(std::error_code ec) const noexcept {
    if (!ec || ec.category() != download_errc_category()) {
        return false;
    }
    return settings_.retryable.contains(static_cast<DownloadErrc>(ec.value()));
}

std::chrono::milliseconds RetryPolicy::nominal_delay(std::uint32_t attempt_count) const noexcept {
    const double base = static_cast<double>(settings_.base_delay.count());
    const double cap = static_cast<double>(settings_.max_delay.count());
    double delay = base * std::pow(settings_.backoff_multiplier, static_cast<double>(attempt_count));
    if (!std::isfinite(delay) || delay > cap) {
        delay = cap;
    }
    return std::chrono::milliseconds{static_cast<std::int64_t>(delay)};
}

std::optional<std::chrono::milliseconds>
RetryPolicy::next_delay(std::error_code ec, std::uint32_t attempt_count) noexcept {
    if (!is_retryable(ec) || attempt_count >= settings_.max_retries) {
        return std::nullopt;
    }

    const double delay = static_cast<double>(nominal_delay(attempt_count).count());
    if (settings_.jitter_factor <= 0.0 || delay <= 0.0) {
        return std::chrono::milliseconds{static_cast<std::int64_t>(delay)};
    }

    std::uniform_real_distribution<double> jitter(-settings_.jitter_factor, settings_.jitter_factor);
    const double jittered = std::max(0.0, delay * (1.0 + jitter(rng_)));
    return std::chrono::milliseconds{static_cast<std::int64_t>(jittered)};
}

} // namespace surge::core
