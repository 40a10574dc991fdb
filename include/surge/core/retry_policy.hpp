// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace surge::core {

// Backoff decisions for one chunk (or one task probe).
// Copies are independent; each worker owns its own.
class RetryPolicy {
public:
    explicit RetryPolicy(RetrySettings settings, std::uint64_t seed = std::random_device{}());

    // Error kind is in the configured retryable set
    [[nodiscard]] bool is_retryable(std::error_code ec) const noexcept;

    // min(base * multiplier^attempt, max_delay), before jitter
    [[nodiscard]] std::chrono::milliseconds nominal_delay(std::uint32_t attempt_count) const noexcept;

    // Delay before the next attempt, or nullopt to abort.
    // attempt_count is the number of failures already charged to the range.
    [[nodiscard]] std::optional<std::chrono::milliseconds>
    next_delay(std::error_code ec, std::uint32_t attempt_count) noexcept;

    [[nodiscard]] std::uint32_t max_retries() const noexcept { return settings_.max_retries; }
    [[nodiscard]] const RetrySettings& settings() const noexcept { return settings_; }

private:
    RetrySettings settings_;
    std::mt19937_64 rng_;
};

} // namespace surge::core
