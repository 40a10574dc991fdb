// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/logging.hpp>
#include <surge/core/progress.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace surge::cli {

// Renders engine events as log lines, at most one progress line per task
// per interval. Status changes are always logged.
class LogProgressSink final : public core::ProgressSink {
public:
    LogProgressSink(core::Logger logger, std::chrono::milliseconds interval);

    void on_progress(const core::ProgressEvent& event) override;
    void on_status(const core::StatusEvent& event) override;
    void flush() override;

private:
    core::Logger logger_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> last_logged_;
};

[[nodiscard]] std::string format_bytes(std::uint64_t bytes);
[[nodiscard]] std::string format_speed(std::uint64_t bps);
[[nodiscard]] std::string format_time(std::uint64_t seconds);

} // namespace surge::cli
