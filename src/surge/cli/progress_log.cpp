// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/cli/progress_log.hpp>
#include <spdlog/spdlog.h>
#include <iomanip>
#include <sstream>

namespace surge::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;
constexpr std::uint64_t TB = 1024 * GB;

std::string scaled(std::uint64_t value, std::uint64_t unit, int precision, const char* suffix) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision)
       << (static_cast<double>(value) / static_cast<double>(unit)) << suffix;
    return ss.str();
}

// Short id prefix keeps log lines readable
std::string_view short_id(const std::string& id) {
    return std::string_view(id).substr(0, 8);
}

} // namespace

std::string format_bytes(std::uint64_t bytes) {
    if (bytes >= TB) return scaled(bytes, TB, 2, " TB");
    if (bytes >= GB) return scaled(bytes, GB, 2, " GB");
    if (bytes >= MB) return scaled(bytes, MB, 1, " MB");
    if (bytes >= KB) return scaled(bytes, KB, 0, " KB");
    return std::to_string(bytes) + " B";
}

std::string format_speed(std::uint64_t bps) {
    if (bps >= GB) return scaled(bps, GB, 1, " GB/s");
    if (bps >= MB) return scaled(bps, MB, 1, " MB/s");
    if (bps >= KB) return scaled(bps, KB, 1, " KB/s");
    return std::to_string(bps) + " B/s";
}

std::string format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m "
           << std::setw(2) << secs << "s";
        return ss.str();
    }
    if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

LogProgressSink::LogProgressSink(core::Logger logger, std::chrono::milliseconds interval)
    : logger_(std::move(logger))
    , interval_(interval) {}

void LogProgressSink::on_progress(const core::ProgressEvent& event) {
    {
        std::lock_guard lock(mutex_);
        auto& last = last_logged_[event.task_id];
        if (event.timestamp - last < interval_) {
            return;
        }
        last = event.timestamp;
    }

    if (event.total_size && *event.total_size > 0) {
        const auto total = *event.total_size;
        const double percent = static_cast<double>(event.bytes_completed) * 100.0
                             / static_cast<double>(total);
        std::string eta = "-";
        if (event.speed_bps > 0 && total > event.bytes_completed) {
            eta = format_time((total - event.bytes_completed) / event.speed_bps);
        }
        logger_->info("{} {:5.1f}% ({}/{}) @ {} ETA {}",
                      short_id(event.task_id), percent,
                      format_bytes(event.bytes_completed), format_bytes(total),
                      format_speed(event.speed_bps), eta);
    } else {
        logger_->info("{} {} @ {}", short_id(event.task_id),
                      format_bytes(event.bytes_completed), format_speed(event.speed_bps));
    }
}

void LogProgressSink::on_status(const core::StatusEvent& event) {
    const auto from = core::to_string(event.from);
    const auto to = core::to_string(event.to);

    if (event.to == core::TaskStatus::failed) {
        logger_->error("{} {} -> {}: {}", short_id(event.task_id), from, to, event.reason);
    } else if (!event.reason.empty()) {
        logger_->warn("{} {} -> {}: {}", short_id(event.task_id), from, to, event.reason);
    } else {
        logger_->info("{} {} -> {}", short_id(event.task_id), from, to);
    }

    // Progress only flows while downloading; any other state ends the rate window
    if (event.to != core::TaskStatus::downloading) {
        std::lock_guard lock(mutex_);
        last_logged_.erase(event.task_id);
    }
}

void LogProgressSink::flush() {
    logger_->flush();
}

} // namespace surge::cli
