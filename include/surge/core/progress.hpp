// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/task_state.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace surge::core {

// Bytes landed on disk for one task (and one chunk when chunk_id is set)
struct ProgressEvent {
    std::string task_id;
    std::optional<std::uint32_t> chunk_id;
    std::uint64_t bytes_delta{0};
    std::uint64_t bytes_completed{0};
    std::optional<std::uint64_t> total_size;
    std::uint64_t speed_bps{0};
    std::chrono::steady_clock::time_point timestamp;
};

struct StatusEvent {
    std::string task_id;
    TaskStatus from{TaskStatus::queued};
    TaskStatus to{TaskStatus::queued};
    std::string reason;   // Human-readable, empty for ordinary transitions
    std::chrono::steady_clock::time_point timestamp;
};

// Consumer of engine events. Called from engine threads concurrently;
// implementations must be thread-safe and must not block for long.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;

    virtual void on_progress(const ProgressEvent& event) = 0;
    virtual void on_status(const StatusEvent& event) = 0;

    // Called once at engine shutdown
    virtual void flush() {}
};

class NullProgressSink final : public ProgressSink {
public:
    void on_progress(const ProgressEvent&) override {}
    void on_status(const StatusEvent&) override {}
};

} // namespace surge::core
