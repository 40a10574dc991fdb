// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/chunk_plan.hpp>
#include <surge/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace surge::core {

enum class TaskStatus : std::uint8_t {
    queued,
    probing,
    downloading,
    paused,
    completed,
    failed,
    cancelled
};

enum class ChunkStatus : std::uint8_t {
    pending,
    active,
    paused,
    completed,
    failed
};

struct ChunkState {
    std::uint32_t id{0};
    ByteRange range;
    std::uint64_t bytes_downloaded{0};
    ChunkStatus status{ChunkStatus::pending};
    std::uint32_t attempt_count{0};
    std::string last_error;

    [[nodiscard]] std::uint64_t resume_offset() const noexcept { return range.start + bytes_downloaded; }
    [[nodiscard]] bool done() const noexcept {
        return !range.open_ended() && bytes_downloaded >= range.length();
    }
    [[nodiscard]] std::uint64_t remaining() const noexcept;
};

// Resumable record of one download
struct TaskState {
    using Clock = std::chrono::system_clock;

    std::string id;
    std::string source;
    std::string destination_path;
    std::optional<std::uint64_t> total_size;
    bool supports_range{false};
    std::string etag;
    std::string last_modified;
    std::vector<ChunkState> chunks;
    TaskStatus status{TaskStatus::queued};
    std::string failure_reason;
    Clock::time_point created_at{};
    Clock::time_point updated_at{};

    // Derived from the chunk table
    [[nodiscard]] std::uint64_t bytes_completed() const noexcept;
    [[nodiscard]] bool is_terminal() const noexcept;
    [[nodiscard]] bool all_chunks_completed() const noexcept;

    // Check the chunk table against total_size; corrupt_state on violation
    [[nodiscard]] std::error_code validate() const noexcept;

    void touch() noexcept { updated_at = Clock::now(); }
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ChunkStatus status) noexcept;
[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<ChunkStatus> parse_chunk_status(std::string_view text) noexcept;

// Build the chunk table for a freshly planned task
[[nodiscard]] std::vector<ChunkState> make_chunks(const std::vector<ByteRange>& ranges);

// 32 hex digits, random
[[nodiscard]] std::string generate_task_id();

} // namespace surge::core
