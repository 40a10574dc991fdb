// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/task_state.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace surge::core {

constexpr std::string_view META_SUFFIX = ".surgemeta";
constexpr int META_FORMAT_VERSION = 1;

// JSON sidecar persistence for TaskState.
//
// One file per task at <destination>.surgemeta:
//   {
//     "format": "surge-resume", "version": 1,
//     "id": "...", "source": "...", "destination": "...",
//     "total_size": 1048576 | null, "supports_range": true,
//     "etag": "...", "last_modified": "...",
//     "status": "paused", "failure_reason": "",
//     "created_at": 1700000000000, "updated_at": 1700000000000,
//     "chunks": [ { "id": 0, "start": 0, "end": 524288 | null,
//                   "bytes_downloaded": 1024, "status": "paused",
//                   "attempt_count": 0, "last_error": "" } ]
//   }
// Timestamps are Unix milliseconds. A null end marks an open-ended chunk.
namespace resume_store {

[[nodiscard]] std::string meta_path(std::string_view destination_path);

// Serialize without touching the filesystem
[[nodiscard]] std::string to_json(const TaskState& state);

// Parse and validate; corrupt_state for anything unusable.
// Chunks recorded as active come back as pending.
[[nodiscard]] std::expected<TaskState, std::error_code> from_json(std::string_view text) noexcept;

// Write atomically (temp file + rename) to meta_path(state.destination_path)
[[nodiscard]] std::error_code save(const TaskState& state) noexcept;

// Load the sidecar belonging to a destination file
[[nodiscard]] std::expected<TaskState, std::error_code> load(std::string_view destination_path) noexcept;

[[nodiscard]] bool exists(std::string_view destination_path) noexcept;

// Delete the sidecar; a missing file is not an error
[[nodiscard]] std::error_code remove(std::string_view destination_path) noexcept;

// Destination paths that have a sidecar directly under a directory, sorted
[[nodiscard]] std::vector<std::string> scan(std::string_view directory) noexcept;

} // namespace resume_store

} // namespace surge::core
