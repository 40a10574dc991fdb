// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/task_state.hpp>
#include <array>
#include <random>

namespace surge::core {

namespace {

constexpr std::array<std::string_view, 7> TASK_STATUS_NAMES{
    "queued", "probing", "downloading", "paused", "completed", "failed", "cancelled"};

constexpr std::array<std::string_view, 5> CHUNK_STATUS_NAMES{
    "pending", "active", "paused", "completed", "failed"};

} // namespace

std::uint64_t ChunkState::remaining() const noexcept {
    if (range.open_ended()) {
        return OPEN_END;
    }
    auto len = range.length();
    return bytes_downloaded >= len ? 0 : len - bytes_downloaded;
}

std::uint64_t TaskState::bytes_completed() const noexcept {
    std::uint64_t sum = 0;
    for (const auto& chunk : chunks) {
        sum += chunk.bytes_downloaded;
    }
    return sum;
}

bool TaskState::is_terminal() const noexcept {
    return status == TaskStatus::completed
        || status == TaskStatus::failed
        || status == TaskStatus::cancelled;
}

bool TaskState::all_chunks_completed() const noexcept {
    if (chunks.empty()) return false;
    for (const auto& chunk : chunks) {
        if (chunk.status != ChunkStatus::completed) return false;
    }
    return true;
}

std::error_code TaskState::validate() const noexcept {
    const auto corrupt = make_error_code(DownloadErrc::corrupt_state);

    if (id.empty() || source.empty() || destination_path.empty()) {
        return corrupt;
    }

    // A task that has not been probed yet has no chunk table
    if (chunks.empty()) {
        return total_size || status == TaskStatus::downloading ? corrupt : std::error_code{};
    }

    if (!total_size) {
        // Unknown size: exactly one open-ended sequential chunk
        if (chunks.size() != 1 || chunks[0].range.start != 0 || !chunks[0].range.open_ended()) {
            return corrupt;
        }
        return {};
    }

    std::vector<ByteRange> ranges;
    ranges.reserve(chunks.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        if (chunk.id != i) return corrupt;
        if (chunk.bytes_downloaded > chunk.range.length()) return corrupt;
        if (chunk.status == ChunkStatus::completed && chunk.bytes_downloaded != chunk.range.length()) {
            return corrupt;
        }
        ranges.push_back(chunk.range);
    }

    if (auto ec = validate_partition(ranges, *total_size)) {
        return ec;
    }
    if (bytes_completed() > *total_size) {
        return corrupt;
    }
    return {};
}

std::string_view to_string(TaskStatus status) noexcept {
    auto index = static_cast<std::size_t>(status);
    return index < TASK_STATUS_NAMES.size() ? TASK_STATUS_NAMES[index] : "unknown";
}

std::string_view to_string(ChunkStatus status) noexcept {
    auto index = static_cast<std::size_t>(status);
    return index < CHUNK_STATUS_NAMES.size() ? CHUNK_STATUS_NAMES[index] : "unknown";
}

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    for (std::size_t i = 0; i < TASK_STATUS_NAMES.size(); ++i) {
        if (TASK_STATUS_NAMES[i] == text) return static_cast<TaskStatus>(i);
    }
    return std::nullopt;
}

std::optional<ChunkStatus> parse_chunk_status(std::string_view text) noexcept {
    for (std::size_t i = 0; i < CHUNK_STATUS_NAMES.size(); ++i) {
        if (CHUNK_STATUS_NAMES[i] == text) return static_cast<ChunkStatus>(i);
    }
    return std::nullopt;
}

std::vector<ChunkState> make_chunks(const std::vector<ByteRange>& ranges) {
    std::vector<ChunkState> chunks;
    chunks.reserve(ranges.size());
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        ChunkState chunk;
        chunk.id = static_cast<std::uint32_t>(i);
        chunk.range = ranges[i];
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::string generate_task_id() {
    static constexpr char HEX[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::string id;
    id.reserve(32);
    for (int word = 0; word < 2; ++word) {
        auto bits = rng();
        for (int i = 0; i < 16; ++i) {
            id += HEX[bits & 0xF];
            bits >>= 4;
        }
    }
    return id;
}

} // namespace surge::core
