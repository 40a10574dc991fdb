// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <limits>
#include <vector>

namespace surge::core {

// End marker for a range whose size is unknown (no Content-Length)
constexpr std::uint64_t OPEN_END = std::numeric_limits<std::uint64_t>::max();

// Half-open byte range [start, end)
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] bool open_ended() const noexcept { return end == OPEN_END; }
    [[nodiscard]] std::uint64_t length() const noexcept {
        return open_ended() ? OPEN_END : end - start;
    }

    friend bool operator==(const ByteRange&, const ByteRange&) = default;
};

// Split [0, total_size) into contiguous ranges.
//
// A single range is returned for sources without range support or files
// smaller than min_chunk_size. Otherwise the file is cut into
// min(target_chunk_count, max_chunks) pieces of total_size / n bytes, n
// reduced until every piece is at least min_chunk_size; the last piece
// takes the division remainder. Pure and deterministic.
[[nodiscard]] std::vector<ByteRange> plan_chunks(std::uint64_t total_size,
                                                 std::uint64_t min_chunk_size,
                                                 std::uint32_t max_chunks,
                                                 std::uint32_t target_chunk_count,
                                                 bool supports_range);

// Check that ranges cover [0, total_size) in order without gaps or overlaps
[[nodiscard]] std::error_code validate_partition(const std::vector<ByteRange>& ranges,
                                                 std::uint64_t total_size) noexcept;

} // namespace surge::core
