// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/core/chunk_plan.hpp>
#include <algorithm>

namespace surge::core {

std::vector<ByteRange> plan_chunks(std::uint64_t total_size,
                                   std::uint64_t min_chunk_size,
                                   std::uint32_t max_chunks,
                                   std::uint32_t target_chunk_count,
                                   bool supports_range) {
    if (!supports_range || total_size < min_chunk_size || total_size == 0) {
        return {ByteRange{0, total_size}};
    }

    std::uint64_t count = std::min(target_chunk_count, max_chunks);
    if (min_chunk_size > 0) {
        count = std::min<std::uint64_t>(count, total_size / min_chunk_size);
    }
    count = std::max<std::uint64_t>(count, 1);

    const std::uint64_t chunk_size = total_size / count;

    std::vector<ByteRange> ranges;
    ranges.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        std::uint64_t start = i * chunk_size;
        std::uint64_t end = (i + 1 == count) ? total_size : start + chunk_size;
        ranges.push_back({start, end});
    }
    return ranges;
}

std::error_code validate_partition(const std::vector<ByteRange>& ranges,
                                   std::uint64_t total_size) noexcept {
    if (ranges.empty()) {
        return make_error_code(DownloadErrc::corrupt_state);
    }

    std::uint64_t expected_start = 0;
    for (const auto& range : ranges) {
        if (range.start != expected_start || range.end < range.start) {
            return make_error_code(DownloadErrc::corrupt_state);
        }
        // Only an empty file may carry a zero-length range
        if (range.end == range.start && total_size != 0) {
            return make_error_code(DownloadErrc::corrupt_state);
        }
        expected_start = range.end;
    }

    if (expected_start != total_size) {
        return make_error_code(DownloadErrc::corrupt_state);
    }
    return {};
}

} // namespace surge::core
