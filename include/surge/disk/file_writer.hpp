// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/disk/error.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace surge::disk {

enum class OpenMode : std::uint8_t {
    create,   // Create or truncate, then size to the expected length
    resume    // File must exist; contents are kept
};

// Positional writer shared by every chunk of one task.
// Each write() is a single pwrite at an explicit offset; there is no shared
// cursor, so concurrent writes to disjoint ranges never interfere.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    // Open file for writing; a known size is pre-allocated on create
    [[nodiscard]] std::error_code open(std::string_view path,
                                       std::optional<std::uint64_t> size,
                                       OpenMode mode) noexcept;

    // Write data at offset (thread-safe)
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    // Flush written data to disk
    [[nodiscard]] std::error_code flush() noexcept;

    // Current size as reported by the filesystem
    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_.load(std::memory_order_acquire) >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::atomic<int> fd_{-1};
    std::string path_;
};

// Size of a file on disk, nullopt if it does not exist
[[nodiscard]] std::optional<std::uint64_t> file_size(std::string_view path) noexcept;

// Delete a file; a missing file is not an error
[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

} // namespace surge::disk
