// Copyright (c) 2026 changcheng967. All rights reserved.

#include <surge/disk/file_writer.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace surge::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:            return {};
        case ENOENT:       return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:        return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case ELOOP:        return make_error_code(DiskErrc::invalid_path);
        case EEXIST:       return make_error_code(DiskErrc::file_exists);
        case EBADF:        return make_error_code(DiskErrc::handle_invalid);
        case EIO:          return make_error_code(DiskErrc::write_error);
        default:           return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

std::error_code FileWriter::open(std::string_view path,
                                 std::optional<std::uint64_t> size,
                                 OpenMode mode) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    try {
        path_ = std::string(path);
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }

    int flags = O_WRONLY | O_CLOEXEC;
    if (mode == OpenMode::create) {
        flags |= O_CREAT | O_TRUNC;
    }

    int fd = ::open(path_.c_str(), flags, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    if (mode == OpenMode::create && size && *size > 0) {
        // Sparse pre-allocation; blocks are materialized by the chunk writes
        if (::ftruncate(fd, static_cast<off_t>(*size)) != 0) {
            auto ec = errno_to_error_code(errno);
            ::close(fd);
            return ec;
        }
    }

    fd_.store(fd, std::memory_order_release);
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t written = ::pwrite(fd, bytes, size, static_cast<off_t>(offset));
        if (written < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        if (written == 0) {
            return make_error_code(DiskErrc::short_write);
        }
        bytes += written;
        offset += static_cast<std::uint64_t>(written);
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code> FileWriter::size() const noexcept {
    int fd = fd_.load(std::memory_order_acquire);
    if (fd < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void FileWriter::close() noexcept {
    // Atomic guard against double-close
    int fd = fd_.exchange(-1, std::memory_order_acq_rel);
    if (fd >= 0) {
        ::close(fd);
    }
}

std::optional<std::uint64_t> file_size(std::string_view path) noexcept {
    try {
        struct stat st{};
        if (::stat(std::string(path).c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(st.st_size);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::error_code remove_file(std::string_view path) noexcept {
    try {
        if (::unlink(std::string(path).c_str()) != 0 && errno != ENOENT) {
            return errno_to_error_code(errno);
        }
        return {};
    } catch (const std::bad_alloc&) {
        return std::make_error_code(std::errc::not_enough_memory);
    }
}

} // namespace surge::disk
