/**
 * @file IoHelpers.hpp
 * @brief Retrying read/write wrappers and page-cache helpers for POSIX descriptors
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>

namespace util {

inline auto read_with_retry(int fd, void* buffer, size_t count) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, count);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

inline auto write_with_retry(int fd, const void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::write(fd, buffer, size);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

/**
 * @brief Write the whole buffer, looping over short writes
 * @return true when every byte was written, false with errno set otherwise
 */
inline auto write_all(int fd, const void* buffer, size_t size) -> bool {
    const auto* cursor = static_cast<const uint8_t*>(buffer);
    size_t remaining = size;
    while (remaining > 0) {
        const auto written = write_with_retry(fd, cursor, remaining);
        if (written < 0) {
            return false;
        }
        if (written == 0) {
            errno = EIO;
            return false;
        }
        cursor += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

/**
 * @brief Fill the buffer unless EOF comes first
 * @return Bytes read (short only at EOF), -1 on error
 */
inline auto read_full(int fd, void* buffer, size_t size) -> ssize_t {
    auto* cursor = static_cast<uint8_t*>(buffer);
    size_t total = 0;
    while (total < size) {
        const auto got = read_with_retry(fd, cursor + total, size - total);
        if (got < 0) {
            return -1;
        }
        if (got == 0) {
            break;
        }
        total += static_cast<size_t>(got);
    }
    return static_cast<ssize_t>(total);
}

/**
 * @brief Ask the kernel to drop cached pages of a file
 *
 * Used after fsync so the following read comes from the device. Advisory only.
 */
inline void drop_page_cache(int fd) {
    (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_DONTNEED);
}

}  // namespace util
