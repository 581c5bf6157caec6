/**
 * @file FileDescriptor.hpp
 * @brief RAII owner for POSIX file descriptors used by the hash and copy paths
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a raw descriptor, closed on destruction
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    /**
     * @brief Open a path with O_CLOEXEC added to the flags
     * @return Owning descriptor, invalid on failure with errno preserved
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, int flags,
                                   mode_t mode = 0644) -> FileDescriptor {
        return FileDescriptor{::open(path.c_str(), flags | O_CLOEXEC, mode)};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }
    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close explicitly so that close() errors on written files are observable
     * @return 0 on success, -1 with errno set otherwise
     */
    auto close() noexcept -> int {
        if (!is_valid()) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }

    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_ = -1;
};

}  // namespace util
