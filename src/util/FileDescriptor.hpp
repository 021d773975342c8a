/**
 * @file FileDescriptor.hpp
 * @brief RAII wrapper for POSIX file descriptors
 *
 * Chunk files and the status file are written through raw descriptors; this
 * wrapper guarantees they are closed on every exit path of the write loop.
 */

#pragma once

#include <fcntl.h>
#include <unistd.h>

#include <filesystem>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Owning handle for a POSIX file descriptor
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;

    /**
     * @brief Take ownership of a raw file descriptor
     * @param fd Raw file descriptor (may be invalid)
     */
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
     * @brief Open a file for writing, creating it if needed
     * @param path File to open
     * @param append Append to the file instead of truncating it
     * @return Owning descriptor; invalid on failure with errno set by open(2)
     */
    [[nodiscard]] static auto open_for_write(const std::filesystem::path& path, bool append = false)
        -> FileDescriptor {
        int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
        flags |= append ? O_APPEND : O_TRUNC;
        return FileDescriptor(::open(path.c_str(), flags, 0644));
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the owned descriptor and adopt a new one
     * @param fd Descriptor to adopt (-1 leaves the wrapper empty)
     */
    void reset(int fd = -1) noexcept {
        if (is_valid()) {
            ::close(fd_);
        }
        fd_ = fd;
    }

    /**
     * @brief Close the descriptor now and report the result of close(2)
     * @return 0 on success, -1 with errno set on failure
     */
    auto close() noexcept -> int {
        if (!is_valid()) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }

private:
    int fd_ = -1;
};

}  // namespace util
