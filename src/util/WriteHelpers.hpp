#pragma once

#include <cerrno>
#include <cstddef>
#include <unistd.h>

namespace util {

inline auto write_with_retry(int fd, const void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::write(fd, buffer, size);
        if (result < 0 && (errno == EINTR || errno == EAGAIN)) {
            continue;
        }
        return result;
    }
}

// Repeats a call that failed with -1/EINTR; every other result is returned as is
template <typename Call>
auto retry_on_eintr(Call&& call) {
    while (true) {
        auto result = call();
        if (result == -1 && errno == EINTR) {
            continue;
        }
        return result;
    }
}

// Short writes are resumed until the whole buffer is out. A zero-length write
// from the kernel is reported as ENOSPC.
inline auto write_all(int fd, const void* buffer, size_t size) -> bool {
    const auto* cursor = static_cast<const char*>(buffer);
    while (size > 0) {
        const auto result = write_with_retry(fd, cursor, size);
        if (result < 0) {
            return false;
        }
        if (result == 0) {
            errno = ENOSPC;
            return false;
        }
        cursor += result;
        size -= static_cast<size_t>(result);
    }
    return true;
}

} // namespace util
