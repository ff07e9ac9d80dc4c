#pragma once

#include "util/Error.hpp"

#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <expected>

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

inline auto read_with_retry(int fd, void* buffer, size_t size) -> ssize_t {
    while (true) {
        const auto result = ::read(fd, buffer, size);
        if (result >= 0 || errno != EINTR) {
            return result;
        }
    }
}

// Writes the whole buffer; short writes are resumed, a zero-byte write is
// reported as ENOSPC.
inline auto write_all(int fd, const uint8_t* data, size_t size) -> std::expected<void, Error> {
    size_t done = 0;
    while (done < size) {
        const auto n = write_with_retry(fd, data + done, size - done);
        if (n < 0) {
            return std::unexpected(Error::from_errno("write"));
        }
        if (n == 0) {
            return std::unexpected(Error{"write: no progress", ENOSPC});
        }
        done += static_cast<size_t>(n);
    }
    return {};
}

// Fills up to size bytes from offset; returns fewer only at end of file.
inline auto pread_full(int fd, uint8_t* data, size_t size, uint64_t offset)
    -> std::expected<size_t, Error> {
    size_t done = 0;
    while (done < size) {
        const auto n = ::pread(fd, data + done, size - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(Error::from_errno("pread"));
        }
        if (n == 0) {
            break;
        }
        done += static_cast<size_t>(n);
    }
    return done;
}

inline auto fsync_with_retry(int fd) -> std::expected<void, Error> {
    while (::fsync(fd) != 0) {
        if (errno != EINTR) {
            return std::unexpected(Error::from_errno("fsync"));
        }
    }
    return {};
}

}  // namespace util
