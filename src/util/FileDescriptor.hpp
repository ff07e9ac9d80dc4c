/**
 * @file FileDescriptor.hpp
 * @brief RAII ownership of POSIX file descriptors
 *
 * Every descriptor the engine opens is owned by a FileDescriptor so that
 * abandoning a wipe midway (exception, early return, dropped execution)
 * still closes the file and drops any flock held on it.
 */

#pragma once

#include "util/Error.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <expected>
#include <filesystem>
#include <utility>

namespace util {

/**
 * @class FileDescriptor
 * @brief Move-only owner of a raw file descriptor
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
     * @brief open(2) wrapper retrying on EINTR
     * @param path File to open
     * @param flags open(2) flags; O_CLOEXEC is always added
     * @param mode Creation mode when O_CREAT is given
     * @return Owned descriptor or the errno-carrying error
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path, int flags,
                                   mode_t mode = 0600) -> std::expected<FileDescriptor, Error> {
        int fd = -1;
        do {
            fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            return std::unexpected(Error::from_errno("open " + path.string()));
        }
        return FileDescriptor{fd};
    }

    /**
     * @brief Take an exclusive advisory lock without blocking
     * @return Error with EWOULDBLOCK when another holder owns the lock
     */
    [[nodiscard]] auto lock_exclusive() const -> std::expected<void, Error> {
        while (::flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            if (errno != EINTR) {
                return std::unexpected(Error::from_errno("flock"));
            }
        }
        return {};
    }

    [[nodiscard]] constexpr auto get() const noexcept -> int { return fd_; }

    [[nodiscard]] constexpr auto is_valid() const noexcept -> bool { return fd_ >= 0; }

    explicit operator bool() const noexcept { return is_valid(); }

    /**
     * @brief Close the current descriptor (if any) and adopt a new one
     */
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
