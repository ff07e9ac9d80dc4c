/**
 * @file Error.hpp
 * @brief Low-level error value carried through std::expected
 *
 * Helpers that talk to the operating system return
 * std::expected<T, util::Error>. The errno that caused the failure travels
 * in the code field so callers can classify it.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <string>

namespace util {

/**
 * @struct Error
 * @brief Represents an error with a message and optional errno code
 */
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    /**
     * @brief Build an error from the current errno
     * @param context What was being attempted (e.g. "open /tmp/a")
     * @return Error with "context: strerror" message and errno code
     */
    [[nodiscard]] static auto from_errno(const std::string& context) -> Error {
        const int saved = errno;
        return Error{context + ": " + std::strerror(saved), saved};
    }
};

}  // namespace util
