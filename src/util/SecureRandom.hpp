#ifndef FILE_SANITIZER_UTIL_SECURE_RANDOM_HPP
#define FILE_SANITIZER_UTIL_SECURE_RANDOM_HPP

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace util {

/**
 * @class SecureRandom
 * @brief Cryptographically secure byte source backed by OpenSSL's DRBG
 *
 * Every call draws fresh bytes; nothing is cached or repeated between
 * calls, so consecutive overwrite chunks never share content.
 */
class SecureRandom {
public:
    static constexpr std::string_view LOWER_ALNUM = "abcdefghijklmnopqrstuvwxyz0123456789";

    /**
     * @brief Fill a buffer with random bytes
     * @param buffer Destination
     * @return Error if the generator is not seeded or fails
     */
    [[nodiscard]] static auto fill(std::span<uint8_t> buffer) -> std::expected<void, Error>;

    /**
     * @brief Uniform integer in [0, bound) without modulo bias
     * @param bound Exclusive upper bound, must be > 0
     */
    [[nodiscard]] static auto uniform(uint64_t bound) -> std::expected<uint64_t, Error>;

    /**
     * @brief Random string drawn from an alphabet
     * @param length Number of characters
     * @param alphabet Allowed characters (default: lowercase letters and digits)
     */
    [[nodiscard]] static auto token(size_t length, std::string_view alphabet = LOWER_ALNUM)
        -> std::expected<std::string, Error>;
};

}  // namespace util

#endif  // FILE_SANITIZER_UTIL_SECURE_RANDOM_HPP
