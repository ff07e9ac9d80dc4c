#include "util/SecureRandom.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <limits>

namespace util {

namespace {

auto openssl_error(const char* what) -> Error {
    const auto code = ERR_get_error();
    std::string detail = code != 0 ? ERR_error_string(code, nullptr) : "unknown error";
    return Error{std::string(what) + " failed: " + detail};
}

}  // namespace

auto SecureRandom::fill(std::span<uint8_t> buffer) -> std::expected<void, Error> {
    // RAND_bytes takes an int length
    constexpr size_t MAX_REQUEST = static_cast<size_t>(INT_MAX);

    size_t offset = 0;
    while (offset < buffer.size()) {
        const size_t request = std::min(MAX_REQUEST, buffer.size() - offset);
        if (RAND_bytes(buffer.data() + offset, static_cast<int>(request)) != 1) {
            return std::unexpected(openssl_error("RAND_bytes"));
        }
        offset += request;
    }
    return {};
}

auto SecureRandom::uniform(uint64_t bound) -> std::expected<uint64_t, Error> {
    if (bound == 0) {
        return std::unexpected(Error{"uniform: bound must be positive", EINVAL});
    }

    // Reject draws from the incomplete top bucket
    const uint64_t limit = std::numeric_limits<uint64_t>::max() -
                           (std::numeric_limits<uint64_t>::max() % bound);
    while (true) {
        uint64_t value = 0;
        auto drawn = fill({reinterpret_cast<uint8_t*>(&value), sizeof(value)});
        if (!drawn) {
            return std::unexpected(drawn.error());
        }
        if (value < limit) {
            return value % bound;
        }
    }
}

auto SecureRandom::token(size_t length, std::string_view alphabet)
    -> std::expected<std::string, Error> {
    if (alphabet.empty()) {
        return std::unexpected(Error{"token: empty alphabet", EINVAL});
    }

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        auto index = uniform(alphabet.size());
        if (!index) {
            return std::unexpected(index.error());
        }
        result.push_back(alphabet[*index]);
    }
    return result;
}

}  // namespace util
