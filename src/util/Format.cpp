#include "util/Format.hpp"

#include <array>
#include <charconv>
#include <cmath>

namespace util {

auto format_fixed(double value, int decimals) -> std::string {
    if (!std::isfinite(value)) {
        return std::isnan(value) ? "nan" : (value < 0 ? "-inf" : "inf");
    }

    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value,
                                         std::chars_format::fixed, decimals);
    if (ec != std::errc{}) {
        // Only magnitudes beyond 1e60 overflow the buffer
        return std::to_string(value);
    }
    return {buffer.data(), end};
}

auto pad_left(std::string value, size_t width, char fill) -> std::string {
    if (value.size() < width) {
        value.insert(0, width - value.size(), fill);
    }
    return value;
}

}  // namespace util
