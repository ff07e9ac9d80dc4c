/**
 * @file Format.hpp
 * @brief Number-to-text primitives shared by log lines, the CLI and reports
 *
 * Every fixed-point and zero-padded rendering in the project goes through here.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace util {

/**
 * @brief Render @p value with exactly @p decimals digits after the point
 *
 * format_fixed(7.98765, 3) == "7.988"
 */
[[nodiscard]] auto format_fixed(double value, int decimals) -> std::string;

/**
 * @brief Right-align @p value in a field of @p width characters
 *
 * Longer values are returned unchanged.
 */
[[nodiscard]] auto pad_left(std::string value, size_t width, char fill = ' ') -> std::string;

/**
 * @brief Zero-padded decimal, e.g. pad_number(7, 2) == "07"
 */
[[nodiscard]] inline auto pad_number(int64_t value, size_t width) -> std::string {
    return pad_left(std::to_string(value), width, '0');
}

}  // namespace util
