/**
 * @file ByteFormat.hpp
 * @brief Human-readable sizes and durations for the CLI and log lines
 */

#pragma once

#include <cstdint>
#include <string>

namespace util {

/**
 * @brief Format a byte count
 *
 * Below 1 KB the exact count is shown ("512 B"); KB and MB get one decimal,
 * GB and TB two ("1.23 GB").
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Format seconds as "M:SS" or "H:MM:SS"
 * @param seconds Duration; negative values render as "--:--"
 */
[[nodiscard]] auto format_duration(int64_t seconds) -> std::string;

}  // namespace util
