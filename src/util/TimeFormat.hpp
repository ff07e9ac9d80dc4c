#pragma once

#include <chrono>
#include <string>

namespace util {

/**
 * @brief Format a wall-clock instant as ISO 8601 UTC with milliseconds
 * @return e.g. "2026-01-22T14:32:45.123Z"
 */
[[nodiscard]] auto iso8601_utc(std::chrono::system_clock::time_point when) -> std::string;

/**
 * @brief iso8601_utc() of the current time
 */
[[nodiscard]] auto iso8601_utc_now() -> std::string;

}  // namespace util
