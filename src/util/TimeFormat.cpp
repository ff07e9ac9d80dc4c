#include "util/TimeFormat.hpp"

#include "util/Format.hpp"

#include <array>
#include <ctime>

namespace util {

auto iso8601_utc(std::chrono::system_clock::time_point when) -> std::string {
    auto time_t_when = std::chrono::system_clock::to_time_t(when);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds{1000};
        --time_t_when;
    }

    std::tm tm_buf{};
    gmtime_r(&time_t_when, &tm_buf);

    std::array<char, 32> stamp{};
    const auto length = std::strftime(stamp.data(), stamp.size(), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(stamp.data(), length) + '.' + pad_number(ms.count(), 3) + 'Z';
}

auto iso8601_utc_now() -> std::string {
    return iso8601_utc(std::chrono::system_clock::now());
}

}  // namespace util
