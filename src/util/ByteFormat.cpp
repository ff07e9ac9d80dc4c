#include "util/ByteFormat.hpp"

#include "util/Format.hpp"

#include <array>

namespace util {

namespace {

struct Unit {
    uint64_t threshold;
    const char* suffix;
    int decimals;
};

constexpr uint64_t KB = 1'024ULL;
constexpr uint64_t MB = KB * 1'024;
constexpr uint64_t GB = MB * 1'024;
constexpr uint64_t TB = GB * 1'024;

constexpr std::array<Unit, 4> UNITS{{
    {TB, "TB", 2},
    {GB, "GB", 2},
    {MB, "MB", 1},
    {KB, "KB", 1},
}};

}  // namespace

auto format_bytes(uint64_t bytes) -> std::string {
    for (const auto& unit : UNITS) {
        if (bytes >= unit.threshold) {
            return format_fixed(static_cast<double>(bytes) / static_cast<double>(unit.threshold),
                                unit.decimals) +
                   ' ' + unit.suffix;
        }
    }
    return std::to_string(bytes) + " B";
}

auto format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const auto hours = seconds / 3'600;
    const auto minutes = (seconds % 3'600) / 60;
    const auto secs = seconds % 60;

    if (hours > 0) {
        return std::to_string(hours) + ':' + pad_number(minutes, 2) + ':' + pad_number(secs, 2);
    }
    return std::to_string(minutes) + ':' + pad_number(secs, 2);
}

}  // namespace util
