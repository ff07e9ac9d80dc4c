#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <numeric>

namespace util {

/**
 * @class ThroughputMeter
 * @brief Rolling average of write speed over recent samples
 *
 * Fed the cumulative byte count after each chunk. A new sample is taken at
 * most every MIN_UPDATE_INTERVAL; between samples the last average is
 * reported.
 *
 * @note Not thread-safe; one meter per wipe execution.
 */
class ThroughputMeter {
public:
    static constexpr auto MIN_UPDATE_INTERVAL = std::chrono::milliseconds{100};
    static constexpr size_t MAX_SAMPLES = 10;
    static constexpr double BYTES_PER_MB = 1'048'576.0;

    ThroughputMeter() : start_time_(std::chrono::steady_clock::now()), last_time_(start_time_) {}

    /**
     * @param cumulative_bytes Bytes written since the meter was created
     * @return Average speed in MB/s (0 until the first sample)
     */
    auto update(uint64_t cumulative_bytes) -> double {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = now - last_time_;

        if (elapsed >= MIN_UPDATE_INTERVAL && cumulative_bytes > last_bytes_) {
            const double seconds = std::chrono::duration<double>(elapsed).count();
            samples_.push_back(static_cast<double>(cumulative_bytes - last_bytes_) / seconds);
            if (samples_.size() > MAX_SAMPLES) {
                samples_.pop_front();
            }
            last_time_ = now;
            last_bytes_ = cumulative_bytes;
        }

        if (samples_.empty()) {
            // Short runs may finish before the first interval elapses
            const double seconds = std::chrono::duration<double>(now - start_time_).count();
            return seconds > 0.0 ? static_cast<double>(cumulative_bytes) / seconds / BYTES_PER_MB
                                 : 0.0;
        }
        const double sum = std::accumulate(samples_.begin(), samples_.end(), 0.0);
        return sum / static_cast<double>(samples_.size()) / BYTES_PER_MB;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_time_;
    uint64_t last_bytes_ = 0;
    std::deque<double> samples_;
};

}  // namespace util
