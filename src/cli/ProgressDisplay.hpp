/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI sanitization runs
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Shows one bar per file with the current pass, percentage of that pass
 * and throughput. Uses ANSI escape codes when stdout is a terminal.
 */
class ProgressDisplay {
public:
    /**
     * @param target Path given on the command line
     * @param standard_name Standard being applied (e.g. "NIST_PURGE")
     * @param file_count Number of files that will be processed
     */
    ProgressDisplay(std::string target, std::string standard_name, size_t file_count);

    /**
     * @brief Redraw for one engine event
     */
    void update(const ProgressEvent& event);

    /**
     * @brief Print the final status line
     */
    void complete(bool success, const std::string& message);

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Status line for an event, e.g. "Pass 2/3: [...]  50.0%  |  120.5 MB/s"
     */
    [[nodiscard]] auto render_status(const ProgressEvent& event) const -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;

    void print_header();
    void clear_line();

    std::string target_;
    std::string standard_name_;
    size_t file_count_;
    size_t files_seen_ = 0;
    std::filesystem::path current_file_;
    bool color_enabled_ = true;
    bool header_printed_ = false;
    std::chrono::steady_clock::time_point start_time_;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
