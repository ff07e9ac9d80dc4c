/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include "util/ByteFormat.hpp"
#include "util/Format.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto CYAN = "\033[36m";

}  // namespace

ProgressDisplay::ProgressDisplay(std::string target, std::string standard_name, size_t file_count)
    : target_(std::move(target)), standard_name_(std::move(standard_name)),
      file_count_(file_count), start_time_(std::chrono::steady_clock::now()) {
    // Disable colors if not a terminal
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::print_header() {
    std::cout << "\n";
    if (color_enabled_) {
        std::cout << BOLD;
    }
    std::cout << "Sanitizing " << target_ << " (" << file_count_ << " file"
              << (file_count_ != 1 ? "s" : "") << ")\n"
              << "Standard: " << standard_name_ << "\n";
    if (color_enabled_) {
        std::cout << RESET;
    }
    std::cout << std::flush;
    header_printed_ = true;
}

void ProgressDisplay::update(const ProgressEvent& event) {
    if (!header_printed_) {
        print_header();
    }

    if (event.path != current_file_) {
        if (files_seen_ > 0) {
            std::cout << "\n";
        }
        current_file_ = event.path;
        ++files_seen_;
        if (color_enabled_) {
            std::cout << CYAN;
        }
        std::cout << "[" << files_seen_ << "/" << file_count_ << "] " << event.path.string()
                  << " (" << util::format_bytes(event.total_bytes) << ")";
        if (color_enabled_) {
            std::cout << RESET;
        }
        std::cout << "\n";
    }

    clear_line();
    std::cout << render_status(event) << std::flush;
}

auto ProgressDisplay::render_status(const ProgressEvent& event) const -> std::string {
    const double percentage =
        event.total_bytes == 0
            ? 100.0
            : 100.0 * static_cast<double>(event.bytes_written) /
                  static_cast<double>(event.total_bytes);

    auto status = "Pass " + std::to_string(event.pass_index) + "/" +
                  std::to_string(event.pass_count) + ": " + generate_progress_bar(percentage) +
                  " " + util::pad_left(util::format_fixed(percentage, 1), 5) + "%";

    if (event.throughput_mbps > 0.0) {
        status += "  |  " + util::format_fixed(event.throughput_mbps, 1) + " MB/s";
    }
    return status;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    if (header_printed_) {
        std::cout << "\n";
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - start_time_)
                             .count();

    if (color_enabled_) {
        std::cout << (success ? GREEN : RED) << BOLD;
    }

    std::cout << (success ? "[OK] " : "[FAILED] ") << message << " in "
              << util::format_duration(elapsed);

    if (color_enabled_) {
        std::cout << RESET;
    }

    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";

    if (color_enabled_) {
        bar += GREEN;
    }

    for (int i = 0; i < filled; ++i) {
        bar += "\u2588";  // Full block character
    }

    if (color_enabled_) {
        bar += RESET;
    }

    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "\u2591";  // Light shade character
    }

    bar += "]";

    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
