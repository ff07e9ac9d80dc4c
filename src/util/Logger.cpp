/**
 * @file Logger.cpp
 * @brief Thread-safe logging implementation
 */

#include "util/Logger.hpp"

#include "util/TimeFormat.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace util {

auto parse_log_level(std::string_view text) -> std::optional<LogLevel> {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger instance;
    return instance;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    initialized_ = false;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "Logger: cannot create " << log_dir_ << ": " << ec.message() << std::endl;
        return false;
    }

    if (!open_locked()) {
        return false;
    }

    initialized_ = true;
    write_line_locked(iso8601_utc_now() + " [INFO ] [Logger] opened " +
                      (log_dir_ / (app_name_ + ".log")).string() + "\n");
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_locked() -> bool {
    const auto log_path = log_dir_ / (app_name_ + ".log");

    file_.open(log_path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Logger: cannot open " << log_path << std::endl;
        return false;
    }

    std::error_code ec;
    current_file_size_ = std::filesystem::file_size(log_path, ec);
    if (ec) {
        current_file_size_ = 0;
    }
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string line = iso8601_utc_now();
    line.append(" [").append(level_to_string(level)).append("] [");
    line.append(component).append("] ").append(message).push_back('\n');

    if (initialized_ && file_.is_open()) {
        if (current_file_size_ >= policy_.max_file_size_bytes) {
            rotate_locked();
        }
        write_line_locked(line);
    }

    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::write_line_locked(const std::string& line) {
    file_ << line;
    file_.flush();
    current_file_size_ += line.size();
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);

    if (initialized_ && file_.is_open()) {
        write_line_locked(iso8601_utc_now() + " [INFO ] [Logger] closing\n");
        file_.close();
    }
    initialized_ = false;
}

auto Logger::level_to_string(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_locked() {
    if (file_.is_open()) {
        file_.close();
    }

    auto rotated = [this](int index) {
        return log_dir_ / (app_name_ + "." + std::to_string(index) + ".log");
    };

    // {app}.N-1.log -> {app}.N.log ... {app}.log -> {app}.1.log; the oldest falls off
    std::error_code ec;
    std::filesystem::remove(rotated(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        if (std::filesystem::exists(rotated(i), ec)) {
            std::filesystem::rename(rotated(i), rotated(i + 1), ec);
        }
    }
    std::filesystem::rename(log_dir_ / (app_name_ + ".log"), rotated(1), ec);

    if (open_locked()) {
        write_line_locked(iso8601_utc_now() + " [INFO ] [Logger] rotated\n");
    }
}

}  // namespace util
