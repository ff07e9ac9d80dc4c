/**
 * @file Logger.hpp
 * @brief Thread-safe operational logging with file rotation
 *
 * Operational diagnostics (stage transitions, warnings, failures) go here.
 * The tamper-evident per-wipe trail is the separate AuditLogger; nothing
 * in this log is required for auditability.
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Per-chunk and per-sample detail
    INFO,     ///< Stage transitions and per-file outcomes
    WARNING,  ///< Degraded but non-fatal conditions
    ERROR     ///< Failed stages
};

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
 * @return Level, or nullopt for unknown text
 */
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<LogLevel>;

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 5 * 1024 * 1024;  ///< Rotate when the file reaches this size
    int max_files = 5;                             ///< Rotated files kept ({app}.N.log)
};

/**
 * @class Logger
 * @brief Process-wide logger writing "{timestamp} [LEVEL] [component] message" lines
 *
 * Usage:
 * @code
 * util::Logger::instance().initialize(log_dir, "file-sanitizer-cli");
 * LOG_INFO("WipeEngine", "pass 1/3 complete for " + path.string());
 * @endcode
 *
 * Before initialize() succeeds, messages only reach stderr (when console
 * output is enabled), so library code may log unconditionally.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending
     * @param log_dir Directory for log files (created if missing)
     * @param app_name Base name of the log file
     * @param min_level Minimum level written
     * @param policy Rotation policy
     * @return true if the log file is open
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Also echo lines to stderr
     */
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    void write_line_locked(const std::string& line);
    void rotate_locked();
    auto open_locked() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
