/**
 * @file CliApplication.hpp
 * @brief CLI application for file sanitization
 */

#pragma once

#include "models/WipeOptions.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool wipe = false;
    std::string target;
    std::string standard = "clear";
    bool verify = false;
    bool dry_run = false;
    bool assume_yes = false;
    bool recursive = true;
    bool keep_dirs = false;
    bool force = false;
    int jobs = 2;
    std::string audit_log;  ///< Empty: default location
    std::string log_level = "info";
    std::string error;  ///< Set when the command line is invalid
};

/**
 * @class CliApplication
 * @brief Command-line front end over Orchestrator
 *
 * Provides command-line interface for:
 * - Previewing the plan for a file or directory (--dry-run)
 * - Sanitizing it after a typed confirmation
 * - Optional entropy verification of every file
 */
class CliApplication {
public:
    CliApplication() = default;

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (see WipeOutcome)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     *
     * Resets getopt state, so it may be called repeatedly.
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();
    static void print_version();

    /**
     * @brief Table of what would happen to each file
     */
    static void print_previews(std::ostream& out, const std::vector<FilePreview>& previews);

    /**
     * @brief Totals plus one line per failed file
     */
    static void print_summary(std::ostream& out, const WipeSummary& summary);

    /**
     * @brief Ask for a typed "yes"
     * @return true only if the answer is exactly "yes"
     */
    [[nodiscard]] static auto confirm_wipe(std::istream& in, std::ostream& out,
                                           const std::vector<FilePreview>& previews) -> bool;

private:
    /**
     * @brief Build options, run the orchestrator and report
     */
    auto cmd_wipe(const CliOptions& options) -> int;
};

}  // namespace cli
