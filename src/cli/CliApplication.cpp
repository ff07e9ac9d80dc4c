/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "services/AuditLogger.hpp"
#include "services/Orchestrator.hpp"
#include "services/StorageClassifier.hpp"
#include "util/ByteFormat.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>

#include <getopt.h>

namespace cli {

namespace {

// Application name
constexpr auto APP_NAME = "file-sanitizer-cli";

// Long-only options
enum : int {
    OPT_NO_RECURSIVE = 1000,
    OPT_KEEP_DIRS,
    OPT_LOG_LEVEL,
};

// Command line options
const struct option long_options[] = {
    {        "help",       no_argument, nullptr,                'h'},
    {     "version",       no_argument, nullptr,                'V'},
    {        "wipe", required_argument, nullptr,                'w'},
    {    "standard", required_argument, nullptr,                's'},
    {      "verify",       no_argument, nullptr,                'v'},
    {     "dry-run",       no_argument, nullptr,                'n'},
    {         "yes",       no_argument, nullptr,                'y'},
    {"no-recursive",       no_argument, nullptr,   OPT_NO_RECURSIVE},
    {        "jobs", required_argument, nullptr,                'j'},
    {   "audit-log", required_argument, nullptr,                'a'},
    {   "keep-dirs",       no_argument, nullptr,      OPT_KEEP_DIRS},
    {       "force",       no_argument, nullptr,                'f'},
    {   "log-level", required_argument, nullptr,      OPT_LOG_LEVEL},
    {       nullptr,                 0, nullptr,                  0}
};

constexpr int MAX_JOBS = 64;

auto parse_jobs(const char* text) -> std::optional<int> {
    const std::string_view view{text};
    int value = 0;
    const auto [end, ec] = std::from_chars(view.data(), view.data() + view.size(), value);
    if (ec != std::errc{} || end != view.data() + view.size() || value < 1 || value > MAX_JOBS) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    const auto level = util::parse_log_level(options.log_level);
    if (!level && options.error.empty()) {
        options.error = "unknown log level '" + options.log_level + "'";
    }

    // Initialize logger for CLI application
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / "file-sanitizer" / "logs";
    util::Logger::instance().initialize(log_dir, APP_NAME, level.value_or(util::LogLevel::INFO));

    if (!options.error.empty()) {
        LOG_ERROR("CLI", options.error);
        std::cerr << "Error: " << options.error << "\n"
                  << "Run with --help for usage.\n";
        return exit_code(WipeOutcome::TotalFailure);
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    if (options.wipe) {
        return cmd_wipe(options);
    }

    // No command specified
    print_help();
    return exit_code(WipeOutcome::TotalFailure);
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    optind = 0;  // full getopt reinitialization (glibc)
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVw:s:vnyj:a:f", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'w':
                options.wipe = true;
                options.target = optarg;
                break;
            case 's':
                options.standard = optarg;
                break;
            case 'v':
                options.verify = true;
                break;
            case 'n':
                options.dry_run = true;
                break;
            case 'y':
                options.assume_yes = true;
                break;
            case OPT_NO_RECURSIVE:
                options.recursive = false;
                break;
            case 'j':
                if (auto jobs = parse_jobs(optarg)) {
                    options.jobs = *jobs;
                } else {
                    options.error = "--jobs expects a number between 1 and " +
                                    std::to_string(MAX_JOBS) + ", got '" + optarg + "'";
                }
                break;
            case 'a':
                options.audit_log = optarg;
                break;
            case OPT_KEEP_DIRS:
                options.keep_dirs = true;
                break;
            case 'f':
                options.force = true;
                break;
            case OPT_LOG_LEVEL:
                options.log_level = optarg;
                break;
            default:
                options.error = "unrecognized or incomplete option";
                break;
        }
    }

    if (options.error.empty() && !parse_standard(options.standard)) {
        options.error = "unknown standard '" + options.standard + "' (use clear, purge or dod)";
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS] --wipe <path>\n\n"
              << "Irreversibly destroy files: multi-pass overwrite, entropy check,\n"
              << "metadata scrub and an append-only audit trail\n\n"
              << "Commands:\n"
              << "  -w, --wipe <path>       Sanitize a file, or every file under a directory\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -s, --standard <name>   clear, purge or dod (default: clear)\n"
              << "  -v, --verify            Check entropy of each file after the last pass\n"
              << "  -n, --dry-run           Show the plan without touching anything\n"
              << "  -y, --yes               Skip the confirmation prompt\n"
              << "      --no-recursive      Only files directly inside the directory\n"
              << "  -j, --jobs <n>          Files processed concurrently (default: 2)\n"
              << "  -a, --audit-log <file>  Audit trail location\n"
              << "      --keep-dirs         Leave emptied directories in place\n"
              << "  -f, --force             Make read-only files writable first\n"
              << "      --log-level <lvl>   debug, info, warning or error (default: info)\n\n"
              << "Standards:\n"
              << "  clear                   One random pass\n"
              << "  purge                   Zero, one, random on HDDs; one random pass on SSDs\n"
              << "  dod                     Zero, one, random on every device\n\n"
              << "Exit codes: 0 success, 1 total failure, 2 partial failure, 3 dry run\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --wipe secrets.txt\n"
              << "  " << APP_NAME << " --wipe ./old-project --standard purge --verify\n"
              << "  " << APP_NAME << " --wipe ./old-project --dry-run\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Part of " << PROJECT_NAME << " - verifiable file destruction\n";
}

void CliApplication::print_previews(std::ostream& out, const std::vector<FilePreview>& previews) {
    // Column widths for table formatting
    constexpr int COL_SIZE = 12;
    constexpr int COL_STRATEGY = 20;
    constexpr int COL_PASSES = 8;

    out << std::left << std::setw(COL_SIZE) << "SIZE" << std::setw(COL_STRATEGY) << "STRATEGY"
        << std::setw(COL_PASSES) << "PASSES"
        << "PATH\n";
    out << std::string(COL_SIZE + COL_STRATEGY + COL_PASSES + 4, '-') << "\n";

    uint64_t total = 0;
    for (const auto& preview : previews) {
        out << std::left << std::setw(COL_SIZE) << util::format_bytes(preview.size_bytes)
            << std::setw(COL_STRATEGY) << preview.plan.strategy_label << std::setw(COL_PASSES)
            << preview.plan.pass_count() << preview.path.string() << "\n";
        total += preview.size_bytes;
    }
    out << "\n"
        << previews.size() << " file" << (previews.size() != 1 ? "s" : "") << ", "
        << util::format_bytes(total) << "\n";
}

void CliApplication::print_summary(std::ostream& out, const WipeSummary& summary) {
    out << "Files:       " << summary.files_wiped << " sanitized, " << summary.files_failed
        << " failed, " << summary.total_files << " total\n"
        << "Overwritten: " << util::format_bytes(summary.total_bytes_overwritten) << "\n";

    if (summary.audit_failures > 0) {
        out << "Audit:       " << summary.audit_failures << " record(s) could not be written\n";
    }
    if (!summary.skipped_directories.empty()) {
        out << "Skipped:     " << summary.skipped_directories.size()
            << " unreadable director" << (summary.skipped_directories.size() == 1 ? "y" : "ies")
            << "\n";
        for (const auto& directory : summary.skipped_directories) {
            out << "  SKIPPED " << directory.string() << "\n";
        }
    }

    for (const auto& result : summary.results) {
        if (result.success) {
            continue;
        }
        out << "  FAILED " << result.path.string();
        if (result.error_stage && result.error_kind) {
            out << " [" << to_string(*result.error_stage) << "/" << to_string(*result.error_kind)
                << "]";
        }
        if (!result.error_message.empty()) {
            out << ": " << result.error_message;
        }
        out << "\n";
    }
}

auto CliApplication::confirm_wipe(std::istream& in, std::ostream& out,
                                  const std::vector<FilePreview>& previews) -> bool {
    out << "\n";
    out << "\033[1;31mWARNING: " << previews.size() << " file"
        << (previews.size() != 1 ? "s" : "")
        << " will be PERMANENTLY DESTROYED. This cannot be undone.\033[0m\n\n";
    out << "Type 'yes' to confirm: ";
    out.flush();

    std::string input;
    std::getline(in, input);

    return input == "yes";
}

auto CliApplication::cmd_wipe(const CliOptions& options) -> int {
    const auto standard =
        parse_standard(options.standard).value_or(SanitizationStandard::NIST_CLEAR);
    const auto audit_path = options.audit_log.empty()
                                ? JsonlAuditLogger::default_path()
                                : std::filesystem::path{options.audit_log};

    Orchestrator orchestrator(std::make_shared<StorageClassifier>(),
                              std::make_shared<JsonlAuditLogger>(audit_path));

    std::unique_ptr<ProgressDisplay> progress;

    WipeOptions wipe_options;
    wipe_options.standard = standard;
    wipe_options.verify = options.verify;
    wipe_options.dry_run = options.dry_run;
    wipe_options.recursive = options.recursive;
    wipe_options.max_concurrency = options.jobs;
    wipe_options.remove_empty_directories = !options.keep_dirs;
    wipe_options.make_writable = options.force;

    // The gate always runs so the plan is shown; --yes only skips the prompt
    wipe_options.confirm = [&](const std::vector<FilePreview>& previews) {
        print_previews(std::cout, previews);
        if (previews.empty()) {
            return true;
        }
        if (!options.assume_yes && !confirm_wipe(std::cin, std::cout, previews)) {
            return false;
        }
        progress = std::make_unique<ProgressDisplay>(options.target,
                                                     std::string(to_string(standard)),
                                                     previews.size());
        return true;
    };
    wipe_options.on_progress = [&progress](const ProgressEvent& event) {
        if (progress) {
            progress->update(event);
        }
    };

    LOG_INFO("CLI", "wipe " + options.target + " standard=" + std::string(to_string(standard)) +
                        (options.dry_run ? " (dry run)" : ""));

    const auto summary = orchestrator.wipe(options.target, wipe_options);

    if (summary.outcome == WipeOutcome::DryRun) {
        print_previews(std::cout, summary.previews);
        std::cout << "\nDry run: nothing was modified.\n";
        return exit_code(summary.outcome);
    }

    if (progress) {
        progress->complete(summary.outcome == WipeOutcome::Success, summary.message);
    } else if (summary.outcome != WipeOutcome::Success) {
        std::cerr << "Error: " << summary.message << "\n";
    }

    if (!summary.results.empty()) {
        print_summary(std::cout, summary);
        std::cout << "Audit log:   " << audit_path.string() << "\n";
    }

    return exit_code(summary.outcome);
}

}  // namespace cli
