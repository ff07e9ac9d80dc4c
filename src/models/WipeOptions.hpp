/**
 * @file WipeOptions.hpp
 * @brief Orchestrator inputs and the aggregated summary it returns
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

/**
 * @enum WipeOutcome
 * @brief Overall result of one wipe() call; doubles as the process exit status
 */
enum class WipeOutcome {
    Success,         ///< Every file wiped (exit 0)
    TotalFailure,    ///< Nothing wiped, target missing, or confirmation withheld (exit 1)
    PartialFailure,  ///< At least one file failed (exit 2)
    DryRun           ///< Preview only (exit 3)
};

[[nodiscard]] auto to_string(WipeOutcome outcome) -> std::string_view;

/**
 * @brief Process exit status for an outcome
 */
[[nodiscard]] auto exit_code(WipeOutcome outcome) -> int;

/**
 * @struct FilePreview
 * @brief What would happen to one file; shown before confirmation and in dry-run
 */
struct FilePreview {
    std::filesystem::path path;
    uint64_t size_bytes = 0;
    StorageKind storage_kind = StorageKind::Unknown;
    PassPlan plan;
};

/**
 * @brief Approves or refuses the destructive stages for the previewed files
 */
using ConfirmationCallback = std::function<bool(const std::vector<FilePreview>&)>;

/**
 * @struct WipeOptions
 * @brief Per-invocation settings for Orchestrator::wipe()
 */
struct WipeOptions {
    SanitizationStandard standard = SanitizationStandard::NIST_CLEAR;
    bool verify = false;
    bool dry_run = false;
    bool pre_confirmed = false;  ///< Skip the confirmation callback
    bool recursive = true;
    int max_concurrency = 2;  ///< Files processed at once; values below 1 are treated as 1
    bool remove_empty_directories = true;
    bool make_writable = false;  ///< Add owner write permission before opening
    ProgressCallback on_progress;
    ConfirmationCallback confirm;
};

/**
 * @struct WipeSummary
 * @brief Aggregated outcome of one wipe() call
 */
struct WipeSummary {
    std::filesystem::path target;
    WipeOutcome outcome = WipeOutcome::TotalFailure;
    std::string message;
    std::vector<WipeResult> results;    ///< Enumeration order; empty in dry-run
    std::vector<FilePreview> previews;  ///< Enumeration order
    size_t total_files = 0;
    size_t files_wiped = 0;
    size_t files_failed = 0;
    uint64_t total_bytes_overwritten = 0;
    double duration_seconds = 0.0;
    size_t audit_failures = 0;
    std::vector<std::filesystem::path> skipped_directories;  ///< Unreadable, not descended into
};
