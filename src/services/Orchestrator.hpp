/**
 * @file Orchestrator.hpp
 * @brief Runs the full sanitization pipeline over a file or directory tree
 */

#pragma once

#include "models/WipeOptions.hpp"
#include "services/IAuditLogger.hpp"
#include "services/IMetadataScrubber.hpp"
#include "services/IStorageClassifier.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

class StorageKindCache;

/**
 * @class Orchestrator
 * @brief classify -> plan -> hash -> overwrite -> verify -> scrub -> audit, per file
 *
 * Each file yields exactly one WipeResult, and outside dry-run exactly one
 * audit record, whether it succeeded or not. A failing file never stops
 * the others. Files run at most WipeOptions::max_concurrency at a time;
 * passes within a file are strictly sequential.
 */
class Orchestrator {
public:
    /**
     * @param scrubber Final scrub and unlink; defaults to MetadataScrubber
     */
    Orchestrator(std::shared_ptr<IStorageClassifier> classifier,
                 std::shared_ptr<IAuditLogger> audit_logger,
                 std::shared_ptr<IMetadataScrubber> scrubber = nullptr);

    /**
     * @brief Sanitize @p target (a regular file, or a directory of them)
     *
     * Nothing destructive happens unless options.pre_confirmed is set or
     * options.confirm approves the previews.
     */
    [[nodiscard]] auto wipe(const std::filesystem::path& target, const WipeOptions& options)
        -> WipeSummary;

    /**
     * @brief Regular files under @p directory, sorted lexicographically
     *
     * Symlinks, special files and subdirectories that cannot be opened are
     * skipped with a warning.
     * @param recursive Descend into subdirectories
     * @param skipped If set, receives the subdirectories that could not be opened
     */
    [[nodiscard]] static auto collect_files(const std::filesystem::path& directory, bool recursive,
                                            std::vector<std::filesystem::path>* skipped = nullptr)
        -> std::expected<std::vector<std::filesystem::path>, util::Error>;

    /**
     * @brief Remove empty subdirectories bottom-up, then @p root itself if empty
     * @return Number of directories removed
     */
    static auto remove_empty_directories(const std::filesystem::path& root) -> size_t;

private:
    [[nodiscard]] auto preview(const std::filesystem::path& path, StorageKindCache& cache,
                               const WipeOptions& options) const -> FilePreview;

    [[nodiscard]] auto wipe_file(const FilePreview& preview, const WipeOptions& options,
                                 const ProgressCallback& progress) const -> WipeResult;

    auto record(const WipeResult& result) -> bool;

    std::shared_ptr<IStorageClassifier> classifier_;
    std::shared_ptr<IAuditLogger> audit_logger_;
    std::shared_ptr<IMetadataScrubber> scrubber_;
};
