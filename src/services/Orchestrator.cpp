#include "services/Orchestrator.hpp"

#include "algorithms/EntropyVerifier.hpp"
#include "algorithms/SanitizationPlanner.hpp"
#include "services/MetadataScrubber.hpp"
#include "services/StorageKindCache.hpp"
#include "services/WipeEngine.hpp"
#include "util/Format.hpp"
#include "util/Logger.hpp"
#include "util/Sha256.hpp"
#include "util/TimeFormat.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace {

auto seconds_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Adds owner write permission to a read-only file
void ensure_writable(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || (st.st_mode & S_IWUSR) != 0) {
        return;
    }
    if (::chmod(path.c_str(), st.st_mode | S_IWUSR) != 0) {
        LOG_WARNING("Orchestrator", util::Error::from_errno("chmod u+w " + path.string()).message);
    }
}

auto plural(size_t count, const char* one, const char* many) -> std::string {
    return std::to_string(count) + " " + (count == 1 ? one : many);
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<IStorageClassifier> classifier,
                           std::shared_ptr<IAuditLogger> audit_logger,
                           std::shared_ptr<IMetadataScrubber> scrubber)
    : classifier_(std::move(classifier)),
      audit_logger_(std::move(audit_logger)),
      scrubber_(scrubber ? std::move(scrubber) : std::make_shared<MetadataScrubber>()) {}

auto Orchestrator::collect_files(const fs::path& directory, bool recursive,
                                 std::vector<fs::path>* skipped)
    -> std::expected<std::vector<fs::path>, util::Error> {
    std::vector<fs::path> files;

    auto consider = [&files](const fs::directory_entry& entry) {
        std::error_code ec;
        const auto status = entry.symlink_status(ec);
        if (ec) {
            LOG_WARNING("Orchestrator", "skipping " + entry.path().string() + ": " + ec.message());
            return;
        }
        if (fs::is_symlink(status)) {
            LOG_WARNING("Orchestrator", "skipping symlink " + entry.path().string());
        } else if (fs::is_regular_file(status)) {
            files.push_back(entry.path());
        } else if (!fs::is_directory(status)) {
            LOG_WARNING("Orchestrator", "skipping special file " + entry.path().string());
        }
    };

    std::error_code ec;
    if (recursive) {
        fs::recursive_directory_iterator it(directory, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            std::error_code type_ec;
            if (it->is_directory(type_ec) && !it->is_symlink(type_ec)) {
                std::error_code open_ec;
                fs::directory_iterator contents(it->path(), open_ec);
                if (open_ec) {
                    LOG_WARNING("Orchestrator", "skipping unreadable directory " +
                                                    it->path().string() + ": " +
                                                    open_ec.message());
                    if (skipped != nullptr) {
                        skipped->push_back(it->path());
                    }
                    it.disable_recursion_pending();
                    continue;
                }
            }
            consider(*it);
        }
    } else {
        fs::directory_iterator it(directory, ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        return std::unexpected(util::Error{"list " + directory.string() + ": " + ec.message(),
                                           ec.value()});
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto Orchestrator::remove_empty_directories(const fs::path& root) -> size_t {
    std::vector<fs::path> directories;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec) && !it->is_symlink(ec)) {
            directories.push_back(it->path());
        }
    }

    // Children sort after their parents; walk backwards so they go first
    std::sort(directories.begin(), directories.end());
    std::reverse(directories.begin(), directories.end());
    directories.push_back(root);

    size_t removed = 0;
    for (const auto& directory : directories) {
        if (::rmdir(directory.c_str()) == 0) {
            ++removed;
        } else if (errno != ENOTEMPTY && errno != EEXIST) {
            LOG_DEBUG("Orchestrator",
                      util::Error::from_errno("rmdir " + directory.string()).message);
        }
    }
    return removed;
}

auto Orchestrator::preview(const fs::path& path, StorageKindCache& cache,
                           const WipeOptions& options) const -> FilePreview {
    FilePreview preview;
    preview.path = path;

    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    preview.size_bytes = ec ? 0 : size;

    preview.storage_kind = cache.kind_for(path);
    preview.plan =
        SanitizationPlanner::plan(options.standard, preview.storage_kind, options.verify);
    return preview;
}

auto Orchestrator::wipe_file(const FilePreview& preview, const WipeOptions& options,
                             const ProgressCallback& progress) const -> WipeResult {
    const auto start = std::chrono::steady_clock::now();
    const auto& path = preview.path;
    const auto& plan = preview.plan;

    WipeResult result;
    result.path = path;
    result.size_bytes = preview.size_bytes;
    result.standard_used = plan.standard;
    result.strategy_label = plan.strategy_label;

    auto failed = [&](const WipeError& error) {
        result.fail(error);
        result.duration_seconds = seconds_since(start);
        LOG_ERROR("Orchestrator", path.string() + " failed at " + error.describe());
        return result;
    };

    if (options.make_writable) {
        ensure_writable(path);
    }

    auto digest = util::sha256_file(path);
    if (!digest) {
        return failed(WipeError::from(WipeStage::Hash, digest.error()));
    }
    result.sha256_before = std::move(*digest);

    auto execution = WipeEngine::execute(path, plan);
    while (true) {
        auto event = execution.next();
        if (!event) {
            result.passes_executed = execution.passes_executed();
            return failed(event.error());
        }
        if (!event->has_value()) {
            break;
        }
        if (progress) {
            progress(**event);
        }
    }
    result.passes_executed = execution.passes_executed();
    result.size_bytes = execution.initial_size();

    std::optional<WipeError> verification_failure;
    if (plan.verify) {
        auto report = EntropyVerifier::verify(path);
        if (!report) {
            return failed(report.error());
        }
        result.verified = report->passed;
        result.mean_entropy = report->mean_entropy_bits_per_byte;
        if (!report->passed) {
            verification_failure = WipeError{
                ErrorKind::VerificationFailed, WipeStage::Verify,
                "mean entropy " + util::format_fixed(report->mean_entropy_bits_per_byte, 3) +
                    " bits/byte is not above " +
                    util::format_fixed(EntropyVerifier::PASS_THRESHOLD, 3),
                0};
        }
    }

    // The overwritten file is removed even when verification failed; that failure is
    // still the one reported.
    auto scrubbed = scrubber_->scrub(path);
    if (!scrubbed) {
        if (verification_failure) {
            LOG_ERROR("Orchestrator", path.string() + ": " + scrubbed.error().describe());
            return failed(*verification_failure);
        }
        return failed(scrubbed.error());
    }
    result.final_path = scrubbed->final_path;
    if (verification_failure) {
        if (scrubbed->degraded) {
            LOG_WARNING("Orchestrator", path.string() + ": " + scrubbed->degraded->describe());
        }
        return failed(*verification_failure);
    }
    if (scrubbed->degraded) {
        // Contents are gone and the file is unlinked, but metadata may linger
        return failed(*scrubbed->degraded);
    }

    result.success = true;
    result.duration_seconds = seconds_since(start);
    const auto passes = static_cast<size_t>(result.passes_executed);
    LOG_INFO("Orchestrator", path.string() + " sanitized (" + plan.strategy_label + ", " +
                                 plural(passes, "pass", "passes") + ")");
    return result;
}

auto Orchestrator::record(const WipeResult& result) -> bool {
    const auto who = audit_logger_->identity();
    const AuditRecord record{util::iso8601_utc_now(), result, who.user, who.hostname};

    if (auto appended = audit_logger_->append(record); !appended) {
        LOG_ERROR("Orchestrator", "audit record for " + result.path.string() +
                                      " not written: " + appended.error().describe());
        return false;
    }
    return true;
}

auto Orchestrator::wipe(const fs::path& target, const WipeOptions& options) -> WipeSummary {
    const auto start = std::chrono::steady_clock::now();

    WipeSummary summary;
    summary.target = target;

    auto give_up = [&summary, &start](std::string message) {
        LOG_ERROR("Orchestrator", message);
        summary.outcome = WipeOutcome::TotalFailure;
        summary.message = std::move(message);
        summary.duration_seconds = seconds_since(start);
        return summary;
    };

    std::error_code ec;
    const auto status = fs::symlink_status(target, ec);
    if (ec || !fs::exists(status)) {
        return give_up("target not found: " + target.string());
    }

    std::vector<fs::path> files;
    const bool is_directory = fs::is_directory(status);
    if (fs::is_regular_file(status)) {
        files.push_back(target);
    } else if (is_directory) {
        auto listed = collect_files(target, options.recursive, &summary.skipped_directories);
        if (!listed) {
            return give_up(listed.error().message);
        }
        files = std::move(*listed);
    } else {
        return give_up("not a regular file or directory: " + target.string());
    }

    // Classification and planning; the cache lives for this call only
    StorageKindCache cache(classifier_);
    summary.previews.reserve(files.size());
    for (const auto& file : files) {
        summary.previews.push_back(preview(file, cache, options));
    }
    summary.total_files = files.size();

    if (options.dry_run) {
        summary.outcome = WipeOutcome::DryRun;
        summary.message =
            "dry run: " + plural(files.size(), "file", "files") + " would be sanitized";
        summary.duration_seconds = seconds_since(start);
        LOG_INFO("Orchestrator", summary.message);
        return summary;
    }

    if (!options.pre_confirmed && (!options.confirm || !options.confirm(summary.previews))) {
        return give_up("confirmation withheld; nothing was touched");
    }

    LOG_INFO("Orchestrator", "sanitizing " + plural(files.size(), "file", "files") + " under " +
                                 target.string() + " with " +
                                 std::string(to_string(options.standard)));

    std::mutex progress_mutex;
    ProgressCallback progress;
    if (options.on_progress) {
        progress = [&progress_mutex, &options](const ProgressEvent& event) {
            std::lock_guard lock(progress_mutex);
            options.on_progress(event);
        };
    }

    std::vector<WipeResult> results(files.size());
    std::vector<char> recorded(files.size(), 0);

    auto run_one = [this, &summary, &options, &progress, &results, &recorded](size_t index) {
        const auto& item = summary.previews[index];
        try {
            results[index] = wipe_file(item, options, progress);
        } catch (const std::exception& e) {
            results[index].path = item.path;
            results[index].standard_used = item.plan.standard;
            results[index].strategy_label = item.plan.strategy_label;
            results[index].fail(WipeError{ErrorKind::IoError, WipeStage::Overwrite, e.what(), 0});
            LOG_ERROR("Orchestrator", item.path.string() + ": " + e.what());
        }
        recorded[index] = record(results[index]) ? 1 : 0;
    };

    const auto window = static_cast<size_t>(std::max(options.max_concurrency, 1));
    std::deque<std::future<void>> in_flight;
    for (size_t i = 0; i < files.size(); ++i) {
        if (in_flight.size() >= window) {
            in_flight.front().get();
            in_flight.pop_front();
        }
        in_flight.push_back(std::async(std::launch::async, run_one, i));
    }
    while (!in_flight.empty()) {
        in_flight.front().get();
        in_flight.pop_front();
    }

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        summary.total_bytes_overwritten +=
            result.size_bytes * static_cast<uint64_t>(result.passes_executed);
        if (result.success) {
            ++summary.files_wiped;
        } else {
            ++summary.files_failed;
        }
        if (!recorded[i]) {
            ++summary.audit_failures;
        }
    }
    summary.results = std::move(results);

    if (is_directory && options.remove_empty_directories) {
        const auto removed = remove_empty_directories(target);
        LOG_DEBUG("Orchestrator",
                  "removed " + plural(removed, "empty directory", "empty directories"));
    }

    if (summary.files_failed == 0 && summary.audit_failures == 0) {
        summary.outcome = WipeOutcome::Success;
    } else if (summary.files_wiped == 0 && summary.total_files > 0) {
        summary.outcome = WipeOutcome::TotalFailure;
    } else {
        summary.outcome = WipeOutcome::PartialFailure;
    }

    summary.message = plural(summary.files_wiped, "file", "files") + " sanitized, " +
                      std::to_string(summary.files_failed) + " failed";
    if (summary.audit_failures > 0) {
        summary.message += ", " +
                           plural(summary.audit_failures, "audit record", "audit records") +
                           " not written";
    }
    summary.duration_seconds = seconds_since(start);
    LOG_INFO("Orchestrator", summary.message);
    return summary;
}
