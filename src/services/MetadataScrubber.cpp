#include "services/MetadataScrubber.hpp"

#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>

namespace fs = std::filesystem;

namespace {

constexpr int MAX_RENAME_ATTEMPTS = 8;

auto scrub_error(const util::Error& error) -> WipeError {
    return WipeError{ErrorKind::ScrubFailed, WipeStage::Scrub, error.message, error.code};
}

auto parent_of(const fs::path& path) -> fs::path {
    auto parent = path.parent_path();
    return parent.empty() ? fs::path{"."} : parent;
}

// rename(2) that refuses to replace; falls back to an lstat check where
// the filesystem lacks RENAME_NOREPLACE
auto rename_no_replace(const fs::path& from, const fs::path& to) -> int {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return 0;
    }
    if (errno != EINVAL && errno != ENOSYS) {
        return -1;
    }

    struct stat st{};
    if (::lstat(to.c_str(), &st) == 0) {
        errno = EEXIST;
        return -1;
    }
    return ::rename(from.c_str(), to.c_str());
}

}  // namespace

auto MetadataScrubber::reset_timestamps(const fs::path& path) -> std::expected<void, WipeError> {
    const struct timespec epoch[2] = {{0, 0}, {0, 0}};
    if (::utimensat(AT_FDCWD, path.c_str(), epoch, AT_SYMLINK_NOFOLLOW) != 0) {
        return std::unexpected(scrub_error(util::Error::from_errno("utimensat " + path.string())));
    }
    return {};
}

auto MetadataScrubber::randomize_name(const fs::path& path) -> std::expected<fs::path, WipeError> {
    const auto directory = parent_of(path);

    for (int attempt = 0; attempt < MAX_RENAME_ATTEMPTS; ++attempt) {
        auto name = util::SecureRandom::token(RANDOM_NAME_LENGTH);
        if (!name) {
            return std::unexpected(scrub_error(name.error()));
        }

        const auto target = directory / *name;
        if (rename_no_replace(path, target) == 0) {
            return target;
        }
        if (errno != EEXIST) {
            return std::unexpected(scrub_error(util::Error::from_errno("rename " + path.string())));
        }
    }
    return std::unexpected(WipeError{ErrorKind::ScrubFailed, WipeStage::Scrub,
                                     "no free random name in " + directory.string(), EEXIST});
}

auto MetadataScrubber::sync_directory(const fs::path& directory)
    -> std::expected<void, WipeError> {
    auto fd = util::FileDescriptor::open(directory, O_RDONLY | O_DIRECTORY);
    if (!fd) {
        return std::unexpected(scrub_error(fd.error()));
    }
    if (auto synced = util::fsync_with_retry(fd->get()); !synced) {
        return std::unexpected(scrub_error(synced.error()));
    }
    return {};
}

auto MetadataScrubber::scrub(const fs::path& path) -> std::expected<ScrubReport, WipeError> {
    ScrubReport report;
    report.final_path = path;

    auto note = [&report](const WipeError& error) {
        LOG_WARNING("MetadataScrubber", error.message);
        if (!report.degraded) {
            report.degraded = error;
        }
    };

    if (auto reset = reset_timestamps(path); reset) {
        report.timestamps_reset = true;
    } else {
        note(reset.error());
    }

    if (auto renamed = randomize_name(path); renamed) {
        report.final_path = *renamed;
        report.renamed = true;
    } else {
        note(renamed.error());
    }

    if (::unlink(report.final_path.c_str()) != 0) {
        const auto error = util::Error::from_errno("unlink " + report.final_path.string());
        return std::unexpected(WipeError{
            error.code == ENOENT ? ErrorKind::TargetVanished : ErrorKind::ScrubFailed,
            WipeStage::Scrub, error.message, error.code});
    }

    if (auto synced = sync_directory(parent_of(report.final_path)); synced) {
        report.directory_synced = true;
    } else {
        note(synced.error());
    }

    LOG_DEBUG("MetadataScrubber", path.string() + " unlinked as " + report.final_path.string());
    return report;
}
