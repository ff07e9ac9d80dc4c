#include "services/WipeEngine.hpp"

#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <span>
#include <utility>

namespace fs = std::filesystem;

WipeExecution::WipeExecution(fs::path path, PassPlan plan)
    : path_(std::move(path)), plan_(std::move(plan)) {}

auto WipeExecution::fail(WipeError error) -> std::unexpected<WipeError> {
    LOG_ERROR("WipeEngine", path_.string() + ": " + error.describe());
    error_ = error;
    fd_.reset();
    return std::unexpected(std::move(error));
}

auto WipeExecution::open() -> std::expected<void, WipeError> {
    auto fd = util::FileDescriptor::open(path_, O_RDWR | O_NOFOLLOW);
    if (!fd) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite, fd.error()));
    }

    if (auto locked = fd->lock_exclusive(); !locked) {
        auto error = WipeError::from(WipeStage::Overwrite, locked.error());
        error.message = path_.string() + " is locked by another process";
        return std::unexpected(std::move(error));
    }

    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite,
                                               util::Error::from_errno("fstat " + path_.string())));
    }
    if (!S_ISREG(st.st_mode)) {
        return std::unexpected(WipeError{ErrorKind::IoError, WipeStage::Overwrite,
                                         path_.string() + " is not a regular file", 0});
    }

    device_ = st.st_dev;
    inode_ = st.st_ino;
    initial_size_ = static_cast<uint64_t>(st.st_size);
    fd_ = std::move(*fd);
    opened_ = true;

    LOG_DEBUG("WipeEngine", "opened " + path_.string() + " (" + std::to_string(initial_size_) +
                                " bytes, " + std::to_string(plan_.pass_count()) + " passes)");
    return {};
}

auto WipeExecution::begin_pass() -> std::expected<void, WipeError> {
    struct stat by_path{};
    if (::stat(path_.c_str(), &by_path) != 0) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite,
                                               util::Error::from_errno("stat " + path_.string()),
                                               ErrorKind::TargetVanished));
    }
    if (by_path.st_dev != device_ || by_path.st_ino != inode_) {
        return std::unexpected(WipeError{ErrorKind::TargetVanished, WipeStage::Overwrite,
                                         path_.string() + " was replaced during the wipe", 0});
    }

    struct stat by_fd{};
    if (::fstat(fd_.get(), &by_fd) != 0) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite,
                                               util::Error::from_errno("fstat " + path_.string())));
    }
    pass_size_ = static_cast<uint64_t>(by_fd.st_size);
    if (initial_size_ > 0 && pass_size_ == 0) {
        return std::unexpected(WipeError{ErrorKind::TargetVanished, WipeStage::Overwrite,
                                         path_.string() + " was truncated during the wipe", 0});
    }

    if (::lseek(fd_.get(), 0, SEEK_SET) != 0) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite,
                                               util::Error::from_errno("lseek " + path_.string())));
    }

    const auto& pass = plan_.passes[pass_index_];
    const auto wanted = static_cast<size_t>(
        std::min<uint64_t>(std::max<size_t>(pass.buffer_size_bytes, 1), pass_size_));
    if (buffer_.size() != wanted) {
        buffer_.assign(wanted, 0);
        buffer_.shrink_to_fit();
    }
    if (pass.pattern != Pattern::Random) {
        std::fill(buffer_.begin(), buffer_.end(), pattern_byte(pass.pattern));
    }

    offset_ = 0;
    in_pass_ = true;
    LOG_DEBUG("WipeEngine", path_.string() + ": pass " + std::to_string(pass_index_ + 1) + "/" +
                                std::to_string(plan_.pass_count()) + " (" +
                                std::string(to_string(pass.pattern)) + ")");
    return {};
}

// A write past the current end would re-extend a file that shrank under us.
auto WipeExecution::check_extent(uint64_t end) -> std::expected<void, WipeError> {
    struct stat st{};
    if (::fstat(fd_.get(), &st) != 0) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite,
                                               util::Error::from_errno("fstat " + path_.string())));
    }
    const auto current = static_cast<uint64_t>(st.st_size);
    if (current < end || (initial_size_ > 0 && current == 0)) {
        return std::unexpected(WipeError{ErrorKind::TargetVanished, WipeStage::Overwrite,
                                         path_.string() + " was truncated during the wipe (" +
                                             std::to_string(current) + " of " +
                                             std::to_string(pass_size_) + " bytes left)",
                                         0});
    }
    return {};
}

auto WipeExecution::fill_chunk(size_t length) -> std::expected<void, WipeError> {
    if (plan_.passes[pass_index_].pattern != Pattern::Random) {
        return {};
    }
    if (auto filled = util::SecureRandom::fill(std::span<uint8_t>(buffer_.data(), length));
        !filled) {
        return std::unexpected(WipeError::from(WipeStage::Overwrite, filled.error()));
    }
    return {};
}

auto WipeExecution::finish_pass() -> std::expected<void, WipeError> {
    if (plan_.passes[pass_index_].requires_sync) {
        if (auto synced = util::fsync_with_retry(fd_.get()); !synced) {
            return std::unexpected(
                WipeError::from(WipeStage::Overwrite, synced.error(), ErrorKind::SyncFailed));
        }
    }

    in_pass_ = false;
    ++pass_index_;
    ++passes_done_;
    LOG_INFO("WipeEngine", path_.string() + ": pass " + std::to_string(passes_done_) + "/" +
                               std::to_string(plan_.pass_count()) + " complete");
    return {};
}

auto WipeExecution::make_event() -> ProgressEvent {
    ProgressEvent event;
    event.path = path_;
    event.pass_index = static_cast<int>(pass_index_ + 1);
    event.pass_count = plan_.pass_count();
    event.bytes_written = offset_;
    event.total_bytes = pass_size_;
    event.throughput_mbps = meter_.update(cumulative_bytes_);
    return event;
}

auto WipeExecution::next() -> std::expected<std::optional<ProgressEvent>, WipeError> {
    if (error_) {
        return std::unexpected(*error_);
    }
    if (finished_) {
        return std::nullopt;
    }

    if (!opened_) {
        if (auto opened = open(); !opened) {
            return fail(opened.error());
        }
    }

    if (!in_pass_) {
        if (pass_index_ >= plan_.passes.size()) {
            finished_ = true;
            fd_.reset();
            return std::nullopt;
        }
        if (auto begun = begin_pass(); !begun) {
            return fail(begun.error());
        }

        if (pass_size_ == 0) {
            auto event = make_event();
            if (auto done = finish_pass(); !done) {
                return fail(done.error());
            }
            return event;
        }
    }

    const auto length = static_cast<size_t>(
        std::min<uint64_t>(buffer_.size(), pass_size_ - offset_));
    if (auto filled = fill_chunk(length); !filled) {
        return fail(filled.error());
    }
    if (auto intact = check_extent(offset_ + length); !intact) {
        return fail(intact.error());
    }
    if (auto written = util::write_all(fd_.get(), buffer_.data(), length); !written) {
        auto error = WipeError::from(WipeStage::Overwrite, written.error());
        error.message = path_.string() + ": " + error.message;
        return fail(std::move(error));
    }
    offset_ += length;
    cumulative_bytes_ += length;

    auto event = make_event();
    if (offset_ == pass_size_) {
        if (auto done = finish_pass(); !done) {
            return fail(done.error());
        }
    }
    return event;
}

auto WipeEngine::execute(const fs::path& path, const PassPlan& plan) -> WipeExecution {
    return WipeExecution(path, plan);
}
