/**
 * @file WipeEngine.hpp
 * @brief Multi-pass in-place overwrite of a single file
 */

#pragma once

#include "models/WipeTypes.hpp"
#include "util/FileDescriptor.hpp"
#include "util/ThroughputMeter.hpp"

#include <sys/types.h>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <vector>

/**
 * @class WipeExecution
 * @brief Pull-based, non-restartable stream of progress events for one file
 *
 * Each next() call performs at most one chunk write (or the per-pass
 * fsync) and returns its event. The stream ends with nullopt once every
 * pass has completed, or with an error after which it yields nothing more.
 * Destroying the execution early closes the descriptor and drops the lock;
 * the file is left partially overwritten.
 *
 * Usage:
 * @code
 * auto execution = WipeEngine::execute(path, plan);
 * while (true) {
 *     auto event = execution.next();
 *     if (!event) { handle(event.error()); break; }
 *     if (!*event) break;  // done
 *     report(**event);
 * }
 * @endcode
 */
class WipeExecution {
public:
    WipeExecution(WipeExecution&&) noexcept = default;
    WipeExecution& operator=(WipeExecution&&) noexcept = default;
    WipeExecution(const WipeExecution&) = delete;
    WipeExecution& operator=(const WipeExecution&) = delete;
    ~WipeExecution() = default;

    /**
     * @brief Advance by one chunk
     * @return The chunk's event, nullopt when finished, or the failure
     */
    [[nodiscard]] auto next() -> std::expected<std::optional<ProgressEvent>, WipeError>;

    /**
     * @brief Passes fully written (and synced where required)
     */
    [[nodiscard]] auto passes_executed() const -> int { return passes_done_; }

    [[nodiscard]] auto is_finished() const -> bool { return finished_; }

    /**
     * @brief File size observed when the file was opened
     */
    [[nodiscard]] auto initial_size() const -> uint64_t { return initial_size_; }

    [[nodiscard]] auto plan() const -> const PassPlan& { return plan_; }

private:
    friend class WipeEngine;

    WipeExecution(std::filesystem::path path, PassPlan plan);

    auto open() -> std::expected<void, WipeError>;
    auto begin_pass() -> std::expected<void, WipeError>;
    auto finish_pass() -> std::expected<void, WipeError>;
    auto fill_chunk(size_t length) -> std::expected<void, WipeError>;
    auto check_extent(uint64_t end) -> std::expected<void, WipeError>;
    auto make_event() -> ProgressEvent;
    auto fail(WipeError error) -> std::unexpected<WipeError>;

    std::filesystem::path path_;
    PassPlan plan_;
    util::FileDescriptor fd_;
    util::ThroughputMeter meter_;
    std::vector<uint8_t> buffer_;

    dev_t device_ = 0;
    ino_t inode_ = 0;
    uint64_t initial_size_ = 0;
    uint64_t pass_size_ = 0;
    uint64_t offset_ = 0;
    uint64_t cumulative_bytes_ = 0;
    size_t pass_index_ = 0;  ///< 0-based index of the current pass
    int passes_done_ = 0;
    bool opened_ = false;
    bool in_pass_ = false;
    bool finished_ = false;
    std::optional<WipeError> error_;
};

/**
 * @class WipeEngine
 * @brief Creates executions; holds no state of its own
 */
class WipeEngine {
public:
    /**
     * @brief Prepare a lazy execution of @p plan against @p path
     *
     * Nothing is opened until the first next(). The file is then opened
     * O_RDWR | O_NOFOLLOW and held under an exclusive non-blocking flock
     * (contention -> PermissionDenied). Before every pass the path must
     * still name the opened inode and must not have shrunk to zero
     * (TargetVanished otherwise). Writes never extend the file.
     */
    [[nodiscard]] static auto execute(const std::filesystem::path& path, const PassPlan& plan)
        -> WipeExecution;
};
