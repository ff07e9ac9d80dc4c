/**
 * @file WipeTypes.hpp
 * @brief Data types for file sanitization
 *
 * Closed enums for storage kinds, standards and patterns, the immutable
 * pass plan handed to the engine, the transient progress event it emits,
 * and the per-file result and audit record produced by the orchestrator.
 */

#pragma once

#include "util/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum StorageKind
 * @brief Physical class of the device backing a file
 */
enum class StorageKind {
    Rotational,  ///< Spinning disk; in-place overwrite reaches the platter
    SolidState,  ///< SSD/NVMe; wear levelling may remap writes
    Unknown      ///< Detection failed or was inconclusive
};

/**
 * @enum SanitizationStandard
 * @brief Requested sanitization standard
 */
enum class SanitizationStandard {
    NIST_CLEAR,  ///< NIST SP 800-88 Clear
    NIST_PURGE,  ///< NIST SP 800-88 Purge
    DOD_LEGACY   ///< DoD 5220.22-M style three-pass overwrite
};

/**
 * @enum Pattern
 * @brief Fill pattern of one overwrite pass
 */
enum class Pattern {
    Zero,   ///< 0x00
    One,    ///< 0xFF
    Random  ///< Fresh CSPRNG bytes per chunk
};

/**
 * @enum ErrorKind
 * @brief Failure classes surfaced per file
 */
enum class ErrorKind {
    PermissionDenied,
    TargetVanished,
    DeviceClassificationFailed,
    SyncFailed,
    VerificationFailed,
    ScrubFailed,
    AuditWriteFailed,
    IoError
};

/**
 * @enum WipeStage
 * @brief Pipeline stage a file was in when it failed
 */
enum class WipeStage { Classify, Plan, Hash, Overwrite, Verify, Scrub, Audit };

[[nodiscard]] auto to_string(StorageKind kind) -> std::string_view;
[[nodiscard]] auto to_string(SanitizationStandard standard) -> std::string_view;
[[nodiscard]] auto to_string(Pattern pattern) -> std::string_view;
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;
[[nodiscard]] auto to_string(WipeStage stage) -> std::string_view;

[[nodiscard]] auto parse_storage_kind(std::string_view text) -> std::optional<StorageKind>;
[[nodiscard]] auto parse_standard(std::string_view text) -> std::optional<SanitizationStandard>;
[[nodiscard]] auto parse_error_kind(std::string_view text) -> std::optional<ErrorKind>;
[[nodiscard]] auto parse_wipe_stage(std::string_view text) -> std::optional<WipeStage>;

/**
 * @brief Constant fill byte of a non-random pattern (0x00 or 0xFF)
 */
[[nodiscard]] constexpr auto pattern_byte(Pattern pattern) -> uint8_t {
    return pattern == Pattern::One ? uint8_t{0xFF} : uint8_t{0x00};
}

/**
 * @struct PassSpec
 * @brief One overwrite pass
 */
struct PassSpec {
    Pattern pattern = Pattern::Random;
    size_t buffer_size_bytes = 0;
    bool requires_sync = true;

    auto operator==(const PassSpec&) const -> bool = default;
};

/**
 * @struct PassPlan
 * @brief Ordered passes for one file, tagged with where they came from
 *
 * Built only by SanitizationPlanner; never mutated afterwards. Holds at
 * least one pass, and the last pass is Random whenever there are several.
 */
struct PassPlan {
    SanitizationStandard standard = SanitizationStandard::NIST_CLEAR;
    StorageKind storage_kind = StorageKind::Unknown;
    bool verify = false;
    std::string strategy_label;
    std::vector<PassSpec> passes;

    [[nodiscard]] auto pass_count() const -> int { return static_cast<int>(passes.size()); }

    auto operator==(const PassPlan&) const -> bool = default;
};

/**
 * @struct ProgressEvent
 * @brief Emitted once per written chunk
 */
struct ProgressEvent {
    std::filesystem::path path;
    int pass_index = 0;  ///< 1-based
    int pass_count = 0;
    uint64_t bytes_written = 0;  ///< Within the current pass
    uint64_t total_bytes = 0;
    double throughput_mbps = 0.0;
};

/**
 * @brief Callback type for progress reporting
 */
using ProgressCallback = std::function<void(const ProgressEvent&)>;

/**
 * @brief Classify an errno value
 *
 * EACCES, EPERM, EROFS and EWOULDBLOCK map to PermissionDenied; ENOENT and
 * ESTALE to TargetVanished; everything else to @p fallback.
 */
[[nodiscard]] auto error_kind_from_errno(int err, ErrorKind fallback = ErrorKind::IoError)
    -> ErrorKind;

/**
 * @struct WipeError
 * @brief A failed stage: what kind, where, and the errno behind it
 */
struct WipeError {
    ErrorKind kind = ErrorKind::IoError;
    WipeStage stage = WipeStage::Overwrite;
    std::string message;
    int sys_errno = 0;

    /**
     * @brief Lift a low-level error, classifying it by its errno
     * @param stage Stage that failed
     * @param error Low-level error
     * @param fallback Kind used when the errno has no specific class
     */
    [[nodiscard]] static auto from(WipeStage stage, const util::Error& error,
                                   ErrorKind fallback = ErrorKind::IoError) -> WipeError;

    /**
     * @brief "stage/Kind: message"
     */
    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @struct WipeResult
 * @brief Outcome of one file, successful or not
 */
struct WipeResult {
    std::filesystem::path path;
    uint64_t size_bytes = 0;
    std::string sha256_before;
    SanitizationStandard standard_used = SanitizationStandard::NIST_CLEAR;
    int passes_executed = 0;
    std::optional<bool> verified;  ///< Empty unless verification was requested
    std::optional<double> mean_entropy;
    double duration_seconds = 0.0;
    bool success = false;
    std::optional<ErrorKind> error_kind;
    std::optional<WipeStage> error_stage;
    std::string error_message;
    std::string strategy_label;
    std::filesystem::path final_path;  ///< Randomized name the file was unlinked under

    /**
     * @brief Mark the result failed with the given error
     */
    void fail(const WipeError& error);
};

/**
 * @struct AuditRecord
 * @brief A WipeResult stamped with when and by whom
 */
struct AuditRecord {
    std::string timestamp_utc;
    WipeResult result;
    std::string user;
    std::string hostname;
};
