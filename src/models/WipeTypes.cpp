#include "models/WipeTypes.hpp"

#include "models/WipeOptions.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <utility>

namespace {

template <typename Enum, size_t N>
auto lookup(const std::array<std::pair<Enum, std::string_view>, N>& table, std::string_view text)
    -> std::optional<Enum> {
    for (const auto& [value, name] : table) {
        if (name == text) {
            return value;
        }
    }
    return std::nullopt;
}

template <typename Enum, size_t N>
auto name_of(const std::array<std::pair<Enum, std::string_view>, N>& table, Enum value)
    -> std::string_view {
    for (const auto& [candidate, name] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "Unknown";
}

constexpr std::array<std::pair<StorageKind, std::string_view>, 3> STORAGE_KINDS{{
    {StorageKind::Rotational, "Rotational"},
    {StorageKind::SolidState, "SolidState"},
    {StorageKind::Unknown, "Unknown"},
}};

constexpr std::array<std::pair<SanitizationStandard, std::string_view>, 3> STANDARDS{{
    {SanitizationStandard::NIST_CLEAR, "NIST_CLEAR"},
    {SanitizationStandard::NIST_PURGE, "NIST_PURGE"},
    {SanitizationStandard::DOD_LEGACY, "DOD_LEGACY"},
}};

constexpr std::array<std::pair<Pattern, std::string_view>, 3> PATTERNS{{
    {Pattern::Zero, "Zero"},
    {Pattern::One, "One"},
    {Pattern::Random, "Random"},
}};

constexpr std::array<std::pair<ErrorKind, std::string_view>, 8> ERROR_KINDS{{
    {ErrorKind::PermissionDenied, "PermissionDenied"},
    {ErrorKind::TargetVanished, "TargetVanished"},
    {ErrorKind::DeviceClassificationFailed, "DeviceClassificationFailed"},
    {ErrorKind::SyncFailed, "SyncFailed"},
    {ErrorKind::VerificationFailed, "VerificationFailed"},
    {ErrorKind::ScrubFailed, "ScrubFailed"},
    {ErrorKind::AuditWriteFailed, "AuditWriteFailed"},
    {ErrorKind::IoError, "IoError"},
}};

constexpr std::array<std::pair<WipeStage, std::string_view>, 7> STAGES{{
    {WipeStage::Classify, "classify"},
    {WipeStage::Plan, "plan"},
    {WipeStage::Hash, "hash"},
    {WipeStage::Overwrite, "overwrite"},
    {WipeStage::Verify, "verify"},
    {WipeStage::Scrub, "scrub"},
    {WipeStage::Audit, "audit"},
}};

constexpr std::array<std::pair<WipeOutcome, std::string_view>, 4> OUTCOMES{{
    {WipeOutcome::Success, "success"},
    {WipeOutcome::TotalFailure, "total failure"},
    {WipeOutcome::PartialFailure, "partial failure"},
    {WipeOutcome::DryRun, "dry run"},
}};

}  // namespace

auto to_string(StorageKind kind) -> std::string_view {
    return name_of(STORAGE_KINDS, kind);
}

auto to_string(SanitizationStandard standard) -> std::string_view {
    return name_of(STANDARDS, standard);
}

auto to_string(Pattern pattern) -> std::string_view {
    return name_of(PATTERNS, pattern);
}

auto to_string(ErrorKind kind) -> std::string_view {
    return name_of(ERROR_KINDS, kind);
}

auto to_string(WipeStage stage) -> std::string_view {
    return name_of(STAGES, stage);
}

auto to_string(WipeOutcome outcome) -> std::string_view {
    return name_of(OUTCOMES, outcome);
}

auto parse_storage_kind(std::string_view text) -> std::optional<StorageKind> {
    return lookup(STORAGE_KINDS, text);
}

auto parse_standard(std::string_view text) -> std::optional<SanitizationStandard> {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    // Short CLI spellings
    if (upper == "CLEAR") {
        return SanitizationStandard::NIST_CLEAR;
    }
    if (upper == "PURGE") {
        return SanitizationStandard::NIST_PURGE;
    }
    if (upper == "DOD") {
        return SanitizationStandard::DOD_LEGACY;
    }
    return lookup(STANDARDS, upper);
}

auto parse_error_kind(std::string_view text) -> std::optional<ErrorKind> {
    return lookup(ERROR_KINDS, text);
}

auto parse_wipe_stage(std::string_view text) -> std::optional<WipeStage> {
    return lookup(STAGES, text);
}

auto error_kind_from_errno(int err, ErrorKind fallback) -> ErrorKind {
    switch (err) {
        case EACCES:
        case EPERM:
        case EROFS:
        case EWOULDBLOCK:
            return ErrorKind::PermissionDenied;
        case ENOENT:
        case ESTALE:
            return ErrorKind::TargetVanished;
        default:
            return fallback;
    }
}

auto WipeError::from(WipeStage stage, const util::Error& error, ErrorKind fallback) -> WipeError {
    return WipeError{error_kind_from_errno(error.code, fallback), stage, error.message,
                     error.code};
}

auto WipeError::describe() const -> std::string {
    std::string text(to_string(stage));
    text.append("/").append(to_string(kind)).append(": ").append(message);
    return text;
}

void WipeResult::fail(const WipeError& error) {
    success = false;
    error_kind = error.kind;
    error_stage = error.stage;
    error_message = error.message;
}

auto exit_code(WipeOutcome outcome) -> int {
    switch (outcome) {
        case WipeOutcome::Success:
            return 0;
        case WipeOutcome::TotalFailure:
            return 1;
        case WipeOutcome::PartialFailure:
            return 2;
        case WipeOutcome::DryRun:
            return 3;
    }
    return 1;
}
