/**
 * @file AuditLogger.hpp
 * @brief JSON Lines audit trail
 *
 * One object per line:
 * @code
 * {"timestamp_utc":"2026-01-22T14:32:45.123Z","path":"/data/a.bin","size_bytes":1048576,
 *  "sha256_before":"9f86...","standard_used":"NIST_PURGE","passes_executed":3,
 *  "verified":true,"duration_seconds":0.41,"success":true,"error_kind":null,
 *  "error_stage":null,"error_message":null,"strategy_label":"HDD (purge)",
 *  "user":"alice","hostname":"ws01"}
 * @endcode
 */

#pragma once

#include "services/IAuditLogger.hpp"
#include "util/FileDescriptor.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class JsonlAuditLogger
 * @brief Appends records to an O_APPEND file, one write(2) and one fsync per record
 *
 * The file is created (mode 0600, parent directories included) on the first
 * append. Appends from concurrent wipes are serialized.
 */
class JsonlAuditLogger : public IAuditLogger {
public:
    static constexpr const char* DEFAULT_FILE_NAME = "file-sanitizer_audit.jsonl";

    /**
     * @param log_path Audit file
     * @param identity Fixed identity; taken from the session when absent
     */
    explicit JsonlAuditLogger(std::filesystem::path log_path,
                              std::optional<AuditIdentity> identity = std::nullopt);

    auto append(const AuditRecord& record) -> std::expected<void, WipeError> override;

    [[nodiscard]] auto identity() const -> AuditIdentity override { return identity_; }

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return log_path_; }

    /**
     * @brief Read back every well-formed record, oldest first
     *
     * Lines that are not valid records are skipped with a warning.
     */
    [[nodiscard]] auto read_records() const -> std::expected<std::vector<AuditRecord>, WipeError>;

    /**
     * @brief Serialize one record as a single JSON line (no trailing newline)
     */
    [[nodiscard]] static auto serialize(const AuditRecord& record) -> std::string;

    /**
     * @brief Parse one line produced by serialize()
     */
    [[nodiscard]] static auto parse(const std::string& line) -> std::optional<AuditRecord>;

    /**
     * @brief {user data dir}/file-sanitizer/file-sanitizer_audit.jsonl
     */
    [[nodiscard]] static auto default_path() -> std::filesystem::path;

    /**
     * @brief Login name and host name of the current session
     */
    [[nodiscard]] static auto session_identity() -> AuditIdentity;

private:
    auto ensure_open_locked() -> std::expected<void, WipeError>;

    std::filesystem::path log_path_;
    AuditIdentity identity_;
    util::FileDescriptor fd_;
    mutable std::mutex mutex_;
};
