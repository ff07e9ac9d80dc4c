/**
 * @file IAuditLogger.hpp
 * @brief Interface for the append-only wipe audit trail
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <expected>
#include <string>

/**
 * @struct AuditIdentity
 * @brief Who ran the wipe, and where
 */
struct AuditIdentity {
    std::string user;
    std::string hostname;
};

/**
 * @class IAuditLogger
 * @brief Sink for one AuditRecord per wipe attempt
 *
 * Implementations never rewrite or reorder what they have stored. A failed
 * append is reported as AuditWriteFailed and does not undo the wipe.
 */
class IAuditLogger {
public:
    virtual ~IAuditLogger() = default;

    /**
     * @brief Durably append one record
     */
    virtual auto append(const AuditRecord& record) -> std::expected<void, WipeError> = 0;

    /**
     * @brief Identity stamped onto records
     */
    [[nodiscard]] virtual auto identity() const -> AuditIdentity = 0;
};
