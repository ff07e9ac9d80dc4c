/**
 * @file SanitizationPlanner.hpp
 * @brief Translates a sanitization standard into concrete overwrite passes
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <string>

/**
 * @class SanitizationPlanner
 * @brief Pure decision table: (standard, storage kind, verify) -> PassPlan
 *
 * | standard   | Rotational / Unknown     | SolidState    |
 * |------------|--------------------------|---------------|
 * | NIST_CLEAR | Random                   | Random        |
 * | NIST_PURGE | Zero, One, Random        | Random        |
 * | DOD_LEGACY | Zero, One, Random        | Zero, One, Random |
 *
 * Every pass is synced. Unclassified devices get the multi-pass column;
 * only a positively identified solid-state device is spared the extra
 * wear of a three-pass purge.
 */
class SanitizationPlanner {
public:
    /**
     * @brief Build the pass plan for one file
     * @param standard Requested standard
     * @param kind Storage kind of the file's device
     * @param verify Whether entropy verification will follow
     * @return Plan with at least one pass; the last pass is always Random
     */
    [[nodiscard]] static auto plan(SanitizationStandard standard, StorageKind kind, bool verify)
        -> PassPlan;

    /**
     * @brief Human-readable label, e.g. "HDD (purge)" or "SSD/NVMe (clear)"
     */
    [[nodiscard]] static auto strategy_label(SanitizationStandard standard, StorageKind kind)
        -> std::string;
};
