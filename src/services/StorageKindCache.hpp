#pragma once

#include "services/IStorageClassifier.hpp"

#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>

/**
 * @class StorageKindCache
 * @brief Per-invocation memo of device id -> StorageKind
 *
 * Owned by one Orchestrator::wipe() call so each device is classified at most
 * once per run. Safe to share between the concurrent per-file tasks.
 */
class StorageKindCache {
public:
    explicit StorageKindCache(std::shared_ptr<IStorageClassifier> classifier);

    /**
     * @brief Kind of the device backing @p path, probing on first sight of its device
     *
     * Paths that cannot be stat'ed are classified directly and not cached.
     */
    [[nodiscard]] auto kind_for(const std::filesystem::path& path) -> StorageKind;

    /**
     * @brief Number of devices classified so far
     */
    [[nodiscard]] auto classified_devices() const -> size_t;

private:
    std::shared_ptr<IStorageClassifier> classifier_;
    std::map<dev_t, StorageKind> kinds_;
    mutable std::mutex mutex_;
};
