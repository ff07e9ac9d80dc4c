/**
 * @file IStorageClassifier.hpp
 * @brief Interface for storage-kind detection
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <filesystem>

/**
 * @class IStorageClassifier
 * @brief Reports the physical kind of device backing a path
 *
 * Implementations never fail: any detection problem yields
 * StorageKind::Unknown.
 */
class IStorageClassifier {
public:
    virtual ~IStorageClassifier() = default;

    /**
     * @brief Classify the device backing a file
     * @param path Existing file or directory
     * @return Detected kind, Unknown when inconclusive
     */
    [[nodiscard]] virtual auto classify(const std::filesystem::path& path) -> StorageKind = 0;
};
