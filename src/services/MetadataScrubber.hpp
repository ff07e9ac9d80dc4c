/**
 * @file MetadataScrubber.hpp
 * @brief Removes the traces a wiped file leaves in its directory
 */

#pragma once

#include "services/IMetadataScrubber.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>

/**
 * @class MetadataScrubber
 * @brief Epoch timestamps, random rename, unlink, directory fsync
 *
 * Timestamp, rename and directory-sync failures do not stop the unlink;
 * they are reported through ScrubReport::degraded. Only a failed unlink is
 * an error.
 */
class MetadataScrubber : public IMetadataScrubber {
public:
    static constexpr size_t RANDOM_NAME_LENGTH = 16;

    auto scrub(const std::filesystem::path& path)
        -> std::expected<ScrubReport, WipeError> override;

    /**
     * @brief Set atime and mtime to 1970-01-01T00:00:00Z
     */
    [[nodiscard]] static auto reset_timestamps(const std::filesystem::path& path)
        -> std::expected<void, WipeError>;

    /**
     * @brief Rename to a random [a-z0-9] name in the same directory
     *
     * Never replaces an existing entry.
     * @return The new path
     */
    [[nodiscard]] static auto randomize_name(const std::filesystem::path& path)
        -> std::expected<std::filesystem::path, WipeError>;

    /**
     * @brief fsync a directory so the rename and unlink are durable
     */
    [[nodiscard]] static auto sync_directory(const std::filesystem::path& directory)
        -> std::expected<void, WipeError>;
};
