#pragma once

#include "services/IStorageClassifier.hpp"

#include <sys/types.h>

#include <cstddef>
#include <filesystem>
#include <optional>

/**
 * @class StorageClassifier
 * @brief sysfs-based classifier for Linux block devices
 *
 * Lookup: stat(path).st_dev -> {sysfs}/dev/block/MAJOR:MINOR -> parent disk
 * when the node is a partition -> queue/rotational. NVMe devices are
 * solid-state regardless of the flag.
 */
class StorageClassifier : public IStorageClassifier {
public:
    static constexpr size_t ROTATIONAL_BUFFER_BYTES = size_t{8} * 1'024 * 1'024;
    static constexpr size_t SOLID_STATE_BUFFER_BYTES = size_t{32} * 1'024 * 1'024;

    /**
     * @param sysfs_root Mount point of sysfs; a fake tree may be substituted in tests
     */
    explicit StorageClassifier(std::filesystem::path sysfs_root = "/sys");

    [[nodiscard]] auto classify(const std::filesystem::path& path) -> StorageKind override;

    /**
     * @brief Classify a device by its major/minor numbers
     */
    [[nodiscard]] auto classify_device(unsigned int major_id, unsigned int minor_id) const
        -> StorageKind;

    /**
     * @brief Write buffer size suited to a storage kind
     * @return 32 MiB for SolidState, 8 MiB otherwise
     */
    [[nodiscard]] static constexpr auto buffer_size_hint(StorageKind kind) -> size_t {
        return kind == StorageKind::SolidState ? SOLID_STATE_BUFFER_BYTES
                                               : ROTATIONAL_BUFFER_BYTES;
    }

private:
    [[nodiscard]] auto resolve_disk_dir(unsigned int major_id, unsigned int minor_id) const
        -> std::optional<std::filesystem::path>;

    std::filesystem::path sysfs_root_;
};
