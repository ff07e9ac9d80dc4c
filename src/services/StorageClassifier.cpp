#include "services/StorageClassifier.hpp"

#include "util/Logger.hpp"

#include <sys/stat.h>
#include <sys/sysmacros.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace {

auto read_int(const fs::path& path) -> std::optional<int> {
    if (std::ifstream file{path}; file.is_open()) {
        int value{};
        if (file >> value) {
            return value;
        }
    }
    return std::nullopt;
}

void warn_unclassified(const std::string& what) {
    LOG_WARNING("StorageClassifier", "DeviceClassificationFailed: " + what);
}

}  // namespace

StorageClassifier::StorageClassifier(fs::path sysfs_root) : sysfs_root_(std::move(sysfs_root)) {}

auto StorageClassifier::classify(const fs::path& path) -> StorageKind {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        warn_unclassified("stat " + path.string() + ": " + std::strerror(errno));
        return StorageKind::Unknown;
    }

    const auto kind = classify_device(major(st.st_dev), minor(st.st_dev));
    LOG_DEBUG("StorageClassifier",
              path.string() + " -> " + std::string(to_string(kind)));
    return kind;
}

auto StorageClassifier::classify_device(unsigned int major_id, unsigned int minor_id) const
    -> StorageKind {
    const auto disk_dir = resolve_disk_dir(major_id, minor_id);
    if (!disk_dir) {
        return StorageKind::Unknown;
    }

    if (disk_dir->filename().string().starts_with("nvme")) {
        return StorageKind::SolidState;
    }

    const auto rotational = read_int(*disk_dir / "queue" / "rotational");
    if (!rotational) {
        // tmpfs, overlay and other virtual filesystems have no queue
        warn_unclassified("no queue/rotational under " + disk_dir->string());
        return StorageKind::Unknown;
    }
    return *rotational == 0 ? StorageKind::SolidState : StorageKind::Rotational;
}

auto StorageClassifier::resolve_disk_dir(unsigned int major_id, unsigned int minor_id) const
    -> std::optional<fs::path> {
    const auto node = sysfs_root_ / "dev" / "block" /
                      (std::to_string(major_id) + ":" + std::to_string(minor_id));

    std::error_code ec;
    auto resolved = fs::canonical(node, ec);
    if (ec) {
        warn_unclassified(node.string() + ": " + ec.message());
        return std::nullopt;
    }

    // Partitions carry a "partition" file; the queue lives on the parent disk
    if (fs::exists(resolved / "partition", ec)) {
        resolved = resolved.parent_path();
    }
    return resolved;
}
