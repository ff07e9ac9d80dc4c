#include "services/StorageKindCache.hpp"

#include <sys/stat.h>

#include <utility>

StorageKindCache::StorageKindCache(std::shared_ptr<IStorageClassifier> classifier)
    : classifier_(std::move(classifier)) {}

auto StorageKindCache::kind_for(const std::filesystem::path& path) -> StorageKind {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return classifier_->classify(path);
    }

    // Held across classify() so concurrent files on one device classify it once
    std::lock_guard lock(mutex_);
    if (const auto it = kinds_.find(st.st_dev); it != kinds_.end()) {
        return it->second;
    }
    const auto kind = classifier_->classify(path);
    kinds_.emplace(st.st_dev, kind);
    return kind;
}

auto StorageKindCache::classified_devices() const -> size_t {
    std::lock_guard lock(mutex_);
    return kinds_.size();
}
