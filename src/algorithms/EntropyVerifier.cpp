#include "algorithms/EntropyVerifier.hpp"

#include "util/FileDescriptor.hpp"
#include "util/Format.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/SecureRandom.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cmath>
#include <set>
#include <utility>
#include <vector>

namespace verification {

auto shannon_entropy(std::span<const uint8_t> data) -> double {
    if (data.empty()) {
        return 0.0;
    }

    std::array<uint64_t, 256> byte_counts{};
    for (const auto byte : data) {
        byte_counts[byte]++;
    }

    const auto length = static_cast<double>(data.size());
    double entropy = 0.0;
    for (const auto count : byte_counts) {
        if (count == 0) {
            continue;
        }
        const double p = static_cast<double>(count) / length;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

}  // namespace verification

namespace {

auto open_for_sampling(const std::filesystem::path& path)
    -> std::expected<util::FileDescriptor, util::Error> {
    // O_NOATIME is refused with EPERM unless we own the file
    auto fd = util::FileDescriptor::open(path, O_RDONLY | O_NOFOLLOW | O_NOATIME);
    if (!fd && fd.error().code == EPERM) {
        return util::FileDescriptor::open(path, O_RDONLY | O_NOFOLLOW);
    }
    return fd;
}

// Offsets in [0, size - BLOCK_SIZE]; distinct whenever that range has room
auto pick_offsets(uint64_t size) -> std::expected<std::vector<uint64_t>, util::Error> {
    const uint64_t candidates = size - EntropyVerifier::BLOCK_SIZE + 1;
    const bool distinct = candidates >= static_cast<uint64_t>(EntropyVerifier::SAMPLE_COUNT);

    std::vector<uint64_t> offsets;
    std::set<uint64_t> seen;
    while (offsets.size() < static_cast<size_t>(EntropyVerifier::SAMPLE_COUNT)) {
        auto offset = util::SecureRandom::uniform(candidates);
        if (!offset) {
            return std::unexpected(offset.error());
        }
        if (distinct && !seen.insert(*offset).second) {
            continue;
        }
        offsets.push_back(*offset);
    }
    return offsets;
}

}  // namespace

auto EntropyVerifier::verify(const std::filesystem::path& path)
    -> std::expected<EntropyReport, WipeError> {
    auto fd = open_for_sampling(path);
    if (!fd) {
        return std::unexpected(WipeError::from(WipeStage::Verify, fd.error()));
    }

    struct stat st{};
    if (::fstat(fd->get(), &st) != 0) {
        return std::unexpected(
            WipeError::from(WipeStage::Verify, util::Error::from_errno("fstat " + path.string())));
    }
    const auto size = static_cast<uint64_t>(st.st_size);

    if (size == 0) {
        LOG_DEBUG("EntropyVerifier", path.string() + " is empty, nothing to sample");
        return EntropyReport{true, 0.0, 0};
    }

    std::vector<uint64_t> offsets;
    if (size < BLOCK_SIZE) {
        offsets.push_back(0);
    } else {
        auto picked = pick_offsets(size);
        if (!picked) {
            return std::unexpected(WipeError::from(WipeStage::Verify, picked.error()));
        }
        offsets = std::move(*picked);
    }

    std::vector<uint8_t> block(static_cast<size_t>(std::min<uint64_t>(size, BLOCK_SIZE)));
    double total_entropy = 0.0;
    int samples = 0;

    for (const auto offset : offsets) {
        auto got = util::pread_full(fd->get(), block.data(), block.size(), offset);
        if (!got) {
            return std::unexpected(WipeError::from(WipeStage::Verify, got.error()));
        }
        if (*got == 0) {
            continue;
        }
        total_entropy +=
            verification::shannon_entropy(std::span<const uint8_t>(block.data(), *got));
        ++samples;
    }

    if (samples == 0) {
        // Truncated underneath us between fstat and the reads
        return std::unexpected(WipeError{ErrorKind::TargetVanished, WipeStage::Verify,
                                         path.string() + ": no data to sample", 0});
    }

    EntropyReport report;
    report.samples = samples;
    report.mean_entropy_bits_per_byte = total_entropy / samples;
    report.passed = report.mean_entropy_bits_per_byte > PASS_THRESHOLD;

    const auto summary = path.string() + ": mean entropy " +
                         util::format_fixed(report.mean_entropy_bits_per_byte, 3) +
                         " bits/byte over " + std::to_string(samples) + " samples -> " +
                         (report.passed ? "pass" : "FAIL");
    if (report.passed) {
        LOG_INFO("EntropyVerifier", summary);
    } else {
        LOG_WARNING("EntropyVerifier", summary);
    }
    return report;
}
