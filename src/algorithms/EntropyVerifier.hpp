/**
 * @file EntropyVerifier.hpp
 * @brief Statistical check that a wiped file now reads as random data
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>

namespace verification {

/**
 * @brief Shannon entropy of a buffer in bits per byte (0.0 to 8.0)
 * @return 0.0 for an empty buffer
 */
[[nodiscard]] auto shannon_entropy(std::span<const uint8_t> data) -> double;

}  // namespace verification

/**
 * @struct EntropyReport
 * @brief Result of sampling one file
 */
struct EntropyReport {
    bool passed = false;
    double mean_entropy_bits_per_byte = 0.0;
    int samples = 0;
};

/**
 * @class EntropyVerifier
 * @brief Samples fixed-size blocks at random offsets and averages their entropy
 *
 * A file whose last pass was Random should average close to 8 bits per
 * byte; a zero or constant fill averages 0. Files shorter than one block
 * are read once in full. The file is opened read-only and never written.
 */
class EntropyVerifier {
public:
    static constexpr int SAMPLE_COUNT = 20;
    static constexpr size_t BLOCK_SIZE = 4'096;
    static constexpr double PASS_THRESHOLD = 7.0;  ///< Mean must be strictly above

    /**
     * @brief Sample @p path and decide whether it passes
     * @return Report, or a Verify-stage error when the file cannot be read
     */
    [[nodiscard]] static auto verify(const std::filesystem::path& path)
        -> std::expected<EntropyReport, WipeError>;
};
