/**
 * @file IMetadataScrubber.hpp
 * @brief Interface for the final metadata scrub and unlink of a wiped file
 */

#pragma once

#include "models/WipeTypes.hpp"

#include <expected>
#include <filesystem>
#include <optional>

/**
 * @struct ScrubReport
 * @brief What the scrub managed before the unlink
 */
struct ScrubReport {
    std::filesystem::path final_path;  ///< Name the file was unlinked under
    bool timestamps_reset = false;
    bool renamed = false;
    bool directory_synced = false;
    std::optional<WipeError> degraded;  ///< First non-fatal step that failed (ScrubFailed)
};

/**
 * @class IMetadataScrubber
 * @brief Removes an overwritten file along with the traces of its name and times
 */
class IMetadataScrubber {
public:
    virtual ~IMetadataScrubber() = default;

    /**
     * @brief Scrub and unlink @p path
     *
     * Only a failed unlink is an error; every other failure is reported
     * through ScrubReport::degraded.
     */
    virtual auto scrub(const std::filesystem::path& path)
        -> std::expected<ScrubReport, WipeError> = 0;
};
