/**
 * @file Sha256.hpp
 * @brief SHA-256 digests of files and buffers (OpenSSL EVP)
 */

#pragma once

#include "util/Error.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>

namespace util {

/**
 * @brief Hex SHA-256 of a memory buffer
 */
[[nodiscard]] auto sha256_hex(std::span<const uint8_t> data) -> std::expected<std::string, Error>;

/**
 * @brief Hex SHA-256 of a file's current contents, streamed in 1MB reads
 * @param path File to hash (opened read-only, symlinks not followed)
 * @return Lowercase hex digest, or the errno-carrying error
 */
[[nodiscard]] auto sha256_file(const std::filesystem::path& path)
    -> std::expected<std::string, Error>;

}  // namespace util
