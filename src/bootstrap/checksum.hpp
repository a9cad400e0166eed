#pragma once

#include <util/error.hpp>

#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace polarbear::bootstrap {

using HashProgress = std::function<void(uint64_t hashed, uint64_t total)>;

/// @brief Lowercase hex SHA-256 of a file, read in 1 MiB chunks.
[[nodiscard]] auto sha256_file(const std::filesystem::path& path, std::stop_token stop = {},
                               const HashProgress& progress = {}) -> Result<std::string>;

/// @brief Checks @p path against @p expected_hex (case-insensitive).
/// @return `integrity_mismatch` when the digests differ.
[[nodiscard]] auto verify_sha256(const std::filesystem::path& path, const std::string& expected_hex,
                                 std::stop_token stop = {}, const HashProgress& progress = {})
    -> Result<void>;

} // namespace polarbear::bootstrap
