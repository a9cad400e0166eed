#pragma once

#include <util/error.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>

namespace polarbear::bootstrap {

struct ExtractOptions {
    /// Leading path components removed from every entry and hard link target.
    uint32_t strip_components = 0;
};

struct ExtractStats {
    uint64_t files = 0;
    uint64_t directories = 0;
    uint64_t symlinks = 0;
    uint64_t hardlinks = 0;
    uint64_t skipped = 0;
};

/// Compressed bytes consumed so far and the archive size.
using ExtractProgress = std::function<void(uint64_t consumed, uint64_t total)>;

/**
 * @brief Streams an xz-compressed tar archive into @p dest.
 *
 * Handles ustar, GNU long names (`L`/`K`) and pax extended headers (`path`, `linkpath`,
 * `size`). Regular files, directories, symlinks and hard links are created; other entry types
 * are skipped. Directory modes are applied after all entries so read-only directories can still
 * be populated.
 *
 * @return `corrupt_archive` for malformed input, absolute or `..` entry paths, and entries that
 * would be written through a symlink. `disk_full` on ENOSPC, `cancelled` when @p stop fires.
 */
[[nodiscard]] auto extract_tar_xz(const std::filesystem::path& archive,
                                  const std::filesystem::path& dest, const ExtractOptions& options,
                                  const ExtractProgress& progress = {}, std::stop_token stop = {})
    -> Result<ExtractStats>;

} // namespace polarbear::bootstrap
