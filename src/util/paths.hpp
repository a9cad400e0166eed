#pragma once

#include "error.hpp"

#include <filesystem>

namespace polarbear {
struct Config;
}

namespace polarbear::util {

/**
 * @brief Stores optional directory root overrides for path resolution.
 *
 * Leave fields empty to use XDG/environment defaults. Non-empty overrides must be absolute paths.
 */
struct PathOverrides {
    std::filesystem::path config_dir;
    std::filesystem::path data_dir;
    std::filesystem::path runtime_dir;
};

/**
 * @brief Holds resolved directory roots for app filesystem operations.
 *
 * @p data_dir receives the guest root filesystem, the downloaded archive and process logs.
 * @p runtime_dir holds the compositor's Wayland socket.
 */
struct AppDirs {
    std::filesystem::path config_dir;
    std::filesystem::path data_dir;
    std::filesystem::path runtime_dir;
};

/**
 * @brief Groups override inputs to avoid ambiguous parameter ordering.
 */
struct OverrideMerge {
    const PathOverrides& high;
    const PathOverrides& low;
};

/**
 * @brief Merges override sets, preferring non-empty fields from @p merge.high.
 */
[[nodiscard]] auto merge_overrides(const OverrideMerge& merge) -> PathOverrides;

/**
 * @brief Extracts path overrides from a parsed configuration.
 */
[[nodiscard]] auto overrides_from_config(const Config& config) -> PathOverrides;

/**
 * @brief Resolves directory roots using overrides and XDG defaults.
 *
 * @param overrides The optional directory root overrides.
 * @return The resolved directory roots, or `invalid_config` for relative overrides.
 */
[[nodiscard]] auto resolve_app_dirs(const PathOverrides& overrides) -> Result<AppDirs>;

/**
 * @brief Creates the resolved directories. The runtime directory is created with mode 0700.
 */
[[nodiscard]] auto ensure_app_dirs(const AppDirs& dirs) -> Result<void>;

/**
 * @brief Joins @p rel under the resolved data directory.
 */
[[nodiscard]] auto data_path(const AppDirs& dirs, const std::filesystem::path& rel)
    -> std::filesystem::path;

/**
 * @brief Joins @p rel under the resolved config directory.
 */
[[nodiscard]] auto config_path(const AppDirs& dirs, const std::filesystem::path& rel)
    -> std::filesystem::path;

} // namespace polarbear::util
