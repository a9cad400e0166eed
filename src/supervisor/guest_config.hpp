#pragma once

#include <util/error.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace polarbear::supervisor {

/// Location of the guest-side configuration, relative to the rootfs.
inline constexpr const char* GUEST_CONFIG_PATH = "etc/polarbear/polarbear.toml";

/// @brief Commands and user read from `[user]` and `[command]` inside the guest.
struct GuestConfig {
    std::string username = "root";
    std::string check;
    std::string install;
    std::string launch;
    std::string compat_server;
};

[[nodiscard]] auto default_guest_config() -> GuestConfig;

struct TryOverrides {
    /// TOML with every `try_<key>` applied over `<key>` in the same table.
    std::string effective;
    /// Original text with the `try_` lines commented out.
    std::string write_back;
    bool changed = false;
};

/// @brief Applies one-shot `try_<key> = value` overrides line by line.
///
/// A `try_` entry wins over its plain key in the same table, or is added if the plain key is
/// missing. The last `try_` entry for a key wins.
[[nodiscard]] auto apply_try_overrides(std::string_view content) -> TryOverrides;

/**
 * @brief Reads the guest configuration from @p rootfs.
 *
 * Consumes `try_` overrides and rewrites the file with them commented out. A missing file gives
 * the defaults; a malformed one is logged and also gives the defaults so the user can fix it in
 * the guest.
 */
[[nodiscard]] auto load_guest_config(const std::filesystem::path& rootfs) -> GuestConfig;

} // namespace polarbear::supervisor
