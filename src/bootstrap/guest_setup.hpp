#pragma once

#include <util/error.hpp>

#include <filesystem>
#include <span>

namespace polarbear::bootstrap {

/// Hidden files under `proc/` that the sandbox binds over their real counterparts.
struct FakeProcFile {
    const char* name;
    const char* contents;
};

[[nodiscard]] auto fake_proc_files() -> std::span<const FakeProcFile>;

/// @brief Writes the fake sysdata files and the empty `sys/.empty` directory.
[[nodiscard]] auto write_fake_sysdata(const std::filesystem::path& rootfs) -> Result<void>;

/// @brief Rewrites an absolute `usr/share/X11/xkb` symlink relative to its directory, so it
/// resolves without the sandbox root translation.
[[nodiscard]] auto fix_xkb_symlink(const std::filesystem::path& rootfs) -> Result<void>;

/// @brief Creates `tmp/` and `tmp/.X11-unix/` with mode 1777.
[[nodiscard]] auto create_socket_dirs(const std::filesystem::path& rootfs) -> Result<void>;

/// @brief Runs every hook above, in order, against an extracted rootfs.
[[nodiscard]] auto run_guest_setup(const std::filesystem::path& rootfs) -> Result<void>;

} // namespace polarbear::bootstrap
