#pragma once

#include "error.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace polarbear {

inline constexpr const char* DEFAULT_ROOTFS_URL =
    "https://github.com/termux/proot-distro/releases/download/v4.29.0/"
    "archlinux-aarch64-pd-v4.29.0.tar.xz";

/// @brief Host path exposed inside the sandbox.
struct BindMount {
    std::string host_path;
    std::string guest_path;
    /// Skipped silently when the host path does not exist.
    bool optional = false;
};

struct Config {
    struct Paths {
        std::filesystem::path data_dir;
        std::filesystem::path runtime_dir;
    } paths;

    struct Rootfs {
        std::string url = DEFAULT_ROOTFS_URL;
        /// Lowercase hex SHA-256 of the archive. Empty disables verification.
        std::string sha256;
        uint32_t strip_components = 1;
        bool keep_archive = false;
    } rootfs;

    struct Download {
        uint32_t max_attempts = 5;
        uint32_t initial_backoff_ms = 1000;
        uint32_t max_backoff_ms = 30000;
        uint32_t connect_timeout_s = 30;
        uint32_t low_speed_timeout_s = 60;
    } download;

    struct Session {
        std::string user = "root";
        std::filesystem::path proot = "proot";
        std::filesystem::path proot_loader;
        std::string x11_display = ":1";
        std::string check_command;
        std::string install_command;
        std::string compat_server_command;
        std::string desktop_command;
        uint32_t restart_window_s = 60;
        uint32_t max_crashes = 3;
        uint32_t restart_delay_ms = 1000;
        uint32_t ready_timeout_ms = 15000;
        uint32_t shutdown_timeout_ms = 5000;
        std::vector<BindMount> binds;
    } session;

    struct Compositor {
        std::string socket_name = "wayland-0";
        uint32_t width = 1280;
        uint32_t height = 720;
        double scale = 1.0;
        uint32_t refresh_mhz = 60000;
        uint32_t ping_timeout_ms = 5000;
        uint32_t max_events_per_tick = 256;
        bool strict_backpressure = true;
    } compositor;

    struct Progress {
        bool enabled = true;
        uint16_t port = 3000;
        std::string subprotocol = "polarbear.progress.v1";
    } progress;

    struct Logging {
        std::string level = "info";
        std::string file;
    } logging;
};

[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config>;
[[nodiscard]] auto default_config() -> Config;

} // namespace polarbear
