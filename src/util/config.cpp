#include "config.hpp"

#include "logging.hpp"

#include <cctype>
#include <toml.hpp>

namespace polarbear {

namespace {

auto read_bounded(const toml::value& table, const char* key, int64_t min, int64_t max,
                  uint32_t& out) -> Result<void> {
    if (!table.contains(key)) {
        return {};
    }
    auto value = toml::find<int64_t>(table, key);
    if (value < min || value > max) {
        return make_error<void>(ErrorCode::invalid_config,
                                std::string("Invalid ") + key + ": " + std::to_string(value) +
                                    " (expected: " + std::to_string(min) + "-" +
                                    std::to_string(max) + ")");
    }
    out = static_cast<uint32_t>(value);
    return {};
}

auto is_sha256_hex(const std::string& digest) -> bool {
    if (digest.size() != 64) {
        return false;
    }
    for (char c : digest) {
        if (!std::isxdigit(static_cast<unsigned char>(c)) ||
            std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

auto parse_paths(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("paths")) {
        return {};
    }
    const auto paths = toml::find(data, "paths");
    if (paths.contains("data_dir")) {
        config.paths.data_dir = toml::find<std::string>(paths, "data_dir");
    }
    if (paths.contains("runtime_dir")) {
        config.paths.runtime_dir = toml::find<std::string>(paths, "runtime_dir");
    }
    return {};
}

auto parse_rootfs(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("rootfs")) {
        return {};
    }
    const auto rootfs = toml::find(data, "rootfs");
    if (rootfs.contains("url")) {
        config.rootfs.url = toml::find<std::string>(rootfs, "url");
        if (config.rootfs.url.empty()) {
            return make_error<void>(ErrorCode::invalid_config, "rootfs.url must not be empty");
        }
    }
    if (rootfs.contains("sha256")) {
        config.rootfs.sha256 = toml::find<std::string>(rootfs, "sha256");
        if (!config.rootfs.sha256.empty() && !is_sha256_hex(config.rootfs.sha256)) {
            return make_error<void>(ErrorCode::invalid_config,
                                    "rootfs.sha256 must be 64 lowercase hex characters");
        }
    }
    POLARBEAR_TRY(read_bounded(rootfs, "strip_components", 0, 16,
                               config.rootfs.strip_components));
    if (rootfs.contains("keep_archive")) {
        config.rootfs.keep_archive = toml::find<bool>(rootfs, "keep_archive");
    }
    return {};
}

auto parse_download(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("download")) {
        return {};
    }
    const auto download = toml::find(data, "download");
    POLARBEAR_TRY(read_bounded(download, "max_attempts", 1, 100, config.download.max_attempts));
    POLARBEAR_TRY(read_bounded(download, "initial_backoff_ms", 0, 600000,
                               config.download.initial_backoff_ms));
    POLARBEAR_TRY(read_bounded(download, "max_backoff_ms", 0, 3600000,
                               config.download.max_backoff_ms));
    POLARBEAR_TRY(read_bounded(download, "connect_timeout_s", 1, 600,
                               config.download.connect_timeout_s));
    POLARBEAR_TRY(read_bounded(download, "low_speed_timeout_s", 1, 3600,
                               config.download.low_speed_timeout_s));
    if (config.download.max_backoff_ms < config.download.initial_backoff_ms) {
        return make_error<void>(ErrorCode::invalid_config,
                                "download.max_backoff_ms must be >= initial_backoff_ms");
    }
    return {};
}

auto parse_binds(const toml::value& session, Config& config) -> Result<void> {
    if (!session.contains("binds")) {
        return {};
    }
    for (const auto& entry : toml::find(session, "binds").as_array()) {
        BindMount bind;
        bind.host_path = toml::find<std::string>(entry, "host");
        bind.guest_path = entry.contains("guest") ? toml::find<std::string>(entry, "guest")
                                                  : bind.host_path;
        if (entry.contains("optional")) {
            bind.optional = toml::find<bool>(entry, "optional");
        }
        if (bind.host_path.empty() || bind.host_path.front() != '/' ||
            bind.guest_path.empty() || bind.guest_path.front() != '/') {
            return make_error<void>(ErrorCode::invalid_config,
                                    "session.binds entries need absolute host and guest paths");
        }
        config.session.binds.push_back(std::move(bind));
    }
    return {};
}

auto parse_session(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("session")) {
        return {};
    }
    const auto session = toml::find(data, "session");
    if (session.contains("user")) {
        config.session.user = toml::find<std::string>(session, "user");
    }
    if (session.contains("proot")) {
        config.session.proot = toml::find<std::string>(session, "proot");
    }
    if (session.contains("proot_loader")) {
        config.session.proot_loader = toml::find<std::string>(session, "proot_loader");
    }
    if (session.contains("x11_display")) {
        config.session.x11_display = toml::find<std::string>(session, "x11_display");
        const auto& display = config.session.x11_display;
        if (display.size() < 2 || display.front() != ':') {
            return make_error<void>(ErrorCode::invalid_config,
                                    "Invalid session.x11_display: " + display +
                                        " (expected: ':<number>')");
        }
    }
    if (session.contains("check_command")) {
        config.session.check_command = toml::find<std::string>(session, "check_command");
    }
    if (session.contains("install_command")) {
        config.session.install_command = toml::find<std::string>(session, "install_command");
    }
    if (session.contains("compat_server_command")) {
        config.session.compat_server_command =
            toml::find<std::string>(session, "compat_server_command");
    }
    if (session.contains("desktop_command")) {
        config.session.desktop_command = toml::find<std::string>(session, "desktop_command");
    }
    POLARBEAR_TRY(read_bounded(session, "restart_window_s", 1, 86400,
                               config.session.restart_window_s));
    POLARBEAR_TRY(read_bounded(session, "max_crashes", 1, 1000, config.session.max_crashes));
    POLARBEAR_TRY(read_bounded(session, "restart_delay_ms", 0, 600000,
                               config.session.restart_delay_ms));
    POLARBEAR_TRY(read_bounded(session, "ready_timeout_ms", 0, 600000,
                               config.session.ready_timeout_ms));
    POLARBEAR_TRY(read_bounded(session, "shutdown_timeout_ms", 0, 600000,
                               config.session.shutdown_timeout_ms));
    return parse_binds(session, config);
}

auto parse_compositor(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("compositor")) {
        return {};
    }
    const auto compositor = toml::find(data, "compositor");
    if (compositor.contains("socket_name")) {
        config.compositor.socket_name = toml::find<std::string>(compositor, "socket_name");
        if (config.compositor.socket_name.empty() ||
            config.compositor.socket_name.find('/') != std::string::npos) {
            return make_error<void>(ErrorCode::invalid_config,
                                    "compositor.socket_name must be a plain file name");
        }
    }
    POLARBEAR_TRY(read_bounded(compositor, "width", 1, 16384, config.compositor.width));
    POLARBEAR_TRY(read_bounded(compositor, "height", 1, 16384, config.compositor.height));
    if (compositor.contains("scale")) {
        auto scale = toml::find<double>(compositor, "scale");
        if (scale < 0.25 || scale > 8.0) {
            return make_error<void>(ErrorCode::invalid_config,
                                    "Invalid compositor.scale: " + std::to_string(scale) +
                                        " (expected: 0.25-8.0)");
        }
        config.compositor.scale = scale;
    }
    POLARBEAR_TRY(read_bounded(compositor, "refresh_mhz", 1000, 500000,
                               config.compositor.refresh_mhz));
    POLARBEAR_TRY(read_bounded(compositor, "ping_timeout_ms", 100, 600000,
                               config.compositor.ping_timeout_ms));
    POLARBEAR_TRY(read_bounded(compositor, "max_events_per_tick", 1, 65536,
                               config.compositor.max_events_per_tick));
    if (compositor.contains("strict_backpressure")) {
        config.compositor.strict_backpressure = toml::find<bool>(compositor, "strict_backpressure");
    }
    return {};
}

auto parse_progress(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("progress")) {
        return {};
    }
    const auto progress = toml::find(data, "progress");
    if (progress.contains("enabled")) {
        config.progress.enabled = toml::find<bool>(progress, "enabled");
    }
    uint32_t port = config.progress.port;
    POLARBEAR_TRY(read_bounded(progress, "port", 0, 65535, port));
    config.progress.port = static_cast<uint16_t>(port);
    if (progress.contains("subprotocol")) {
        config.progress.subprotocol = toml::find<std::string>(progress, "subprotocol");
        if (config.progress.subprotocol.empty()) {
            return make_error<void>(ErrorCode::invalid_config,
                                    "progress.subprotocol must not be empty");
        }
    }
    return {};
}

auto parse_logging(const toml::value& data, Config& config) -> Result<void> {
    if (!data.contains("logging")) {
        return {};
    }
    const auto logging = toml::find(data, "logging");
    if (logging.contains("level")) {
        config.logging.level = toml::find<std::string>(logging, "level");
        if (!parse_log_level(config.logging.level)) {
            return make_error<void>(
                ErrorCode::invalid_config,
                "Invalid log level: " + config.logging.level +
                    " (expected: trace, debug, info, warn, error, critical)");
        }
    }
    if (logging.contains("file")) {
        config.logging.file = toml::find<std::string>(logging, "file");
    }
    return {};
}

auto parse_sections(const toml::value& data, Config& config) -> Result<void> {
    POLARBEAR_TRY(parse_paths(data, config));
    POLARBEAR_TRY(parse_rootfs(data, config));
    POLARBEAR_TRY(parse_download(data, config));
    POLARBEAR_TRY(parse_session(data, config));
    POLARBEAR_TRY(parse_compositor(data, config));
    POLARBEAR_TRY(parse_progress(data, config));
    POLARBEAR_TRY(parse_logging(data, config));
    return {};
}

} // namespace

auto default_config() -> Config {
    return Config{}; // Uses struct defaults
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    if (!std::filesystem::exists(path)) {
        return make_error<Config>(ErrorCode::file_not_found,
                                  "Configuration file not found: " + path.string());
    }

    toml::value data;
    try {
        data = toml::parse(path);
    } catch (const std::exception& e) {
        return make_error<Config>(ErrorCode::parse_error,
                                  "Failed to parse TOML: " + std::string(e.what()));
    }

    Config config = default_config();
    Result<void> sections;
    try {
        sections = parse_sections(data, config);
    } catch (const std::exception& e) {
        // toml::find throws on wrong value types
        return make_error<Config>(ErrorCode::parse_error,
                                  "Invalid value type in " + path.string() + ": " + e.what());
    }
    if (!sections) {
        return nonstd::make_unexpected(sections.error());
    }

    return config;
}

} // namespace polarbear
