#include "paths.hpp"

#include "config.hpp"
#include "profiling.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <system_error>
#include <unistd.h>

namespace polarbear::util {

namespace {

auto is_absolute_or_empty(const std::filesystem::path& path) -> bool {
    return path.empty() || path.is_absolute();
}

auto get_env_path(std::string_view key) -> std::optional<std::filesystem::path> {
    const char* value = std::getenv(std::string(key).c_str());
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    std::filesystem::path p(value);
    if (!p.is_absolute()) {
        return std::nullopt;
    }
    return p;
}

auto resolve_xdg_root(std::string_view xdg_key, const char* home_suffix)
    -> std::optional<std::filesystem::path> {
    if (auto env = get_env_path(xdg_key)) {
        return env;
    }
    auto home = get_env_path("HOME");
    if (!home) {
        return std::nullopt;
    }
    return *home / home_suffix;
}

auto resolve_runtime_root() -> std::filesystem::path {
    if (auto env = get_env_path("XDG_RUNTIME_DIR")) {
        return *env;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = "/tmp";
    }
    return tmp / ("polarbear-" + std::to_string(::getuid()));
}

} // namespace

auto merge_overrides(const OverrideMerge& merge) -> PathOverrides {
    PathOverrides merged = merge.low;

    if (!merge.high.config_dir.empty()) {
        merged.config_dir = merge.high.config_dir;
    }
    if (!merge.high.data_dir.empty()) {
        merged.data_dir = merge.high.data_dir;
    }
    if (!merge.high.runtime_dir.empty()) {
        merged.runtime_dir = merge.high.runtime_dir;
    }

    return merged;
}

auto overrides_from_config(const Config& config) -> PathOverrides {
    PathOverrides overrides{};
    overrides.data_dir = config.paths.data_dir;
    overrides.runtime_dir = config.paths.runtime_dir;
    return overrides;
}

auto resolve_app_dirs(const PathOverrides& overrides) -> Result<AppDirs> {
    POLARBEAR_PROFILE_FUNCTION();
    if (!is_absolute_or_empty(overrides.config_dir) || !is_absolute_or_empty(overrides.data_dir) ||
        !is_absolute_or_empty(overrides.runtime_dir)) {
        return make_error<AppDirs>(ErrorCode::invalid_config,
                                   "paths.* overrides must be absolute paths");
    }

    std::filesystem::path config_dir;
    if (!overrides.config_dir.empty()) {
        config_dir = overrides.config_dir.lexically_normal();
    } else {
        auto root = resolve_xdg_root("XDG_CONFIG_HOME", ".config");
        if (!root) {
            return make_error<AppDirs>(ErrorCode::invalid_data,
                                       "Unable to resolve XDG config directory");
        }
        config_dir = (*root / "polarbear").lexically_normal();
    }

    std::filesystem::path data_dir;
    if (!overrides.data_dir.empty()) {
        data_dir = overrides.data_dir.lexically_normal();
    } else {
        auto root = resolve_xdg_root("XDG_DATA_HOME", ".local/share");
        if (!root) {
            return make_error<AppDirs>(ErrorCode::invalid_data,
                                       "Unable to resolve XDG data directory");
        }
        data_dir = (*root / "polarbear").lexically_normal();
    }

    std::filesystem::path runtime_dir = overrides.runtime_dir.empty()
                                            ? resolve_runtime_root().lexically_normal()
                                            : overrides.runtime_dir.lexically_normal();

    return AppDirs{
        .config_dir = std::move(config_dir),
        .data_dir = std::move(data_dir),
        .runtime_dir = std::move(runtime_dir),
    };
}

auto ensure_app_dirs(const AppDirs& dirs) -> Result<void> {
    std::error_code ec;
    std::filesystem::create_directories(dirs.data_dir, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Failed to create data directory " + dirs.data_dir.string() +
                                    ": " + ec.message());
    }
    std::filesystem::create_directories(dirs.runtime_dir, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Failed to create runtime directory " +
                                    dirs.runtime_dir.string() + ": " + ec.message());
    }
    std::filesystem::permissions(dirs.runtime_dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Failed to restrict runtime directory: " + ec.message());
    }
    return {};
}

auto data_path(const AppDirs& dirs, const std::filesystem::path& rel) -> std::filesystem::path {
    return (dirs.data_dir / rel).lexically_normal();
}

auto config_path(const AppDirs& dirs, const std::filesystem::path& rel) -> std::filesystem::path {
    return (dirs.config_dir / rel).lexically_normal();
}

} // namespace polarbear::util
