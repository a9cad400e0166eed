#include "util/paths.hpp"

#include "support/test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <sys/stat.h>
#include <util/config.hpp>

using namespace polarbear;
using polarbear::test::EnvVarGuard;
using polarbear::test::TempDir;

TEST_CASE("merge_overrides prefers non-empty high fields", "[paths]") {
    util::PathOverrides low{};
    low.config_dir = "/low/config";
    low.data_dir = "/low/data";

    util::PathOverrides high{};
    high.data_dir = "/high/data";

    auto merged = util::merge_overrides({.high = high, .low = low});
    REQUIRE(merged.config_dir == "/low/config");
    REQUIRE(merged.data_dir == "/high/data");
    REQUIRE(merged.runtime_dir.empty());
}

TEST_CASE("overrides_from_config reads the paths section", "[paths]") {
    Config config = default_config();
    config.paths.data_dir = "/srv/polarbear";
    config.paths.runtime_dir = "/run/polarbear";

    auto overrides = util::overrides_from_config(config);
    REQUIRE(overrides.data_dir == "/srv/polarbear");
    REQUIRE(overrides.runtime_dir == "/run/polarbear");
    REQUIRE(overrides.config_dir.empty());
}

TEST_CASE("resolve_app_dirs uses XDG variables", "[paths]") {
    TempDir tmp("polarbear_paths");
    const auto xdg_config = tmp / "config";
    const auto xdg_data = tmp / "data";
    const auto xdg_runtime = tmp / "runtime";

    EnvVarGuard config_env("XDG_CONFIG_HOME", xdg_config.string());
    EnvVarGuard data_env("XDG_DATA_HOME", xdg_data.string());
    EnvVarGuard runtime_env("XDG_RUNTIME_DIR", xdg_runtime.string());

    auto result = util::resolve_app_dirs({});
    REQUIRE(result.has_value());
    REQUIRE(result->config_dir == (xdg_config / "polarbear").lexically_normal());
    REQUIRE(result->data_dir == (xdg_data / "polarbear").lexically_normal());
    REQUIRE(result->runtime_dir == xdg_runtime.lexically_normal());
}

TEST_CASE("resolve_app_dirs falls back to HOME", "[paths]") {
    TempDir tmp("polarbear_home");
    EnvVarGuard home("HOME", tmp.path().string());
    EnvVarGuard config_env("XDG_CONFIG_HOME", std::nullopt);
    EnvVarGuard data_env("XDG_DATA_HOME", "relative/ignored");

    auto result = util::resolve_app_dirs({});
    REQUIRE(result.has_value());
    REQUIRE(result->config_dir == (tmp / ".config/polarbear").lexically_normal());
    REQUIRE(result->data_dir == (tmp / ".local/share/polarbear").lexically_normal());
}

TEST_CASE("resolve_app_dirs applies and validates overrides", "[paths]") {
    SECTION("Absolute overrides win") {
        util::PathOverrides overrides{};
        overrides.data_dir = "/srv/polarbear/./data";
        auto result = util::resolve_app_dirs(overrides);
        REQUIRE(result.has_value());
        REQUIRE(result->data_dir == std::filesystem::path("/srv/polarbear/data"));
    }

    SECTION("Relative overrides are rejected") {
        util::PathOverrides overrides{};
        overrides.runtime_dir = "run";
        auto result = util::resolve_app_dirs(overrides);
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::invalid_config);
    }
}

TEST_CASE("ensure_app_dirs creates a private runtime directory", "[paths]") {
    TempDir tmp("polarbear_ensure");
    util::AppDirs dirs{
        .config_dir = tmp / "config",
        .data_dir = tmp / "data",
        .runtime_dir = tmp / "run",
    };
    REQUIRE(util::ensure_app_dirs(dirs).has_value());
    REQUIRE(std::filesystem::is_directory(dirs.data_dir));

    struct stat st {};
    REQUIRE(::stat(dirs.runtime_dir.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0700);
}

TEST_CASE("path helpers normalize relative parts", "[paths]") {
    util::AppDirs dirs{
        .config_dir = "/tmp/polarbear_cfg",
        .data_dir = "/tmp/polarbear_data",
        .runtime_dir = "/tmp/polarbear_run",
    };
    REQUIRE(util::data_path(dirs, "logs/../rootfs") ==
            std::filesystem::path("/tmp/polarbear_data/rootfs"));
    REQUIRE(util::config_path(dirs, "x/./y") == std::filesystem::path("/tmp/polarbear_cfg/x/y"));
}
