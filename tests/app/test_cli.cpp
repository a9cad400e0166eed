#include "app/cli.hpp"

#include "support/test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace polarbear;
using polarbear::test::TempDir;

namespace {

struct ArgvBuilder {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    explicit ArgvBuilder(std::initializer_list<std::string> args) : storage(args) {
        argv.reserve(storage.size());
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
    }

    [[nodiscard]] auto argc() const -> int { return static_cast<int>(argv.size()); }
};

} // namespace

TEST_CASE("parse_cli: no arguments runs with defaults", "[cli]") {
    ArgvBuilder args({"polarbear"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(result);
    REQUIRE(result->action == app::CliAction::run);
    REQUIRE(result->options.config_path.empty());
    REQUIRE(result->options.data_dir.empty());
    REQUIRE_FALSE(result->options.reset);
    REQUIRE_FALSE(result->options.progress_port.has_value());
}

TEST_CASE("parse_cli: all options are parsed", "[cli]") {
    TempDir tmp("polarbear_cli");
    const auto cfg = tmp / "polarbear.toml";
    polarbear::test::write_file(cfg, "");

    ArgvBuilder args({"polarbear", "--config", cfg.string(), "--data-dir", "/srv/polarbear",
                      "--reset", "--progress-port", "4100"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(result);
    REQUIRE(result->options.config_path == cfg);
    REQUIRE(result->options.data_dir == std::filesystem::path("/srv/polarbear"));
    REQUIRE(result->options.reset);
    REQUIRE(result->options.progress_port == std::optional<uint16_t>{4100});
}

TEST_CASE("parse_cli: missing config file is rejected", "[cli]") {
    ArgvBuilder args({"polarbear", "-c", "/nonexistent/polarbear.toml"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_cli: relative data dir is rejected", "[cli]") {
    ArgvBuilder args({"polarbear", "--data-dir", "relative/dir"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_cli: progress port outside range is rejected", "[cli]") {
    ArgvBuilder args({"polarbear", "--progress-port", "0"});

    auto result = app::parse_cli(args.argc(), args.argv.data());
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::parse_error);
}

TEST_CASE("parse_cli: help and version exit cleanly", "[cli]") {
    SECTION("help") {
        ArgvBuilder args({"polarbear", "--help"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(result);
        REQUIRE(result->action == app::CliAction::exit_ok);
    }

    SECTION("version") {
        ArgvBuilder args({"polarbear", "--version"});
        auto result = app::parse_cli(args.argc(), args.argv.data());
        REQUIRE(result);
        REQUIRE(result->action == app::CliAction::exit_ok);
    }
}
