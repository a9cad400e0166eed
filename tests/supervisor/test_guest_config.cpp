#include "supervisor/guest_config.hpp"

#include "support/test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace polarbear::supervisor;
using polarbear::test::read_file;
using polarbear::test::TempDir;
using polarbear::test::write_file;

TEST_CASE("try_ overrides replace keys in the same table", "[guest_config]") {
    const std::string content = "[user]\n"
                                "username = \"alice\"\n"
                                "try_username = \"bob\"\n"
                                "[command]\n"
                                "launch = \"startlxqt\"\n";

    auto result = apply_try_overrides(content);
    REQUIRE(result.changed);
    REQUIRE(result.effective == "[user]\n"
                                "username = \"bob\"\n"
                                "[command]\n"
                                "launch = \"startlxqt\"\n");
    REQUIRE(result.write_back == "[user]\n"
                                 "username = \"alice\"\n"
                                 "# try_username = \"bob\"\n"
                                 "[command]\n"
                                 "launch = \"startlxqt\"\n");
}

TEST_CASE("try_ overrides add missing keys and the last one wins", "[guest_config]") {
    const std::string content = "[command]\n"
                                "try_launch = \"first\"\n"
                                "try_launch = \"second\"\n"
                                "[user]\n"
                                "username = \"alice\"\n";

    auto result = apply_try_overrides(content);
    REQUIRE(result.effective == "[command]\n"
                                "launch = \"second\"\n"
                                "[user]\n"
                                "username = \"alice\"\n");
}

TEST_CASE("try_ overrides do not cross tables", "[guest_config]") {
    const std::string content = "[user]\n"
                                "try_launch = \"x\"\n"
                                "[command]\n"
                                "launch = \"y\"\n";

    auto result = apply_try_overrides(content);
    REQUIRE(result.effective == "[user]\n"
                                "launch = \"x\"\n"
                                "[command]\n"
                                "launch = \"y\"\n");
}

TEST_CASE("Content without try_ entries is unchanged", "[guest_config]") {
    const std::string content = "[user]\nusername = \"alice\"\n";
    auto result = apply_try_overrides(content);
    REQUIRE_FALSE(result.changed);
    REQUIRE(result.effective == content);
    REQUIRE(result.write_back == content);
}

TEST_CASE("load_guest_config", "[guest_config]") {
    TempDir rootfs("polarbear_guest_cfg");
    const auto path = rootfs / GUEST_CONFIG_PATH;

    SECTION("Missing file gives defaults") {
        auto config = load_guest_config(rootfs.path());
        const auto defaults = default_guest_config();
        REQUIRE(config.username == "root");
        REQUIRE(config.launch == defaults.launch);
        REQUIRE(config.compat_server == "Xwayland -hidpi :1");
    }

    SECTION("Values and try_ overrides are read, then consumed") {
        write_file(path, "[user]\n"
                         "username = \"alice\"\n"
                         "[command]\n"
                         "launch = \"startplasma-wayland\"\n"
                         "try_launch = \"weston\"\n");

        auto first = load_guest_config(rootfs.path());
        REQUIRE(first.username == "alice");
        REQUIRE(first.launch == "weston");
        REQUIRE(first.check == default_guest_config().check);
        REQUIRE(read_file(path).find("# try_launch = \"weston\"") != std::string::npos);

        auto second = load_guest_config(rootfs.path());
        REQUIRE(second.launch == "startplasma-wayland");
    }

    SECTION("Malformed file gives defaults") {
        write_file(path, "[user\nusername = ");
        auto config = load_guest_config(rootfs.path());
        REQUIRE(config.username == "root");
    }
}
