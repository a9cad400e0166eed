#include "util/config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace polarbear;

namespace {

class TempToml {
public:
    explicit TempToml(const std::string& content) {
        m_path = std::filesystem::temp_directory_path() /
                 ("polarbear_config_" + std::to_string(::getpid()) + "_" +
                  std::to_string(s_counter++) + ".toml");
        std::ofstream out(m_path);
        out << content;
    }
    ~TempToml() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
    TempToml(const TempToml&) = delete;
    TempToml& operator=(const TempToml&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }

private:
    static inline int s_counter = 0;
    std::filesystem::path m_path;
};

} // namespace

TEST_CASE("default_config returns expected values", "[config]") {
    auto config = default_config();

    SECTION("Rootfs defaults") {
        REQUIRE(config.rootfs.url == DEFAULT_ROOTFS_URL);
        REQUIRE(config.rootfs.sha256.empty());
        REQUIRE(config.rootfs.strip_components == 1);
        REQUIRE_FALSE(config.rootfs.keep_archive);
    }

    SECTION("Session defaults") {
        REQUIRE(config.session.user == "root");
        REQUIRE(config.session.x11_display == ":1");
        REQUIRE(config.session.restart_window_s == 60);
        REQUIRE(config.session.max_crashes == 3);
        REQUIRE(config.session.binds.empty());
    }

    SECTION("Compositor defaults") {
        REQUIRE(config.compositor.socket_name == "wayland-0");
        REQUIRE(config.compositor.strict_backpressure);
    }

    SECTION("Progress defaults") {
        REQUIRE(config.progress.enabled);
        REQUIRE(config.progress.port == 3000);
        REQUIRE(config.progress.subprotocol == "polarbear.progress.v1");
    }

    SECTION("Logging defaults") {
        REQUIRE(config.logging.level == "info");
        REQUIRE(config.logging.file.empty());
    }
}

TEST_CASE("load_config handles missing file", "[config]") {
    const std::string nonexistent_file = "/nonexistent/polarbear.toml";
    auto result = load_config(nonexistent_file);

    REQUIRE(!result.has_value());
    REQUIRE(result.error().code == ErrorCode::file_not_found);
    REQUIRE(result.error().message.find(nonexistent_file) != std::string::npos);
}

TEST_CASE("load_config parses a full configuration", "[config]") {
    TempToml file(R"(
[rootfs]
url = "https://example.invalid/rootfs.tar.xz"
sha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"
strip_components = 0
keep_archive = true

[download]
max_attempts = 7
initial_backoff_ms = 10
max_backoff_ms = 100

[session]
user = "alice"
x11_display = ":3"
desktop_command = "startxfce4"
max_crashes = 5

[[session.binds]]
host = "/srv/shared"
guest = "/mnt/shared"

[[session.binds]]
host = "/media/usb"
optional = true

[compositor]
socket_name = "polarbear-0"
width = 1920
height = 1080
scale = 2.0
strict_backpressure = false

[progress]
port = 4000

[logging]
level = "debug"
file = "polarbear.log"
)");

    auto result = load_config(file.path());
    REQUIRE(result.has_value());
    const auto& config = result.value();

    REQUIRE(config.rootfs.url == "https://example.invalid/rootfs.tar.xz");
    REQUIRE(config.rootfs.strip_components == 0);
    REQUIRE(config.rootfs.keep_archive);
    REQUIRE(config.download.max_attempts == 7);
    REQUIRE(config.download.max_backoff_ms == 100);
    REQUIRE(config.session.user == "alice");
    REQUIRE(config.session.x11_display == ":3");
    REQUIRE(config.session.desktop_command == "startxfce4");
    REQUIRE(config.session.max_crashes == 5);
    REQUIRE(config.session.binds.size() == 2);
    REQUIRE(config.session.binds[0].guest_path == "/mnt/shared");
    REQUIRE(config.session.binds[1].guest_path == "/media/usb");
    REQUIRE(config.session.binds[1].optional);
    REQUIRE(config.compositor.socket_name == "polarbear-0");
    REQUIRE(config.compositor.width == 1920);
    REQUIRE(config.compositor.scale == 2.0);
    REQUIRE_FALSE(config.compositor.strict_backpressure);
    REQUIRE(config.progress.port == 4000);
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.file == "polarbear.log");
}

TEST_CASE("load_config keeps defaults for missing sections", "[config]") {
    TempToml file(R"(
[logging]
level = "warn"
)");
    auto result = load_config(file.path());
    REQUIRE(result.has_value());
    REQUIRE(result->logging.level == "warn");
    REQUIRE(result->session.x11_display == ":1");
    REQUIRE(result->progress.port == 3000);
}

TEST_CASE("load_config rejects invalid values", "[config]") {
    auto expect_invalid = [](const std::string& content) {
        TempToml file(content);
        auto result = load_config(file.path());
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::invalid_config);
    };

    SECTION("Uppercase digest") {
        expect_invalid("[rootfs]\nsha256 = \"E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855\"\n");
    }
    SECTION("Backoff cap below initial") {
        expect_invalid("[download]\ninitial_backoff_ms = 500\nmax_backoff_ms = 100\n");
    }
    SECTION("Display without colon") {
        expect_invalid("[session]\nx11_display = \"1\"\n");
    }
    SECTION("Relative bind") {
        expect_invalid("[[session.binds]]\nhost = \"relative/dir\"\n");
    }
    SECTION("Socket name with a slash") {
        expect_invalid("[compositor]\nsocket_name = \"run/wayland-0\"\n");
    }
    SECTION("Unknown log level") {
        expect_invalid("[logging]\nlevel = \"verbose\"\n");
    }
    SECTION("Out of range crash limit") {
        expect_invalid("[session]\nmax_crashes = 0\n");
    }
}

TEST_CASE("load_config reports malformed TOML and wrong types", "[config]") {
    SECTION("Syntax error") {
        TempToml file("[session\nuser = ");
        auto result = load_config(file.path());
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::parse_error);
    }
    SECTION("Wrong value type") {
        TempToml file("[compositor]\nwidth = \"wide\"\n");
        auto result = load_config(file.path());
        REQUIRE(!result.has_value());
        REQUIRE(result.error().code == ErrorCode::parse_error);
    }
}
