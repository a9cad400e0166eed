#pragma once

#include <util/error.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>

namespace polarbear::app {

struct CliOptions {
    std::filesystem::path config_path;
    std::filesystem::path data_dir;
    /// Delete the installed rootfs before starting.
    bool reset = false;
    std::optional<uint16_t> progress_port;
};

enum class CliAction : std::uint8_t {
    run,
    exit_ok,
};

struct CliParseOutcome {
    CliAction action = CliAction::run;
    CliOptions options;
};

using CliResult = Result<CliParseOutcome>;

/// @brief Parses the command line. `--help` and `--version` come back as `exit_ok`.
[[nodiscard]] auto parse_cli(int argc, char** argv) -> CliResult;

} // namespace polarbear::app
