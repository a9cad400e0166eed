#include "app/cli.hpp"

#include <CLI/CLI.hpp>
#include <util/profiling.hpp>

namespace polarbear::app {
namespace {

[[nodiscard]] auto make_exit_ok() -> CliResult {
    return CliParseOutcome{
        .action = CliAction::exit_ok,
        .options = {},
    };
}

auto register_options(CLI::App& app, CliOptions& options, uint16_t& progress_port) -> CLI::Option* {
    app.add_option("-c,--config", options.config_path, "Path to configuration file")
        ->check(CLI::ExistingFile);
    app.add_option("-d,--data-dir", options.data_dir,
                   "Directory for the guest root filesystem and logs (overrides [paths])");
    app.add_flag("--reset", options.reset,
                 "Delete the installed root filesystem and bootstrap it again");
    return app.add_option("--progress-port", progress_port,
                          "Loopback port of the progress WebSocket (overrides [progress])")
        ->check(CLI::Range(1, 65535));
}

[[nodiscard]] auto validate(const CliOptions& options) -> Result<void> {
    POLARBEAR_PROFILE_FUNCTION();
    if (!options.data_dir.empty() && !options.data_dir.is_absolute()) {
        return make_error<void>(ErrorCode::parse_error,
                                "--data-dir must be an absolute path: " + options.data_dir.string());
    }
    return {};
}

} // namespace

auto parse_cli(int argc, char** argv) -> CliResult {
    POLARBEAR_PROFILE_FUNCTION();
    CLI::App app{POLARBEAR_PROJECT_NAME " - Linux desktop session in a proot sandbox"};
    app.set_version_flag("--version,-v", POLARBEAR_PROJECT_NAME " v" POLARBEAR_VERSION);
    app.footer(R"(Usage:
  polarbear [--config FILE] [--data-dir DIR] [--reset] [--progress-port PORT]

Notes:
  - The first run downloads and installs the guest root filesystem.
  - Setup progress is served on ws://127.0.0.1:<port> while installing.)");

    CliOptions options;
    uint16_t progress_port = 0;
    auto* port_option = register_options(app, options, progress_port);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        if (e.get_exit_code() == 0) {
            (void)app.exit(e);
            return make_exit_ok();
        }
        (void)app.exit(e);
        return make_error<CliParseOutcome>(ErrorCode::parse_error,
                                           "Failed to parse command line arguments.");
    }

    if (port_option->count() > 0) {
        options.progress_port = progress_port;
    }

    if (auto validation = validate(options); !validation) {
        return make_error<CliParseOutcome>(validation.error().code, validation.error().message,
                                           validation.error().location);
    }

    return CliParseOutcome{
        .action = CliAction::run,
        .options = std::move(options),
    };
}

} // namespace polarbear::app
