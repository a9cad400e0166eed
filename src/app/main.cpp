#include "application.hpp"
#include "cli.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/job_system.hpp>
#include <util/logging.hpp>
#include <util/paths.hpp>

static auto load_effective_config(const polarbear::app::CliOptions& cli_opts)
    -> polarbear::Config {
    std::filesystem::path config_path = cli_opts.config_path;
    if (config_path.empty()) {
        auto default_dirs = polarbear::util::resolve_app_dirs({});
        std::error_code ec;
        if (!default_dirs ||
            !std::filesystem::exists(default_dirs->config_dir / "polarbear.toml", ec)) {
            return polarbear::default_config();
        }
        config_path = default_dirs->config_dir / "polarbear.toml";
    }
    auto config_result = polarbear::load_config(config_path);
    if (!config_result) {
        const auto& error = config_result.error();
        POLARBEAR_LOG_ERROR("Failed to load configuration from '{}': {} ({})",
                            config_path.string(), error.message,
                            polarbear::error_code_name(error.code));
        POLARBEAR_LOG_INFO("Using default configuration");
        return polarbear::default_config();
    }
    return config_result.value();
}

static auto run_app(int argc, char** argv) -> int {
    auto cli_result = polarbear::app::parse_cli(argc, argv);
    if (!cli_result) {
        std::fprintf(stderr, "Error: %s\n", cli_result.error().message.c_str());
        return EXIT_FAILURE;
    }
    if (cli_result->action == polarbear::app::CliAction::exit_ok) {
        return EXIT_SUCCESS;
    }
    const auto& cli_opts = cli_result->options;

    polarbear::initialize_logger("polarbear");
    POLARBEAR_LOG_INFO(POLARBEAR_PROJECT_NAME " v" POLARBEAR_VERSION " starting");

    auto config = load_effective_config(cli_opts);
    if (auto level = polarbear::parse_log_level(config.logging.level)) {
        polarbear::set_log_level(*level);
    } else {
        POLARBEAR_LOG_WARN("Unknown log level '{}', keeping default", config.logging.level);
    }
    if (cli_opts.progress_port) {
        config.progress.port = *cli_opts.progress_port;
    }

    polarbear::util::PathOverrides cli_overrides;
    cli_overrides.data_dir = cli_opts.data_dir;
    const auto config_overrides = polarbear::util::overrides_from_config(config);
    auto dirs_result = polarbear::util::resolve_app_dirs(
        polarbear::util::merge_overrides({.high = cli_overrides, .low = config_overrides}));
    if (!dirs_result) {
        POLARBEAR_LOG_CRITICAL("Failed to resolve directories: {}", dirs_result.error().message);
        return EXIT_FAILURE;
    }
    const auto& dirs = dirs_result.value();
    if (auto ensured = polarbear::util::ensure_app_dirs(dirs); !ensured) {
        POLARBEAR_LOG_CRITICAL("Failed to create directories: {}", ensured.error().message);
        return EXIT_FAILURE;
    }

    if (!config.logging.file.empty()) {
        const std::filesystem::path log_file = config.logging.file;
        const auto resolved =
            log_file.is_absolute() ? log_file : polarbear::util::data_path(dirs, log_file);
        if (!polarbear::attach_log_file(resolved)) {
            POLARBEAR_LOG_WARN("Could not open log file {}", resolved.string());
        }
    }

    POLARBEAR_LOG_DEBUG("Configuration loaded:");
    POLARBEAR_LOG_DEBUG("  Data dir: {}", dirs.data_dir.string());
    POLARBEAR_LOG_DEBUG("  Runtime dir: {}", dirs.runtime_dir.string());
    POLARBEAR_LOG_DEBUG("  Rootfs url: {}", config.rootfs.url);
    POLARBEAR_LOG_DEBUG("  Session user: {}", config.session.user);
    POLARBEAR_LOG_DEBUG("  Progress: {} (port {})", config.progress.enabled,
                        config.progress.port);
    POLARBEAR_LOG_DEBUG("  Log level: {}", config.logging.level);

    polarbear::util::JobSystem::initialize(2);

    auto app_result = polarbear::app::Application::create(config, dirs);
    if (!app_result) {
        POLARBEAR_LOG_CRITICAL("Failed to start: {} ({})", app_result.error().message,
                               polarbear::error_code_name(app_result.error().code));
        polarbear::util::JobSystem::shutdown();
        return EXIT_FAILURE;
    }
    auto& app = *app_result.value();

    app.start(cli_opts.reset);
    app.run();

    POLARBEAR_LOG_INFO("Shutting down...");
    app.shutdown();
    app_result.value().reset();
    polarbear::util::JobSystem::shutdown();
    POLARBEAR_LOG_INFO("Polarbear terminated successfully");
    return EXIT_SUCCESS;
}

auto main(int argc, char** argv) -> int {
    try {
        return run_app(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[CRITICAL] Unhandled exception: %s\n", e.what());
        try {
            POLARBEAR_LOG_CRITICAL("Unhandled exception caught in main: {}", e.what());
            spdlog::shutdown();
        } catch (...) {
            std::fprintf(stderr, "[CRITICAL] Logger failed to handle exception\n");
        }
        return EXIT_FAILURE;
    } catch (...) {
        std::fprintf(stderr, "[CRITICAL] Unknown exception caught in main\n");
        return EXIT_FAILURE;
    }
}
