#include "logging.hpp"

#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace polarbear {

namespace {
std::shared_ptr<spdlog::logger> g_logger;

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
} // namespace

void initialize_logger(std::string_view app_name) {
    if (g_logger) {
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(LOG_PATTERN);

    g_logger = std::make_shared<spdlog::logger>(std::string(app_name), console_sink);

#ifdef NDEBUG
    g_logger->set_level(spdlog::level::info);
#else
    g_logger->set_level(spdlog::level::debug);
#endif

    g_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(g_logger);
}

auto attach_log_file(const std::filesystem::path& path) -> bool {
    auto logger = get_logger();
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string());
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        logger->sinks().push_back(std::move(file_sink));
    } catch (const std::exception& e) {
        POLARBEAR_LOG_WARN("Failed to open log file '{}': {}", path.string(), e.what());
        return false;
    }
    return true;
}

auto get_logger() -> std::shared_ptr<spdlog::logger> {
    if (!g_logger) {
        initialize_logger();
    }
    return g_logger;
}

void set_log_level(spdlog::level::level_enum level) {
    if (g_logger) {
        g_logger->set_level(level);
    }
}

auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum> {
    if (name == "trace") {
        return spdlog::level::trace;
    }
    if (name == "debug") {
        return spdlog::level::debug;
    }
    if (name == "info") {
        return spdlog::level::info;
    }
    if (name == "warn") {
        return spdlog::level::warn;
    }
    if (name == "error") {
        return spdlog::level::err;
    }
    if (name == "critical") {
        return spdlog::level::critical;
    }
    return std::nullopt;
}

} // namespace polarbear
