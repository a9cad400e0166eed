#pragma once

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <filesystem>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace polarbear {

// Initialize the global logger
// Should be called once at application startup
void initialize_logger(std::string_view app_name = "polarbear");

// Mirror all output into a file in addition to the console
// Returns false if the file sink could not be opened
auto attach_log_file(const std::filesystem::path& path) -> bool;

// Get the global logger (for advanced usage)
[[nodiscard]] auto get_logger() -> std::shared_ptr<spdlog::logger>;

// Set log level at runtime
void set_log_level(spdlog::level::level_enum level);

// Maps config level names (trace..critical) to spdlog levels
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<spdlog::level::level_enum>;

} // namespace polarbear

// Project-wide logging macros
// These wrap spdlog and use the global logger

#define POLARBEAR_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::polarbear::get_logger(), __VA_ARGS__)

#define POLARBEAR_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::polarbear::get_logger(), __VA_ARGS__)

#define POLARBEAR_LOG_INFO(...) SPDLOG_LOGGER_INFO(::polarbear::get_logger(), __VA_ARGS__)

#define POLARBEAR_LOG_WARN(...) SPDLOG_LOGGER_WARN(::polarbear::get_logger(), __VA_ARGS__)

#define POLARBEAR_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::polarbear::get_logger(), __VA_ARGS__)

#define POLARBEAR_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::polarbear::get_logger(), __VA_ARGS__)
