#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <nonstd/expected.hpp>
#include <source_location>
#include <string>
#include <utility>

namespace polarbear {

enum class ErrorCode : std::uint8_t {
    ok,
    file_not_found,
    file_read_failed,
    file_write_failed,
    parse_error,
    invalid_config,
    invalid_state,
    invalid_data,
    protocol_violation,
    compositor_init_failed,
    no_compatible_config,
    context_lost,
    render_failed,
    transient_network,
    download_failed,
    integrity_mismatch,
    corrupt_archive,
    disk_full,
    cancelled,
    process_spawn_failed,
    sandbox_launch_failed,
    restart_threshold_exceeded,
    progress_channel_failed,
    unknown_error
};

struct Error {
    ErrorCode code;
    std::string message;
    std::source_location location;

    Error(ErrorCode error_code, std::string msg,
          std::source_location loc = std::source_location::current())
        : code(error_code), message(std::move(msg)), location(loc) {}
};

template <typename T>
using Result = nonstd::expected<T, Error>;

template <typename T>
using ResultPtr = Result<std::unique_ptr<T>>;

template <typename T>
[[nodiscard]] inline auto make_error(ErrorCode code, std::string message,
                                     std::source_location loc = std::source_location::current())
    -> Result<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

template <typename T>
[[nodiscard]] inline auto make_result_ptr(std::unique_ptr<T> ptr) -> ResultPtr<T> {
    return ResultPtr<T>{std::move(ptr)};
}

template <typename T>
[[nodiscard]] inline auto
make_result_ptr_error(ErrorCode code, std::string message,
                      std::source_location loc = std::source_location::current()) -> ResultPtr<T> {
    return nonstd::make_unexpected(Error{code, std::move(message), loc});
}

[[nodiscard]] constexpr auto error_code_name(ErrorCode code) -> const char* {
    switch (code) {
    case ErrorCode::ok:
        return "ok";
    case ErrorCode::file_not_found:
        return "file_not_found";
    case ErrorCode::file_read_failed:
        return "file_read_failed";
    case ErrorCode::file_write_failed:
        return "file_write_failed";
    case ErrorCode::parse_error:
        return "parse_error";
    case ErrorCode::invalid_config:
        return "invalid_config";
    case ErrorCode::invalid_state:
        return "invalid_state";
    case ErrorCode::invalid_data:
        return "invalid_data";
    case ErrorCode::protocol_violation:
        return "protocol_violation";
    case ErrorCode::compositor_init_failed:
        return "compositor_init_failed";
    case ErrorCode::no_compatible_config:
        return "no_compatible_config";
    case ErrorCode::context_lost:
        return "context_lost";
    case ErrorCode::render_failed:
        return "render_failed";
    case ErrorCode::transient_network:
        return "transient_network";
    case ErrorCode::download_failed:
        return "download_failed";
    case ErrorCode::integrity_mismatch:
        return "integrity_mismatch";
    case ErrorCode::corrupt_archive:
        return "corrupt_archive";
    case ErrorCode::disk_full:
        return "disk_full";
    case ErrorCode::cancelled:
        return "cancelled";
    case ErrorCode::process_spawn_failed:
        return "process_spawn_failed";
    case ErrorCode::sandbox_launch_failed:
        return "sandbox_launch_failed";
    case ErrorCode::restart_threshold_exceeded:
        return "restart_threshold_exceeded";
    case ErrorCode::progress_channel_failed:
        return "progress_channel_failed";
    case ErrorCode::unknown_error:
        return "unknown_error";
    }
    return "unknown";
}

/// Transient errors are retried internally and never surfaced on their own.
[[nodiscard]] constexpr auto is_transient(ErrorCode code) -> bool {
    return code == ErrorCode::transient_network;
}

/// Integrity errors get exactly one automatic re-attempt before becoming fatal.
[[nodiscard]] constexpr auto is_integrity_error(ErrorCode code) -> bool {
    return code == ErrorCode::integrity_mismatch || code == ErrorCode::corrupt_archive;
}

} // namespace polarbear

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/// Propagate error or return value. Expression-style like Rust's `?` operator.
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define POLARBEAR_TRY(expr)                                                                        \
    ({                                                                                             \
        auto _try_result = (expr);                                                                 \
        if (!_try_result)                                                                          \
            return nonstd::make_unexpected(_try_result.error());                                   \
        std::move(_try_result).value();                                                            \
    })

/// Abort on error or return value. Use for internal invariants where failure is a bug.
// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define POLARBEAR_MUST(expr)                                                                       \
    ({                                                                                             \
        auto _must_result = (expr);                                                                \
        if (!_must_result) {                                                                       \
            auto& _err = _must_result.error();                                                     \
            std::fprintf(stderr, "POLARBEAR_MUST failed at %s:%u in %s\n  %s: %s\n",               \
                         _err.location.file_name(), _err.location.line(),                          \
                         _err.location.function_name(), polarbear::error_code_name(_err.code),     \
                         _err.message.c_str());                                                    \
            std::abort();                                                                          \
        }                                                                                          \
        std::move(_must_result).value();                                                           \
    })

// NOLINTEND(cppcoreguidelines-macro-usage)
