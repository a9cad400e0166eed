#pragma once

#include "restart_policy.hpp"

#include <util/error.hpp>

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polarbear::supervisor {

enum class ProcessRole : std::uint8_t {
    sandbox_wrapper,
    compat_server,
    desktop
};

enum class ProcessStatus : std::uint8_t {
    pending,
    spawning,
    running,
    exited,
    crashed,
    restarting,
    terminal
};

[[nodiscard]] auto to_string(ProcessRole role) -> const char*;
[[nodiscard]] auto to_string(ProcessStatus status) -> const char*;

struct ProcessSpec {
    std::string name;
    ProcessRole role = ProcessRole::desktop;
    std::vector<std::string> argv;
    /// Complete environment for the child, `KEY=value` entries.
    std::vector<std::string> env;
    /// Oneshot processes must exit 0 before the next process starts.
    bool oneshot = false;
    /// Later processes wait until this path exists.
    std::filesystem::path ready_path;
};

struct ProcessInfo {
    std::string name;
    ProcessRole role;
    ProcessStatus status;
    pid_t pid = -1;
    uint32_t restarts = 0;
    std::optional<int> last_exit_code;
    std::optional<int> last_signal;
};

struct SupervisorOptions {
    std::filesystem::path log_dir;
    std::chrono::seconds restart_window{60};
    uint32_t max_crashes = 3;
    std::chrono::milliseconds restart_delay{1000};
    std::chrono::milliseconds ready_timeout{15000};
    std::chrono::milliseconds shutdown_timeout{5000};
};

/// @brief Starts @p spec in its own process group with stdout and stderr appended to
/// @p log_path. Exec failures come back as `process_spawn_failed`.
[[nodiscard]] auto spawn_process(const ProcessSpec& spec, const std::filesystem::path& log_path)
    -> Result<pid_t>;

/**
 * @brief Launches the session processes in order and keeps them alive.
 *
 * Processes start one at a time: a oneshot must exit 0, a process with a ready path must
 * produce it. Restartable processes are respawned after `restart_delay` until the restart policy
 * trips, which is fatal. Everything runs on the caller's thread; `poll()` never blocks.
 */
class ProcessSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using FatalHandler = std::function<void(const Error&)>;

    explicit ProcessSupervisor(SupervisorOptions options);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    void set_fatal_handler(FatalHandler handler) { m_fatal_handler = std::move(handler); }

    /// @brief Starts the first process of @p specs. Fails if a session is already running.
    [[nodiscard]] auto launch(std::vector<ProcessSpec> specs) -> Result<void>;

    /// @brief Reaps exits, advances the launch sequence and performs due restarts.
    void poll() { poll(Clock::now()); }
    void poll(Clock::time_point now);

    /// @brief SIGTERM in reverse launch order, then SIGKILL after `shutdown_timeout`.
    void shutdown();

    [[nodiscard]] auto processes() const -> std::vector<ProcessInfo>;
    [[nodiscard]] auto status(std::string_view name) const -> std::optional<ProcessStatus>;
    [[nodiscard]] auto is_active() const -> bool { return m_active; }
    [[nodiscard]] auto has_failed() const -> bool { return m_failed; }

private:
    struct Managed {
        ProcessSpec spec;
        ProcessStatus status = ProcessStatus::pending;
        pid_t pid = -1;
        uint32_t restarts = 0;
        std::optional<int> last_exit_code;
        std::optional<int> last_signal;
        RestartPolicy policy;
        Clock::time_point started_at{};
        Clock::time_point restart_at{};
        bool ready = false;
    };

    void start(Managed& process, Clock::time_point now);
    void handle_exit(Managed& process, int wait_status, Clock::time_point now);
    void advance(Clock::time_point now);
    void fail(Managed& process, const Error& error);
    [[nodiscard]] auto log_path(const Managed& process) const -> std::filesystem::path;

    SupervisorOptions m_options;
    std::vector<Managed> m_processes;
    /// Index of the next process in the launch sequence that has not been started.
    size_t m_next = 0;
    bool m_active = false;
    bool m_failed = false;
    FatalHandler m_fatal_handler;
};

} // namespace polarbear::supervisor
