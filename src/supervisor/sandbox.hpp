#pragma once

#include "guest_config.hpp"
#include "process_supervisor.hpp"

#include <util/config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace polarbear::supervisor {

/// @brief Everything needed to run a command inside the proot sandbox.
struct SandboxSpec {
    std::filesystem::path proot = "proot";
    /// Exported as `PROOT_LOADER` when set.
    std::filesystem::path proot_loader;
    std::filesystem::path rootfs;
    /// Host path of the compositor's listening socket.
    std::filesystem::path wayland_socket;
    std::string x11_display = ":1";
    std::string user = "root";
    /// Appended after the default binds.
    std::vector<BindMount> extra_binds;
};

/// Commands the session runs, after host overrides are applied over the guest config.
struct SessionCommands {
    std::string check;
    std::string install;
    std::string compat_server;
    std::string desktop;
};

[[nodiscard]] auto default_binds(const SandboxSpec& spec) -> std::vector<BindMount>;

/// @brief `--bind=` arguments for the default and extra binds. Optional binds whose host path is
/// missing are left out.
[[nodiscard]] auto bind_arguments(const SandboxSpec& spec) -> std::vector<std::string>;

/// @brief Full argv running `sh -c command` inside the sandbox with a clean environment.
[[nodiscard]] auto build_sandbox_argv(const SandboxSpec& spec, const std::string& command)
    -> std::vector<std::string>;

/// @brief Environment for the proot process itself: @p host_env plus the proot variables.
[[nodiscard]] auto build_sandbox_env(const SandboxSpec& spec,
                                     const std::vector<std::string>& host_env)
    -> std::vector<std::string>;

/// @brief Current process environment as `KEY=value` entries.
[[nodiscard]] auto current_environment() -> std::vector<std::string>;

/// @brief Number part of an X display such as `:1`. Returns "0" when there is none.
[[nodiscard]] auto x11_display_number(const std::string& display) -> std::string;

/// @brief Non-empty host commands win over the guest's.
[[nodiscard]] auto resolve_session_commands(const GuestConfig& guest,
                                            const Config::Session& session) -> SessionCommands;

/**
 * @brief Builds the launch sequence: provisioning wrapper, compatibility server, desktop.
 *
 * The wrapper clears stale X locks and provisions the guest; it must exit 0. The compatibility
 * server gates the desktop on its X socket appearing under the rootfs.
 */
[[nodiscard]] auto session_processes(const SandboxSpec& spec, const SessionCommands& commands,
                                     const std::vector<std::string>& host_env)
    -> std::vector<ProcessSpec>;

} // namespace polarbear::supervisor
