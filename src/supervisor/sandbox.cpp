#include "sandbox.hpp"

#include <util/logging.hpp>

#include <fmt/format.h>

#include <cctype>
#include <system_error>

extern char** environ;

namespace polarbear::supervisor {

namespace {

constexpr const char* GUEST_PATH =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin:/usr/local/games:/usr/games";

struct ProcTarget {
    const char* fake_name;
    const char* guest_path;
};

constexpr ProcTarget PROC_TARGETS[] = {
    {".loadavg", "/proc/loadavg"},
    {".stat", "/proc/stat"},
    {".uptime", "/proc/uptime"},
    {".version", "/proc/version"},
    {".vmstat", "/proc/vmstat"},
    {".sysctl_entry_cap_last_cap", "/proc/sys/kernel/cap_last_cap"},
    {".sysctl_inotify_max_user_watches", "/proc/sys/fs/inotify/max_user_watches"},
};

auto guest_home(const std::string& user) -> std::string {
    return user == "root" ? "/root" : "/home/" + user;
}

} // namespace

auto default_binds(const SandboxSpec& spec) -> std::vector<BindMount> {
    const auto root = spec.rootfs.string();
    std::vector<BindMount> binds = {
        {"/dev", "/dev", false},
        {"/proc", "/proc", false},
        {"/sys", "/sys", false},
        {root + "/tmp", "/dev/shm", false},
        {"/dev/urandom", "/dev/random", false},
        {"/proc/self/fd", "/dev/fd", false},
        {"/proc/self/fd/0", "/dev/stdin", false},
        {"/proc/self/fd/1", "/dev/stdout", false},
        {"/proc/self/fd/2", "/dev/stderr", false},
    };
    for (const auto& target : PROC_TARGETS) {
        binds.push_back({root + "/proc/" + target.fake_name, target.guest_path, false});
    }
    binds.push_back({root + "/sys/.empty", "/sys/fs/selinux", false});
    if (!spec.wayland_socket.empty()) {
        binds.push_back({spec.wayland_socket.string(),
                         "/tmp/" + spec.wayland_socket.filename().string(), false});
    }
    return binds;
}

auto bind_arguments(const SandboxSpec& spec) -> std::vector<std::string> {
    std::vector<std::string> args;
    auto add = [&args](const BindMount& bind) {
        if (bind.optional) {
            std::error_code ec;
            if (!std::filesystem::exists(bind.host_path, ec)) {
                POLARBEAR_LOG_DEBUG("Skipping optional bind {}: host path missing", bind.host_path);
                return;
            }
        }
        if (bind.guest_path.empty() || bind.guest_path == bind.host_path) {
            args.push_back("--bind=" + bind.host_path);
        } else {
            args.push_back(fmt::format("--bind={}:{}", bind.host_path, bind.guest_path));
        }
    };
    for (const auto& bind : default_binds(spec)) {
        add(bind);
    }
    for (const auto& bind : spec.extra_binds) {
        add(bind);
    }
    return args;
}

auto build_sandbox_argv(const SandboxSpec& spec, const std::string& command)
    -> std::vector<std::string> {
    std::vector<std::string> argv = {
        spec.proot.string(), "-r", spec.rootfs.string(), "-L", "--link2symlink", "--sysvipc",
        "--kill-on-exit", "--root-id",
    };
    auto binds = bind_arguments(spec);
    argv.insert(argv.end(), binds.begin(), binds.end());

    argv.emplace_back("/usr/bin/env");
    argv.emplace_back("-i");
    argv.push_back("HOME=" + guest_home(spec.user));
    argv.emplace_back("LANG=C.UTF-8");
    argv.push_back(std::string("PATH=") + GUEST_PATH);
    argv.emplace_back("TMPDIR=/tmp");
    argv.push_back("USER=" + spec.user);
    argv.push_back("LOGNAME=" + spec.user);
    argv.emplace_back("XDG_RUNTIME_DIR=/tmp");
    if (!spec.wayland_socket.empty()) {
        argv.push_back("WAYLAND_DISPLAY=" + spec.wayland_socket.filename().string());
    }
    argv.push_back("DISPLAY=" + spec.x11_display);

    if (spec.user != "root") {
        argv.insert(argv.end(), {"runuser", "-u", spec.user, "--"});
    }
    argv.insert(argv.end(), {"sh", "-c", command});
    return argv;
}

auto build_sandbox_env(const SandboxSpec& spec, const std::vector<std::string>& host_env)
    -> std::vector<std::string> {
    std::vector<std::string> env;
    env.reserve(host_env.size() + 2);
    for (const auto& entry : host_env) {
        if (entry.starts_with("PROOT_TMP_DIR=") || entry.starts_with("PROOT_LOADER=")) {
            continue;
        }
        env.push_back(entry);
    }
    env.push_back("PROOT_TMP_DIR=" + spec.rootfs.string());
    if (!spec.proot_loader.empty()) {
        env.push_back("PROOT_LOADER=" + spec.proot_loader.string());
    }
    return env;
}

auto current_environment() -> std::vector<std::string> {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        env.emplace_back(*entry);
    }
    return env;
}

auto x11_display_number(const std::string& display) -> std::string {
    const auto colon = display.rfind(':');
    if (colon == std::string::npos) {
        return "0";
    }
    std::string number;
    for (size_t i = colon + 1; i < display.size() && std::isdigit(static_cast<unsigned char>(display[i])); ++i) {
        number.push_back(display[i]);
    }
    return number.empty() ? "0" : number;
}

auto resolve_session_commands(const GuestConfig& guest, const Config::Session& session)
    -> SessionCommands {
    auto pick = [](const std::string& host, const std::string& fallback) {
        return host.empty() ? fallback : host;
    };
    return SessionCommands{
        .check = pick(session.check_command, guest.check),
        .install = pick(session.install_command, guest.install),
        .compat_server = pick(session.compat_server_command, guest.compat_server),
        .desktop = pick(session.desktop_command, guest.launch),
    };
}

auto session_processes(const SandboxSpec& spec, const SessionCommands& commands,
                       const std::vector<std::string>& host_env) -> std::vector<ProcessSpec> {
    const auto env = build_sandbox_env(spec, host_env);
    const auto display = x11_display_number(spec.x11_display);

    std::string provision =
        fmt::format("rm -f /tmp/.X{0}-lock /tmp/.X11-unix/X{0}", display);
    if (!commands.check.empty() || !commands.install.empty()) {
        const auto check = commands.check.empty() ? std::string("false") : commands.check;
        const auto install = commands.install.empty() ? std::string("true") : commands.install;
        provision += fmt::format("; ({}) || ({})", check, install);
    }

    // Provisioning runs as root regardless of the session user.
    SandboxSpec root_spec = spec;
    root_spec.user = "root";

    std::vector<ProcessSpec> processes;
    processes.push_back(ProcessSpec{
        .name = "sandbox",
        .role = ProcessRole::sandbox_wrapper,
        .argv = build_sandbox_argv(root_spec, provision),
        .env = env,
        .oneshot = true,
    });
    processes.push_back(ProcessSpec{
        .name = "compat-server",
        .role = ProcessRole::compat_server,
        .argv = build_sandbox_argv(spec, commands.compat_server),
        .env = env,
        .ready_path = spec.rootfs / "tmp" / ".X11-unix" / ("X" + display),
    });
    processes.push_back(ProcessSpec{
        .name = "desktop",
        .role = ProcessRole::desktop,
        .argv = build_sandbox_argv(spec, commands.desktop),
        .env = env,
    });
    return processes;
}

} // namespace polarbear::supervisor
