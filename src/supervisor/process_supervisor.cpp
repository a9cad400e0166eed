#include "process_supervisor.hpp"

#include <util/logging.hpp>
#include <util/unique_fd.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace polarbear::supervisor {

namespace {

constexpr auto SHUTDOWN_POLL_INTERVAL = std::chrono::milliseconds(20);

auto to_cstrings(const std::vector<std::string>& strings) -> std::vector<char*> {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (const auto& s : strings) {
        out.push_back(const_cast<char*>(s.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

} // namespace

auto to_string(ProcessRole role) -> const char* {
    switch (role) {
    case ProcessRole::sandbox_wrapper:
        return "sandbox_wrapper";
    case ProcessRole::compat_server:
        return "compat_server";
    case ProcessRole::desktop:
        return "desktop";
    }
    return "unknown";
}

auto to_string(ProcessStatus status) -> const char* {
    switch (status) {
    case ProcessStatus::pending:
        return "pending";
    case ProcessStatus::spawning:
        return "spawning";
    case ProcessStatus::running:
        return "running";
    case ProcessStatus::exited:
        return "exited";
    case ProcessStatus::crashed:
        return "crashed";
    case ProcessStatus::restarting:
        return "restarting";
    case ProcessStatus::terminal:
        return "terminal";
    }
    return "unknown";
}

auto spawn_process(const ProcessSpec& spec, const std::filesystem::path& log_path)
    -> Result<pid_t> {
    if (spec.argv.empty()) {
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 "Process '" + spec.name + "' has no command");
    }

    util::UniqueFd log_fd(
        ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!log_fd.valid()) {
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 "Cannot open log " + log_path.string() + ": " +
                                     std::strerror(errno));
    }
    util::UniqueFd null_fd(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (!null_fd.valid()) {
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 std::string("Cannot open /dev/null: ") + std::strerror(errno));
    }

    auto err_pipe = util::UniqueFd::pipe();
    if (!err_pipe) {
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 std::string("pipe2 failed: ") + std::strerror(errno));
    }
    util::UniqueFd err_read = std::move(err_pipe->read_end);
    util::UniqueFd err_write = std::move(err_pipe->write_end);

    // Everything the child touches is prepared before fork.
    auto argv = to_cstrings(spec.argv);
    auto envp = to_cstrings(spec.env);
    const pid_t parent_pid = ::getpid();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::prctl(PR_SET_PDEATHSIG, SIGTERM, 0, 0, 0);
        if (::getppid() != parent_pid) {
            ::_exit(127);
        }
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        ::dup2(null_fd.get(), STDIN_FILENO);
        ::dup2(log_fd.get(), STDOUT_FILENO);
        ::dup2(log_fd.get(), STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());

        const int err = errno;
        [[maybe_unused]] auto n = ::write(err_write.get(), &err, sizeof(err));
        ::_exit(127);
    }

    // Both sides set the group so signals cannot race the child's own setpgid.
    ::setpgid(pid, pid);
    err_write.reset();

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(err_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return make_error<pid_t>(ErrorCode::process_spawn_failed,
                                 "exec " + spec.argv[0] + " failed: " + std::strerror(child_errno));
    }

    POLARBEAR_LOG_INFO("Started {} (pid {})", spec.name, pid);
    return pid;
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options) : m_options(std::move(options)) {}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

auto ProcessSupervisor::launch(std::vector<ProcessSpec> specs) -> Result<void> {
    if (m_active) {
        return make_error<void>(ErrorCode::invalid_state, "Session processes already running");
    }
    if (specs.empty()) {
        return make_error<void>(ErrorCode::invalid_state, "No session processes to launch");
    }
    std::error_code ec;
    std::filesystem::create_directories(m_options.log_dir, ec);
    if (ec) {
        return make_error<void>(ErrorCode::file_write_failed,
                                "Cannot create log directory " + m_options.log_dir.string() +
                                    ": " + ec.message());
    }

    m_processes.clear();
    m_processes.reserve(specs.size());
    for (auto& spec : specs) {
        m_processes.push_back(Managed{
            .spec = std::move(spec),
            .policy = RestartPolicy(m_options.restart_window, m_options.max_crashes),
        });
    }
    m_next = 0;
    m_failed = false;
    m_active = true;
    advance(Clock::now());
    return {};
}

auto ProcessSupervisor::log_path(const Managed& process) const -> std::filesystem::path {
    return m_options.log_dir / (process.spec.name + ".log");
}

void ProcessSupervisor::start(Managed& process, Clock::time_point now) {
    process.status = ProcessStatus::spawning;
    process.ready = false;
    auto pid = spawn_process(process.spec, log_path(process));
    if (!pid) {
        const ErrorCode code = process.spec.role == ProcessRole::sandbox_wrapper
                                   ? ErrorCode::sandbox_launch_failed
                                   : ErrorCode::process_spawn_failed;
        fail(process, Error{code, pid.error().message});
        return;
    }
    process.pid = *pid;
    process.status = ProcessStatus::running;
    process.started_at = now;
}

void ProcessSupervisor::advance(Clock::time_point now) {
    while (!m_failed && m_next < m_processes.size()) {
        if (m_next > 0) {
            auto& previous = m_processes[m_next - 1];
            if (previous.spec.oneshot) {
                if (previous.status != ProcessStatus::exited) {
                    return;
                }
            } else if (!previous.spec.ready_path.empty() && !previous.ready) {
                return;
            }
        }
        start(m_processes[m_next], now);
        ++m_next;
    }
}

void ProcessSupervisor::handle_exit(Managed& process, int wait_status, Clock::time_point now) {
    process.pid = -1;
    process.last_exit_code.reset();
    process.last_signal.reset();
    bool clean = false;
    if (WIFEXITED(wait_status)) {
        process.last_exit_code = WEXITSTATUS(wait_status);
        clean = *process.last_exit_code == 0;
    } else if (WIFSIGNALED(wait_status)) {
        process.last_signal = WTERMSIG(wait_status);
    }
    process.status = clean ? ProcessStatus::exited : ProcessStatus::crashed;

    const std::string how =
        process.last_signal ? "signal " + std::to_string(*process.last_signal)
                            : "status " + std::to_string(process.last_exit_code.value_or(-1));
    if (process.spec.oneshot) {
        if (clean) {
            POLARBEAR_LOG_INFO("{} finished", process.spec.name);
            return;
        }
        fail(process, Error{ErrorCode::sandbox_launch_failed,
                            process.spec.name + " failed with " + how + ", see " +
                                log_path(process).string()});
        return;
    }

    POLARBEAR_LOG_WARN("{} {} with {}", process.spec.name, clean ? "exited" : "crashed", how);
    // A long-running process exiting at all counts against its restart budget.
    if (process.policy.record_failure(now)) {
        fail(process, Error{ErrorCode::restart_threshold_exceeded,
                            process.spec.name + " failed " + std::to_string(m_options.max_crashes) +
                                " times within " + std::to_string(m_options.restart_window.count()) +
                                "s"});
        return;
    }
    process.status = ProcessStatus::restarting;
    process.restart_at = now + m_options.restart_delay;
}

void ProcessSupervisor::fail(Managed& process, const Error& error) {
    process.status = ProcessStatus::terminal;
    if (m_failed) {
        return;
    }
    m_failed = true;
    POLARBEAR_LOG_ERROR("Session process {} is terminal [{}]: {}", process.spec.name,
                        error_code_name(error.code), error.message);
    if (m_fatal_handler) {
        m_fatal_handler(error);
    }
}

void ProcessSupervisor::poll(Clock::time_point now) {
    if (!m_active) {
        return;
    }

    for (auto& process : m_processes) {
        if (process.pid <= 0) {
            continue;
        }
        int wait_status = 0;
        const pid_t reaped = ::waitpid(process.pid, &wait_status, WNOHANG);
        if (reaped == process.pid) {
            handle_exit(process, wait_status, now);
        } else if (reaped < 0 && errno == ECHILD) {
            POLARBEAR_LOG_WARN("{} (pid {}) vanished without a status", process.spec.name,
                               process.pid);
            handle_exit(process, 0xFF00, now);
        }
    }
    if (m_failed) {
        return;
    }

    for (auto& process : m_processes) {
        if (process.status == ProcessStatus::running && !process.spec.ready_path.empty() &&
            !process.ready) {
            std::error_code ec;
            if (std::filesystem::exists(process.spec.ready_path, ec)) {
                process.ready = true;
                POLARBEAR_LOG_INFO("{} is ready", process.spec.name);
            } else if (now - process.started_at >= m_options.ready_timeout) {
                POLARBEAR_LOG_WARN("{} not ready after {} ms, terminating", process.spec.name,
                                   m_options.ready_timeout.count());
                // The SIGKILL exit is reaped on a later tick and counted as a crash.
                ::killpg(process.pid, SIGKILL);
                process.started_at = now;
            }
        }
        if (process.status == ProcessStatus::restarting && now >= process.restart_at) {
            ++process.restarts;
            POLARBEAR_LOG_INFO("Restarting {} (restart #{})", process.spec.name,
                               process.restarts);
            start(process, now);
            if (m_failed) {
                return;
            }
        }
    }

    advance(now);
}

void ProcessSupervisor::shutdown() {
    if (!m_active) {
        return;
    }
    m_active = false;

    for (auto it = m_processes.rbegin(); it != m_processes.rend(); ++it) {
        if (it->pid > 0) {
            POLARBEAR_LOG_DEBUG("SIGTERM {} (pgid {})", it->spec.name, it->pid);
            ::killpg(it->pid, SIGTERM);
        }
    }

    const auto deadline = Clock::now() + m_options.shutdown_timeout;
    auto reap_all = [this] {
        bool alive = false;
        for (auto& process : m_processes) {
            if (process.pid <= 0) {
                continue;
            }
            int wait_status = 0;
            const pid_t reaped = ::waitpid(process.pid, &wait_status, WNOHANG);
            if (reaped == process.pid || (reaped < 0 && errno == ECHILD)) {
                process.pid = -1;
                process.status = ProcessStatus::exited;
            } else {
                alive = true;
            }
        }
        return alive;
    };

    while (reap_all() && Clock::now() < deadline) {
        std::this_thread::sleep_for(SHUTDOWN_POLL_INTERVAL);
    }

    for (auto& process : m_processes) {
        if (process.pid <= 0) {
            continue;
        }
        POLARBEAR_LOG_WARN("{} ignored SIGTERM, killing", process.spec.name);
        ::killpg(process.pid, SIGKILL);
        int wait_status = 0;
        while (::waitpid(process.pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
        process.pid = -1;
        process.status = ProcessStatus::exited;
    }
    POLARBEAR_LOG_INFO("Session processes stopped");
}

auto ProcessSupervisor::processes() const -> std::vector<ProcessInfo> {
    std::vector<ProcessInfo> infos;
    infos.reserve(m_processes.size());
    for (const auto& process : m_processes) {
        infos.push_back(ProcessInfo{
            .name = process.spec.name,
            .role = process.spec.role,
            .status = process.status,
            .pid = process.pid,
            .restarts = process.restarts,
            .last_exit_code = process.last_exit_code,
            .last_signal = process.last_signal,
        });
    }
    return infos;
}

auto ProcessSupervisor::status(std::string_view name) const -> std::optional<ProcessStatus> {
    auto it = std::ranges::find_if(m_processes,
                                   [name](const auto& process) { return process.spec.name == name; });
    if (it == m_processes.end()) {
        return std::nullopt;
    }
    return it->status;
}

} // namespace polarbear::supervisor
