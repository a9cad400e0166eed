#include "supervisor/process_supervisor.hpp"
#include "supervisor/sandbox.hpp"

#include "support/test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>
#include <csignal>
#include <functional>
#include <thread>

using namespace polarbear;
using namespace polarbear::supervisor;
using namespace std::chrono_literals;
using polarbear::test::read_file;
using polarbear::test::TempDir;

namespace {

auto shell(std::string name, const std::string& script, ProcessRole role = ProcessRole::desktop)
    -> ProcessSpec {
    return ProcessSpec{
        .name = std::move(name),
        .role = role,
        .argv = {"/bin/sh", "-c", script},
        .env = current_environment(),
    };
}

auto fast_options(const std::filesystem::path& log_dir) -> SupervisorOptions {
    return SupervisorOptions{
        .log_dir = log_dir,
        .restart_window = 60s,
        .max_crashes = 3,
        .restart_delay = 0ms,
        .ready_timeout = 5000ms,
        .shutdown_timeout = 2000ms,
    };
}

/// Polls until @p done holds or five seconds pass.
auto poll_until(ProcessSupervisor& supervisor, const std::function<bool()>& done) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        supervisor.poll();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // namespace

TEST_CASE("Processes start in sequence behind oneshot and readiness gates",
          "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");
    const auto ready = tmp / "ready.sock";

    ProcessSupervisor supervisor(fast_options(tmp / "logs"));
    std::vector<ProcessSpec> specs;
    specs.push_back(shell("wrapper", "echo provisioning", ProcessRole::sandbox_wrapper));
    specs.back().oneshot = true;
    specs.push_back(shell("server", "touch '" + ready.string() + "'; exec sleep 30",
                          ProcessRole::compat_server));
    specs.back().ready_path = ready;
    specs.push_back(shell("desktop", "exec sleep 30"));

    REQUIRE(supervisor.launch(specs).has_value());
    REQUIRE(supervisor.is_active());
    REQUIRE(supervisor.status("server") == ProcessStatus::pending);

    REQUIRE(poll_until(supervisor,
                       [&] { return supervisor.status("desktop") == ProcessStatus::running; }));
    REQUIRE(supervisor.status("wrapper") == ProcessStatus::exited);
    REQUIRE(supervisor.status("server") == ProcessStatus::running);
    REQUIRE_FALSE(supervisor.has_failed());
    REQUIRE(read_file(tmp / "logs/wrapper.log") == "provisioning\n");

    SECTION("Second launch is rejected") {
        auto again = supervisor.launch({shell("x", "true")});
        REQUIRE(!again);
        REQUIRE(again.error().code == ErrorCode::invalid_state);
    }

    SECTION("Shutdown stops everything") {
        supervisor.shutdown();
        REQUIRE_FALSE(supervisor.is_active());
        for (const auto& info : supervisor.processes()) {
            REQUIRE(info.pid == -1);
            REQUIRE(info.status == ProcessStatus::exited);
        }
    }
}

TEST_CASE("Failing oneshot wrapper is fatal", "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");
    ProcessSupervisor supervisor(fast_options(tmp / "logs"));
    std::vector<Error> fatal;
    supervisor.set_fatal_handler([&](const Error& error) { fatal.push_back(error); });

    std::vector<ProcessSpec> specs;
    specs.push_back(shell("wrapper", "exit 3", ProcessRole::sandbox_wrapper));
    specs.back().oneshot = true;
    specs.push_back(shell("desktop", "exec sleep 30"));
    REQUIRE(supervisor.launch(specs).has_value());

    REQUIRE(poll_until(supervisor, [&] { return supervisor.has_failed(); }));
    REQUIRE(fatal.size() == 1);
    REQUIRE(fatal.front().code == ErrorCode::sandbox_launch_failed);
    REQUIRE(supervisor.status("wrapper") == ProcessStatus::terminal);
    REQUIRE(supervisor.status("desktop") == ProcessStatus::pending);
    REQUIRE(supervisor.processes().front().last_exit_code == 3);
}

TEST_CASE("Crash loop trips the restart threshold", "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");
    ProcessSupervisor supervisor(fast_options(tmp / "logs"));
    std::vector<Error> fatal;
    supervisor.set_fatal_handler([&](const Error& error) { fatal.push_back(error); });

    REQUIRE(supervisor.launch({shell("desktop", "echo run; exit 1")}).has_value());
    REQUIRE(poll_until(supervisor, [&] { return supervisor.has_failed(); }));

    REQUIRE(fatal.size() == 1);
    REQUIRE(fatal.front().code == ErrorCode::restart_threshold_exceeded);
    const auto info = supervisor.processes().front();
    REQUIRE(info.status == ProcessStatus::terminal);
    REQUIRE(info.restarts == 2);
    REQUIRE(read_file(tmp / "logs/desktop.log") == "run\nrun\nrun\n");
}

TEST_CASE("A crash below the threshold is restarted", "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");
    const auto marker = tmp / "crashed-once";
    ProcessSupervisor supervisor(fast_options(tmp / "logs"));

    const std::string script = "if [ -e '" + marker.string() + "' ]; then exec sleep 30; fi; touch '" +
                               marker.string() + "'; exit 1";
    REQUIRE(supervisor.launch({shell("desktop", script)}).has_value());

    REQUIRE(poll_until(supervisor, [&] {
        const auto info = supervisor.processes().front();
        return info.restarts == 1 && info.status == ProcessStatus::running;
    }));
    REQUIRE_FALSE(supervisor.has_failed());
    REQUIRE(supervisor.processes().front().last_exit_code == 1);
}

TEST_CASE("Exec failure is reported", "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");

    SECTION("spawn_process returns process_spawn_failed") {
        ProcessSpec spec{.name = "missing", .argv = {"/nonexistent/polarbear-binary"}};
        auto pid = spawn_process(spec, tmp / "missing.log");
        REQUIRE(!pid);
        REQUIRE(pid.error().code == ErrorCode::process_spawn_failed);
    }

    SECTION("Supervisor fails the session") {
        ProcessSupervisor supervisor(fast_options(tmp / "logs"));
        std::vector<Error> fatal;
        supervisor.set_fatal_handler([&](const Error& error) { fatal.push_back(error); });

        ProcessSpec spec{.name = "wrapper",
                         .role = ProcessRole::sandbox_wrapper,
                         .argv = {"/nonexistent/proot"},
                         .oneshot = true};
        REQUIRE(supervisor.launch({spec}).has_value());
        REQUIRE(supervisor.has_failed());
        REQUIRE(fatal.size() == 1);
        REQUIRE(fatal.front().code == ErrorCode::sandbox_launch_failed);
    }
}

TEST_CASE("Readiness timeout kills the process", "[process_supervisor]") {
    TempDir tmp("polarbear_supervisor");
    auto options = fast_options(tmp / "logs");
    options.ready_timeout = 50ms;
    options.restart_delay = 60s;
    ProcessSupervisor supervisor(options);

    auto server = shell("server", "exec sleep 30", ProcessRole::compat_server);
    server.ready_path = tmp / "never";
    REQUIRE(supervisor.launch({server, shell("desktop", "exec sleep 30")}).has_value());

    REQUIRE(poll_until(supervisor,
                       [&] { return supervisor.status("server") == ProcessStatus::restarting; }));
    const auto info = supervisor.processes().front();
    REQUIRE(info.last_signal == SIGKILL);
    REQUIRE(supervisor.status("desktop") == ProcessStatus::pending);
}

TEST_CASE("Status names", "[process_supervisor]") {
    REQUIRE(std::string(to_string(ProcessStatus::restarting)) == "restarting");
    REQUIRE(std::string(to_string(ProcessRole::compat_server)) == "compat_server");
    REQUIRE_FALSE(ProcessSupervisor(fast_options("/tmp")).status("nothing").has_value());
}
