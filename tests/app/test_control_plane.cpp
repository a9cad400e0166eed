#include "app/control_plane.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <thread>
#include <vector>

using namespace polarbear;
using namespace polarbear::app;

namespace {

struct FakeActions : SessionActions {
    bool installed = false;
    std::vector<uint64_t> bootstrap_attempts;
    int cancels = 0;
    int session_starts = 0;
    int session_stops = 0;
    std::vector<bool> wipes;
    std::optional<Error> session_failure;
    std::optional<Error> wipe_failure;
    std::vector<progress::ProgressMessage> published;

    [[nodiscard]] auto is_installed() const -> bool override { return installed; }
    void start_bootstrap(uint64_t attempt) override { bootstrap_attempts.push_back(attempt); }
    void cancel_bootstrap() override { ++cancels; }
    [[nodiscard]] auto start_session() -> Result<void> override {
        ++session_starts;
        if (session_failure) {
            return nonstd::make_unexpected(*session_failure);
        }
        return {};
    }
    void stop_session() override { ++session_stops; }
    [[nodiscard]] auto wipe_install(bool wipe) -> Result<void> override {
        wipes.push_back(wipe);
        if (wipe_failure) {
            return nonstd::make_unexpected(*wipe_failure);
        }
        if (wipe) {
            installed = false;
        }
        return {};
    }
    void publish_progress(const progress::ProgressMessage& message) override {
        published.push_back(message);
    }
};

auto progress_event(uint64_t attempt, uint8_t percent) -> BootstrapProgressEvent {
    return BootstrapProgressEvent{
        .attempt = attempt,
        .state = bootstrap::BootstrapState{.phase = bootstrap::BootstrapPhase::downloading,
                                           .percent = percent,
                                           .message = "Downloading"},
    };
}

} // namespace

TEST_CASE("Installed start goes straight to the session", "[control_plane]") {
    FakeActions actions;
    actions.installed = true;
    ControlPlane control(actions);

    control.start();
    REQUIRE(control.state() == ControlState::session_active);
    REQUIRE(actions.bootstrap_attempts.empty());
    REQUIRE(actions.session_starts == 1);
    REQUIRE(actions.published.back().progress == 100);
}

TEST_CASE("Fresh start bootstraps then starts the session", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);

    control.start();
    REQUIRE(control.state() == ControlState::bootstrapping);
    REQUIRE(actions.bootstrap_attempts == std::vector<uint64_t>{1});

    control.post(progress_event(1, 30));
    control.post(progress_event(1, 45));
    REQUIRE(control.process_events() == 2);
    REQUIRE(control.last_percent() == 45);
    REQUIRE(actions.published.size() == 2);
    REQUIRE(actions.published.back().message == "Downloading");
    REQUIRE_FALSE(actions.published.back().is_error);

    control.post(BootstrapFinishedEvent{.attempt = 1});
    static_cast<void>(control.process_events());
    REQUIRE(control.state() == ControlState::session_active);
    REQUIRE(actions.session_starts == 1);
}

TEST_CASE("Bootstrap failure enters the error state", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();
    control.post(progress_event(1, 62));
    control.post(BootstrapFailedEvent{.attempt = 1,
                                      .error = Error{ErrorCode::integrity_mismatch, "bad digest"}});
    static_cast<void>(control.process_events());

    REQUIRE(control.state() == ControlState::session_error);
    REQUIRE(control.last_error()->code == ErrorCode::integrity_mismatch);
    const auto& last = actions.published.back();
    REQUIRE(last.is_error);
    REQUIRE(last.progress == 62);
    REQUIRE(last.message == "bad digest");

    SECTION("Other events are ignored until reset") {
        control.post(BootstrapFinishedEvent{.attempt = 1});
        control.post(SupervisorFatalEvent{.error = Error{ErrorCode::unknown_error, "late"}});
        static_cast<void>(control.process_events());
        REQUIRE(control.state() == ControlState::session_error);
        REQUIRE(actions.session_starts == 0);
    }

    SECTION("Reset starts a new attempt") {
        control.post(ResetRequestedEvent{.wipe = true});
        static_cast<void>(control.process_events());
        REQUIRE(control.state() == ControlState::bootstrapping);
        REQUIRE_FALSE(control.last_error().has_value());
        REQUIRE(control.bootstrap_attempt() == 2);
        REQUIRE(actions.bootstrap_attempts == std::vector<uint64_t>{1, 2});
        REQUIRE(actions.wipes == std::vector<bool>{true});
        REQUIRE(control.last_percent() == 0);
    }
}

TEST_CASE("Cancelled bootstrap returns to uninstalled", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();
    control.post(progress_event(1, 20));
    control.post(BootstrapFailedEvent{.attempt = 1, .error = Error{ErrorCode::cancelled, "stop"}});
    static_cast<void>(control.process_events());

    REQUIRE(control.state() == ControlState::uninstalled);
    REQUIRE_FALSE(control.last_error().has_value());
    REQUIRE(control.last_percent() == 20);
}

TEST_CASE("Events from a superseded attempt are ignored", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();

    control.post(ResetRequestedEvent{.wipe = false});
    static_cast<void>(control.process_events());
    REQUIRE(actions.cancels == 1);
    REQUIRE(control.bootstrap_attempt() == 2);

    control.post(progress_event(1, 90));
    control.post(BootstrapFinishedEvent{.attempt = 1});
    control.post(BootstrapFailedEvent{.attempt = 1, .error = Error{ErrorCode::cancelled, "old"}});
    static_cast<void>(control.process_events());
    REQUIRE(control.state() == ControlState::bootstrapping);
    REQUIRE(control.last_percent() == 0);
    REQUIRE(actions.session_starts == 0);

    control.post(BootstrapFinishedEvent{.attempt = 2});
    static_cast<void>(control.process_events());
    REQUIRE(control.state() == ControlState::session_active);
}

TEST_CASE("Session failures", "[control_plane]") {
    FakeActions actions;
    actions.installed = true;
    ControlPlane control(actions);

    SECTION("Session that fails to start") {
        actions.session_failure = Error{ErrorCode::compositor_init_failed, "no socket"};
        control.start();
        REQUIRE(control.state() == ControlState::session_error);
        REQUIRE(actions.session_stops == 1);
        REQUIRE(actions.published.back().is_error);
        REQUIRE(actions.published.back().progress == 100);
    }

    SECTION("Supervisor fatal stops the session") {
        control.start();
        control.post(SupervisorFatalEvent{
            .error = Error{ErrorCode::restart_threshold_exceeded, "desktop crashed"}});
        static_cast<void>(control.process_events());
        REQUIRE(control.state() == ControlState::session_error);
        REQUIRE(actions.session_stops == 1);
        REQUIRE(control.last_error()->code == ErrorCode::restart_threshold_exceeded);
    }

    SECTION("Compositor fatal stops the session") {
        control.start();
        control.post(
            CompositorFatalEvent{.error = Error{ErrorCode::no_compatible_config, "no gpu"}});
        static_cast<void>(control.process_events());
        REQUIRE(control.state() == ControlState::session_error);

        SECTION("Reset without wipe restarts the session") {
            actions.session_failure.reset();
            control.post(ResetRequestedEvent{.wipe = false});
            static_cast<void>(control.process_events());
            REQUIRE(control.state() == ControlState::session_active);
            REQUIRE(actions.session_starts == 2);
            REQUIRE(actions.published.back().progress == 100);
        }
    }

    SECTION("Failed wipe is an error") {
        control.start();
        actions.wipe_failure = Error{ErrorCode::file_write_failed, "busy"};
        control.post(ResetRequestedEvent{.wipe = true});
        static_cast<void>(control.process_events());
        REQUIRE(control.state() == ControlState::session_error);
        REQUIRE(control.last_error()->code == ErrorCode::file_write_failed);
    }
}

TEST_CASE("Fatal events outside a session are ignored", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();

    control.post(CompositorFatalEvent{.error = Error{ErrorCode::context_lost, "x"}});
    static_cast<void>(control.process_events());
    REQUIRE(control.state() == ControlState::bootstrapping);
    REQUIRE(actions.session_stops == 0);
}

TEST_CASE("Events can be posted from other threads", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();

    std::thread worker([&control] {
        for (uint8_t i = 1; i <= 50; ++i) {
            control.post(progress_event(1, i));
        }
    });
    worker.join();
    REQUIRE(control.process_events() == 50);
    REQUIRE(control.last_percent() == 50);
    REQUIRE(control.process_events() == 0);
}

TEST_CASE("Shutdown cancels bootstrap and stops the session", "[control_plane]") {
    FakeActions actions;
    ControlPlane control(actions);
    control.start();
    control.shutdown();
    REQUIRE(actions.cancels == 1);
    REQUIRE(actions.session_stops == 1);
    REQUIRE(std::string(to_string(ControlState::session_active)) == "session_active");
}
