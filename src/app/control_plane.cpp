#include "control_plane.hpp"

#include <util/logging.hpp>

#include <utility>

namespace polarbear::app {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

auto to_string(ControlState state) -> const char* {
    switch (state) {
    case ControlState::uninstalled:
        return "uninstalled";
    case ControlState::bootstrapping:
        return "bootstrapping";
    case ControlState::ready:
        return "ready";
    case ControlState::session_active:
        return "session_active";
    case ControlState::session_error:
        return "session_error";
    }
    return "unknown";
}

void ControlPlane::start() {
    if (m_actions.is_installed()) {
        m_last_percent = 100;
        transition(ControlState::ready);
        m_actions.publish_progress({.progress = 100, .message = "Installed", .is_error = false});
        begin_session();
        return;
    }
    begin_bootstrap();
}

void ControlPlane::post(ControlEvent event) {
    std::lock_guard lock(m_mutex);
    m_events.push_back(std::move(event));
}

auto ControlPlane::process_events() -> size_t {
    std::deque<ControlEvent> pending;
    {
        std::lock_guard lock(m_mutex);
        pending.swap(m_events);
    }
    for (const auto& event : pending) {
        handle(event);
    }
    return pending.size();
}

void ControlPlane::shutdown() {
    if (m_state == ControlState::bootstrapping) {
        m_actions.cancel_bootstrap();
    }
    m_actions.stop_session();
}

void ControlPlane::handle(const ControlEvent& event) {
    // Only a reset leaves the error state.
    if (m_state == ControlState::session_error &&
        !std::holds_alternative<ResetRequestedEvent>(event)) {
        return;
    }
    std::visit(Overloaded{
                   [this](const BootstrapProgressEvent& e) { on_progress(e.attempt, e.state); },
                   [this](const BootstrapFinishedEvent& e) { on_bootstrap_finished(e.attempt); },
                   [this](const BootstrapFailedEvent& e) {
                       on_bootstrap_failed(e.attempt, e.error);
                   },
                   [this](const SupervisorFatalEvent& e) { on_session_fatal(e.error, "supervisor"); },
                   [this](const CompositorFatalEvent& e) { on_session_fatal(e.error, "compositor"); },
                   [this](const ResetRequestedEvent& e) { on_reset(e.wipe); },
               },
               event);
}

auto ControlPlane::is_current_attempt(uint64_t attempt) const -> bool {
    return m_state == ControlState::bootstrapping && attempt == m_attempt;
}

void ControlPlane::on_progress(uint64_t attempt, const bootstrap::BootstrapState& state) {
    if (!is_current_attempt(attempt)) {
        return;
    }
    m_last_percent = state.percent;
    m_actions.publish_progress(progress::message_from_state(state));
}

void ControlPlane::on_bootstrap_finished(uint64_t attempt) {
    if (!is_current_attempt(attempt)) {
        return;
    }
    m_last_percent = 100;
    transition(ControlState::ready);
    begin_session();
}

void ControlPlane::on_bootstrap_failed(uint64_t attempt, const Error& error) {
    if (!is_current_attempt(attempt)) {
        POLARBEAR_LOG_DEBUG("Ignoring failure of superseded bootstrap #{}: {}", attempt,
                            error.message);
        return;
    }
    if (error.code == ErrorCode::cancelled) {
        POLARBEAR_LOG_INFO("Bootstrap paused at {}%", m_last_percent);
        transition(ControlState::uninstalled);
        return;
    }
    enter_error(error);
}

void ControlPlane::on_session_fatal(const Error& error, const char* source) {
    if (m_state != ControlState::session_active && m_state != ControlState::ready) {
        POLARBEAR_LOG_DEBUG("Ignoring {} failure in state {}: {}", source, to_string(m_state),
                            error.message);
        return;
    }
    POLARBEAR_LOG_ERROR("Session failed in {}: {}", source, error.message);
    m_actions.stop_session();
    enter_error(error);
}

void ControlPlane::on_reset(bool wipe) {
    POLARBEAR_LOG_INFO("Reset requested (wipe: {})", wipe);
    if (m_state == ControlState::bootstrapping) {
        m_actions.cancel_bootstrap();
    }
    m_actions.stop_session();
    m_last_error.reset();
    m_last_percent = 0;

    if (auto result = m_actions.wipe_install(wipe); !result) {
        enter_error(result.error());
        return;
    }
    transition(ControlState::uninstalled);
    m_actions.publish_progress({.progress = 0, .message = "Restarting", .is_error = false});

    if (m_actions.is_installed()) {
        m_last_percent = 100;
        transition(ControlState::ready);
        m_actions.publish_progress({.progress = 100, .message = "Installed", .is_error = false});
        begin_session();
        return;
    }
    begin_bootstrap();
}

void ControlPlane::begin_bootstrap() {
    ++m_attempt;
    transition(ControlState::bootstrapping);
    m_actions.start_bootstrap(m_attempt);
}

void ControlPlane::begin_session() {
    auto result = m_actions.start_session();
    if (!result) {
        m_actions.stop_session();
        enter_error(result.error());
        return;
    }
    transition(ControlState::session_active);
}

void ControlPlane::enter_error(const Error& error) {
    POLARBEAR_LOG_ERROR("{} [{}]", error.message, error_code_name(error.code));
    m_last_error = error;
    transition(ControlState::session_error);
    m_actions.publish_progress(
        {.progress = m_last_percent, .message = error.message, .is_error = true});
}

void ControlPlane::transition(ControlState next) {
    if (next == m_state) {
        return;
    }
    POLARBEAR_LOG_INFO("Control state: {} -> {}", to_string(m_state), to_string(next));
    m_state = next;
}

} // namespace polarbear::app
