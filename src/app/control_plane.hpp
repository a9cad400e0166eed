#pragma once

#include <bootstrap/bootstrap_state.hpp>
#include <progress/progress_channel.hpp>
#include <util/error.hpp>

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>

namespace polarbear::app {

enum class ControlState : std::uint8_t {
    uninstalled,
    bootstrapping,
    ready,
    session_active,
    session_error
};

[[nodiscard]] auto to_string(ControlState state) -> const char*;

// =============================================================================
// Events
// =============================================================================

/// Bootstrap events carry the attempt number handed to `start_bootstrap()`. Events from an
/// attempt that was cancelled and superseded are ignored.
struct BootstrapProgressEvent {
    uint64_t attempt = 0;
    bootstrap::BootstrapState state;
};

struct BootstrapFinishedEvent {
    uint64_t attempt = 0;
};

struct BootstrapFailedEvent {
    uint64_t attempt = 0;
    Error error;
};

struct SupervisorFatalEvent {
    Error error;
};

struct CompositorFatalEvent {
    Error error;
};

struct ResetRequestedEvent {
    /// Also delete the installed rootfs and archive.
    bool wipe = false;
};

using ControlEvent = std::variant<BootstrapProgressEvent, BootstrapFinishedEvent,
                                  BootstrapFailedEvent, SupervisorFatalEvent,
                                  CompositorFatalEvent, ResetRequestedEvent>;

/// @brief Collaborators the control plane drives. All calls come from the main thread.
class SessionActions {
public:
    virtual ~SessionActions() = default;

    [[nodiscard]] virtual auto is_installed() const -> bool = 0;
    /// Starts the bootstrap pipeline in the background. Completion arrives as an event tagged
    /// with @p attempt.
    virtual void start_bootstrap(uint64_t attempt) = 0;
    /// Requests a stop and waits for the pipeline to wind down.
    virtual void cancel_bootstrap() = 0;
    /// Starts the compositor and then the supervised guest processes.
    [[nodiscard]] virtual auto start_session() -> Result<void> = 0;
    virtual void stop_session() = 0;
    /// Returns progress to zero; with @p wipe also deletes the install.
    [[nodiscard]] virtual auto wipe_install(bool wipe) -> Result<void> = 0;
    virtual void publish_progress(const progress::ProgressMessage& message) = 0;
};

/**
 * @brief Top-level lifecycle: Uninstalled -> Bootstrapping -> Ready -> SessionActive, with
 * SessionError as the sink for fatal failures.
 *
 * Other threads only `post()`. `process_events()` drains the queue on the main thread, where all
 * state transitions and collaborator calls happen. SessionError is left only by a reset.
 */
class ControlPlane {
public:
    explicit ControlPlane(SessionActions& actions) : m_actions(actions) {}

    ControlPlane(const ControlPlane&) = delete;
    ControlPlane& operator=(const ControlPlane&) = delete;
    ControlPlane(ControlPlane&&) = delete;
    ControlPlane& operator=(ControlPlane&&) = delete;

    /// Enters the initial state: straight to the session when installed, bootstrap otherwise.
    void start();
    /// Thread-safe.
    void post(ControlEvent event);
    /// @return Number of events handled.
    auto process_events() -> size_t;
    /// Cancels any bootstrap and stops the session.
    void shutdown();

    [[nodiscard]] auto state() const -> ControlState { return m_state; }
    [[nodiscard]] auto last_error() const -> const std::optional<Error>& { return m_last_error; }
    [[nodiscard]] auto last_percent() const -> uint8_t { return m_last_percent; }
    [[nodiscard]] auto bootstrap_attempt() const -> uint64_t { return m_attempt; }

private:
    void handle(const ControlEvent& event);
    void on_progress(uint64_t attempt, const bootstrap::BootstrapState& state);
    void on_bootstrap_finished(uint64_t attempt);
    void on_bootstrap_failed(uint64_t attempt, const Error& error);
    [[nodiscard]] auto is_current_attempt(uint64_t attempt) const -> bool;
    void on_session_fatal(const Error& error, const char* source);
    void on_reset(bool wipe);

    void begin_bootstrap();
    void begin_session();
    void enter_error(const Error& error);
    void transition(ControlState next);

    SessionActions& m_actions;
    ControlState m_state = ControlState::uninstalled;
    std::optional<Error> m_last_error;
    uint8_t m_last_percent = 0;
    uint64_t m_attempt = 0;

    std::mutex m_mutex;
    std::deque<ControlEvent> m_events;
};

} // namespace polarbear::app
