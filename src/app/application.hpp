#pragma once

#include "control_plane.hpp"

#include <bootstrap/bootstrap_manager.hpp>
#include <util/config.hpp>
#include <util/error.hpp>
#include <util/job_system.hpp>
#include <util/paths.hpp>

#include <cstdint>
#include <memory>

union SDL_Event;

namespace polarbear {

namespace compositor {
class CompositorServer;
}

namespace input {
class HostBridge;
}

namespace progress {
class ProgressChannel;
}

namespace supervisor {
class ProcessSupervisor;
}

namespace app {

class SdlPlatform;

/**
 * @brief Host application: owns the window, the bootstrap pipeline, the compositor and the
 * supervised guest session, and implements the actions the control plane drives.
 */
class Application : public SessionActions {
public:
    [[nodiscard]] static auto create(const Config& config, const util::AppDirs& app_dirs)
        -> ResultPtr<Application>;

    ~Application() override;

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;
    Application(Application&&) = delete;
    Application& operator=(Application&&) = delete;

    /// Enters the initial control state; with @p reset the install is wiped first.
    void start(bool reset);
    void run();
    void shutdown();

    [[nodiscard]] auto is_running() const -> bool { return m_running; }
    [[nodiscard]] auto control_state() const -> ControlState { return m_control->state(); }

    // SessionActions
    [[nodiscard]] auto is_installed() const -> bool override;
    void start_bootstrap(uint64_t attempt) override;
    void cancel_bootstrap() override;
    [[nodiscard]] auto start_session() -> Result<void> override;
    void stop_session() override;
    [[nodiscard]] auto wipe_install(bool wipe) -> Result<void> override;
    void publish_progress(const progress::ProgressMessage& message) override;

private:
    Application() = default;

    void pump_events();
    void handle_event(const SDL_Event& event);
    void tick();
    void pace_frame();
    [[nodiscard]] auto launch_guest_processes() -> Result<void>;

    Config m_config;
    util::AppDirs m_dirs;

    std::unique_ptr<SdlPlatform> m_platform;
    std::unique_ptr<progress::ProgressChannel> m_progress;
    std::unique_ptr<bootstrap::BootstrapManager> m_bootstrap;
    util::CancellableJob<Result<void>> m_bootstrap_job;
    std::unique_ptr<compositor::CompositorServer> m_compositor;
    std::unique_ptr<input::HostBridge> m_bridge;
    std::unique_ptr<supervisor::ProcessSupervisor> m_supervisor;
    std::unique_ptr<ControlPlane> m_control;

    bool m_running = true;
    bool m_surface_dirty = false;
    uint64_t m_frame_interval_ns = 0;
    uint64_t m_next_frame_ns = 0;
};

} // namespace app
} // namespace polarbear
