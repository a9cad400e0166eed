#include "application.hpp"

#include "sdl_platform.hpp"

#include <compositor/compositor_server.hpp>
#include <input/host_bridge.hpp>
#include <input/sdl_input.hpp>
#include <progress/progress_channel.hpp>
#include <render/vulkan/vulkan_backend.hpp>
#include <supervisor/guest_config.hpp>
#include <supervisor/process_supervisor.hpp>
#include <supervisor/sandbox.hpp>
#include <util/logging.hpp>
#include <util/profiling.hpp>

#include <SDL3/SDL.h>
#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

namespace polarbear::app {

// =============================================================================
// Helper Functions
// =============================================================================

static auto compositor_config_from(const Config& config) -> compositor::CompositorServerConfig {
    return compositor::CompositorServerConfig{
        .socket_name = config.compositor.socket_name,
        .width = config.compositor.width,
        .height = config.compositor.height,
        .ping_timeout_ms = config.compositor.ping_timeout_ms,
        .core =
            {
                .scale = config.compositor.scale,
                .refresh_mhz = config.compositor.refresh_mhz,
                .max_events_per_tick = config.compositor.max_events_per_tick,
                .strict_backpressure = config.compositor.strict_backpressure,
            },
    };
}

static auto supervisor_options_from(const Config& config, const util::AppDirs& dirs)
    -> supervisor::SupervisorOptions {
    const auto& session = config.session;
    return supervisor::SupervisorOptions{
        .log_dir = util::data_path(dirs, "logs"),
        .restart_window = std::chrono::seconds(session.restart_window_s),
        .max_crashes = session.max_crashes,
        .restart_delay = std::chrono::milliseconds(session.restart_delay_ms),
        .ready_timeout = std::chrono::milliseconds(session.ready_timeout_ms),
        .shutdown_timeout = std::chrono::milliseconds(session.shutdown_timeout_ms),
    };
}

// =============================================================================
// Lifecycle
// =============================================================================

auto Application::create(const Config& config, const util::AppDirs& app_dirs)
    -> ResultPtr<Application> {
    auto app = std::unique_ptr<Application>(new Application());
    app->m_config = config;
    app->m_dirs = app_dirs;

    app->m_platform = POLARBEAR_TRY(SdlPlatform::create({
        .title = "Polarbear",
        .width = static_cast<int>(config.compositor.width),
        .height = static_cast<int>(config.compositor.height),
        .resizable = true,
    }));

    // Progress observers are optional; the install proceeds without them.
    if (config.progress.enabled) {
        auto channel = progress::ProgressChannel::create({
            .address = "127.0.0.1",
            .port = config.progress.port,
            .subprotocol = config.progress.subprotocol,
        });
        if (!channel) {
            POLARBEAR_LOG_WARN("Progress channel disabled: {}", channel.error().message);
        } else {
            app->m_progress = std::move(channel.value());
        }
    }

    auto bootstrap_config = bootstrap::bootstrap_config_from(config);
    auto fetcher = std::make_shared<bootstrap::CurlFetcher>(bootstrap_config.download);
    app->m_bootstrap = std::make_unique<bootstrap::BootstrapManager>(
        bootstrap::layout_for(app_dirs.data_dir), std::move(bootstrap_config), std::move(fetcher));

    app->m_control = std::make_unique<ControlPlane>(*app);

    const uint32_t refresh_mhz = std::max<uint32_t>(config.compositor.refresh_mhz, 1000);
    app->m_frame_interval_ns = 1'000'000'000'000ULL / refresh_mhz;
    return make_result_ptr(std::move(app));
}

Application::~Application() {
    shutdown();
}

void Application::start(bool reset) {
    if (reset) {
        m_control->post(ResetRequestedEvent{.wipe = true});
        return;
    }
    m_control->start();
}

void Application::shutdown() {
    if (m_control) {
        m_control->shutdown();
    }
    if (m_progress) {
        m_progress->stop();
        m_progress.reset();
    }
    m_bootstrap.reset();
    m_platform.reset();
}

// =============================================================================
// Run Loop
// =============================================================================

void Application::run() {
    while (m_running) {
        POLARBEAR_PROFILE_FRAME("Main");
        pump_events();
        tick();
        pace_frame();
    }
    POLARBEAR_LOG_INFO("Leaving main loop in state {}", to_string(m_control->state()));
}

void Application::pump_events() {
    POLARBEAR_PROFILE_SCOPE("EventProcessing");
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        handle_event(event);
    }
}

void Application::handle_event(const SDL_Event& event) {
    switch (event.type) {
    case SDL_EVENT_QUIT:
        POLARBEAR_LOG_INFO("Quit event received");
        m_running = false;
        return;

    case SDL_EVENT_WINDOW_RESIZED:
    case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
    case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
        m_surface_dirty = true;
        return;

    case SDL_EVENT_WINDOW_MINIMIZED:
    case SDL_EVENT_WINDOW_HIDDEN:
    case SDL_EVENT_WILL_ENTER_BACKGROUND:
        if (m_bridge) {
            m_bridge->lifecycle_pause();
        }
        return;

    case SDL_EVENT_WINDOW_RESTORED:
    case SDL_EVENT_WINDOW_SHOWN:
    case SDL_EVENT_DID_ENTER_FOREGROUND:
        if (m_bridge) {
            m_bridge->lifecycle_resume();
        }
        return;

    default:
        break;
    }

    if (m_bridge) {
        const auto size = m_platform->pixel_size();
        input::forward_sdl_input(*m_bridge, event, size.width, size.height,
                                 m_platform->pixel_density());
    }
}

void Application::tick() {
    if (m_surface_dirty && m_bridge) {
        POLARBEAR_PROFILE_SCOPE("SurfaceResize");
        const auto surface = m_platform->native_surface();
        m_bridge->supply_native_surface(surface.handle, surface.width, surface.height);
    }
    m_surface_dirty = false;

    m_control->process_events();

    if (m_supervisor) {
        POLARBEAR_PROFILE_SCOPE("SupervisorPoll");
        m_supervisor->poll();
    }
}

void Application::pace_frame() {
    uint64_t now = SDL_GetTicksNS();
    if (m_next_frame_ns > now) {
        SDL_DelayNS(m_next_frame_ns - now);
        now = SDL_GetTicksNS();
    }
    m_next_frame_ns = std::max(m_next_frame_ns + m_frame_interval_ns, now);
    if (m_bridge) {
        m_bridge->vsync(now);
    }
}

// =============================================================================
// Session Actions
// =============================================================================

auto Application::is_installed() const -> bool {
    return m_bootstrap->is_installed();
}

void Application::start_bootstrap(uint64_t attempt) {
    cancel_bootstrap();
    m_bootstrap->set_state_listener([this, attempt](const bootstrap::BootstrapState& state) {
        m_control->post(BootstrapProgressEvent{.attempt = attempt, .state = state});
    });
    POLARBEAR_LOG_INFO("Starting bootstrap #{}", attempt);
    m_bootstrap_job = util::JobSystem::submit_cancellable([this, attempt](std::stop_token stop) {
        auto result = m_bootstrap->run(stop);
        if (result) {
            m_control->post(BootstrapFinishedEvent{.attempt = attempt});
        } else {
            m_control->post(BootstrapFailedEvent{.attempt = attempt, .error = result.error()});
        }
        return result;
    });
}

void Application::cancel_bootstrap() {
    if (!m_bootstrap_job.valid()) {
        return;
    }
    m_bootstrap_job.cancel();
    auto result = m_bootstrap_job.future.get();
    if (!result && result.error().code != ErrorCode::cancelled) {
        POLARBEAR_LOG_DEBUG("Cancelled bootstrap ended with: {}", result.error().message);
    }
    m_bootstrap_job = {};
}

auto Application::start_session() -> Result<void> {
    stop_session();

    // wl_display_add_socket places the socket under XDG_RUNTIME_DIR.
    const char* runtime_env = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_env == nullptr || m_dirs.runtime_dir != runtime_env) {
        ::setenv("XDG_RUNTIME_DIR", m_dirs.runtime_dir.c_str(), 1);
    }

    m_compositor = POLARBEAR_TRY(compositor::CompositorServer::create(
        compositor_config_from(m_config),
        [](const compositor::NativeSurface& surface) {
            return render::VulkanBackend::create(surface);
        },
        [this](const Error& error) { m_control->post(CompositorFatalEvent{error}); }));

    m_bridge = std::make_unique<input::HostBridge>(*m_compositor);
    const auto surface = m_platform->native_surface();
    m_bridge->supply_native_surface(surface.handle, surface.width, surface.height);

    POLARBEAR_TRY(launch_guest_processes());
    return {};
}

auto Application::launch_guest_processes() -> Result<void> {
    const auto& layout = m_bootstrap->layout();
    const auto guest = supervisor::load_guest_config(layout.rootfs);
    const auto& session = m_config.session;

    supervisor::SandboxSpec spec{
        .proot = session.proot,
        .proot_loader = session.proot_loader,
        .rootfs = layout.rootfs,
        .wayland_socket = m_compositor->socket_path(),
        .x11_display = session.x11_display,
        // A host user other than the default root wins over the guest's.
        .user = session.user != "root" ? session.user : guest.username,
        .extra_binds = session.binds,
    };
    auto commands = supervisor::resolve_session_commands(guest, session);
    auto processes =
        supervisor::session_processes(spec, commands, supervisor::current_environment());

    m_supervisor =
        std::make_unique<supervisor::ProcessSupervisor>(supervisor_options_from(m_config, m_dirs));
    m_supervisor->set_fatal_handler(
        [this](const Error& error) { m_control->post(SupervisorFatalEvent{error}); });

    POLARBEAR_LOG_INFO("Launching guest session as '{}' on {} / DISPLAY={}", spec.user,
                       m_compositor->wayland_display(), spec.x11_display);
    POLARBEAR_TRY(m_supervisor->launch(std::move(processes)));
    return {};
}

void Application::stop_session() {
    if (m_supervisor) {
        m_supervisor->shutdown();
        m_supervisor.reset();
    }
    if (m_bridge) {
        m_bridge->surface_destroyed();
        m_bridge.reset();
    }
    if (m_compositor) {
        m_compositor->stop();
        m_compositor.reset();
    }
}

auto Application::wipe_install(bool wipe) -> Result<void> {
    return m_bootstrap->reset(wipe);
}

void Application::publish_progress(const progress::ProgressMessage& message) {
    POLARBEAR_LOG_DEBUG("Progress {}%{}: {}", message.progress, message.is_error ? " (error)" : "",
                        message.message);
    if (m_progress) {
        m_progress->publish(message);
    }
}

} // namespace polarbear::app
