#pragma once

#include "host_event.hpp"
#include "scene.hpp"

#include <render/render_backend.hpp>
#include <util/error.hpp>
#include <util/queues.hpp>

#include <functional>
#include <memory>

namespace polarbear::compositor {

/// @brief Outbound protocol actions the core requests from the Wayland binding.
class ProtocolSink {
public:
    virtual ~ProtocolSink() = default;

    virtual void send_frame_done(SurfaceId surface, uint32_t time_ms) = 0;
    /// Post an implementation error and drop the client's connection.
    virtual void disconnect_client(ClientId client, const Error& error) = 0;
    virtual void configure_output(const Output& output) = 0;
    virtual void configure_toplevel(SurfaceId surface, uint32_t width, uint32_t height) = 0;
    virtual void set_keyboard_focus(SurfaceId surface) = 0;
    virtual void deliver_input(SurfaceId surface, const InputEvent& event, double local_x,
                               double local_y) = 0;
};

struct CoreConfig {
    double scale = 1.0;
    uint32_t refresh_mhz = 60000;
    uint32_t max_events_per_tick = 256;
    bool strict_backpressure = true;
    size_t host_queue_capacity = 1024;
};

/// @brief Protocol-independent compositor: scene state, host event pump and frame loop.
///
/// All methods except `post_host_event()` run on the compositor thread.
class CompositorCore : public HostEventSink {
public:
    using FatalHandler = std::function<void(const Error&)>;
    using WakeHandler = std::function<void()>;

    CompositorCore(CoreConfig config, render::RenderBackendFactory backend_factory,
                   ProtocolSink& sink);
    ~CompositorCore() override = default;

    CompositorCore(const CompositorCore&) = delete;
    CompositorCore& operator=(const CompositorCore&) = delete;
    CompositorCore(CompositorCore&&) = delete;
    CompositorCore& operator=(CompositorCore&&) = delete;

    // Host thread
    [[nodiscard]] auto post_host_event(const HostEvent& event) -> bool override;

    /// Applies at most `max_events_per_tick` queued host events, then renders if a vsync arrived.
    /// @return True if events remain queued.
    auto process_host_events() -> bool;

    // Client lifecycle, called by the Wayland binding
    [[nodiscard]] auto accept_client(pid_t pid = 0) -> ClientId;
    void bind_client(ClientId client);
    /// The connection closed on its own; nothing is sent back.
    void client_gone(ClientId client);

    [[nodiscard]] auto create_surface(ClientId client) -> Result<SurfaceId>;
    void destroy_surface(SurfaceId surface);
    [[nodiscard]] auto set_role(SurfaceId surface, SurfaceRole role,
                                SurfaceId parent = NO_SURFACE) -> Result<void>;
    [[nodiscard]] auto set_position(SurfaceId surface, int32_t x, int32_t y) -> Result<void>;
    [[nodiscard]] auto attach_buffer(SurfaceId surface, Buffer buffer) -> Result<void>;
    [[nodiscard]] auto detach_buffer(SurfaceId surface) -> Result<void>;
    [[nodiscard]] auto add_damage(SurfaceId surface, Rect damage) -> Result<void>;
    [[nodiscard]] auto commit(SurfaceId surface) -> Result<void>;
    /// Called once the committed state, frame callbacks included, is current. Role-less
    /// surfaces are never composited, so their frame-done is sent here.
    void commit_applied(SurfaceId surface, uint32_t time_ms);

    /// Replaces the single output and reconfigures every toplevel to its logical size.
    void create_output(uint32_t width, uint32_t height);
    void dispatch_input(const InputEvent& event);
    /// Disconnects @p client for a protocol error detected outside the core, such as a
    /// missed ping.
    void disconnect(ClientId client, const Error& error);

    /// Composites and presents one frame. Skipped while paused or without a surface.
    [[nodiscard]] auto render_frame(uint32_t time_ms) -> Result<render::FrameStats>;

    void set_fatal_handler(FatalHandler handler) { m_fatal_handler = std::move(handler); }
    void set_wake_handler(WakeHandler handler) { m_wake_handler = std::move(handler); }

    [[nodiscard]] auto scene() -> Scene& { return m_scene; }
    [[nodiscard]] auto scene() const -> const Scene& { return m_scene; }
    [[nodiscard]] auto is_paused() const -> bool { return m_paused; }
    [[nodiscard]] auto has_backend() const -> bool { return m_backend != nullptr; }
    [[nodiscard]] auto backend_generation() const -> uint32_t { return m_backend_generation; }

private:
    void apply_host_event(const HostEvent& event);
    void on_surface_supplied(const NativeSurface& surface);
    [[nodiscard]] auto create_backend() -> Result<void>;
    [[nodiscard]] auto recover_backend(const Error& cause) -> Result<render::FrameStats>;
    void report_fatal(const Error& error);

    /// Disconnects the owner of @p surface when @p result is a protocol violation.
    auto check_violation(SurfaceId surface, Result<void> result) -> Result<void>;
    void focus(SurfaceId surface);
    void deliver(SurfaceId surface, const InputEvent& event);

    CoreConfig m_config;
    render::RenderBackendFactory m_backend_factory;
    ProtocolSink& m_sink;
    Scene m_scene;

    util::SPSCQueue<HostEvent> m_host_events;
    std::unique_ptr<render::RenderBackend> m_backend;
    NativeSurface m_native_surface{};
    uint32_t m_backend_generation = 0;

    bool m_paused = false;
    bool m_frame_requested = false;
    bool m_fatal = false;
    uint64_t m_last_vsync_ns = 0;

    FatalHandler m_fatal_handler;
    WakeHandler m_wake_handler;
};

} // namespace polarbear::compositor
