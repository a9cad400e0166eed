#include "compositor_core.hpp"

#include <util/logging.hpp>
#include <util/profiling.hpp>

namespace polarbear::compositor {

CompositorCore::CompositorCore(CoreConfig config, render::RenderBackendFactory backend_factory,
                               ProtocolSink& sink)
    : m_config(config), m_backend_factory(std::move(backend_factory)), m_sink(sink),
      m_host_events(config.host_queue_capacity) {
    m_scene.set_strict_backpressure(config.strict_backpressure);
}

auto CompositorCore::post_host_event(const HostEvent& event) -> bool {
    if (!m_host_events.try_push(event)) {
        POLARBEAR_LOG_WARN("Host event queue full, dropping event type={}",
                           static_cast<int>(event.type));
        return false;
    }
    if (m_wake_handler) {
        m_wake_handler();
    }
    return true;
}

auto CompositorCore::process_host_events() -> bool {
    POLARBEAR_PROFILE_FUNCTION();
    POLARBEAR_PROFILE_COUNT("HostEventQueue", m_host_events.size());
    m_host_events.drain(m_config.max_events_per_tick,
                        [this](const HostEvent& event) { apply_host_event(event); });

    if (m_frame_requested) {
        m_frame_requested = false;
        auto frame = render_frame(static_cast<uint32_t>(m_last_vsync_ns / 1000000U));
        if (!frame) {
            POLARBEAR_LOG_WARN("Frame skipped: {}", frame.error().message);
        }
    }
    return !m_host_events.empty();
}

void CompositorCore::apply_host_event(const HostEvent& event) {
    switch (event.type) {
    case HostEventType::surface_supplied:
        on_surface_supplied(event.surface);
        break;
    case HostEventType::surface_destroyed:
        POLARBEAR_LOG_INFO("Native surface destroyed, rendering suspended");
        m_backend.reset();
        m_native_surface = {};
        break;
    case HostEventType::input:
        dispatch_input(event.input);
        break;
    case HostEventType::pause:
        m_paused = true;
        break;
    case HostEventType::resume:
        m_paused = false;
        break;
    case HostEventType::vsync:
        m_last_vsync_ns = event.vsync_ns;
        m_frame_requested = true;
        break;
    }
}

void CompositorCore::on_surface_supplied(const NativeSurface& surface) {
    if (surface.width == 0 || surface.height == 0) {
        POLARBEAR_LOG_WARN("Ignoring native surface with empty size");
        return;
    }
    const bool same_handle = m_backend && m_native_surface.handle == surface.handle;
    m_native_surface = surface;

    if (!same_handle) {
        m_backend.reset();
        if (auto created = create_backend(); !created) {
            report_fatal(created.error());
            return;
        }
    }

    const auto& output = m_scene.output();
    if (output.width != surface.width || output.height != surface.height) {
        create_output(surface.width, surface.height);
    }
    if (auto resized = m_backend->resize(surface.width, surface.height); !resized) {
        POLARBEAR_LOG_WARN("Backend resize failed: {}", resized.error().message);
    }
}

auto CompositorCore::create_backend() -> Result<void> {
    if (!m_backend_factory) {
        return make_error<void>(ErrorCode::no_compatible_config, "No render backend available");
    }
    auto backend = POLARBEAR_TRY(m_backend_factory(m_native_surface));
    m_backend = std::move(backend);
    ++m_backend_generation;
    POLARBEAR_LOG_INFO("Render backend ready (generation {})", m_backend_generation);
    return {};
}

auto CompositorCore::recover_backend(const Error& cause) -> Result<render::FrameStats> {
    POLARBEAR_LOG_WARN("Render context lost ({}), recreating backend", cause.message);
    m_backend.reset();
    if (auto created = create_backend(); !created) {
        report_fatal(created.error());
        return nonstd::make_unexpected(created.error());
    }
    const auto& output = m_scene.output();
    if (auto resized = m_backend->resize(output.width, output.height); !resized) {
        report_fatal(resized.error());
        return nonstd::make_unexpected(resized.error());
    }
    // Nothing was consumed, so surfaces keep waiting for the next frame's frame-done.
    return render::FrameStats{};
}

void CompositorCore::report_fatal(const Error& error) {
    m_backend.reset();
    if (m_fatal) {
        return;
    }
    m_fatal = true;
    POLARBEAR_LOG_ERROR("Compositor fatal [{}]: {}", error_code_name(error.code), error.message);
    if (m_fatal_handler) {
        m_fatal_handler(error);
    }
}

auto CompositorCore::accept_client(pid_t pid) -> ClientId {
    return m_scene.accept_client(pid);
}

void CompositorCore::bind_client(ClientId client) {
    if (auto bound = m_scene.bind_client(client); !bound) {
        POLARBEAR_LOG_DEBUG("bind_client: {}", bound.error().message);
    }
}

void CompositorCore::client_gone(ClientId client) {
    static_cast<void>(m_scene.disconnect_client(client, "connection closed"));
}

void CompositorCore::disconnect(ClientId client, const Error& error) {
    const auto* record = m_scene.client(client);
    if (record == nullptr) {
        return;
    }
    POLARBEAR_LOG_WARN("Disconnecting client {}: {}", client, error.message);
    static_cast<void>(m_scene.disconnect_client(client, error.message));
    m_sink.disconnect_client(client, error);
}

auto CompositorCore::create_surface(ClientId client) -> Result<SurfaceId> {
    auto surface = m_scene.create_surface(client);
    if (!surface && surface.error().code == ErrorCode::protocol_violation) {
        disconnect(client, surface.error());
    }
    return surface;
}

void CompositorCore::destroy_surface(SurfaceId surface) {
    if (auto destroyed = m_scene.destroy_surface(surface); !destroyed) {
        POLARBEAR_LOG_DEBUG("destroy_surface: {}", destroyed.error().message);
    }
}

auto CompositorCore::set_role(SurfaceId surface, SurfaceRole role, SurfaceId parent)
    -> Result<void> {
    POLARBEAR_TRY(check_violation(surface, m_scene.set_role(surface, role, parent)));
    if (role == SurfaceRole::toplevel && m_scene.has_output()) {
        const auto& output = m_scene.output();
        m_sink.configure_toplevel(surface, output.logical_width(), output.logical_height());
        focus(surface);
    }
    return {};
}

auto CompositorCore::set_position(SurfaceId surface, int32_t x, int32_t y) -> Result<void> {
    return m_scene.set_position(surface, x, y);
}

auto CompositorCore::attach_buffer(SurfaceId surface, Buffer buffer) -> Result<void> {
    return check_violation(surface, m_scene.attach_buffer(surface, std::move(buffer)));
}

auto CompositorCore::detach_buffer(SurfaceId surface) -> Result<void> {
    return check_violation(surface, m_scene.detach_buffer(surface));
}

auto CompositorCore::add_damage(SurfaceId surface, Rect damage) -> Result<void> {
    return check_violation(surface, m_scene.add_damage(surface, damage));
}

auto CompositorCore::commit(SurfaceId surface) -> Result<void> {
    return check_violation(surface, m_scene.commit(surface));
}

void CompositorCore::commit_applied(SurfaceId surface, uint32_t time_ms) {
    const auto* record = m_scene.surface(surface);
    if (record != nullptr && record->role == SurfaceRole::none) {
        m_sink.send_frame_done(surface, time_ms);
    }
}

auto CompositorCore::check_violation(SurfaceId surface, Result<void> result) -> Result<void> {
    if (result || result.error().code != ErrorCode::protocol_violation) {
        return result;
    }
    if (const auto* record = m_scene.surface(surface)) {
        disconnect(record->client, result.error());
    }
    return result;
}

void CompositorCore::create_output(uint32_t width, uint32_t height) {
    const auto& output = m_scene.create_output(Output{
        .width = width,
        .height = height,
        .scale = m_config.scale,
        .refresh_mhz = m_config.refresh_mhz,
    });
    m_sink.configure_output(output);
    for (SurfaceId toplevel : m_scene.toplevels()) {
        m_sink.configure_toplevel(toplevel, output.logical_width(), output.logical_height());
    }
}

void CompositorCore::dispatch_input(const InputEvent& event) {
    auto& seat = m_scene.seat();
    switch (event.type) {
    case InputEventType::key:
        if ((seat.capabilities & SEAT_KEYBOARD) != 0 && seat.keyboard_focus != NO_SURFACE) {
            deliver(seat.keyboard_focus, event);
        }
        break;
    case InputEventType::touch_down: {
        if ((seat.capabilities & SEAT_TOUCH) == 0) {
            break;
        }
        const SurfaceId target = m_scene.surface_at(event.x, event.y);
        if (target == NO_SURFACE) {
            break;
        }
        m_scene.raise(target);
        focus(m_scene.root_of(target));
        seat.touch_focus[event.touch_id] = target;
        deliver(target, event);
        break;
    }
    case InputEventType::touch_motion: {
        auto it = seat.touch_focus.find(event.touch_id);
        if (it != seat.touch_focus.end()) {
            deliver(it->second, event);
        }
        break;
    }
    case InputEventType::touch_up: {
        auto it = seat.touch_focus.find(event.touch_id);
        if (it != seat.touch_focus.end()) {
            const SurfaceId target = it->second;
            seat.touch_focus.erase(it);
            deliver(target, event);
        }
        break;
    }
    case InputEventType::pointer_motion: {
        if ((seat.capabilities & SEAT_POINTER) == 0) {
            break;
        }
        seat.pointer_x = event.x;
        seat.pointer_y = event.y;
        seat.pointer_focus = m_scene.surface_at(event.x, event.y);
        if (seat.pointer_focus != NO_SURFACE) {
            deliver(seat.pointer_focus, event);
        }
        break;
    }
    case InputEventType::pointer_button:
        if (seat.pointer_focus == NO_SURFACE) {
            break;
        }
        if (event.pressed) {
            m_scene.raise(seat.pointer_focus);
            focus(m_scene.root_of(seat.pointer_focus));
        }
        deliver(seat.pointer_focus, event);
        break;
    case InputEventType::pointer_axis:
        if (seat.pointer_focus != NO_SURFACE) {
            deliver(seat.pointer_focus, event);
        }
        break;
    }
}

void CompositorCore::focus(SurfaceId surface) {
    auto& seat = m_scene.seat();
    if (seat.keyboard_focus == surface) {
        return;
    }
    seat.keyboard_focus = surface;
    m_sink.set_keyboard_focus(surface);
}

void CompositorCore::deliver(SurfaceId surface, const InputEvent& event) {
    const auto* record = m_scene.surface(surface);
    if (record == nullptr) {
        return;
    }
    double x = event.x;
    double y = event.y;
    if (event.type != InputEventType::key) {
        const auto& seat = m_scene.seat();
        if (event.type == InputEventType::pointer_button ||
            event.type == InputEventType::pointer_axis) {
            x = seat.pointer_x;
            y = seat.pointer_y;
        }
        const Rect placed = m_scene.placement(surface);
        x -= placed.x;
        y -= placed.y;
    }
    m_sink.deliver_input(surface, event, x, y);
}

auto CompositorCore::render_frame(uint32_t time_ms) -> Result<render::FrameStats> {
    POLARBEAR_PROFILE_FUNCTION();
    if (m_paused || !m_backend) {
        return render::FrameStats{};
    }

    auto snapshot = m_scene.snapshot();
    auto stats = m_backend->composite(snapshot);
    if (!stats) {
        if (stats.error().code == ErrorCode::context_lost) {
            return recover_backend(stats.error());
        }
        return stats;
    }

    if (auto presented = m_backend->present(); !presented) {
        if (presented.error().code == ErrorCode::context_lost) {
            return recover_backend(presented.error());
        }
        return nonstd::make_unexpected(presented.error());
    }

    for (SurfaceId surface : m_scene.mark_consumed(snapshot)) {
        m_sink.send_frame_done(surface, time_ms);
    }
    POLARBEAR_PROFILE_FRAME("Compositor");
    return stats;
}

} // namespace polarbear::compositor
