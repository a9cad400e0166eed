#include "host_bridge.hpp"

#include <util/logging.hpp>

namespace polarbear::input {

using compositor::HostEvent;
using compositor::HostEventType;
using compositor::InputEvent;
using compositor::InputEventType;

void HostBridge::supply_native_surface(void* handle, uint32_t width, uint32_t height) {
    if (handle == nullptr || width == 0 || height == 0) {
        POLARBEAR_LOG_WARN("Ignoring invalid native surface ({}x{})", width, height);
        return;
    }
    m_surface = compositor::NativeSurface{.handle = handle, .width = width, .height = height};
    post(HostEvent{.type = HostEventType::surface_supplied, .surface = m_surface});
}

void HostBridge::surface_destroyed() {
    if (m_surface.handle == nullptr) {
        return;
    }
    m_surface = {};
    post(HostEvent{.type = HostEventType::surface_destroyed});
}

void HostBridge::dispatch_touch(const TouchEvent& event) {
    InputEvent input{.time_ms = event.time_ms, .touch_id = event.id, .x = event.x, .y = event.y};
    switch (event.phase) {
    case TouchPhase::down:
        input.type = InputEventType::touch_down;
        break;
    case TouchPhase::motion:
        input.type = InputEventType::touch_motion;
        break;
    case TouchPhase::up:
        input.type = InputEventType::touch_up;
        break;
    }
    post_input(input);
}

void HostBridge::dispatch_key(const KeyEvent& event) {
    if (event.code == 0) {
        return;
    }
    post_input(InputEvent{.type = InputEventType::key,
                          .time_ms = event.time_ms,
                          .code = event.code,
                          .pressed = event.pressed});
}

void HostBridge::dispatch_pointer_motion(double x, double y, uint32_t time_ms) {
    post_input(InputEvent{.type = InputEventType::pointer_motion, .time_ms = time_ms, .x = x, .y = y});
}

void HostBridge::dispatch_pointer_button(uint32_t button, bool pressed, uint32_t time_ms) {
    if (button == 0) {
        return;
    }
    post_input(InputEvent{.type = InputEventType::pointer_button,
                          .time_ms = time_ms,
                          .code = button,
                          .pressed = pressed});
}

void HostBridge::dispatch_pointer_axis(double value, bool horizontal, uint32_t time_ms) {
    if (value == 0.0) {
        return;
    }
    post_input(InputEvent{.type = InputEventType::pointer_axis,
                          .time_ms = time_ms,
                          .value = value,
                          .horizontal = horizontal});
}

void HostBridge::lifecycle_pause() {
    if (m_paused) {
        return;
    }
    m_paused = true;
    post(HostEvent{.type = HostEventType::pause});
}

void HostBridge::lifecycle_resume() {
    if (!m_paused) {
        return;
    }
    m_paused = false;
    post(HostEvent{.type = HostEventType::resume});
}

void HostBridge::vsync(uint64_t timestamp_ns) {
    if (m_paused || m_surface.handle == nullptr) {
        return;
    }
    post(HostEvent{.type = HostEventType::vsync, .vsync_ns = timestamp_ns});
}

void HostBridge::post_input(const InputEvent& input) {
    if (m_surface.handle == nullptr) {
        POLARBEAR_LOG_TRACE("No native surface, dropping input type={}",
                            static_cast<int>(input.type));
        return;
    }
    post(HostEvent{.type = HostEventType::input, .input = input});
}

void HostBridge::post(const HostEvent& event) {
    if (!m_sink.post_host_event(event)) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace polarbear::input
