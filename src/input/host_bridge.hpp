#pragma once

#include <compositor/host_event.hpp>

#include <atomic>
#include <cstdint>

namespace polarbear::input {

enum class TouchPhase : std::uint8_t { down, motion, up };

struct TouchEvent {
    TouchPhase phase = TouchPhase::down;
    int32_t id = 0;
    /// Output pixel coordinates
    double x = 0.0;
    double y = 0.0;
    uint32_t time_ms = 0;
};

struct KeyEvent {
    /// Linux evdev key code
    uint32_t code = 0;
    bool pressed = false;
    uint32_t time_ms = 0;
};

/// @brief Host-facing entry point: turns host surface, input and lifecycle callbacks into
/// compositor host events.
///
/// Called from the host thread only. Input is dropped while no native surface is attached.
class HostBridge {
public:
    explicit HostBridge(compositor::HostEventSink& sink) : m_sink(sink) {}

    void supply_native_surface(void* handle, uint32_t width, uint32_t height);
    void surface_destroyed();

    void dispatch_touch(const TouchEvent& event);
    void dispatch_key(const KeyEvent& event);
    void dispatch_pointer_motion(double x, double y, uint32_t time_ms = 0);
    void dispatch_pointer_button(uint32_t button, bool pressed, uint32_t time_ms = 0);
    void dispatch_pointer_axis(double value, bool horizontal, uint32_t time_ms = 0);

    void lifecycle_pause();
    void lifecycle_resume();
    void vsync(uint64_t timestamp_ns);

    [[nodiscard]] auto has_surface() const -> bool { return m_surface.handle != nullptr; }
    [[nodiscard]] auto is_paused() const -> bool { return m_paused; }
    [[nodiscard]] auto dropped_events() const -> uint64_t {
        return m_dropped.load(std::memory_order_relaxed);
    }

private:
    void post(const compositor::HostEvent& event);
    void post_input(const compositor::InputEvent& input);

    compositor::HostEventSink& m_sink;
    compositor::NativeSurface m_surface{};
    bool m_paused = false;
    std::atomic<uint64_t> m_dropped{0};
};

} // namespace polarbear::input
