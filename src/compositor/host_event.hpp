#pragma once

#include <cstdint>

namespace polarbear::compositor {

/// @brief Opaque host drawable plus its pixel size. The handle is an `SDL_Window*` on desktop.
struct NativeSurface {
    void* handle = nullptr;
    uint32_t width = 0;
    uint32_t height = 0;
};

enum class InputEventType : std::uint8_t {
    key,
    touch_down,
    touch_motion,
    touch_up,
    pointer_motion,
    pointer_button,
    pointer_axis
};

/// @brief Normalized input event in output (logical) coordinates.
struct InputEvent {
    InputEventType type = InputEventType::key;
    uint32_t time_ms = 0;
    /// Linux evdev key or button code
    uint32_t code = 0;
    bool pressed = false;
    int32_t touch_id = 0;
    double x = 0.0;
    double y = 0.0;
    double value = 0.0;
    bool horizontal = false;
};

enum class HostEventType : std::uint8_t {
    surface_supplied,
    surface_destroyed,
    input,
    pause,
    resume,
    vsync
};

/// @brief Everything the host may tell the compositor. Enqueued on the host thread only.
struct HostEvent {
    HostEventType type = HostEventType::vsync;
    NativeSurface surface{};
    InputEvent input{};
    uint64_t vsync_ns = 0;
};

/// @brief Receiver for host events; implementations must be callable from the host thread.
class HostEventSink {
public:
    virtual ~HostEventSink() = default;

    /// @return False if the event was dropped because the queue is full.
    [[nodiscard]] virtual auto post_host_event(const HostEvent& event) -> bool = 0;
};

} // namespace polarbear::compositor
