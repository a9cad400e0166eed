#pragma once

#include "host_bridge.hpp"

#include <SDL3/SDL_events.h>

#include <cstdint>

namespace polarbear::input {

/// @brief Maps an SDL scancode to a Linux evdev key code; 0 when unmapped.
[[nodiscard]] auto sdl_to_linux_keycode(SDL_Scancode scancode) -> uint32_t;
/// @brief Maps an SDL mouse button index to a Linux BTN_* code; 0 when unmapped.
[[nodiscard]] auto sdl_to_linux_button(uint8_t sdl_button) -> uint32_t;

/// @brief Translates one SDL input event into bridge calls.
/// @param pixel_width Window width in pixels, used to scale normalized finger coordinates.
/// @param pixel_height Window height in pixels.
/// @param pixel_density Window pixel density, used to scale mouse coordinates.
/// @return True if the event was an input event handled here.
auto forward_sdl_input(HostBridge& bridge, const SDL_Event& event, uint32_t pixel_width,
                       uint32_t pixel_height, float pixel_density) -> bool;

} // namespace polarbear::input
