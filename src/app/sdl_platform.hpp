#pragma once

#include <compositor/host_event.hpp>
#include <util/error.hpp>

#include <cstdint>
#include <string>

struct SDL_Window;

namespace polarbear::app {

struct PixelSize {
    uint32_t width = 0;
    uint32_t height = 0;
};

/// @brief Owns SDL initialization and the host window the guest desktop is drawn into.
class SdlPlatform {
public:
    struct CreateInfo {
        std::string title;
        int width = 0;
        int height = 0;
        bool resizable = true;
    };

    [[nodiscard]] static auto create(const CreateInfo& create_info) -> ResultPtr<SdlPlatform>;

    ~SdlPlatform();

    SdlPlatform(const SdlPlatform&) = delete;
    SdlPlatform& operator=(const SdlPlatform&) = delete;
    SdlPlatform(SdlPlatform&&) = delete;
    SdlPlatform& operator=(SdlPlatform&&) = delete;

    void shutdown();

    [[nodiscard]] auto window() const -> SDL_Window* { return m_window; }
    /// Drawable size in pixels, which differs from the window size on high density displays.
    [[nodiscard]] auto pixel_size() const -> PixelSize;
    [[nodiscard]] auto pixel_density() const -> float;
    [[nodiscard]] auto native_surface() const -> compositor::NativeSurface;

private:
    SdlPlatform() = default;

    SDL_Window* m_window = nullptr;
    bool m_sdl_initialized = false;
};

} // namespace polarbear::app
