#include "sdl_platform.hpp"

#include <util/logging.hpp>

#include <SDL3/SDL.h>
#include <memory>
#include <string>

namespace polarbear::app {

auto SdlPlatform::create(const CreateInfo& create_info) -> ResultPtr<SdlPlatform> {
    auto platform = std::unique_ptr<SdlPlatform>(new SdlPlatform());

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        return make_result_ptr_error<SdlPlatform>(
            ErrorCode::unknown_error, "Failed to initialize SDL3: " + std::string(SDL_GetError()));
    }
    platform->m_sdl_initialized = true;

    auto window_flags = static_cast<SDL_WindowFlags>(
        SDL_WINDOW_VULKAN | SDL_WINDOW_HIGH_PIXEL_DENSITY |
        (create_info.resizable ? SDL_WINDOW_RESIZABLE : 0));

    auto* window = SDL_CreateWindow(create_info.title.c_str(), create_info.width,
                                    create_info.height, window_flags);
    if (window == nullptr) {
        return make_result_ptr_error<SdlPlatform>(
            ErrorCode::unknown_error, "Failed to create window: " + std::string(SDL_GetError()));
    }
    platform->m_window = window;

    const auto size = platform->pixel_size();
    POLARBEAR_LOG_INFO("SDL3 window {}x{} px (density {:.2f})", size.width, size.height,
                       platform->pixel_density());
    return make_result_ptr(std::move(platform));
}

SdlPlatform::~SdlPlatform() {
    shutdown();
}

void SdlPlatform::shutdown() {
    if (m_window != nullptr) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdl_initialized) {
        SDL_Quit();
        m_sdl_initialized = false;
    }
}

auto SdlPlatform::pixel_size() const -> PixelSize {
    int width = 0;
    int height = 0;
    if (m_window == nullptr || !SDL_GetWindowSizeInPixels(m_window, &width, &height)) {
        return {};
    }
    return {.width = static_cast<uint32_t>(width), .height = static_cast<uint32_t>(height)};
}

auto SdlPlatform::pixel_density() const -> float {
    if (m_window == nullptr) {
        return 1.0F;
    }
    const float density = SDL_GetWindowPixelDensity(m_window);
    return density > 0.0F ? density : 1.0F;
}

auto SdlPlatform::native_surface() const -> compositor::NativeSurface {
    const auto size = pixel_size();
    return {.handle = m_window, .width = size.width, .height = size.height};
}

} // namespace polarbear::app
