#pragma once

#include <compositor/host_event.hpp>
#include <compositor/scene.hpp>
#include <util/error.hpp>

#include <cstdint>
#include <functional>

namespace polarbear::render {

struct FrameStats {
    uint64_t frame_index = 0;
    uint32_t layers_drawn = 0;
    uint64_t bytes_uploaded = 0;
};

/// @brief Draws composited scene snapshots to a host native surface.
///
/// `context_lost` from any call means the backend is unusable and must be recreated against the
/// same native surface; all other errors are per-frame.
class RenderBackend {
public:
    virtual ~RenderBackend() = default;

    [[nodiscard]] virtual auto resize(uint32_t width, uint32_t height) -> Result<void> = 0;
    [[nodiscard]] virtual auto composite(const compositor::SceneSnapshot& snapshot)
        -> Result<FrameStats> = 0;
    [[nodiscard]] virtual auto present() -> Result<void> = 0;
};

/// Creates a backend for a native surface, or `no_compatible_config` when none fits.
using RenderBackendFactory =
    std::function<ResultPtr<RenderBackend>(const compositor::NativeSurface& surface)>;

} // namespace polarbear::render
