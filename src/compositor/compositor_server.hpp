#pragma once

#include "compositor_core.hpp"
#include "host_event.hpp"

#include <render/render_backend.hpp>
#include <util/error.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace polarbear::compositor {

struct CompositorServerConfig {
    /// Preferred socket name; `<name>-1..9` are tried when it is taken.
    std::string socket_name = "wayland-0";
    /// Initial output size until the host supplies a surface.
    uint32_t width = 1280;
    uint32_t height = 720;
    uint32_t ping_timeout_ms = 5000;
    CoreConfig core;
};

/// @brief Headless wlroots compositor that serves guest Wayland clients and renders them through
/// a `RenderBackend` onto the host surface.
///
/// `start()` spawns the compositor thread. `post_host_event()` is the only method that may be
/// called from the host thread while it runs.
class CompositorServer : public HostEventSink {
public:
    using FatalHandler = CompositorCore::FatalHandler;

    CompositorServer(CompositorServerConfig config, render::RenderBackendFactory backend_factory);
    ~CompositorServer() override;

    CompositorServer(const CompositorServer&) = delete;
    CompositorServer& operator=(const CompositorServer&) = delete;
    CompositorServer(CompositorServer&&) = delete;
    CompositorServer& operator=(CompositorServer&&) = delete;

    /// @brief Creates and starts a compositor server.
    /// @param fatal_handler Invoked on the compositor thread when rendering cannot recover.
    [[nodiscard]] static auto create(CompositorServerConfig config,
                                     render::RenderBackendFactory backend_factory,
                                     FatalHandler fatal_handler) -> ResultPtr<CompositorServer>;

    /// @brief Binds the Wayland socket and starts the compositor thread.
    [[nodiscard]] auto start() -> Result<void>;
    /// @brief Stops the compositor thread and releases all wlroots resources.
    void stop();

    /// @brief Queues a host event and wakes the compositor thread.
    [[nodiscard]] auto post_host_event(const HostEvent& event) -> bool override;

    /// @brief Returns the bound socket name, or an empty string if not started.
    [[nodiscard]] auto wayland_display() const -> std::string;
    /// @brief Absolute host path of the bound socket.
    [[nodiscard]] auto socket_path() const -> std::filesystem::path;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace polarbear::compositor
