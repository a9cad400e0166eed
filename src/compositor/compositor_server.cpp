#include "compositor_server.hpp"

#include <array>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <linux/input-event-codes.h>
#include <memory>
#include <optional>
#include <sys/eventfd.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <utility>
#include <vector>

extern "C" {
#include <pixman.h>
#include <wayland-server-core.h>
#include <wlr/backend.h>
#include <wlr/backend/headless.h>
#include <wlr/interfaces/wlr_keyboard.h>
#include <wlr/render/allocator.h>
#include <wlr/render/wlr_renderer.h>
#include <wlr/types/wlr_buffer.h>
#include <wlr/types/wlr_compositor.h>
#include <wlr/types/wlr_data_device.h>
#include <wlr/types/wlr_keyboard.h>
#include <wlr/types/wlr_output.h>
#include <wlr/types/wlr_output_layout.h>
#include <wlr/types/wlr_seat.h>
#include <wlr/types/wlr_shm.h>
#include <wlr/types/wlr_subcompositor.h>
#include <wlr/types/wlr_xdg_shell.h>
#include <wlr/util/log.h>
#include <xkbcommon/xkbcommon.h>
}

#include "host_keyboard.hpp"

#include <util/logging.hpp>
#include <util/unique_fd.hpp>

namespace polarbear::compositor {

namespace {

constexpr auto fourcc_code(char a, char b, char c, char d) -> uint32_t {
    return static_cast<uint32_t>(a) | (static_cast<uint32_t>(b) << 8) |
           (static_cast<uint32_t>(c) << 16) | (static_cast<uint32_t>(d) << 24);
}

constexpr uint32_t DRM_FORMAT_XRGB8888 = fourcc_code('X', 'R', '2', '4');
constexpr uint32_t DRM_FORMAT_ARGB8888 = fourcc_code('A', 'R', '2', '4');

// wl_shm is the only buffer path; these are the two formats every client must support.
constexpr std::array<uint32_t, 2> SHM_FORMATS = {DRM_FORMAT_ARGB8888, DRM_FORMAT_XRGB8888};

constexpr int MAX_SOCKET_SUFFIX = 9;

auto get_time_msec() -> uint32_t {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>(ts.tv_sec * 1000 + ts.tv_nsec / 1000000);
}

auto format_wlr_message(const char* format, va_list args) -> std::optional<std::string> {
    if (!format) {
        return std::nullopt;
    }
    va_list args_copy;
    va_copy(args_copy, args);
    const int length = std::vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);
    if (length < 0) {
        return std::nullopt;
    }

    std::string message(static_cast<size_t>(length) + 1, '\0');
    va_copy(args_copy, args);
    std::vsnprintf(message.data(), message.size(), format, args_copy);
    va_end(args_copy);
    message.resize(static_cast<size_t>(length));
    while (!message.empty() && message.back() == '\n') {
        message.pop_back();
    }
    return message;
}

auto wlr_importance_from_log_level(spdlog::level::level_enum level) -> wlr_log_importance {
    if (level <= spdlog::level::debug) {
        return WLR_DEBUG;
    }
    if (level <= spdlog::level::info) {
        return WLR_INFO;
    }
    if (level <= spdlog::level::critical) {
        return WLR_ERROR;
    }
    return WLR_SILENT;
}

void wlr_log_bridge(wlr_log_importance importance, const char* format, va_list args) {
    auto message = format_wlr_message(format, args);
    if (!message) {
        POLARBEAR_LOG_WARN("[wlr] log formatting failed for format '{}'",
                           format ? format : "<null>");
        return;
    }
    if (message->empty()) {
        return;
    }

    switch (importance) {
    case WLR_ERROR:
        POLARBEAR_LOG_ERROR("[wlr] {}", *message);
        return;
    case WLR_INFO:
        POLARBEAR_LOG_INFO("[wlr] {}", *message);
        return;
    case WLR_DEBUG:
        POLARBEAR_LOG_DEBUG("[wlr] {}", *message);
        return;
    case WLR_SILENT:
    case WLR_LOG_IMPORTANCE_LAST:
        return;
    }
}

auto bind_wayland_socket(wl_display* display, const std::string& preferred)
    -> Result<std::string> {
    if (wl_display_add_socket(display, preferred.c_str()) == 0) {
        return preferred;
    }
    for (int suffix = 1; suffix <= MAX_SOCKET_SUFFIX; ++suffix) {
        std::string name = preferred + "-" + std::to_string(suffix);
        if (wl_display_add_socket(display, name.c_str()) == 0) {
            POLARBEAR_LOG_WARN("Wayland socket '{}' busy, using '{}'", preferred, name);
            return name;
        }
    }
    return make_error<std::string>(ErrorCode::compositor_init_failed,
                                   "No available Wayland socket (" + preferred + ", " +
                                       preferred + "-1.." + std::to_string(MAX_SOCKET_SUFFIX) +
                                       " all bound)");
}

/// Copies a wl_shm buffer into an immutable CPU frame.
auto copy_shm_buffer(wlr_buffer* buffer, uint64_t id) -> Result<Buffer> {
    void* data = nullptr;
    uint32_t format = 0;
    size_t stride = 0;
    if (!wlr_buffer_begin_data_ptr_access(buffer, WLR_BUFFER_DATA_PTR_ACCESS_READ, &data, &format,
                                          &stride)) {
        return make_error<Buffer>(ErrorCode::protocol_violation,
                                  "Only wl_shm buffers are accepted");
    }

    const auto height = static_cast<uint32_t>(buffer->height);
    auto pixels = std::make_shared<std::vector<uint8_t>>(stride * height);
    std::memcpy(pixels->data(), data, pixels->size());
    wlr_buffer_end_data_ptr_access(buffer);

    return Buffer{
        .id = id,
        .width = static_cast<uint32_t>(buffer->width),
        .height = height,
        .stride = static_cast<uint32_t>(stride),
        .opaque = format == DRM_FORMAT_XRGB8888,
        .pixels = std::move(pixels),
    };
}

template <typename Hooks>
auto hooks_from(wl_listener* listener, size_t offset) -> Hooks* {
    return reinterpret_cast<Hooks*>(reinterpret_cast<char*>(listener) - offset);
}

void detach_listener(wl_listener& listener) {
    wl_list_remove(&listener.link);
    wl_list_init(&listener.link);
}

} // anonymous namespace

struct CompositorServer::Impl : ProtocolSink {
    struct ClientHooks {
        Impl* impl = nullptr;
        wl_client* client = nullptr;
        ClientId id = 0;
        bool bound = false;

        wl_listener destroy{};
        wl_listener resource_created{};
    };

    struct SurfaceHooks {
        Impl* impl = nullptr;
        wlr_surface* surface = nullptr;
        SurfaceId id = NO_SURFACE;
        ClientId client = 0;
        wlr_xdg_toplevel* toplevel = nullptr;
        wlr_xdg_popup* popup = nullptr;
        wlr_subsurface* subsurface = nullptr;
        uint32_t configure_width = 0;
        uint32_t configure_height = 0;

        wl_listener client_commit{};
        wl_listener commit{};
        wl_listener destroy{};
        wl_listener new_subsurface{};
        wl_listener role_destroy{};
        wl_listener ping_timeout{};
    };

    struct Listeners {
        Impl* impl = nullptr;

        wl_listener client_created{};
        wl_listener new_surface{};
        wl_listener new_xdg_toplevel{};
        wl_listener new_xdg_popup{};
    };

    CompositorServerConfig config;
    CompositorCore core;

    wl_display* display = nullptr;
    wl_event_loop* event_loop = nullptr;
    wl_event_source* event_source = nullptr;
    wl_event_source* ping_timer = nullptr;
    wl_event_source* disconnect_idle = nullptr;
    wlr_backend* backend = nullptr;
    wlr_renderer* renderer = nullptr;
    wlr_allocator* allocator = nullptr;
    wlr_compositor* compositor = nullptr;
    wlr_xdg_shell* xdg_shell = nullptr;
    wlr_seat* seat = nullptr;
    HostKeyboard keyboard;
    xkb_context* xkb_ctx = nullptr;
    wlr_output_layout* output_layout = nullptr;
    wlr_output* output = nullptr;
    wlr_xdg_toplevel* activated_toplevel = nullptr;
    std::jthread compositor_thread;

    std::unordered_map<ClientId, std::unique_ptr<ClientHooks>> clients;
    std::unordered_map<wl_client*, ClientHooks*> clients_by_handle;
    std::unordered_map<SurfaceId, std::unique_ptr<SurfaceHooks>> surfaces;
    std::unordered_map<wlr_surface*, SurfaceHooks*> surfaces_by_handle;
    std::vector<ClientId> pending_disconnects;

    std::string wayland_socket_name;
    Listeners listeners;
    util::UniqueFd event_fd;
    uint64_t next_buffer_id = 1;

    Impl(CompositorServerConfig cfg, render::RenderBackendFactory factory)
        : config(std::move(cfg)), core(config.core, std::move(factory), *this) {
        listeners.impl = this;
        core.set_wake_handler([this] { wake_event_loop(); });
    }

    [[nodiscard]] auto setup_base_components() -> Result<void>;
    [[nodiscard]] auto create_globals() -> Result<void>;
    [[nodiscard]] auto setup_xdg_shell() -> Result<void>;
    [[nodiscard]] auto setup_input_devices() -> Result<void>;
    [[nodiscard]] auto setup_event_loop_fd() -> Result<void>;
    [[nodiscard]] auto start_backend() -> Result<void>;
    [[nodiscard]] auto setup_output() -> Result<void>;
    void start_compositor_thread();

    bool wake_event_loop();
    void arm_ping_timer();
    void ping_toplevels();
    void flush_disconnects();

    void handle_client_created(wl_client* client);
    void handle_client_resource(ClientHooks* hooks, wl_resource* resource);
    void handle_client_destroy(ClientHooks* hooks);
    void handle_new_surface(wlr_surface* surface);
    void handle_surface_client_commit(SurfaceHooks* hooks);
    void handle_surface_commit(SurfaceHooks* hooks);
    void handle_surface_destroy(SurfaceHooks* hooks);
    void handle_new_xdg_toplevel(wlr_xdg_toplevel* toplevel);
    void handle_new_xdg_popup(wlr_xdg_popup* popup);
    void handle_new_subsurface(wlr_subsurface* subsurface);
    void handle_role_destroy(SurfaceHooks* hooks);
    /// @p base is null for roles without a ping, i.e. subsurfaces.
    void watch_role(SurfaceHooks* hooks, wl_signal* role_destroy, wlr_xdg_surface* base);
    void sync_subsurface_position(SurfaceHooks* hooks);

    [[nodiscard]] auto find_surface(SurfaceId id) const -> SurfaceHooks*;

    // ProtocolSink
    void send_frame_done(SurfaceId surface, uint32_t time_ms) override;
    void disconnect_client(ClientId client, const Error& error) override;
    void configure_output(const Output& output_config) override;
    void configure_toplevel(SurfaceId surface, uint32_t width, uint32_t height) override;
    void set_keyboard_focus(SurfaceId surface) override;
    void deliver_input(SurfaceId surface, const InputEvent& event, double local_x,
                       double local_y) override;
};

CompositorServer::CompositorServer(CompositorServerConfig config,
                                   render::RenderBackendFactory backend_factory)
    : m_impl(std::make_unique<Impl>(std::move(config), std::move(backend_factory))) {}

CompositorServer::~CompositorServer() {
    stop();
}

auto CompositorServer::create(CompositorServerConfig config,
                              render::RenderBackendFactory backend_factory,
                              FatalHandler fatal_handler) -> ResultPtr<CompositorServer> {
    auto server = std::make_unique<CompositorServer>(std::move(config), std::move(backend_factory));
    server->m_impl->core.set_fatal_handler(std::move(fatal_handler));

    auto start_result = server->start();
    if (!start_result) {
        return make_result_ptr_error<CompositorServer>(start_result.error().code,
                                                       start_result.error().message);
    }
    return make_result_ptr(std::move(server));
}

auto CompositorServer::wayland_display() const -> std::string {
    return m_impl->wayland_socket_name;
}

auto CompositorServer::socket_path() const -> std::filesystem::path {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    if (runtime_dir == nullptr || m_impl->wayland_socket_name.empty()) {
        return {};
    }
    return std::filesystem::path(runtime_dir) / m_impl->wayland_socket_name;
}

auto CompositorServer::post_host_event(const HostEvent& event) -> bool {
    return m_impl->core.post_host_event(event);
}

// =============================================================================
// Setup
// =============================================================================

auto CompositorServer::Impl::setup_base_components() -> Result<void> {
    wlr_log_init(wlr_importance_from_log_level(get_logger()->level()), wlr_log_bridge);

    display = wl_display_create();
    if (!display) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create Wayland display");
    }

    event_loop = wl_display_get_event_loop(display);
    if (!event_loop) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to get event loop");
    }

    backend = wlr_headless_backend_create(event_loop);
    if (!backend) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create headless backend");
    }

    renderer = wlr_renderer_autocreate(backend);
    if (!renderer) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create renderer");
    }

    allocator = wlr_allocator_autocreate(backend, renderer);
    if (!allocator) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create allocator");
    }
    return {};
}

auto CompositorServer::Impl::create_globals() -> Result<void> {
    if (!wlr_shm_create(display, 1, SHM_FORMATS.data(), SHM_FORMATS.size())) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create wl_shm");
    }

    compositor = wlr_compositor_create(display, 6, renderer);
    if (!compositor) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create compositor");
    }
    wl_list_init(&listeners.new_surface.link);
    listeners.new_surface.notify = [](wl_listener* listener, void* data) {
        auto* list = hooks_from<Listeners>(listener, offsetof(Listeners, new_surface));
        list->impl->handle_new_surface(static_cast<wlr_surface*>(data));
    };
    wl_signal_add(&compositor->events.new_surface, &listeners.new_surface);

    if (!wlr_subcompositor_create(display)) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create subcompositor");
    }
    if (!wlr_data_device_manager_create(display)) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create data device manager");
    }

    output_layout = wlr_output_layout_create(display);
    if (!output_layout) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create output layout");
    }

    wl_list_init(&listeners.client_created.link);
    listeners.client_created.notify = [](wl_listener* listener, void* data) {
        auto* list = hooks_from<Listeners>(listener, offsetof(Listeners, client_created));
        list->impl->handle_client_created(static_cast<wl_client*>(data));
    };
    wl_display_add_client_created_listener(display, &listeners.client_created);
    return {};
}

auto CompositorServer::Impl::setup_xdg_shell() -> Result<void> {
    xdg_shell = wlr_xdg_shell_create(display, 3);
    if (!xdg_shell) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create xdg-shell");
    }
    xdg_shell->ping_timeout = config.ping_timeout_ms;

    wl_list_init(&listeners.new_xdg_toplevel.link);
    listeners.new_xdg_toplevel.notify = [](wl_listener* listener, void* data) {
        auto* list = hooks_from<Listeners>(listener, offsetof(Listeners, new_xdg_toplevel));
        list->impl->handle_new_xdg_toplevel(static_cast<wlr_xdg_toplevel*>(data));
    };
    wl_signal_add(&xdg_shell->events.new_toplevel, &listeners.new_xdg_toplevel);

    wl_list_init(&listeners.new_xdg_popup.link);
    listeners.new_xdg_popup.notify = [](wl_listener* listener, void* data) {
        auto* list = hooks_from<Listeners>(listener, offsetof(Listeners, new_xdg_popup));
        list->impl->handle_new_xdg_popup(static_cast<wlr_xdg_popup*>(data));
    };
    wl_signal_add(&xdg_shell->events.new_popup, &listeners.new_xdg_popup);

    ping_timer = wl_event_loop_add_timer(
        event_loop,
        [](void* data) -> int {
            auto* impl = static_cast<Impl*>(data);
            impl->ping_toplevels();
            impl->arm_ping_timer();
            return 0;
        },
        this);
    if (!ping_timer) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create ping timer");
    }
    arm_ping_timer();
    return {};
}

auto CompositorServer::Impl::setup_input_devices() -> Result<void> {
    seat = wlr_seat_create(display, "seat0");
    if (!seat) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create seat");
    }
    wlr_seat_set_capabilities(seat, WL_SEAT_CAPABILITY_KEYBOARD | WL_SEAT_CAPABILITY_POINTER |
                                        WL_SEAT_CAPABILITY_TOUCH);

    xkb_ctx = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    if (!xkb_ctx) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create xkb context");
    }

    xkb_keymap* keymap = xkb_keymap_new_from_names(xkb_ctx, nullptr, XKB_KEYMAP_COMPILE_NO_FLAGS);
    if (!keymap) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create xkb keymap");
    }

    keyboard.init(keymap);
    xkb_keymap_unref(keymap);
    wlr_seat_set_keyboard(seat, keyboard.get());
    return {};
}

auto CompositorServer::Impl::setup_event_loop_fd() -> Result<void> {
    int efd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (efd < 0) {
        return make_error<void>(ErrorCode::compositor_init_failed, "Failed to create eventfd");
    }
    event_fd = util::UniqueFd(efd);

    event_source = wl_event_loop_add_fd(
        event_loop, event_fd.get(), WL_EVENT_READABLE,
        [](int /*fd*/, uint32_t /*mask*/, void* data) -> int {
            auto* impl = static_cast<Impl*>(data);
            uint64_t val = 0;
            // eventfd guarantees 8-byte atomic read when readable
            (void)read(impl->event_fd.get(), &val, sizeof(val));
            if (impl->core.process_host_events()) {
                // Bounded per tick; the rest is picked up on the next wakeup.
                impl->wake_event_loop();
            }
            return 0;
        },
        this);

    if (!event_source) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to add eventfd to event loop");
    }
    return {};
}

auto CompositorServer::Impl::start_backend() -> Result<void> {
    if (!wlr_backend_start(backend)) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to start wlroots backend");
    }
    return {};
}

auto CompositorServer::Impl::setup_output() -> Result<void> {
    output = wlr_headless_add_output(backend, config.width, config.height);
    if (!output) {
        return make_error<void>(ErrorCode::compositor_init_failed,
                                "Failed to create headless output");
    }
    wlr_output_init_render(output, allocator, renderer);
    wlr_output_layout_add_auto(output_layout, output);
    core.create_output(config.width, config.height);
    return {};
}

void CompositorServer::Impl::start_compositor_thread() {
    compositor_thread = std::jthread([this] { wl_display_run(display); });
}

auto CompositorServer::start() -> Result<void> {
    auto& impl = *m_impl;
    auto cleanup_on_error = [this](void*) { stop(); };
    std::unique_ptr<void, decltype(cleanup_on_error)> guard(this, cleanup_on_error);

    POLARBEAR_TRY(impl.setup_base_components());
    POLARBEAR_TRY(impl.create_globals());
    POLARBEAR_TRY(impl.setup_xdg_shell());
    POLARBEAR_TRY(impl.setup_input_devices());
    POLARBEAR_TRY(impl.setup_event_loop_fd());

    impl.wayland_socket_name =
        POLARBEAR_TRY(bind_wayland_socket(impl.display, impl.config.socket_name));

    POLARBEAR_TRY(impl.start_backend());
    POLARBEAR_TRY(impl.setup_output());

    impl.start_compositor_thread();
    POLARBEAR_LOG_INFO("Compositor listening on {}", impl.wayland_socket_name);

    guard.release(); // NOLINT(bugprone-unused-return-value)
    return {};
}

void CompositorServer::stop() {
    auto& impl = *m_impl;
    if (!impl.display) {
        return;
    }

    wl_display_terminate(impl.display);

    // Must join before destroying objects thread accesses
    if (impl.compositor_thread.joinable()) {
        impl.compositor_thread.join();
    }

    // Must remove before closing eventfd
    if (impl.event_source) {
        wl_event_source_remove(impl.event_source);
        impl.event_source = nullptr;
    }
    if (impl.ping_timer) {
        wl_event_source_remove(impl.ping_timer);
        impl.ping_timer = nullptr;
    }

    // Clients go first so their surface and destroy hooks run while globals still exist.
    wl_display_destroy_clients(impl.display);
    detach_listener(impl.listeners.client_created);
    detach_listener(impl.listeners.new_surface);
    detach_listener(impl.listeners.new_xdg_toplevel);
    detach_listener(impl.listeners.new_xdg_popup);
    impl.activated_toplevel = nullptr;

    impl.keyboard.reset();
    if (impl.xkb_ctx) {
        xkb_context_unref(impl.xkb_ctx);
        impl.xkb_ctx = nullptr;
    }
    if (impl.seat) {
        wlr_seat_destroy(impl.seat);
        impl.seat = nullptr;
    }

    impl.xdg_shell = nullptr;
    impl.compositor = nullptr;
    impl.output = nullptr;

    if (impl.output_layout) {
        wlr_output_layout_destroy(impl.output_layout);
        impl.output_layout = nullptr;
    }
    if (impl.allocator) {
        wlr_allocator_destroy(impl.allocator);
        impl.allocator = nullptr;
    }
    if (impl.renderer) {
        wlr_renderer_destroy(impl.renderer);
        impl.renderer = nullptr;
    }
    if (impl.backend) {
        wlr_backend_destroy(impl.backend);
        impl.backend = nullptr;
    }

    wl_display_destroy(impl.display);
    impl.display = nullptr;
    impl.event_loop = nullptr;
    impl.disconnect_idle = nullptr;
    impl.wayland_socket_name.clear();
}

// =============================================================================
// Event loop helpers
// =============================================================================

bool CompositorServer::Impl::wake_event_loop() {
    if (!event_fd.valid()) {
        return false;
    }
    uint64_t val = 1;
    auto ret = write(event_fd.get(), &val, sizeof(val));
    return ret == sizeof(val);
}

void CompositorServer::Impl::arm_ping_timer() {
    wl_event_source_timer_update(ping_timer, static_cast<int>(config.ping_timeout_ms));
}

void CompositorServer::Impl::ping_toplevels() {
    for (auto& [id, hooks] : surfaces) {
        if (hooks->toplevel && hooks->toplevel->base->initialized) {
            wlr_xdg_surface_ping(hooks->toplevel->base);
        }
    }
}

void CompositorServer::Impl::flush_disconnects() {
    disconnect_idle = nullptr;
    auto pending = std::move(pending_disconnects);
    pending_disconnects.clear();
    for (ClientId id : pending) {
        auto it = clients.find(id);
        if (it != clients.end()) {
            wl_client_destroy(it->second->client);
        }
    }
}

auto CompositorServer::Impl::find_surface(SurfaceId id) const -> SurfaceHooks* {
    auto it = surfaces.find(id);
    return it == surfaces.end() ? nullptr : it->second.get();
}

// =============================================================================
// Clients
// =============================================================================

void CompositorServer::Impl::handle_client_created(wl_client* client) {
    pid_t pid = 0;
    wl_client_get_credentials(client, &pid, nullptr, nullptr);

    auto hooks = std::make_unique<ClientHooks>();
    hooks->impl = this;
    hooks->client = client;
    hooks->id = core.accept_client(pid);

    wl_list_init(&hooks->destroy.link);
    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<ClientHooks>(listener, offsetof(ClientHooks, destroy));
        h->impl->handle_client_destroy(h);
    };
    wl_client_add_destroy_listener(client, &hooks->destroy);

    wl_list_init(&hooks->resource_created.link);
    hooks->resource_created.notify = [](wl_listener* listener, void* data) {
        auto* h = hooks_from<ClientHooks>(listener, offsetof(ClientHooks, resource_created));
        h->impl->handle_client_resource(h, static_cast<wl_resource*>(data));
    };
    wl_client_add_resource_created_listener(client, &hooks->resource_created);

    clients_by_handle[client] = hooks.get();
    clients.emplace(hooks->id, std::move(hooks));
}

void CompositorServer::Impl::handle_client_resource(ClientHooks* hooks, wl_resource* resource) {
    const char* cls = wl_resource_get_class(resource);
    // Bookkeeping objects do not count as binding a global.
    if (std::strcmp(cls, "wl_registry") == 0 || std::strcmp(cls, "wl_callback") == 0 ||
        std::strcmp(cls, "wl_display") == 0) {
        return;
    }
    hooks->bound = true;
    core.bind_client(hooks->id);
    detach_listener(hooks->resource_created);
}

void CompositorServer::Impl::handle_client_destroy(ClientHooks* hooks) {
    detach_listener(hooks->destroy);
    detach_listener(hooks->resource_created);
    const ClientId id = hooks->id;
    core.client_gone(id);
    std::erase(pending_disconnects, id);
    clients_by_handle.erase(hooks->client);
    clients.erase(id);
}

// =============================================================================
// Surfaces
// =============================================================================

void CompositorServer::Impl::handle_new_surface(wlr_surface* surface) {
    auto client_it = clients_by_handle.find(wl_resource_get_client(surface->resource));
    if (client_it == clients_by_handle.end()) {
        POLARBEAR_LOG_WARN("Surface from untracked client ignored");
        return;
    }
    const ClientId client = client_it->second->id;
    auto created = core.create_surface(client);
    if (!created) {
        POLARBEAR_LOG_WARN("Surface rejected for client {}: {}", client, created.error().message);
        return;
    }

    auto hooks = std::make_unique<SurfaceHooks>();
    hooks->impl = this;
    hooks->surface = surface;
    hooks->id = *created;
    hooks->client = client;

    wl_list_init(&hooks->client_commit.link);
    hooks->client_commit.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, client_commit));
        h->impl->handle_surface_client_commit(h);
    };
    wl_signal_add(&surface->events.client_commit, &hooks->client_commit);

    wl_list_init(&hooks->commit.link);
    hooks->commit.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, commit));
        h->impl->handle_surface_commit(h);
    };
    wl_signal_add(&surface->events.commit, &hooks->commit);

    wl_list_init(&hooks->destroy.link);
    hooks->destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, destroy));
        h->impl->handle_surface_destroy(h);
    };
    wl_signal_add(&surface->events.destroy, &hooks->destroy);

    wl_list_init(&hooks->new_subsurface.link);
    hooks->new_subsurface.notify = [](wl_listener* listener, void* data) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, new_subsurface));
        h->impl->handle_new_subsurface(static_cast<wlr_subsurface*>(data));
    };
    wl_signal_add(&surface->events.new_subsurface, &hooks->new_subsurface);

    wl_list_init(&hooks->role_destroy.link);
    wl_list_init(&hooks->ping_timeout.link);

    surfaces_by_handle[surface] = hooks.get();
    surfaces.emplace(hooks->id, std::move(hooks));
}

void CompositorServer::Impl::handle_surface_client_commit(SurfaceHooks* hooks) {
    const SurfaceId id = hooks->id;
    wlr_surface_state& pending = hooks->surface->pending;

    if ((pending.committed & WLR_SURFACE_STATE_BUFFER) != 0) {
        if (pending.buffer == nullptr) {
            if (!core.detach_buffer(id)) {
                return;
            }
        } else {
            auto buffer = copy_shm_buffer(pending.buffer, next_buffer_id++);
            if (!buffer) {
                core.disconnect(hooks->client, buffer.error());
                return;
            }
            if (!core.attach_buffer(id, std::move(*buffer))) {
                return;
            }
            const pixman_box32_t* box = pixman_region32_extents(&pending.buffer_damage);
            const Rect damage{.x = box->x1,
                              .y = box->y1,
                              .width = box->x2 - box->x1,
                              .height = box->y2 - box->y1};
            if (!damage.empty() && !core.add_damage(id, damage)) {
                return;
            }
        }
    }

    static_cast<void>(core.commit(id));
}

void CompositorServer::Impl::handle_surface_commit(SurfaceHooks* hooks) {
    if (hooks->toplevel && hooks->toplevel->base->initial_commit) {
        if (hooks->configure_width > 0) {
            wlr_xdg_toplevel_set_size(hooks->toplevel, static_cast<int32_t>(hooks->configure_width),
                                      static_cast<int32_t>(hooks->configure_height));
        } else {
            wlr_xdg_surface_schedule_configure(hooks->toplevel->base);
        }
    }
    if (hooks->popup) {
        if (hooks->popup->base->initial_commit) {
            wlr_xdg_surface_schedule_configure(hooks->popup->base);
        }
        const auto& geometry = hooks->popup->current.geometry;
        if (auto moved = core.set_position(hooks->id, geometry.x, geometry.y); !moved) {
            POLARBEAR_LOG_DEBUG("Popup position: {}", moved.error().message);
        }
    }

    // Subsurface offsets are applied with the parent's state.
    sync_subsurface_position(hooks);
    for (auto& entry : surfaces) {
        auto* child = entry.second.get();
        if (child->subsurface && child->subsurface->parent == hooks->surface) {
            sync_subsurface_position(child);
        }
    }

    // client_commit fires before the frame callbacks move to current; a frame-done sent
    // from there would find an empty list.
    core.commit_applied(hooks->id, get_time_msec());
}

void CompositorServer::Impl::sync_subsurface_position(SurfaceHooks* hooks) {
    if (!hooks->subsurface) {
        return;
    }
    const auto& current = hooks->subsurface->current;
    if (auto moved = core.set_position(hooks->id, current.x, current.y); !moved) {
        POLARBEAR_LOG_DEBUG("Subsurface position: {}", moved.error().message);
    }
}

void CompositorServer::Impl::handle_surface_destroy(SurfaceHooks* hooks) {
    detach_listener(hooks->client_commit);
    detach_listener(hooks->commit);
    detach_listener(hooks->destroy);
    detach_listener(hooks->new_subsurface);
    detach_listener(hooks->role_destroy);
    detach_listener(hooks->ping_timeout);

    if (activated_toplevel && activated_toplevel == hooks->toplevel) {
        activated_toplevel = nullptr;
    }
    const SurfaceId id = hooks->id;
    core.destroy_surface(id);
    surfaces_by_handle.erase(hooks->surface);
    surfaces.erase(id);
}

void CompositorServer::Impl::watch_role(SurfaceHooks* hooks, wl_signal* role_destroy,
                                        wlr_xdg_surface* base) {
    detach_listener(hooks->role_destroy);
    hooks->role_destroy.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, role_destroy));
        h->impl->handle_role_destroy(h);
    };
    wl_signal_add(role_destroy, &hooks->role_destroy);

    detach_listener(hooks->ping_timeout);
    if (!base) {
        return;
    }
    hooks->ping_timeout.notify = [](wl_listener* listener, void* /*data*/) {
        auto* h = hooks_from<SurfaceHooks>(listener, offsetof(SurfaceHooks, ping_timeout));
        h->impl->core.disconnect(
            h->client, Error{ErrorCode::protocol_violation,
                             "Client did not answer ping within " +
                                 std::to_string(h->impl->config.ping_timeout_ms) + " ms"});
    };
    wl_signal_add(&base->events.ping_timeout, &hooks->ping_timeout);
}

void CompositorServer::Impl::handle_new_xdg_toplevel(wlr_xdg_toplevel* toplevel) {
    auto it = surfaces_by_handle.find(toplevel->base->surface);
    if (it == surfaces_by_handle.end()) {
        return;
    }
    auto* hooks = it->second;
    hooks->toplevel = toplevel;
    if (!core.set_role(hooks->id, SurfaceRole::toplevel)) {
        hooks->toplevel = nullptr;
        return;
    }
    watch_role(hooks, &toplevel->events.destroy, toplevel->base);
    POLARBEAR_LOG_DEBUG("New toplevel: surface={} client={}", hooks->id, hooks->client);
}

void CompositorServer::Impl::handle_new_xdg_popup(wlr_xdg_popup* popup) {
    auto it = surfaces_by_handle.find(popup->base->surface);
    auto parent_it = surfaces_by_handle.find(popup->parent);
    if (it == surfaces_by_handle.end() || parent_it == surfaces_by_handle.end()) {
        return;
    }
    auto* hooks = it->second;
    hooks->popup = popup;
    if (!core.set_role(hooks->id, SurfaceRole::popup, parent_it->second->id)) {
        hooks->popup = nullptr;
        return;
    }
    watch_role(hooks, &popup->events.destroy, popup->base);
}

void CompositorServer::Impl::handle_new_subsurface(wlr_subsurface* subsurface) {
    auto it = surfaces_by_handle.find(subsurface->surface);
    auto parent_it = surfaces_by_handle.find(subsurface->parent);
    if (it == surfaces_by_handle.end() || parent_it == surfaces_by_handle.end()) {
        return;
    }
    auto* hooks = it->second;
    if (!core.set_role(hooks->id, SurfaceRole::subsurface, parent_it->second->id)) {
        return;
    }
    hooks->subsurface = subsurface;
    watch_role(hooks, &subsurface->events.destroy, nullptr);
    sync_subsurface_position(hooks);
    POLARBEAR_LOG_DEBUG("New subsurface: surface={} parent={}", hooks->id,
                        parent_it->second->id);
}

void CompositorServer::Impl::handle_role_destroy(SurfaceHooks* hooks) {
    detach_listener(hooks->role_destroy);
    detach_listener(hooks->ping_timeout);
    if (activated_toplevel && activated_toplevel == hooks->toplevel) {
        activated_toplevel = nullptr;
    }
    hooks->toplevel = nullptr;
    hooks->popup = nullptr;
    hooks->subsurface = nullptr;
    // The role object is gone but the wl_surface lives on unmapped.
    if (core.detach_buffer(hooks->id)) {
        static_cast<void>(core.commit(hooks->id));
    }
}

// =============================================================================
// ProtocolSink
// =============================================================================

void CompositorServer::Impl::send_frame_done(SurfaceId surface, uint32_t /*time_ms*/) {
    auto* hooks = find_surface(surface);
    if (!hooks) {
        return;
    }
    timespec now{};
    clock_gettime(CLOCK_MONOTONIC, &now);
    wlr_surface_send_frame_done(hooks->surface, &now);
}

void CompositorServer::Impl::disconnect_client(ClientId client, const Error& error) {
    auto it = clients.find(client);
    if (it == clients.end()) {
        return;
    }
    wl_client_post_implementation_error(it->second->client, "%s", error.message.c_str());
    // Destroying inside a request dispatch would free objects still on the stack.
    pending_disconnects.push_back(client);
    if (!disconnect_idle) {
        disconnect_idle = wl_event_loop_add_idle(
            event_loop, [](void* data) { static_cast<Impl*>(data)->flush_disconnects(); }, this);
    }
}

void CompositorServer::Impl::configure_output(const Output& output_config) {
    if (!output) {
        return;
    }
    wlr_output_state state;
    wlr_output_state_init(&state);
    wlr_output_state_set_enabled(&state, true);
    wlr_output_state_set_custom_mode(&state, static_cast<int32_t>(output_config.width),
                                     static_cast<int32_t>(output_config.height),
                                     static_cast<int32_t>(output_config.refresh_mhz));
    wlr_output_state_set_scale(&state, static_cast<float>(output_config.scale));
    if (!wlr_output_commit_state(output, &state)) {
        POLARBEAR_LOG_WARN("Output mode {}x{} rejected", output_config.width,
                           output_config.height);
    }
    wlr_output_state_finish(&state);
}

void CompositorServer::Impl::configure_toplevel(SurfaceId surface, uint32_t width,
                                                uint32_t height) {
    auto* hooks = find_surface(surface);
    if (!hooks) {
        return;
    }
    hooks->configure_width = width;
    hooks->configure_height = height;
    // Before the initial commit the size is sent from handle_surface_commit().
    if (hooks->toplevel && hooks->toplevel->base->initialized) {
        wlr_xdg_toplevel_set_size(hooks->toplevel, static_cast<int32_t>(width),
                                  static_cast<int32_t>(height));
    }
}

void CompositorServer::Impl::set_keyboard_focus(SurfaceId surface) {
    auto* hooks = find_surface(surface);
    if (!hooks) {
        wlr_seat_keyboard_clear_focus(seat);
        return;
    }
    if (activated_toplevel && activated_toplevel != hooks->toplevel &&
        activated_toplevel->base->initialized) {
        wlr_xdg_toplevel_set_activated(activated_toplevel, false);
    }
    if (hooks->toplevel && hooks->toplevel->base->initialized) {
        wlr_xdg_toplevel_set_activated(hooks->toplevel, true);
        activated_toplevel = hooks->toplevel;
    }
    wlr_seat_set_keyboard(seat, keyboard.get());
    wlr_seat_keyboard_notify_enter(seat, hooks->surface, keyboard->keycodes,
                                   keyboard->num_keycodes, &keyboard->modifiers);
}

void CompositorServer::Impl::deliver_input(SurfaceId surface, const InputEvent& event,
                                           double local_x, double local_y) {
    auto* hooks = find_surface(surface);
    if (!hooks) {
        return;
    }
    const uint32_t time = event.time_ms != 0 ? event.time_ms : get_time_msec();

    switch (event.type) {
    case InputEventType::key: {
        if (seat->keyboard_state.focused_surface != hooks->surface) {
            wlr_seat_keyboard_notify_enter(seat, hooks->surface, keyboard->keycodes,
                                           keyboard->num_keycodes, &keyboard->modifiers);
        }
        auto state = event.pressed ? WL_KEYBOARD_KEY_STATE_PRESSED : WL_KEYBOARD_KEY_STATE_RELEASED;
        wlr_seat_keyboard_notify_key(seat, time, event.code, state);
        break;
    }
    case InputEventType::touch_down:
        wlr_seat_touch_notify_down(seat, hooks->surface, time, event.touch_id, local_x, local_y);
        wlr_seat_touch_notify_frame(seat);
        break;
    case InputEventType::touch_motion:
        wlr_seat_touch_notify_motion(seat, time, event.touch_id, local_x, local_y);
        wlr_seat_touch_notify_frame(seat);
        break;
    case InputEventType::touch_up:
        wlr_seat_touch_notify_up(seat, time, event.touch_id);
        wlr_seat_touch_notify_frame(seat);
        break;
    case InputEventType::pointer_motion:
        if (seat->pointer_state.focused_surface != hooks->surface) {
            wlr_seat_pointer_notify_enter(seat, hooks->surface, local_x, local_y);
        }
        wlr_seat_pointer_notify_motion(seat, time, local_x, local_y);
        wlr_seat_pointer_notify_frame(seat);
        break;
    case InputEventType::pointer_button: {
        auto state =
            event.pressed ? WL_POINTER_BUTTON_STATE_PRESSED : WL_POINTER_BUTTON_STATE_RELEASED;
        wlr_seat_pointer_notify_button(seat, time, event.code, state);
        wlr_seat_pointer_notify_frame(seat);
        break;
    }
    case InputEventType::pointer_axis: {
        auto orientation =
            event.horizontal ? WL_POINTER_AXIS_HORIZONTAL_SCROLL : WL_POINTER_AXIS_VERTICAL_SCROLL;
        wlr_seat_pointer_notify_axis(seat, time, orientation, event.value,
                                     0, // value_discrete (legacy)
                                     WL_POINTER_AXIS_SOURCE_WHEEL,
                                     WL_POINTER_AXIS_RELATIVE_DIRECTION_IDENTICAL);
        wlr_seat_pointer_notify_frame(seat);
        break;
    }
    }
}

} // namespace polarbear::compositor
