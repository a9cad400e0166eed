#include "compositor/compositor_core.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <vector>

using namespace polarbear;
using namespace polarbear::compositor;

namespace {

struct BackendLog {
    int created = 0;
    int composites = 0;
    int presents = 0;
    std::vector<std::pair<uint32_t, uint32_t>> resizes;
    std::vector<CompositeLayer> last_layers;
    /// Error codes returned by upcoming composite() calls, consumed front first.
    std::vector<ErrorCode> composite_failures;
    bool fail_create = false;
};

class FakeBackend : public render::RenderBackend {
public:
    explicit FakeBackend(BackendLog& log) : m_log(log) {}

    [[nodiscard]] auto resize(uint32_t width, uint32_t height) -> Result<void> override {
        m_log.resizes.emplace_back(width, height);
        return {};
    }

    [[nodiscard]] auto composite(const SceneSnapshot& snapshot)
        -> Result<render::FrameStats> override {
        ++m_log.composites;
        m_log.last_layers = snapshot.layers;
        if (!m_log.composite_failures.empty()) {
            auto code = m_log.composite_failures.front();
            m_log.composite_failures.erase(m_log.composite_failures.begin());
            return make_error<render::FrameStats>(code, "injected failure");
        }
        return render::FrameStats{
            .frame_index = static_cast<uint64_t>(m_log.composites),
            .layers_drawn = static_cast<uint32_t>(snapshot.layers.size()),
        };
    }

    [[nodiscard]] auto present() -> Result<void> override {
        ++m_log.presents;
        return {};
    }

private:
    BackendLog& m_log;
};

struct RecordingSink : ProtocolSink {
    std::vector<SurfaceId> frame_done;
    std::vector<ClientId> disconnected;
    std::vector<Output> outputs;
    std::vector<std::pair<SurfaceId, uint32_t>> toplevel_configures;
    std::vector<SurfaceId> focus_changes;
    struct Delivered {
        SurfaceId surface;
        InputEventType type;
        double x;
        double y;
    };
    std::vector<Delivered> input;

    void send_frame_done(SurfaceId surface, uint32_t /*time_ms*/) override {
        frame_done.push_back(surface);
    }
    void disconnect_client(ClientId client, const Error& /*error*/) override {
        disconnected.push_back(client);
    }
    void configure_output(const Output& output) override { outputs.push_back(output); }
    void configure_toplevel(SurfaceId surface, uint32_t width, uint32_t /*height*/) override {
        toplevel_configures.emplace_back(surface, width);
    }
    void set_keyboard_focus(SurfaceId surface) override { focus_changes.push_back(surface); }
    void deliver_input(SurfaceId surface, const InputEvent& event, double local_x,
                       double local_y) override {
        input.push_back({surface, event.type, local_x, local_y});
    }
};

auto make_buffer(uint64_t id, uint32_t width, uint32_t height) -> Buffer {
    return Buffer{
        .id = id,
        .width = width,
        .height = height,
        .stride = width * 4U,
        .pixels = std::make_shared<const std::vector<uint8_t>>(
            static_cast<size_t>(width) * height * 4U, uint8_t{0}),
    };
}

struct CoreFixture {
    BackendLog log;
    RecordingSink sink;
    std::vector<Error> fatal;
    int native_handle = 0;
    CompositorCore core;

    explicit CoreFixture(CoreConfig config = {})
        : core(config, make_factory(), sink) {
        core.set_fatal_handler([this](const Error& error) { fatal.push_back(error); });
    }

    auto make_factory() -> render::RenderBackendFactory {
        return [this](const NativeSurface& /*surface*/) -> ResultPtr<render::RenderBackend> {
            if (log.fail_create) {
                return make_result_ptr_error<render::RenderBackend>(
                    ErrorCode::no_compatible_config, "no config");
            }
            ++log.created;
            return make_result_ptr<render::RenderBackend>(std::make_unique<FakeBackend>(log));
        };
    }

    void supply(uint32_t width, uint32_t height) {
        REQUIRE(core.post_host_event(HostEvent{
            .type = HostEventType::surface_supplied,
            .surface = NativeSurface{.handle = &native_handle, .width = width, .height = height},
        }));
    }

    void vsync(uint64_t ns = 16'000'000) {
        REQUIRE(core.post_host_event(HostEvent{.type = HostEventType::vsync, .vsync_ns = ns}));
        static_cast<void>(core.process_host_events());
    }

    auto mapped_toplevel(uint64_t buffer_id, int32_t x = 0, int32_t y = 0) -> SurfaceId {
        const ClientId client = core.accept_client();
        core.bind_client(client);
        auto surface = core.create_surface(client);
        REQUIRE(surface.has_value());
        REQUIRE(core.set_role(*surface, SurfaceRole::toplevel).has_value());
        REQUIRE(core.set_position(*surface, x, y).has_value());
        REQUIRE(core.attach_buffer(*surface, make_buffer(buffer_id, 100, 100)).has_value());
        REQUIRE(core.commit(*surface).has_value());
        return *surface;
    }
};

auto input_event(InputEventType type, double x, double y) -> HostEvent {
    return HostEvent{
        .type = HostEventType::input,
        .input = InputEvent{.type = type, .pressed = true, .x = x, .y = y},
    };
}

} // namespace

TEST_CASE("Surface supply creates backend and output", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(1920, 1080);
    static_cast<void>(fx.core.process_host_events());

    REQUIRE(fx.core.has_backend());
    REQUIRE(fx.log.created == 1);
    REQUIRE(fx.core.backend_generation() == 1);
    REQUIRE(fx.sink.outputs.size() == 1);
    REQUIRE(fx.sink.outputs.front().width == 1920);
    REQUIRE(fx.log.resizes.back() == std::pair<uint32_t, uint32_t>{1920, 1080});

    SECTION("Resupplying the same handle resizes without recreating") {
        fx.supply(1280, 720);
        static_cast<void>(fx.core.process_host_events());
        REQUIRE(fx.log.created == 1);
        REQUIRE(fx.core.scene().output().width == 1280);
        REQUIRE(fx.log.resizes.back() == std::pair<uint32_t, uint32_t>{1280, 720});
    }

    SECTION("Surface destroyed drops the backend") {
        REQUIRE(fx.core.post_host_event(HostEvent{.type = HostEventType::surface_destroyed}));
        static_cast<void>(fx.core.process_host_events());
        REQUIRE_FALSE(fx.core.has_backend());
        fx.vsync();
        REQUIRE(fx.log.composites == 0);
    }
}

TEST_CASE("Backend creation failure is fatal", "[compositor_core]") {
    CoreFixture fx;
    fx.log.fail_create = true;
    fx.supply(640, 480);
    static_cast<void>(fx.core.process_host_events());

    REQUIRE_FALSE(fx.core.has_backend());
    REQUIRE(fx.fatal.size() == 1);
    REQUIRE(fx.fatal.front().code == ErrorCode::no_compatible_config);
}

TEST_CASE("Vsync renders and releases frame-done", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());

    const SurfaceId surface = fx.mapped_toplevel(1);
    REQUIRE(fx.sink.toplevel_configures.size() == 1);
    REQUIRE(fx.sink.focus_changes == std::vector<SurfaceId>{surface});

    fx.vsync();
    REQUIRE(fx.log.composites == 1);
    REQUIRE(fx.log.presents == 1);
    REQUIRE(fx.sink.frame_done == std::vector<SurfaceId>{surface});
    REQUIRE_FALSE(fx.core.scene().surface(surface)->awaiting_ack);

    SECTION("No vsync means no frame") {
        static_cast<void>(fx.core.process_host_events());
        REQUIRE(fx.log.composites == 1);
    }

    SECTION("Paused compositor skips frames until resumed") {
        REQUIRE(fx.core.post_host_event(HostEvent{.type = HostEventType::pause}));
        fx.vsync();
        REQUIRE(fx.core.is_paused());
        REQUIRE(fx.log.composites == 1);

        REQUIRE(fx.core.post_host_event(HostEvent{.type = HostEventType::resume}));
        fx.vsync();
        REQUIRE(fx.log.composites == 2);
    }
}

TEST_CASE("Context loss recreates the backend without acknowledging", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());
    const SurfaceId surface = fx.mapped_toplevel(1);

    fx.log.composite_failures.push_back(ErrorCode::context_lost);
    fx.vsync();
    REQUIRE(fx.log.created == 2);
    REQUIRE(fx.core.backend_generation() == 2);
    REQUIRE(fx.sink.frame_done.empty());
    REQUIRE(fx.core.scene().surface(surface)->awaiting_ack);
    REQUIRE(fx.fatal.empty());

    fx.vsync();
    REQUIRE(fx.sink.frame_done == std::vector<SurfaceId>{surface});
}

TEST_CASE("Per-frame render errors do not acknowledge or abort", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());
    static_cast<void>(fx.mapped_toplevel(1));

    fx.log.composite_failures.push_back(ErrorCode::render_failed);
    fx.vsync();
    REQUIRE(fx.log.created == 1);
    REQUIRE(fx.sink.frame_done.empty());
    REQUIRE(fx.fatal.empty());
}

TEST_CASE("Protocol violations disconnect the client", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());
    const SurfaceId surface = fx.mapped_toplevel(1);
    const ClientId owner = fx.core.scene().surface(surface)->client;

    auto early = fx.core.attach_buffer(surface, make_buffer(2, 100, 100));
    REQUIRE(!early);
    REQUIRE(fx.sink.disconnected == std::vector<ClientId>{owner});
    REQUIRE(fx.core.scene().surface(surface) == nullptr);
    REQUIRE(fx.core.scene().client(owner) == nullptr);

    fx.vsync();
    REQUIRE(fx.sink.frame_done.empty());
}

TEST_CASE("Unbound client creating a surface is disconnected", "[compositor_core]") {
    CoreFixture fx;
    const ClientId client = fx.core.accept_client();
    REQUIRE(!fx.core.create_surface(client));
    REQUIRE(fx.sink.disconnected == std::vector<ClientId>{client});
}

TEST_CASE("Input routing", "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());
    const SurfaceId back = fx.mapped_toplevel(1, 0, 0);
    const SurfaceId front = fx.mapped_toplevel(2, 200, 200);
    fx.sink.focus_changes.clear();

    SECTION("Keys go to the keyboard focus") {
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::key, 0, 0)));
        static_cast<void>(fx.core.process_host_events());
        REQUIRE(fx.sink.input.size() == 1);
        REQUIRE(fx.sink.input.front().surface == front);
    }

    SECTION("Touch down focuses, raises and translates coordinates") {
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::touch_down, 10, 20)));
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::touch_motion, 500, 500)));
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::touch_up, 500, 500)));
        static_cast<void>(fx.core.process_host_events());

        REQUIRE(fx.sink.focus_changes == std::vector<SurfaceId>{back});
        REQUIRE(fx.core.scene().surfaces_in_order().back() == back);
        REQUIRE(fx.sink.input.size() == 3);
        for (const auto& delivered : fx.sink.input) {
            REQUIRE(delivered.surface == back);
        }
        REQUIRE(fx.sink.input.front().x == 10.0);
        REQUIRE(fx.sink.input.front().y == 20.0);
        REQUIRE(fx.core.scene().seat().touch_focus.empty());
    }

    SECTION("Pointer motion tracks focus and buttons use the last position") {
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::pointer_motion, 250, 260)));
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::pointer_button, 0, 0)));
        static_cast<void>(fx.core.process_host_events());

        REQUIRE(fx.sink.input.size() == 2);
        REQUIRE(fx.sink.input[1].surface == front);
        REQUIRE(fx.sink.input[1].x == 50.0);
        REQUIRE(fx.sink.input[1].y == 60.0);
    }

    SECTION("Touch outside every surface is dropped") {
        REQUIRE(fx.core.post_host_event(input_event(InputEventType::touch_down, 700, 50)));
        static_cast<void>(fx.core.process_host_events());
        REQUIRE(fx.sink.input.empty());
    }
}

TEST_CASE("Role-less surfaces are released once their commit is applied",
          "[compositor_core]") {
    CoreFixture fx;
    const ClientId client = fx.core.accept_client();
    fx.core.bind_client(client);
    auto cursor = fx.core.create_surface(client);
    REQUIRE(cursor.has_value());
    const SurfaceId toplevel = fx.mapped_toplevel(1);

    REQUIRE(fx.core.attach_buffer(*cursor, make_buffer(2, 16, 16)).has_value());
    REQUIRE(fx.core.commit(*cursor).has_value());
    REQUIRE(fx.sink.frame_done.empty());

    fx.core.commit_applied(*cursor, 5);
    REQUIRE(fx.sink.frame_done == std::vector<SurfaceId>{*cursor});

    // Composited surfaces wait for a presented frame instead.
    fx.core.commit_applied(toplevel, 5);
    REQUIRE(fx.sink.frame_done == std::vector<SurfaceId>{*cursor});

    fx.core.destroy_surface(*cursor);
    fx.core.commit_applied(*cursor, 6);
    REQUIRE(fx.sink.frame_done.size() == 1);
}

TEST_CASE("Subsurfaces composite and receive input at their parent offset",
          "[compositor_core]") {
    CoreFixture fx;
    fx.supply(800, 600);
    static_cast<void>(fx.core.process_host_events());
    const SurfaceId parent = fx.mapped_toplevel(1, 100, 100);
    const ClientId owner = fx.core.scene().surface(parent)->client;

    auto child = fx.core.create_surface(owner);
    REQUIRE(child.has_value());
    REQUIRE(fx.core.set_role(*child, SurfaceRole::subsurface, parent).has_value());
    REQUIRE(fx.core.set_position(*child, 20, 30).has_value());
    REQUIRE(fx.core.attach_buffer(*child, make_buffer(2, 40, 40)).has_value());
    REQUIRE(fx.core.commit(*child).has_value());

    fx.vsync();
    REQUIRE(fx.log.last_layers.size() == 2);
    REQUIRE(fx.log.last_layers[0].surface == parent);
    REQUIRE(fx.log.last_layers[1].surface == *child);
    REQUIRE(fx.log.last_layers[1].x == 120);
    REQUIRE(fx.log.last_layers[1].y == 130);
    REQUIRE(std::find(fx.sink.frame_done.begin(), fx.sink.frame_done.end(), *child) !=
            fx.sink.frame_done.end());

    REQUIRE(fx.core.post_host_event(input_event(InputEventType::touch_down, 125, 135)));
    static_cast<void>(fx.core.process_host_events());
    REQUIRE(fx.sink.input.size() == 1);
    REQUIRE(fx.sink.input.front().surface == *child);
    REQUIRE(fx.sink.input.front().x == 5.0);
    REQUIRE(fx.sink.input.front().y == 5.0);
    REQUIRE(fx.sink.focus_changes.back() == parent);
}

TEST_CASE("Host events are bounded per tick", "[compositor_core]") {
    CoreFixture fx(CoreConfig{.max_events_per_tick = 2, .host_queue_capacity = 4});

    int wakes = 0;
    fx.core.set_wake_handler([&wakes] { ++wakes; });

    for (int i = 0; i < 4; ++i) {
        REQUIRE(fx.core.post_host_event(HostEvent{.type = HostEventType::pause}));
    }
    REQUIRE_FALSE(fx.core.post_host_event(HostEvent{.type = HostEventType::pause}));
    REQUIRE(wakes == 4);

    REQUIRE(fx.core.process_host_events());
    REQUIRE_FALSE(fx.core.process_host_events());
}
