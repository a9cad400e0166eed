#pragma once

#include <util/error.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

namespace polarbear::compositor {

using ClientId = uint32_t;
using SurfaceId = uint32_t;

inline constexpr SurfaceId NO_SURFACE = 0;

struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    [[nodiscard]] auto empty() const -> bool { return width <= 0 || height <= 0; }

    [[nodiscard]] auto contains(double px, double py) const -> bool {
        return px >= x && py >= y && px < static_cast<double>(x) + width &&
               py < static_cast<double>(y) + height;
    }

    /// Bounding box of both rectangles; an empty side is ignored.
    [[nodiscard]] auto united(const Rect& other) const -> Rect {
        if (empty()) {
            return other;
        }
        if (other.empty()) {
            return *this;
        }
        const int32_t left = std::min(x, other.x);
        const int32_t top = std::min(y, other.y);
        const int32_t right = std::max(x + width, other.x + other.width);
        const int32_t bottom = std::max(y + height, other.y + other.height);
        return Rect{.x = left, .y = top, .width = right - left, .height = bottom - top};
    }

    [[nodiscard]] auto intersected(const Rect& other) const -> Rect {
        const int32_t left = std::max(x, other.x);
        const int32_t top = std::max(y, other.y);
        const int32_t right = std::min(x + width, other.x + other.width);
        const int32_t bottom = std::min(y + height, other.y + other.height);
        if (right <= left || bottom <= top) {
            return Rect{};
        }
        return Rect{.x = left, .y = top, .width = right - left, .height = bottom - top};
    }

    auto operator==(const Rect&) const -> bool = default;
};

/// @brief CPU copy of a client buffer in ARGB8888/XRGB8888 (BGRA byte order).
struct Buffer {
    uint64_t id = 0;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t stride = 0;
    bool opaque = false;
    std::shared_ptr<const std::vector<uint8_t>> pixels;
};

enum class ClientState : std::uint8_t { connecting, bound, active };
enum class SurfaceRole : std::uint8_t { none, toplevel, popup, subsurface };

[[nodiscard]] constexpr auto to_string(ClientState state) -> const char* {
    switch (state) {
    case ClientState::connecting:
        return "connecting";
    case ClientState::bound:
        return "bound";
    case ClientState::active:
        return "active";
    }
    return "unknown";
}

struct Client {
    ClientId id = 0;
    pid_t pid = 0;
    ClientState state = ClientState::connecting;
    std::vector<SurfaceId> surfaces;
};

struct Surface {
    SurfaceId id = NO_SURFACE;
    ClientId client = 0;
    SurfaceRole role = SurfaceRole::none;
    SurfaceId parent = NO_SURFACE;
    /// Output position; parent-relative offset for subsurfaces.
    int32_t x = 0;
    int32_t y = 0;

    std::optional<Buffer> pending;
    bool pending_detach = false;
    Rect pending_damage{};

    std::optional<Buffer> committed;
    /// Committed buffer not yet consumed by a frame and acknowledged via frame-done.
    bool awaiting_ack = false;
    /// Coalesced damage since the last composited frame, in surface coordinates.
    Rect damage{};
    uint64_t commit_seq = 0;

    [[nodiscard]] auto mapped() const -> bool {
        return committed.has_value() && role != SurfaceRole::none;
    }
    [[nodiscard]] auto bounds() const -> Rect {
        if (!committed) {
            return Rect{.x = x, .y = y};
        }
        return Rect{.x = x,
                    .y = y,
                    .width = static_cast<int32_t>(committed->width),
                    .height = static_cast<int32_t>(committed->height)};
    }
};

struct Output {
    uint32_t width = 0;
    uint32_t height = 0;
    double scale = 1.0;
    uint32_t refresh_mhz = 60000;

    [[nodiscard]] auto logical_width() const -> uint32_t {
        return static_cast<uint32_t>(static_cast<double>(width) / scale);
    }
    [[nodiscard]] auto logical_height() const -> uint32_t {
        return static_cast<uint32_t>(static_cast<double>(height) / scale);
    }
};

enum SeatCapability : uint8_t {
    SEAT_POINTER = 1U << 0U,
    SEAT_KEYBOARD = 1U << 1U,
    SEAT_TOUCH = 1U << 2U,
};

struct Seat {
    uint8_t capabilities = SEAT_POINTER | SEAT_KEYBOARD | SEAT_TOUCH;
    SurfaceId keyboard_focus = NO_SURFACE;
    SurfaceId pointer_focus = NO_SURFACE;
    std::map<int32_t, SurfaceId> touch_focus;
    double pointer_x = 0.0;
    double pointer_y = 0.0;
};

/// @brief One committed buffer placed on the output, bottom-most first in a snapshot.
struct CompositeLayer {
    SurfaceId surface = NO_SURFACE;
    int32_t x = 0;
    int32_t y = 0;
    Buffer buffer;
    Rect damage{};
};

struct SceneSnapshot {
    Output output;
    std::vector<CompositeLayer> layers;
};

/// @brief Protocol-independent compositor state: clients, surfaces, output and seat.
///
/// Mutated only from the compositor thread. Operations that a well-behaved client could not
/// trigger return `protocol_violation`; the caller disconnects the offending client.
class Scene {
public:
    Scene() = default;

    [[nodiscard]] auto accept_client(pid_t pid = 0) -> ClientId;
    [[nodiscard]] auto bind_client(ClientId client) -> Result<void>;
    /// Forgets the client and drops its surfaces. Returns the dropped surface ids.
    auto disconnect_client(ClientId client, std::string reason) -> std::vector<SurfaceId>;

    [[nodiscard]] auto create_surface(ClientId client) -> Result<SurfaceId>;
    [[nodiscard]] auto destroy_surface(SurfaceId surface) -> Result<void>;
    [[nodiscard]] auto set_role(SurfaceId surface, SurfaceRole role, SurfaceId parent = NO_SURFACE)
        -> Result<void>;
    [[nodiscard]] auto set_position(SurfaceId surface, int32_t x, int32_t y) -> Result<void>;

    /// Fails with `protocol_violation` while an earlier buffer is uncommitted or unacknowledged.
    [[nodiscard]] auto attach_buffer(SurfaceId surface, Buffer buffer) -> Result<void>;
    [[nodiscard]] auto detach_buffer(SurfaceId surface) -> Result<void>;
    [[nodiscard]] auto add_damage(SurfaceId surface, Rect damage) -> Result<void>;
    [[nodiscard]] auto commit(SurfaceId surface) -> Result<void>;

    auto create_output(const Output& output) -> const Output&;
    [[nodiscard]] auto output() const -> const Output& { return m_output; }
    [[nodiscard]] auto has_output() const -> bool { return m_output.width > 0; }

    void raise(SurfaceId surface);
    [[nodiscard]] auto surface_at(double x, double y) const -> SurfaceId;
    /// The top-level ancestor of @p surface, or the surface itself.
    [[nodiscard]] auto root_of(SurfaceId surface) const -> SurfaceId;
    /// Output-space rectangle of the committed buffer, with subsurface offsets resolved.
    [[nodiscard]] auto placement(SurfaceId surface) const -> Rect;
    /// Mapped, and for subsurfaces every ancestor is visible too.
    [[nodiscard]] auto visible(SurfaceId surface) const -> bool;

    [[nodiscard]] auto snapshot() const -> SceneSnapshot;
    /// Clears acknowledgement and damage state of composited surfaces; returns those still alive.
    /// Subsurfaces hidden behind an unmapped ancestor are released as well.
    auto mark_consumed(const SceneSnapshot& snapshot) -> std::vector<SurfaceId>;

    [[nodiscard]] auto client(ClientId id) const -> const Client*;
    [[nodiscard]] auto surface(SurfaceId id) const -> const Surface*;
    [[nodiscard]] auto surfaces_in_order() const -> const std::vector<SurfaceId>& {
        return m_stack;
    }
    [[nodiscard]] auto toplevels() const -> std::vector<SurfaceId>;
    [[nodiscard]] auto live_client_count() const -> size_t;

    [[nodiscard]] auto seat() -> Seat& { return m_seat; }
    [[nodiscard]] auto seat() const -> const Seat& { return m_seat; }

    /// Enforce one in-flight buffer per surface; disabled only for lenient clients.
    void set_strict_backpressure(bool strict) { m_strict_backpressure = strict; }

private:
    [[nodiscard]] auto live_surface(SurfaceId id) -> Result<Surface*>;
    [[nodiscard]] auto descends_from(SurfaceId surface, SurfaceId ancestor) const -> bool;
    void stack_above_parent(SurfaceId surface);
    void forget_surface(SurfaceId id);

    std::unordered_map<ClientId, Client> m_clients;
    std::unordered_map<SurfaceId, Surface> m_surfaces;
    std::vector<SurfaceId> m_stack;
    Output m_output{};
    Seat m_seat{};
    ClientId m_next_client = 1;
    SurfaceId m_next_surface = 1;
    bool m_strict_backpressure = true;
};

} // namespace polarbear::compositor
