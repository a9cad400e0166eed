#include "scene.hpp"

#include <util/logging.hpp>

namespace polarbear::compositor {

auto Scene::accept_client(pid_t pid) -> ClientId {
    const ClientId id = m_next_client++;
    m_clients.emplace(id, Client{.id = id, .pid = pid});
    POLARBEAR_LOG_DEBUG("Client {} connecting (pid={})", id, pid);
    return id;
}

auto Scene::bind_client(ClientId id) -> Result<void> {
    auto it = m_clients.find(id);
    if (it == m_clients.end()) {
        return make_error<void>(ErrorCode::invalid_state, "Unknown client " + std::to_string(id));
    }
    auto& client = it->second;
    if (client.state == ClientState::connecting) {
        client.state = ClientState::bound;
    }
    return {};
}

auto Scene::disconnect_client(ClientId id, std::string reason) -> std::vector<SurfaceId> {
    auto it = m_clients.find(id);
    if (it == m_clients.end()) {
        return {};
    }
    std::vector<SurfaceId> dropped = std::move(it->second.surfaces);
    m_clients.erase(it);
    for (SurfaceId surface : dropped) {
        forget_surface(surface);
    }
    POLARBEAR_LOG_INFO("Client {} disconnected ({}), dropped {} surface(s)", id,
                       reason.empty() ? "closed" : reason, dropped.size());
    return dropped;
}

auto Scene::create_surface(ClientId id) -> Result<SurfaceId> {
    auto it = m_clients.find(id);
    if (it == m_clients.end()) {
        return make_error<SurfaceId>(ErrorCode::invalid_state,
                                     "Unknown client " + std::to_string(id));
    }
    auto& client = it->second;
    switch (client.state) {
    case ClientState::connecting:
        return make_error<SurfaceId>(ErrorCode::protocol_violation,
                                     "Surface created before binding the compositor global");
    case ClientState::bound:
        client.state = ClientState::active;
        break;
    case ClientState::active:
        break;
    }

    const SurfaceId surface_id = m_next_surface++;
    m_surfaces.emplace(surface_id, Surface{.id = surface_id, .client = id});
    m_stack.push_back(surface_id);
    client.surfaces.push_back(surface_id);
    return surface_id;
}

auto Scene::destroy_surface(SurfaceId id) -> Result<void> {
    auto it = m_surfaces.find(id);
    if (it == m_surfaces.end()) {
        return make_error<void>(ErrorCode::invalid_state, "Unknown surface " + std::to_string(id));
    }
    auto owner = m_clients.find(it->second.client);
    if (owner != m_clients.end()) {
        std::erase(owner->second.surfaces, id);
    }
    forget_surface(id);
    return {};
}

auto Scene::set_role(SurfaceId id, SurfaceRole role, SurfaceId parent) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    if (surface->role == role) {
        return {};
    }
    if (surface->role != SurfaceRole::none) {
        return make_error<void>(ErrorCode::protocol_violation,
                                "Surface " + std::to_string(id) + " already has a role");
    }
    if (role == SurfaceRole::popup || role == SurfaceRole::subsurface) {
        if (parent == NO_SURFACE || !m_surfaces.contains(parent) || descends_from(parent, id)) {
            return make_error<void>(ErrorCode::protocol_violation,
                                    "Surface " + std::to_string(id) +
                                        " needs a live parent outside its own tree");
        }
        surface->parent = parent;
    }
    surface->role = role;
    if (role == SurfaceRole::subsurface) {
        stack_above_parent(id);
    }
    return {};
}

auto Scene::set_position(SurfaceId id, int32_t x, int32_t y) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    if (surface->role == SurfaceRole::popup) {
        // Popups are resolved once; subsurfaces keep the offset and follow their parent.
        const auto& parent = m_surfaces.at(surface->parent);
        surface->x = parent.x + x;
        surface->y = parent.y + y;
    } else {
        surface->x = x;
        surface->y = y;
    }
    return {};
}

auto Scene::attach_buffer(SurfaceId id, Buffer buffer) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    if (surface->pending) {
        return make_error<void>(ErrorCode::protocol_violation,
                                "Surface " + std::to_string(id) +
                                    ": buffer attached while another is uncommitted");
    }
    if (m_strict_backpressure && surface->awaiting_ack) {
        return make_error<void>(ErrorCode::protocol_violation,
                                "Surface " + std::to_string(id) +
                                    ": buffer attached before frame-done");
    }
    if (buffer.width == 0 || buffer.height == 0 || !buffer.pixels ||
        buffer.stride < buffer.width * 4U ||
        buffer.pixels->size() < static_cast<size_t>(buffer.stride) * buffer.height) {
        return make_error<void>(ErrorCode::protocol_violation,
                                "Surface " + std::to_string(id) + ": malformed buffer");
    }
    surface->pending = std::move(buffer);
    surface->pending_detach = false;
    return {};
}

auto Scene::detach_buffer(SurfaceId id) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    surface->pending.reset();
    surface->pending_detach = true;
    return {};
}

auto Scene::add_damage(SurfaceId id, Rect damage) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    surface->pending_damage = surface->pending_damage.united(damage);
    return {};
}

auto Scene::commit(SurfaceId id) -> Result<void> {
    auto* surface = POLARBEAR_TRY(live_surface(id));
    if (surface->pending) {
        const auto& buffer = *surface->pending;
        const Rect full{.width = static_cast<int32_t>(buffer.width),
                        .height = static_cast<int32_t>(buffer.height)};
        // Without explicit damage the whole buffer counts as changed.
        const Rect damage =
            surface->pending_damage.empty() ? full : surface->pending_damage.intersected(full);
        surface->committed = std::move(surface->pending);
        surface->pending.reset();
        surface->damage = surface->damage.united(damage);
        // Role-less surfaces are never composited and so never acknowledged.
        surface->awaiting_ack = surface->role != SurfaceRole::none;
    } else if (surface->pending_detach) {
        surface->committed.reset();
        surface->awaiting_ack = false;
        surface->damage = Rect{};
    }
    surface->pending_detach = false;
    surface->pending_damage = Rect{};
    ++surface->commit_seq;
    return {};
}

auto Scene::create_output(const Output& output) -> const Output& {
    m_output = output;
    POLARBEAR_LOG_INFO("Output {}x{} scale={} refresh={}mHz", m_output.width, m_output.height,
                       m_output.scale, m_output.refresh_mhz);
    return m_output;
}

void Scene::raise(SurfaceId id) {
    const SurfaceId root = root_of(id);
    if (!m_surfaces.contains(root)) {
        return;
    }
    // Move the toplevel and its popups to the top, keeping their relative order.
    std::vector<SurfaceId> family;
    std::vector<SurfaceId> rest;
    for (SurfaceId s : m_stack) {
        (root_of(s) == root ? family : rest).push_back(s);
    }
    rest.insert(rest.end(), family.begin(), family.end());
    m_stack = std::move(rest);
}

auto Scene::surface_at(double x, double y) const -> SurfaceId {
    for (auto it = m_stack.rbegin(); it != m_stack.rend(); ++it) {
        if (visible(*it) && placement(*it).contains(x, y)) {
            return *it;
        }
    }
    return NO_SURFACE;
}

auto Scene::root_of(SurfaceId id) const -> SurfaceId {
    SurfaceId current = id;
    // Parent chains are acyclic because a parent must exist before its popup.
    while (true) {
        auto it = m_surfaces.find(current);
        if (it == m_surfaces.end() || (it->second.role != SurfaceRole::popup &&
                                       it->second.role != SurfaceRole::subsurface)) {
            return current;
        }
        current = it->second.parent;
    }
}

auto Scene::placement(SurfaceId id) const -> Rect {
    auto it = m_surfaces.find(id);
    if (it == m_surfaces.end()) {
        return Rect{};
    }
    Rect rect = it->second.bounds();
    for (const Surface* s = &it->second; s->role == SurfaceRole::subsurface;) {
        auto parent = m_surfaces.find(s->parent);
        if (parent == m_surfaces.end()) {
            break;
        }
        s = &parent->second;
        rect.x += s->x;
        rect.y += s->y;
    }
    return rect;
}

auto Scene::visible(SurfaceId id) const -> bool {
    auto it = m_surfaces.find(id);
    while (it != m_surfaces.end()) {
        if (!it->second.mapped()) {
            return false;
        }
        if (it->second.role != SurfaceRole::subsurface) {
            return true;
        }
        it = m_surfaces.find(it->second.parent);
    }
    return false;
}

auto Scene::snapshot() const -> SceneSnapshot {
    SceneSnapshot snap{.output = m_output};
    snap.layers.reserve(m_stack.size());
    for (SurfaceId id : m_stack) {
        if (!visible(id)) {
            continue;
        }
        const auto& surface = m_surfaces.at(id);
        const Rect rect = placement(id);
        snap.layers.push_back(CompositeLayer{
            .surface = id,
            .x = rect.x,
            .y = rect.y,
            .buffer = *surface.committed,
            .damage = surface.damage,
        });
    }
    return snap;
}

auto Scene::mark_consumed(const SceneSnapshot& snapshot) -> std::vector<SurfaceId> {
    std::vector<SurfaceId> consumed;
    consumed.reserve(snapshot.layers.size());
    for (const auto& layer : snapshot.layers) {
        auto it = m_surfaces.find(layer.surface);
        if (it == m_surfaces.end()) {
            continue;
        }
        auto& surface = it->second;
        // A newer commit that raced the frame keeps its acknowledgement pending.
        if (surface.committed && surface.committed->id != layer.buffer.id) {
            continue;
        }
        surface.awaiting_ack = false;
        surface.damage = Rect{};
        consumed.push_back(layer.surface);
    }
    for (auto& [id, surface] : m_surfaces) {
        if (surface.role == SurfaceRole::subsurface && surface.awaiting_ack && !visible(id)) {
            surface.awaiting_ack = false;
            consumed.push_back(id);
        }
    }
    return consumed;
}

auto Scene::client(ClientId id) const -> const Client* {
    auto it = m_clients.find(id);
    return it == m_clients.end() ? nullptr : &it->second;
}

auto Scene::surface(SurfaceId id) const -> const Surface* {
    auto it = m_surfaces.find(id);
    return it == m_surfaces.end() ? nullptr : &it->second;
}

auto Scene::toplevels() const -> std::vector<SurfaceId> {
    std::vector<SurfaceId> result;
    for (SurfaceId id : m_stack) {
        if (m_surfaces.at(id).role == SurfaceRole::toplevel) {
            result.push_back(id);
        }
    }
    return result;
}

auto Scene::live_client_count() const -> size_t {
    return m_clients.size();
}

auto Scene::live_surface(SurfaceId id) -> Result<Surface*> {
    auto it = m_surfaces.find(id);
    if (it == m_surfaces.end()) {
        return make_error<Surface*>(ErrorCode::invalid_state,
                                    "Unknown surface " + std::to_string(id));
    }
    return &it->second;
}

auto Scene::descends_from(SurfaceId id, SurfaceId ancestor) const -> bool {
    for (SurfaceId current = id; current != NO_SURFACE;) {
        if (current == ancestor) {
            return true;
        }
        auto it = m_surfaces.find(current);
        if (it == m_surfaces.end() || it->second.role == SurfaceRole::none ||
            it->second.role == SurfaceRole::toplevel) {
            return false;
        }
        current = it->second.parent;
    }
    return false;
}

void Scene::stack_above_parent(SurfaceId id) {
    // New subsurfaces go directly above the parent and its existing descendants.
    std::erase(m_stack, id);
    const SurfaceId parent = m_surfaces.at(id).parent;
    auto pos = std::find(m_stack.begin(), m_stack.end(), parent);
    if (pos == m_stack.end()) {
        m_stack.push_back(id);
        return;
    }
    ++pos;
    while (pos != m_stack.end() && descends_from(*pos, parent)) {
        ++pos;
    }
    m_stack.insert(pos, id);
}

void Scene::forget_surface(SurfaceId id) {
    // Subsurfaces lose their role with the parent and stay as inert surfaces.
    for (auto& [sid, surface] : m_surfaces) {
        if (surface.role == SurfaceRole::subsurface && surface.parent == id) {
            surface.role = SurfaceRole::none;
            surface.parent = NO_SURFACE;
            surface.awaiting_ack = false;
        }
    }
    // Orphaned popups go with their parent.
    std::vector<SurfaceId> children;
    for (const auto& [sid, surface] : m_surfaces) {
        if (surface.role == SurfaceRole::popup && surface.parent == id) {
            children.push_back(sid);
        }
    }
    for (SurfaceId child : children) {
        auto owner = m_clients.find(m_surfaces.at(child).client);
        if (owner != m_clients.end()) {
            std::erase(owner->second.surfaces, child);
        }
        forget_surface(child);
    }

    m_surfaces.erase(id);
    std::erase(m_stack, id);

    if (m_seat.keyboard_focus == id) {
        m_seat.keyboard_focus = NO_SURFACE;
    }
    if (m_seat.pointer_focus == id) {
        m_seat.pointer_focus = NO_SURFACE;
    }
    std::erase_if(m_seat.touch_focus, [id](const auto& entry) { return entry.second == id; });
}

} // namespace polarbear::compositor
