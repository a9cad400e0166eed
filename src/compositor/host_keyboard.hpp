#pragma once

#include <memory>

extern "C" {
#include <wlr/interfaces/wlr_keyboard.h>
#include <wlr/types/wlr_keyboard.h>
#include <xkbcommon/xkbcommon.h>
}

namespace polarbear::compositor {

/// Owns the virtual keyboard the host forwards key events through.
/// wlr_keyboard_finish() runs before the storage is released.
class HostKeyboard {
public:
    HostKeyboard() = default;
    HostKeyboard(const HostKeyboard&) = delete;
    HostKeyboard& operator=(const HostKeyboard&) = delete;
    ~HostKeyboard() { reset(); }

    /// Re-initialises the keyboard; the keymap is referenced, not taken over.
    void init(xkb_keymap* keymap) {
        reset();
        m_storage = std::make_unique<wlr_keyboard>();
        wlr_keyboard_init(m_storage.get(), nullptr, "host-keyboard");
        wlr_keyboard_set_keymap(m_storage.get(), keymap);
    }

    void reset() {
        if (m_storage) {
            wlr_keyboard_finish(m_storage.get());
            m_storage.reset();
        }
    }

    [[nodiscard]] auto get() const -> wlr_keyboard* { return m_storage.get(); }
    auto operator->() const -> wlr_keyboard* { return m_storage.get(); }

private:
    std::unique_ptr<wlr_keyboard> m_storage;
};

} // namespace polarbear::compositor
