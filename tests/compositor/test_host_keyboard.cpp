#include "compositor/host_keyboard.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace polarbear::compositor;

namespace {

struct Keymap {
    xkb_context* context = xkb_context_new(XKB_CONTEXT_NO_FLAGS);
    xkb_keymap* keymap = nullptr;

    Keymap() {
        REQUIRE(context != nullptr);
        keymap = xkb_keymap_new_from_names(context, nullptr, XKB_KEYMAP_COMPILE_NO_FLAGS);
        REQUIRE(keymap != nullptr);
    }
    ~Keymap() {
        xkb_keymap_unref(keymap);
        xkb_context_unref(context);
    }
};

} // namespace

TEST_CASE("Host keyboard owns an initialised wlr_keyboard", "[host_keyboard]") {
    Keymap keymap;
    HostKeyboard keyboard;
    REQUIRE(keyboard.get() == nullptr);

    keyboard.init(keymap.keymap);
    REQUIRE(keyboard.get() != nullptr);
    REQUIRE(keyboard->keymap != nullptr);
    REQUIRE(keyboard->num_keycodes == 0);

    SECTION("Re-initialising replaces the keyboard") {
        keyboard.init(keymap.keymap);
        REQUIRE(keyboard.get() != nullptr);
        REQUIRE(keyboard->keymap != nullptr);
    }

    SECTION("Reset finishes the keyboard and is repeatable") {
        keyboard.reset();
        REQUIRE(keyboard.get() == nullptr);
        keyboard.reset();
        REQUIRE(keyboard.get() == nullptr);
    }
}
