#include "doctest/doctest.h"

#include "core/editor_config.hpp"
#include "editor/controls.hpp"
#include "utils/log.hpp"

using editor::Control;
using editor::Controls;
using editor::Keybind;

namespace {

SDL_Event key_event(Uint32 type, SDL_Keycode key) {
    SDL_Event e{};
    e.type = type;
    e.key.keysym.sym = key;
    return e;
}

SDL_Event button_event(Uint32 type, Uint8 button, int x, int y) {
    SDL_Event e{};
    e.type = type;
    e.button.button = button;
    e.button.x = x;
    e.button.y = y;
    return e;
}

}

TEST_CASE("keybind names parse to keys and mouse buttons") {
    auto w = editor::parse_keybind("W");
    REQUIRE(w);
    CHECK(*w == Keybind::keyboard(SDLK_w));

    auto ctrl = editor::parse_keybind("Left Ctrl");
    REQUIRE(ctrl);
    CHECK(*ctrl == Keybind::keyboard(SDLK_LCTRL));

    auto left = editor::parse_keybind("mouse_left");
    REQUIRE(left);
    CHECK(*left == Keybind::mouse(SDL_BUTTON_LEFT));

    CHECK_FALSE(editor::parse_keybind("definitely not a key"));
}

TEST_CASE("control names round trip") {
    for (int i = 0; i < static_cast<int>(Control::Count); ++i) {
        const auto control = static_cast<Control>(i);
        auto parsed = editor::control_from_name(editor::control_name(control));
        REQUIRE(parsed);
        CHECK(*parsed == control);
    }
    CHECK_FALSE(editor::control_from_name("jump"));
}

TEST_CASE("default keybinds drive controls from keyboard and mouse events") {
    Controls controls = Controls::from_table(config::EditorSettings::default_keybinds());
    CHECK(controls.bind_count() == 10);

    controls.handle_event(key_event(SDL_KEYDOWN, SDLK_w));
    CHECK(controls.pressed(Control::Forward));
    controls.handle_event(key_event(SDL_KEYUP, SDLK_w));
    CHECK_FALSE(controls.pressed(Control::Forward));

    controls.handle_event(key_event(SDL_KEYDOWN, SDLK_SPACE));
    CHECK(controls.pressed(Control::ZoomOut));

    controls.handle_event(button_event(SDL_MOUSEBUTTONDOWN, SDL_BUTTON_RIGHT, 12, 34));
    CHECK(controls.pressed(Control::DeleteTile));
    CHECK(controls.mouse_pos().x == 12);
    CHECK(controls.mouse_pos().y == 34);

    controls.release_all();
    CHECK_FALSE(controls.pressed(Control::ZoomOut));
    CHECK_FALSE(controls.pressed(Control::DeleteTile));
}

TEST_CASE("mouse motion only updates the pointer") {
    Controls controls = Controls::from_table(config::EditorSettings::default_keybinds());
    SDL_Event e{};
    e.type = SDL_MOUSEMOTION;
    e.motion.x = 100;
    e.motion.y = 200;
    controls.handle_event(e);
    CHECK(controls.mouse_pos().x == 100);
    CHECK(controls.mouse_pos().y == 200);
    CHECK_FALSE(controls.pressed(Control::CreateTile));
}

TEST_CASE("one control can have several binds") {
    Controls controls = Controls::from_table(config::EditorSettings::default_keybinds());
    controls.handle_event(key_event(SDL_KEYDOWN, SDLK_z));
    CHECK(controls.pressed(Control::CreateTile));
    controls.handle_event(button_event(SDL_MOUSEBUTTONUP, SDL_BUTTON_LEFT, 0, 0));
    CHECK_FALSE(controls.pressed(Control::CreateTile));
}

TEST_CASE("unknown controls and keys are skipped") {
    tessera::log::set_level(tessera::log::Level::Error);
    config::KeybindTable table{
        { "forward", { "W", "no such key" } },
        { "teleport", { "T" } },
    };
    Controls controls = Controls::from_table(table);
    CHECK(controls.bind_count() == 1);
    tessera::log::set_level(tessera::log::Level::Info);
}
