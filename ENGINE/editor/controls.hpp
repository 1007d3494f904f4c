#pragma once

#include <SDL.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/editor_config.hpp"

namespace editor {

enum class Control {
    Forward = 0,
    Back,
    Right,
    Left,
    ZoomOut,
    ZoomIn,
    CreateTile,
    DeleteTile,
    Count
};

const char* control_name(Control control);
std::optional<Control> control_from_name(const std::string& name);

struct Keybind {
    enum class Kind { Keyboard, Mouse };

    Kind        kind   = Kind::Keyboard;
    SDL_Keycode key    = SDLK_UNKNOWN;
    Uint8       button = 0;

    static Keybind keyboard(SDL_Keycode key) { return Keybind{ Kind::Keyboard, key, 0 }; }
    static Keybind mouse(Uint8 button) { return Keybind{ Kind::Mouse, SDLK_UNKNOWN, button }; }

    bool operator==(const Keybind& other) const {
        return kind == other.kind && (kind == Kind::Keyboard ? key == other.key : button == other.button);
    }
};

// "mouse_left" / "mouse_right" / "mouse_middle", or any SDL key name.
std::optional<Keybind> parse_keybind(const std::string& name);

// Held state of every editor control, fed from SDL events.
class Controls {
public:
    // Unknown control or key names are logged and skipped.
    static Controls from_table(const config::KeybindTable& table);

    void bind(Keybind keybind, Control control);

    void handle_event(const SDL_Event& e);
    void set_bind_state(Keybind keybind, bool down);
    void release_all();

    bool pressed(Control control) const { return state_[static_cast<std::size_t>(control)]; }
    SDL_Point mouse_pos() const { return mouse_; }
    std::size_t bind_count() const { return binds_.size(); }

private:
    std::vector<std::pair<Keybind, Control>> binds_;
    std::array<bool, static_cast<std::size_t>(Control::Count)> state_{};
    SDL_Point mouse_{ 0, 0 };
};

}
