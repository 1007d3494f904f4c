#include "editor/controls.hpp"

#include "utils/log.hpp"

namespace editor {

namespace {

struct ControlName {
    Control     control;
    const char* name;
};

constexpr ControlName kControlNames[] = {
    { Control::Forward,    "forward" },
    { Control::Back,       "back" },
    { Control::Right,      "right" },
    { Control::Left,       "left" },
    { Control::ZoomOut,    "zoom_out" },
    { Control::ZoomIn,     "zoom_in" },
    { Control::CreateTile, "create_tile" },
    { Control::DeleteTile, "delete_tile" },
};

}

const char* control_name(Control control) {
    for (const auto& entry : kControlNames) {
        if (entry.control == control) return entry.name;
    }
    return "unknown";
}

std::optional<Control> control_from_name(const std::string& name) {
    for (const auto& entry : kControlNames) {
        if (name == entry.name) return entry.control;
    }
    return std::nullopt;
}

std::optional<Keybind> parse_keybind(const std::string& name) {
    if (name == "mouse_left")   return Keybind::mouse(SDL_BUTTON_LEFT);
    if (name == "mouse_right")  return Keybind::mouse(SDL_BUTTON_RIGHT);
    if (name == "mouse_middle") return Keybind::mouse(SDL_BUTTON_MIDDLE);
    const SDL_Keycode key = SDL_GetKeyFromName(name.c_str());
    if (key == SDLK_UNKNOWN) {
        return std::nullopt;
    }
    return Keybind::keyboard(key);
}

Controls Controls::from_table(const config::KeybindTable& table) {
    Controls controls;
    for (const auto& [control_key, names] : table) {
        const auto control = control_from_name(control_key);
        if (!control) {
            tessera::log::warn("[Controls] Unknown control '" + control_key + "' in keybinds");
            continue;
        }
        for (const auto& name : names) {
            const auto keybind = parse_keybind(name);
            if (!keybind) {
                tessera::log::warn("[Controls] Unknown key '" + name + "' for control '" + control_key + "'");
                continue;
            }
            controls.bind(*keybind, *control);
        }
    }
    return controls;
}

void Controls::bind(Keybind keybind, Control control) {
    binds_.emplace_back(keybind, control);
}

void Controls::set_bind_state(Keybind keybind, bool down) {
    for (const auto& [bound, control] : binds_) {
        if (bound == keybind) {
            state_[static_cast<std::size_t>(control)] = down;
        }
    }
}

void Controls::release_all() {
    state_.fill(false);
}

void Controls::handle_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_KEYDOWN:
    case SDL_KEYUP:
        set_bind_state(Keybind::keyboard(e.key.keysym.sym), e.type == SDL_KEYDOWN);
        break;

    case SDL_MOUSEMOTION:
        mouse_ = SDL_Point{ e.motion.x, e.motion.y };
        break;

    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        mouse_ = SDL_Point{ e.button.x, e.button.y };
        set_bind_state(Keybind::mouse(e.button.button), e.type == SDL_MOUSEBUTTONDOWN);
        break;

    default:
        break;
    }
}

}
