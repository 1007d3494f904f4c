#include "core/editor_config.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"

namespace config {
namespace {

constexpr int   kMinWindowSide = 64;
constexpr int   kMaxWindowSide = 16384;
constexpr int   kMinFps = 1;
constexpr int   kMaxFps = 240;
constexpr int   kMinFontSize = 6;
constexpr int   kMaxFontSize = 128;
constexpr int   kMinAnimationMs = 1;
constexpr int   kMaxAnimationMs = 10000;
constexpr float kMaxPanelMargin = 0.45f;

void read_int(const nlohmann::json& obj, const char* key, int& out) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_number_integer()) {
        out = it->get<int>();
    }
}

void read_float(const nlohmann::json& obj, const char* key, float& out) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_number()) {
        out = it->get<float>();
    }
}

void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        out = it->get<std::string>();
    }
}

float clamp_finite(float v, float lo, float hi, float fallback) {
    if (!std::isfinite(v)) return fallback;
    return std::clamp(v, lo, hi);
}

KeybindTable read_keybinds(const nlohmann::json& obj, KeybindTable binds) {
    auto it = obj.find("keybinds");
    if (it == obj.end() || !it->is_object()) {
        return binds;
    }
    for (auto entry = it->begin(); entry != it->end(); ++entry) {
        std::vector<std::string> names;
        if (entry->is_string()) {
            names.push_back(entry->get<std::string>());
        } else if (entry->is_array()) {
            for (const auto& name : *entry) {
                if (name.is_string()) names.push_back(name.get<std::string>());
            }
        } else {
            tessera::log::warn("[Config] Ignoring keybind '" + entry.key() + "': expected a string or array");
            continue;
        }
        binds[entry.key()] = std::move(names);
    }
    return binds;
}

}

KeybindTable EditorSettings::default_keybinds() {
    return KeybindTable{
        { "forward",     { "W" } },
        { "back",        { "S" } },
        { "left",        { "A" } },
        { "right",       { "D" } },
        { "zoom_out",    { "Space" } },
        { "zoom_in",     { "Left Ctrl" } },
        { "create_tile", { "mouse_left", "Z" } },
        { "delete_tile", { "mouse_right", "X" } },
    };
}

EditorSettings EditorSettings::defaults() {
    EditorSettings settings;
    settings.keybinds = default_keybinds();
    return settings;
}

EditorSettings EditorSettings::from_json(const nlohmann::json* obj) {
    EditorSettings settings = defaults();
    if (!obj || !obj->is_object()) {
        return settings;
    }
    read_int(*obj, "window_width", settings.window_width);
    read_int(*obj, "window_height", settings.window_height);
    read_int(*obj, "fps", settings.fps);
    read_string(*obj, "window_title", settings.window_title);
    read_string(*obj, "tiles_dir", settings.tiles_dir);
    read_string(*obj, "ui_dir", settings.ui_dir);
    read_string(*obj, "font_path", settings.font_path);
    read_int(*obj, "hud_font_size", settings.hud_font_size);
    read_string(*obj, "log_level", settings.log_level);
    read_string(*obj, "log_file", settings.log_file);

    auto cam = obj->find("camera");
    if (cam != obj->end() && cam->is_object()) {
        read_float(*cam, "height", settings.camera.height);
        read_float(*cam, "pan_speed", settings.camera.pan_speed);
        read_float(*cam, "zoom_base", settings.camera.zoom_base);
        read_float(*cam, "zoom_rate", settings.camera.zoom_rate);
        read_float(*cam, "min_height", settings.camera.min_height);
        read_float(*cam, "max_height", settings.camera.max_height);
    }

    auto panel = obj->find("tile_panel");
    if (panel != obj->end() && panel->is_object()) {
        read_int(*panel, "animation_ms", settings.tile_panel.animation_ms);
        read_float(*panel, "margin", settings.tile_panel.margin);
    }

    settings.keybinds = read_keybinds(*obj, std::move(settings.keybinds));
    settings.clamp();
    return settings;
}

void EditorSettings::clamp() {
    const EditorSettings d{};
    window_width  = std::clamp(window_width, kMinWindowSide, kMaxWindowSide);
    window_height = std::clamp(window_height, kMinWindowSide, kMaxWindowSide);
    fps           = std::clamp(fps, kMinFps, kMaxFps);
    hud_font_size = std::clamp(hud_font_size, kMinFontSize, kMaxFontSize);
    if (tiles_dir.empty()) tiles_dir = d.tiles_dir;
    if (ui_dir.empty()) ui_dir = d.ui_dir;

    camera.min_height = clamp_finite(camera.min_height, 0.01f, 1.0e4f, d.camera.min_height);
    camera.max_height = clamp_finite(camera.max_height, camera.min_height, 1.0e6f, d.camera.max_height);
    camera.height     = clamp_finite(camera.height, camera.min_height, camera.max_height, d.camera.height);
    camera.pan_speed  = clamp_finite(camera.pan_speed, 0.0f, 1.0f, d.camera.pan_speed);
    camera.zoom_base  = clamp_finite(camera.zoom_base, 0.01f, 0.999f, d.camera.zoom_base);
    camera.zoom_rate  = clamp_finite(camera.zoom_rate, 0.0f, 1.0f, d.camera.zoom_rate);

    tile_panel.animation_ms = std::clamp(tile_panel.animation_ms, kMinAnimationMs, kMaxAnimationMs);
    tile_panel.margin = clamp_finite(tile_panel.margin, 0.0f, kMaxPanelMargin, d.tile_panel.margin);
}

void EditorSettings::apply_to_json(nlohmann::json& obj) const {
    if (!obj.is_object()) {
        obj = nlohmann::json::object();
    }
    obj["window_width"]  = window_width;
    obj["window_height"] = window_height;
    obj["fps"]           = fps;
    obj["window_title"]  = window_title;
    obj["tiles_dir"]     = tiles_dir;
    obj["ui_dir"]        = ui_dir;
    obj["font_path"]     = font_path;
    obj["hud_font_size"] = hud_font_size;
    obj["log_level"]     = log_level;
    obj["log_file"]      = log_file;

    nlohmann::json& cam = obj["camera"];
    cam = nlohmann::json::object();
    cam["height"]     = camera.height;
    cam["pan_speed"]  = camera.pan_speed;
    cam["zoom_base"]  = camera.zoom_base;
    cam["zoom_rate"]  = camera.zoom_rate;
    cam["min_height"] = camera.min_height;
    cam["max_height"] = camera.max_height;

    nlohmann::json& panel = obj["tile_panel"];
    panel = nlohmann::json::object();
    panel["animation_ms"] = tile_panel.animation_ms;
    panel["margin"]       = tile_panel.margin;

    nlohmann::json& binds = obj["keybinds"];
    binds = nlohmann::json::object();
    for (const auto& [control, names] : keybinds) {
        binds[control] = names;
    }
}

std::filesystem::path project_root() {
#ifdef PROJECT_ROOT
    return std::filesystem::path(PROJECT_ROOT);
#else
    return std::filesystem::current_path();
#endif
}

std::filesystem::path default_config_path() {
    return project_root() / "editor_config.json";
}

void save_editor_config(const std::filesystem::path& path, const EditorSettings& settings) {
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create config directory '" + parent.u8string() + "': " + ec.message());
        }
    }

    nlohmann::json obj = nlohmann::json::object();
    settings.apply_to_json(obj);

    std::ofstream out(path);
    if (!out.is_open()) {
        std::ostringstream oss;
        oss << "Unable to open config file at '" << path.u8string() << "' for writing.";
        throw std::runtime_error(oss.str());
    }
    out << obj.dump(2);
    if (!out.good()) {
        std::ostringstream oss;
        oss << "Failed while writing config file at '" << path.u8string() << "'.";
        throw std::runtime_error(oss.str());
    }
}

EditorSettings load_editor_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        EditorSettings settings = EditorSettings::defaults();
        try {
            save_editor_config(path, settings);
            tessera::log::info("[Config] Wrote default config to '" + path.u8string() + "'");
        } catch (const std::exception& ex) {
            tessera::log::warn(std::string("[Config] ") + ex.what());
        }
        return settings;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        tessera::log::warn("[Config] Unable to open '" + path.u8string() + "'; using defaults");
        return EditorSettings::defaults();
    }

    nlohmann::json obj;
    try {
        in >> obj;
    } catch (const nlohmann::json::parse_error& ex) {
        tessera::log::warn("[Config] Parse error in '" + path.u8string() + "': " + ex.what() + "; using defaults");
        return EditorSettings::defaults();
    }

    if (!obj.is_object()) {
        tessera::log::warn("[Config] '" + path.u8string() + "' is not a JSON object; using defaults");
        return EditorSettings::defaults();
    }
    return EditorSettings::from_json(&obj);
}

}
