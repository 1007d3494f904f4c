#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace config {

struct CameraSettings {
    float height     = 10.0f;
    float pan_speed  = 0.002f;
    float zoom_base  = 0.9f;
    float zoom_rate  = 0.05f;
    float min_height = 0.5f;
    float max_height = 500.0f;
};

struct TilePanelSettings {
    int   animation_ms = 200;
    float margin       = 0.1f;
};

// control name -> bind names ("W", "Left Ctrl", "mouse_left", ...)
using KeybindTable = std::map<std::string, std::vector<std::string>>;

struct EditorSettings {
    int         window_width  = 640;
    int         window_height = 480;
    int         fps           = 60;
    std::string window_title  = "tile editor";
    std::string tiles_dir     = "tiles";
    std::string ui_dir        = "ui";
    std::string font_path;
    int         hud_font_size = 18;

    // Empty keeps whatever TESSERA_LOG_LEVEL / TESSERA_LOG_FILE selected.
    std::string log_level;
    std::string log_file;

    CameraSettings    camera{};
    TilePanelSettings tile_panel{};
    KeybindTable      keybinds;

    static EditorSettings defaults();
    static KeybindTable default_keybinds();

    // Missing or mistyped keys keep their defaults. The result is clamped.
    static EditorSettings from_json(const nlohmann::json* obj);

    void clamp();
    void apply_to_json(nlohmann::json& obj) const;
};

std::filesystem::path project_root();
std::filesystem::path default_config_path();

// Creates the file with defaults when missing. A file that does not parse is
// left alone and defaults are returned.
EditorSettings load_editor_config(const std::filesystem::path& path);

// Throws std::runtime_error when the file cannot be written.
void save_editor_config(const std::filesystem::path& path, const EditorSettings& settings);

}
