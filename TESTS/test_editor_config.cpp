#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "core/editor_config.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

static fs::path test_root() {
#ifdef PROJECT_ROOT
    return fs::path(PROJECT_ROOT) / "TEST_TMP";
#else
    return fs::current_path() / "TEST_TMP";
#endif
}

static fs::path fresh_file(const std::string& name) {
    const fs::path root = test_root();
    std::error_code ec;
    fs::create_directories(root, ec);
    const fs::path path = root / name;
    fs::remove(path, ec);
    return path;
}

TEST_CASE("defaults match the documented values") {
    const config::EditorSettings s = config::EditorSettings::defaults();
    CHECK(s.window_width == 640);
    CHECK(s.window_height == 480);
    CHECK(s.fps == 60);
    CHECK(s.tiles_dir == "tiles");
    CHECK(s.ui_dir == "ui");
    CHECK(s.camera.height == doctest::Approx(10.0f));
    CHECK(s.tile_panel.animation_ms == 200);
    REQUIRE(s.keybinds.count("create_tile") == 1);
    CHECK(s.keybinds.at("create_tile") == std::vector<std::string>{ "mouse_left", "Z" });
}

TEST_CASE("from_json overrides present keys and keeps the rest") {
    const nlohmann::json obj = {
        { "window_width", 1280 },
        { "window_title", "maps" },
        { "fps", "fast" },
        { "log_level", "debug" },
        { "camera", { { "height", 25.0 } } },
        { "tile_panel", { { "animation_ms", 350 } } },
        { "keybinds", { { "forward", "Up" }, { "back", { "Down", "S" } } } },
    };
    const config::EditorSettings s = config::EditorSettings::from_json(&obj);
    CHECK(s.window_width == 1280);
    CHECK(s.window_height == 480);
    CHECK(s.window_title == "maps");
    CHECK(s.fps == 60);
    CHECK(s.log_level == "debug");
    CHECK(s.log_file.empty());
    CHECK(s.camera.height == doctest::Approx(25.0f));
    CHECK(s.camera.pan_speed == doctest::Approx(0.002f));
    CHECK(s.tile_panel.animation_ms == 350);
    CHECK(s.keybinds.at("forward") == std::vector<std::string>{ "Up" });
    CHECK(s.keybinds.at("back") == std::vector<std::string>{ "Down", "S" });
    CHECK(s.keybinds.at("left") == std::vector<std::string>{ "A" });
}

TEST_CASE("from_json clamps out of range values") {
    const nlohmann::json obj = {
        { "fps", 1000 },
        { "window_height", 2 },
        { "tiles_dir", "" },
        { "camera", { { "height", 1.0e9 }, { "zoom_base", 5.0 } } },
        { "tile_panel", { { "animation_ms", 0 }, { "margin", 0.9 } } },
    };
    const config::EditorSettings s = config::EditorSettings::from_json(&obj);
    CHECK(s.fps == 240);
    CHECK(s.window_height == 64);
    CHECK(s.tiles_dir == "tiles");
    CHECK(s.camera.height == doctest::Approx(s.camera.max_height));
    CHECK(s.camera.zoom_base < 1.0f);
    CHECK(s.tile_panel.animation_ms >= 1);
    CHECK(s.tile_panel.margin < 0.5f);
}

TEST_CASE("from_json without an object yields defaults") {
    CHECK(config::EditorSettings::from_json(nullptr).fps == 60);
    const nlohmann::json arr = nlohmann::json::array();
    CHECK(config::EditorSettings::from_json(&arr).window_width == 640);
}

TEST_CASE("a missing config file is created with defaults") {
    const fs::path path = fresh_file("editor_config_missing.json");
    const config::EditorSettings s = config::load_editor_config(path);
    CHECK(s.fps == 60);
    REQUIRE(fs::exists(path));

    std::ifstream in(path);
    nlohmann::json written;
    in >> written;
    CHECK(written["window_width"] == 640);
    CHECK(written["camera"]["zoom_base"].is_number());
    CHECK(written["keybinds"]["delete_tile"].size() == 2);
}

TEST_CASE("saved settings load back") {
    const fs::path path = fresh_file("editor_config_saved.json");
    config::EditorSettings s = config::EditorSettings::defaults();
    s.fps = 30;
    s.window_title = "saved";
    s.keybinds["zoom_in"] = { "Q" };
    config::save_editor_config(path, s);

    const config::EditorSettings loaded = config::load_editor_config(path);
    CHECK(loaded.fps == 30);
    CHECK(loaded.window_title == "saved");
    CHECK(loaded.keybinds.at("zoom_in") == std::vector<std::string>{ "Q" });
}

TEST_CASE("a config that does not parse falls back to defaults and is left alone") {
    tessera::log::set_level(tessera::log::Level::Error);
    const fs::path path = fresh_file("editor_config_broken.json");
    {
        std::ofstream out(path);
        REQUIRE(out.is_open());
        out << "{\n  \"fps\": 12,\n";
    }

    const config::EditorSettings s = config::load_editor_config(path);
    CHECK(s.fps == 60);

    std::ifstream in(path);
    const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(contents.find("\"fps\": 12") != std::string::npos);
    tessera::log::set_level(tessera::log::Level::Info);
}

TEST_CASE("a config holding a non-object falls back to defaults") {
    tessera::log::set_level(tessera::log::Level::Error);
    const fs::path path = fresh_file("editor_config_array.json");
    {
        std::ofstream out(path);
        out << "[1, 2, 3]";
    }
    CHECK(config::load_editor_config(path).window_height == 480);
    tessera::log::set_level(tessera::log::Level::Info);
}
