#pragma once

#include <SDL.h>

#include <cstddef>
#include <optional>
#include <vector>

#include "animation/animator.hpp"
#include "core/editor_config.hpp"
#include "editor/camera.hpp"
#include "editor/controls.hpp"
#include "tiling/scene.hpp"
#include "tiling/tile.hpp"
#include "ui/element_id.hpp"
#include "ui/hud_text.hpp"
#include "ui/ui_tree.hpp"

class TextureRegistry;

namespace editor {

class TileEditor {
public:
    TileEditor(SDL_Renderer* renderer,
               SDL_Point window_size,
               config::EditorSettings settings,
               TextureRegistry& textures);

    void run();

    // One tick: events, movement, painting, drawing. Returns false on quit.
    bool single_frame();

    // Returns false when the editor should quit.
    bool on_event(const SDL_Event& e);

    std::size_t current_scene() const { return current_scene_; }
    tiling::Tile current_tile() const { return current_tile_; }

private:
    enum class UiVariant { Normal, Tiles };

    void build_main_ui();
    void build_tile_picker();

    bool handle_pointer_down(const SDL_MouseButtonEvent& button);
    void handle_main_ui_event(const ui::UiEvent& event);
    void handle_picker_event(const ui::UiEvent& event);
    void toggle_tile_picker();

    void ensure_current_tile();
    void ensure_current_scene();
    void apply_movement(float dt_ms);
    void paint_under_cursor();

    void draw_scene(const tiling::Scene& scene) const;
    void draw_tile_picker();
    void draw_hud();

    SDL_Renderer*          renderer_ = nullptr;
    SDL_Point              window_size_{ 0, 0 };
    config::EditorSettings settings_;
    TextureRegistry&       textures_;

    Camera   camera_;
    Controls controls_;

    std::vector<tiling::Scene> scenes_;
    std::size_t  current_scene_ = 0;
    tiling::Tile current_tile_  = tiling::Tile::from_index(0);

    ui::UiTree ui_;
    std::optional<ui::ElementId> next_scene_button_;
    std::optional<ui::ElementId> prev_scene_button_;
    std::optional<ui::ElementId> current_tile_button_;

    ui::UiTree tiles_ui_;
    std::optional<ui::ElementId> tiles_panel_;
    std::vector<ui::ElementId>     tile_buttons_;

    std::optional<animation::Animator<ui::UiProperty>> picker_open_;
    std::optional<animation::Animator<ui::UiProperty>> picker_close_;
    UiVariant current_ui_ = UiVariant::Normal;

    HudText hud_;
};

}
