#include "editor/tile_editor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>
#include <utility>

#include "core/texture_registry.hpp"
#include "editor/editor_layout.hpp"
#include "editor/pointer_routing.hpp"
#include "utils/log.hpp"

namespace editor {

namespace {

constexpr SDL_Color kHudColor{ 235, 235, 235, 255 };
constexpr int       kHudInset = 8;

ui::UiElement make_element(ui::UiElementType kind, const LayoutRect& rect, TextureId texture) {
    ui::UiElement element;
    element.kind    = kind;
    element.pos     = rect.pos;
    element.size    = rect.size;
    element.texture = texture;
    return element;
}

}

TileEditor::TileEditor(SDL_Renderer* renderer,
                       SDL_Point window_size,
                       config::EditorSettings settings,
                       TextureRegistry& textures)
: renderer_(renderer),
  window_size_(window_size),
  settings_(std::move(settings)),
  textures_(textures),
  camera_(settings_.camera),
  controls_(Controls::from_table(settings_.keybinds)),
  hud_(settings_.font_path, settings_.hud_font_size, kHudColor) {
    build_main_ui();
    build_tile_picker();
    ensure_current_tile();
    tessera::log::info("[Editor] Ready with " + std::to_string(textures_.tile_count()) + " tile(s) and " +
                       std::to_string(controls_.bind_count()) + " keybind(s).");
}

void TileEditor::build_main_ui() {
    const float aspect = static_cast<float>(window_size_.x) / static_cast<float>(window_size_.y);
    const MainUiLayout layout = main_ui_layout(aspect);

    next_scene_button_ = ui_.push(make_element(ui::UiElementType::Button, layout.next_scene,
                                               textures_.texture_id("ui/plus.png")));
    prev_scene_button_ = ui_.push(make_element(ui::UiElementType::Button, layout.prev_scene,
                                               textures_.texture_id("ui/minus.png")));

    ui_.push(make_element(ui::UiElementType::Panel, layout.tile_frame, textures_.texture_id("ui/white.png")));
    ui_.push(make_element(ui::UiElementType::Panel, layout.tile_background,
                          textures_.texture_id("ui/background.png")));
    current_tile_button_ = ui_.push(make_element(ui::UiElementType::Button, layout.tile_button,
                                                 textures_.tile_texture_id(current_tile_)));
}

void TileEditor::build_tile_picker() {
    const float aspect = static_cast<float>(window_size_.x) / static_cast<float>(window_size_.y);
    const LayoutRect panel = picker_panel_rect(aspect, settings_.tile_panel.margin);

    tiles_panel_ = tiles_ui_.push(make_element(ui::UiElementType::Panel, panel, textures_.texture_id("ui/panel.png")));

    const std::size_t count = textures_.tile_count();
    tile_buttons_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const tiling::Tile tile = tiling::Tile::from_index(i);
        tile_buttons_.push_back(tiles_ui_.push_child(
            *tiles_panel_,
            make_element(ui::UiElementType::Button, picker_tile_rect(i, count), textures_.tile_texture_id(tile))));
    }

    const auto duration = std::chrono::milliseconds(settings_.tile_panel.animation_ms);
    picker_open_  = picker_open_animator(panel, duration);
    picker_close_ = picker_open_->reversed();
}

void TileEditor::run() {
    const Uint32 frame_ms = static_cast<Uint32>(1000 / settings_.fps);
    while (single_frame()) {
        SDL_Delay(frame_ms);
    }
    tessera::log::info("[Editor] Quit requested.");
}

bool TileEditor::single_frame() {
    SDL_Event e;
    while (SDL_PollEvent(&e)) {
        if (!on_event(e)) {
            return false;
        }
    }

    ensure_current_scene();

    const float dt_ms = 1000.0f / static_cast<float>(settings_.fps);
    apply_movement(dt_ms);
    paint_under_cursor();

    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);

    draw_scene(scenes_[current_scene_]);
    ui_.draw(renderer_, textures_, window_size_);
    draw_tile_picker();
    draw_hud();

    SDL_RenderPresent(renderer_);
    return true;
}

bool TileEditor::on_event(const SDL_Event& e) {
    switch (e.type) {
    case SDL_QUIT:
        return false;

    case SDL_MOUSEBUTTONDOWN:
        if (handle_pointer_down(e.button)) {
            return true;
        }
        controls_.handle_event(e);
        break;

    case SDL_WINDOWEVENT:
        if (e.window.event == SDL_WINDOWEVENT_FOCUS_LOST) {
            controls_.release_all();
        }
        break;

    default:
        controls_.handle_event(e);
        break;
    }
    return true;
}

bool TileEditor::handle_pointer_down(const SDL_MouseButtonEvent& button) {
    const PointerDecision decision =
        route_pointer_press(ui_, tiles_ui_, current_ui_ == UiVariant::Tiles, button, window_size_);

    switch (decision.route) {
    case PointerRoute::MainUi:
        handle_main_ui_event(*decision.event);
        return true;
    case PointerRoute::Picker:
        handle_picker_event(*decision.event);
        return true;
    case PointerRoute::Consumed:
        return true;
    case PointerRoute::PassThrough:
    default:
        return false;
    }
}

void TileEditor::handle_main_ui_event(const ui::UiEvent& event) {
    const ui::ElementId& id = event.element_id;
    if (id == *next_scene_button_) {
        ++current_scene_;
        tessera::log::info("[Editor] current scene: " + std::to_string(current_scene_));
    } else if (id == *prev_scene_button_) {
        current_scene_ = current_scene_ > 0 ? current_scene_ - 1 : 0;
        tessera::log::info("[Editor] current scene: " + std::to_string(current_scene_));
    } else if (id == *current_tile_button_) {
        toggle_tile_picker();
    } else {
        tessera::log::error("[Editor] Unhandled element id: " + id.to_string());
    }
}

void TileEditor::handle_picker_event(const ui::UiEvent& event) {
    auto it = std::find(tile_buttons_.begin(), tile_buttons_.end(), event.element_id);
    if (it == tile_buttons_.end()) {
        tessera::log::error("[Editor] No tile button with id: " + event.element_id.to_string());
        return;
    }
    current_tile_ = tiling::Tile::from_index(static_cast<std::size_t>(it - tile_buttons_.begin()));
    ensure_current_tile();
    tessera::log::debug("[Editor] Selected tile " + std::to_string(current_tile_.id()));
}

void TileEditor::toggle_tile_picker() {
    if (current_ui_ == UiVariant::Normal) {
        picker_open_->reset();
        current_ui_ = UiVariant::Tiles;
    } else {
        picker_close_->reset();
        current_ui_ = UiVariant::Normal;
    }
}

void TileEditor::ensure_current_tile() {
    ui_.get(*current_tile_button_).set_texture(textures_.tile_texture_id(current_tile_));
}

void TileEditor::ensure_current_scene() {
    while (scenes_.size() <= current_scene_) {
        scenes_.emplace_back();
    }
}

void TileEditor::apply_movement(float dt_ms) {
    const float speed = camera_.pan_step(dt_ms);

    if (controls_.pressed(Control::Forward)) {
        camera_.pan(0.0f, speed);
    } else if (controls_.pressed(Control::Back)) {
        camera_.pan(0.0f, -speed);
    }

    if (controls_.pressed(Control::Right)) {
        camera_.pan(speed, 0.0f);
    } else if (controls_.pressed(Control::Left)) {
        camera_.pan(-speed, 0.0f);
    }

    if (controls_.pressed(Control::ZoomOut)) {
        camera_.zoom(1, dt_ms);
    } else if (controls_.pressed(Control::ZoomIn)) {
        camera_.zoom(-1, dt_ms);
    }
}

void TileEditor::paint_under_cursor() {
    const bool create = controls_.pressed(Control::CreateTile);
    if (!create && !controls_.pressed(Control::DeleteTile)) {
        return;
    }
    const SDL_Point tile_pos = camera_.screen_to_tile(controls_.mouse_pos(), window_size_);
    scenes_[current_scene_].set(tile_pos, create ? current_tile_ : tiling::Tile::none());
}

void TileEditor::draw_scene(const tiling::Scene& scene) const {
    const float w = static_cast<float>(window_size_.x);
    const float h = static_cast<float>(window_size_.y);
    const float size = camera_.tile_view_size();

    scene.for_each([&](SDL_Point pos, const tiling::Tile& tile) {
        if (tile.is_none()) {
            return;
        }
        SDL_FPoint view = camera_.tile_to_view(pos);
        view.y = 1.0f - view.y - size;

        const SDL_Rect dst{
            static_cast<int>(std::floor(view.x * w)),
            static_cast<int>(std::floor(view.y * h)),
            static_cast<int>(size * w) + 1,
            static_cast<int>(size * h) + 1 };
        SDL_Texture* texture = textures_.texture(textures_.tile_texture_id(tile));
        if (SDL_RenderCopy(renderer_, texture, nullptr, &dst) != 0) {
            tessera::log::warn(std::string("[Editor] Failed to draw tile: ") + SDL_GetError());
        }
    });
}

void TileEditor::draw_tile_picker() {
    ui::UiNode& panel = tiles_ui_.get(*tiles_panel_);

    bool visible = false;
    if (current_ui_ == UiVariant::Tiles) {
        picker_open_->animate(panel);
        visible = true;
    } else if (picker_close_->is_playing()) {
        picker_close_->animate(panel);
        visible = true;
    }

    if (visible) {
        tiles_ui_.draw(renderer_, textures_, window_size_);
    }
}

void TileEditor::draw_hud() {
    if (!hud_.has_font()) {
        return;
    }
    const SDL_FPoint center = camera_.pos();
    hud_.set_text(renderer_, "Scene " + std::to_string(current_scene_) + "  tiles: " +
                             std::to_string(scenes_[current_scene_].painted_count()) + "  at " +
                             std::to_string(static_cast<int>(std::floor(center.x))) + ", " +
                             std::to_string(static_cast<int>(std::floor(center.y))));
    hud_.render(renderer_, SDL_Point{ kHudInset, window_size_.y - settings_.hud_font_size - kHudInset * 2 });
}

}
