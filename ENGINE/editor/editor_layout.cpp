#include "editor/editor_layout.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace editor {

namespace {
constexpr float kSceneButtonWidth  = 0.08f;
constexpr float kSceneButtonHeight = 0.07f;
constexpr float kSceneButtonGap    = 0.02f;
constexpr float kTileButtonSize    = 0.1f;

constexpr float kPickerMargin  = 0.045f;
constexpr float kPickerPadding = 0.1f;

constexpr float kThinLine      = 0.02f;
constexpr float kYScaleStart   = 0.2f;
constexpr float kXScaleEnd     = 0.4f;
constexpr float kXCurveStrength = 0.7f;
constexpr float kYCurveStrength = 0.9f;
}

MainUiLayout main_ui_layout(float aspect) {
    MainUiLayout layout;
    const float button_h = kSceneButtonHeight * aspect;

    layout.next_scene.pos  = SDL_FPoint{ 1.0f - kSceneButtonWidth, 1.0f - button_h };
    layout.next_scene.size = SDL_FPoint{ kSceneButtonWidth, button_h };

    layout.prev_scene.pos  = SDL_FPoint{ 1.0f - kSceneButtonWidth * 2.0f - kSceneButtonGap, 1.0f - button_h };
    layout.prev_scene.size = SDL_FPoint{ kSceneButtonWidth, button_h };

    const float size = kTileButtonSize;
    const float margin = size * 0.1f;
    layout.tile_frame.pos  = SDL_FPoint{ 0.0f, 1.0f - (size + margin) * aspect };
    layout.tile_frame.size = SDL_FPoint{ size + margin, (size + margin) * aspect };

    layout.tile_background.pos  = SDL_FPoint{ 0.0f, 1.0f - size * aspect };
    layout.tile_background.size = SDL_FPoint{ size, size * aspect };
    layout.tile_button = layout.tile_background;
    return layout;
}

LayoutRect picker_panel_rect(float aspect, float margin) {
    float side = 1.0f - margin * 2.0f;
    if (aspect >= 1.0f) {
        side /= aspect;
    }
    LayoutRect rect;
    rect.size = SDL_FPoint{ side, side * aspect };
    rect.pos  = SDL_FPoint{ (1.0f - rect.size.x) * 0.5f, (1.0f - rect.size.y) * 0.5f };
    return rect;
}

LayoutRect picker_tile_rect(std::size_t index, std::size_t count) {
    const std::size_t per_row = std::max<std::size_t>(
        1, static_cast<std::size_t>(std::ceil(std::sqrt(static_cast<float>(count)))));
    const float col = static_cast<float>(index % per_row);
    const float row = static_cast<float>(index / per_row);

    const float row_size = static_cast<float>(per_row) + static_cast<float>(per_row - 1) * kPickerPadding;
    const float tile = (1.0f - kPickerMargin * 2.0f) / row_size;
    const float padding = tile * kPickerPadding;

    LayoutRect rect;
    rect.size = SDL_FPoint{ tile, tile };
    rect.pos.x = col * (tile + padding) + kPickerMargin;
    rect.pos.y = 1.0f - row * (tile + padding) - tile - kPickerMargin;
    return rect;
}

animation::Animator<ui::UiProperty> picker_open_animator(const LayoutRect& panel,
                                                         animation::Clock::duration duration) {
    using animation::Curve;
    using animation::TimedProperty;
    using ui::UiProperty;

    const Curve x_curve = Curve::ease_in(kXCurveStrength);
    const Curve y_curve = Curve::ease_in(kYCurveStrength);
    const float thin_line = panel.size.y * kThinLine;

    std::vector<TimedProperty<UiProperty>> values{
        { UiProperty::ScaleY,    { thin_line, panel.size.y },                          y_curve, { kYScaleStart, 1.0f } },
        { UiProperty::PositionY, { panel.size.y / 2.0f + panel.pos.y, panel.pos.y },   y_curve, { kYScaleStart, 1.0f } },
        { UiProperty::ScaleX,    { 0.0f, panel.size.x },                               x_curve, { 0.0f, kXScaleEnd } },
        { UiProperty::PositionX, { panel.size.x / 2.0f + panel.pos.x, panel.pos.x },   x_curve, { 0.0f, kXScaleEnd } },
    };
    return animation::Animator<ui::UiProperty>(std::move(values), duration);
}

}
