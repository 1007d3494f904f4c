#pragma once

#include <SDL.h>

#include <cstddef>

#include "animation/animator.hpp"
#include "ui/ui_node.hpp"

namespace editor {

struct LayoutRect {
    SDL_FPoint pos{ 0.0f, 0.0f };
    SDL_FPoint size{ 0.0f, 0.0f };
};

// Placement of the always-visible buttons, in window-normalized units with
// y up. aspect is window width / height.
struct MainUiLayout {
    LayoutRect next_scene;
    LayoutRect prev_scene;
    LayoutRect tile_frame;
    LayoutRect tile_background;
    LayoutRect tile_button;
};

MainUiLayout main_ui_layout(float aspect);

// A panel that is square on screen and centered, leaving `margin` on the
// tighter axis.
LayoutRect picker_panel_rect(float aspect, float margin);

// Slot for tile `index` of `count` inside the picker panel, in panel-relative
// units. Rows hold ceil(sqrt(count)) tiles and fill from the top.
LayoutRect picker_tile_rect(std::size_t index, std::size_t count);

// Panel grows from a thin horizontal line: width first, then height.
animation::Animator<ui::UiProperty> picker_open_animator(const LayoutRect& panel,
                                                         animation::Clock::duration duration);

}
