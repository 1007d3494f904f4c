#pragma once

#include <SDL.h>

#include <optional>

#include "ui/ui_tree.hpp"

namespace editor {

enum class PointerRoute {
    MainUi,       // a main-UI button was hit
    Picker,       // a picker tile was hit
    Consumed,     // swallowed by the open picker without a hit
    PassThrough   // left for Controls to turn into painting
};

struct PointerDecision {
    PointerRoute           route = PointerRoute::PassThrough;
    std::optional<ui::UiEvent> event;
};

// Only the left button hits UI. The main UI is searched first, then the
// picker when it is open. While the picker is open every press is consumed.
PointerDecision route_pointer_press(const ui::UiTree& main_ui,
                                    const ui::UiTree& picker,
                                    bool picker_open,
                                    const SDL_MouseButtonEvent& button,
                                    SDL_Point window_size);

}
