#include "editor/pointer_routing.hpp"

namespace editor {

PointerDecision route_pointer_press(const ui::UiTree& main_ui,
                                    const ui::UiTree& picker,
                                    bool picker_open,
                                    const SDL_MouseButtonEvent& button,
                                    SDL_Point window_size) {
    PointerDecision decision;
    const bool primary = (button.button == SDL_BUTTON_LEFT);
    const SDL_FPoint pos = ui::to_normalized(SDL_Point{ button.x, button.y }, window_size);

    if (primary) {
        decision.event = main_ui.click(pos);
        if (decision.event) {
            decision.route = PointerRoute::MainUi;
            return decision;
        }
    }

    if (!picker_open) {
        decision.route = PointerRoute::PassThrough;
        return decision;
    }

    if (primary) {
        decision.event = picker.click(pos);
    }
    decision.route = decision.event ? PointerRoute::Picker : PointerRoute::Consumed;
    return decision;
}

}
