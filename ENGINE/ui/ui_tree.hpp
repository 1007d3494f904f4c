#pragma once

#include <SDL.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "ui/element_id.hpp"
#include "ui/ui_node.hpp"

class TextureRegistry;

namespace ui {

struct UiEvent {
    ElementId element_id;
};

// Maps normalized global geometry (origin bottom-left, y up) onto window
// pixels (origin top-left). Sizes round to the nearest pixel and never go
// negative.
SDL_Rect to_pixel_rect(SDL_FPoint global_pos, SDL_FPoint global_size, SDL_Point window_size);

// Normalized pointer position for a pixel coordinate, y up.
SDL_FPoint to_normalized(SDL_Point pixel, SDL_Point window_size);

// A forest of UI elements. Every node's global geometry is kept in sync with
// its intrinsic geometry on every mutation. Nodes are never removed.
class UiTree {
public:
    // Return true to stop the traversal.
    using Visitor = std::function<bool(const ElementId&, const UiNode&)>;

    ElementId push(UiElement element);

    // Throws std::out_of_range when parent_id does not address a node.
    ElementId push_child(const ElementId& parent_id, UiElement element);

    // Throws std::out_of_range on a stale or malformed id.
    UiNode& get(const ElementId& id);
    const UiNode& get(const ElementId& id) const;

    // One SDL_RenderCopy per node, pre-order, insertion order.
    void draw(SDL_Renderer* renderer, const TextureRegistry& textures, SDL_Point window_size) const;

    // First interactive node containing pos, in draw order. A match is not
    // descended into.
    std::optional<UiEvent> click(SDL_FPoint pos) const;

    // Pre-order walk. Returns true if the visitor stopped it.
    bool try_for_each_element(const Visitor& visitor) const;
    void for_each_element(const std::function<void(const ElementId&, const UiNode&)>& fn) const;

private:
    std::vector<std::unique_ptr<UiNode>> roots_;
};

}
