#include "ui/ui_tree.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "core/texture_registry.hpp"
#include "utils/log.hpp"

namespace ui {

namespace {

bool visit(const UiNode& node, const ElementId& id, const UiTree::Visitor& visitor) {
    if (visitor(id, node)) {
        return true;
    }
    for (std::size_t i = 0; i < node.child_count(); ++i) {
        if (visit(node.child(i), id.push(i), visitor)) {
            return true;
        }
    }
    return false;
}

int round_to_int(float v) {
    return static_cast<int>(std::lround(v));
}

}

SDL_Rect to_pixel_rect(SDL_FPoint global_pos, SDL_FPoint global_size, SDL_Point window_size) {
    const float w = static_cast<float>(window_size.x);
    const float h = static_cast<float>(window_size.y);
    const float flipped_y = 1.0f - global_pos.y - global_size.y;
    SDL_Rect rect;
    rect.x = round_to_int(global_pos.x * w);
    rect.y = round_to_int(flipped_y * h);
    rect.w = std::max(0, round_to_int(global_size.x * w));
    rect.h = std::max(0, round_to_int(global_size.y * h));
    return rect;
}

SDL_FPoint to_normalized(SDL_Point pixel, SDL_Point window_size) {
    const float w = static_cast<float>(std::max(1, window_size.x));
    const float h = static_cast<float>(std::max(1, window_size.y));
    return SDL_FPoint{ static_cast<float>(pixel.x) / w, 1.0f - static_cast<float>(pixel.y) / h };
}

ElementId UiTree::push(UiElement element) {
    const std::size_t index = roots_.size();
    roots_.push_back(std::make_unique<UiNode>(element));
    return ElementId(index);
}

ElementId UiTree::push_child(const ElementId& parent_id, UiElement element) {
    const std::size_t index = get(parent_id).push(element);
    return parent_id.push(index);
}

UiNode& UiTree::get(const ElementId& id) {
    const auto& path = id.path();
    UiNode* node = roots_.at(path.front()).get();
    for (std::size_t level = 1; level < path.size(); ++level) {
        node = &node->child(path[level]);
    }
    return *node;
}

const UiNode& UiTree::get(const ElementId& id) const {
    const auto& path = id.path();
    const UiNode* node = roots_.at(path.front()).get();
    for (std::size_t level = 1; level < path.size(); ++level) {
        node = &node->child(path[level]);
    }
    return *node;
}

void UiTree::draw(SDL_Renderer* renderer, const TextureRegistry& textures, SDL_Point window_size) const {
    for_each_element([&](const ElementId& id, const UiNode& node) {
        SDL_Texture* texture = textures.texture(node.element().texture);
        const SDL_Rect dst = to_pixel_rect(node.global_pos(), node.global_size(), window_size);
        if (SDL_RenderCopy(renderer, texture, nullptr, &dst) != 0) {
            tessera::log::warn("[Ui] Failed to draw element " + id.to_string() + ": " + SDL_GetError());
        }
    });
}

std::optional<UiEvent> UiTree::click(SDL_FPoint pos) const {
    std::optional<UiEvent> hit;
    try_for_each_element([&](const ElementId& id, const UiNode& node) {
        if (node.is_interactive() && node.intersects(pos)) {
            hit = UiEvent{ id };
            return true;
        }
        return false;
    });
    return hit;
}

bool UiTree::try_for_each_element(const Visitor& visitor) const {
    for (std::size_t i = 0; i < roots_.size(); ++i) {
        if (visit(*roots_[i], ElementId(i), visitor)) {
            return true;
        }
    }
    return false;
}

void UiTree::for_each_element(const std::function<void(const ElementId&, const UiNode&)>& fn) const {
    try_for_each_element([&](const ElementId& id, const UiNode& node) {
        fn(id, node);
        return false;
    });
}

}
