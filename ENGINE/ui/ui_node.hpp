#pragma once

#include <SDL.h>

#include <cstddef>
#include <memory>
#include <vector>

#include "animation/animatable.hpp"
#include "core/texture_id.hpp"

namespace ui {

enum class UiElementType {
    Panel,
    Button
};

// Parent-relative description of an element. pos and size are fractions of
// the parent's global size; for roots they are fractions of the window.
struct UiElement {
    UiElementType kind = UiElementType::Panel;
    SDL_FPoint    pos{ 0.0f, 0.0f };
    SDL_FPoint    size{ 1.0f, 1.0f };
    TextureId     texture{};
};

enum class UiProperty {
    ScaleX,
    ScaleY,
    PositionX,
    PositionY
};

const char* property_name(UiProperty property);

class UiNode : public animation::Animatable<UiProperty> {
public:
    explicit UiNode(UiElement element, UiNode* parent = nullptr, std::size_t index_in_parent = 0);

    UiNode(const UiNode&) = delete;
    UiNode& operator=(const UiNode&) = delete;

    // Writes one intrinsic component, then refreshes this node's global
    // geometry and everything below it before returning.
    void set(const UiProperty& id, float value) override;

    std::size_t push(UiElement element);

    UiNode& child(std::size_t index);
    const UiNode& child(std::size_t index) const;
    std::size_t child_count() const { return children_.size(); }

    const UiElement& element() const { return element_; }
    SDL_FPoint global_pos() const { return global_pos_; }
    SDL_FPoint global_size() const { return global_size_; }

    bool is_interactive() const { return element_.kind == UiElementType::Button; }
    bool intersects(SDL_FPoint pos) const;

    void set_texture(TextureId texture) { element_.texture = texture; }

private:
    void update();
    void update_child(std::size_t index);
    void update_children();

    UiElement  element_;
    SDL_FPoint global_pos_{ 0.0f, 0.0f };
    SDL_FPoint global_size_{ 0.0f, 0.0f };

    // Non-owning; only used to ask the parent to refresh this subtree.
    UiNode*     parent_ = nullptr;
    std::size_t index_in_parent_ = 0;

    std::vector<std::unique_ptr<UiNode>> children_;
};

}
