#include "ui/ui_node.hpp"

#include "utils/fpoint.hpp"

namespace ui {

namespace fp = tessera::fpoint;

const char* property_name(UiProperty property) {
    switch (property) {
    case UiProperty::ScaleX:    return "scale_x";
    case UiProperty::ScaleY:    return "scale_y";
    case UiProperty::PositionX: return "position_x";
    case UiProperty::PositionY: return "position_y";
    default:                    return "unknown";
    }
}

UiNode::UiNode(UiElement element, UiNode* parent, std::size_t index_in_parent)
: element_(element),
  global_pos_(element.pos),
  global_size_(element.size),
  parent_(parent),
  index_in_parent_(index_in_parent) {}

void UiNode::set(const UiProperty& id, float value) {
    switch (id) {
    case UiProperty::ScaleX:    element_.size.x = value; break;
    case UiProperty::ScaleY:    element_.size.y = value; break;
    case UiProperty::PositionX: element_.pos.x  = value; break;
    case UiProperty::PositionY: element_.pos.y  = value; break;
    }
    update();
}

std::size_t UiNode::push(UiElement element) {
    const std::size_t index = children_.size();
    children_.push_back(std::make_unique<UiNode>(element, this, index));
    update_child(index);
    return index;
}

UiNode& UiNode::child(std::size_t index) {
    return *children_.at(index);
}

const UiNode& UiNode::child(std::size_t index) const {
    return *children_.at(index);
}

bool UiNode::intersects(SDL_FPoint pos) const {
    return pos.x >= global_pos_.x && pos.x <= global_pos_.x + global_size_.x &&
           pos.y >= global_pos_.y && pos.y <= global_pos_.y + global_size_.y;
}

void UiNode::update() {
    if (parent_) {
        parent_->update_child(index_in_parent_);
        return;
    }
    global_pos_  = element_.pos;
    global_size_ = element_.size;
    update_children();
}

void UiNode::update_child(std::size_t index) {
    UiNode& c = *children_[index];
    c.global_pos_  = fp::add(global_pos_, fp::mul(c.element_.pos, global_size_));
    c.global_size_ = fp::mul(c.element_.size, global_size_);
    c.update_children();
}

void UiNode::update_children() {
    for (std::size_t i = 0; i < children_.size(); ++i) {
        update_child(i);
    }
}

}
