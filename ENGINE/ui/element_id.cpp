#include "ui/element_id.hpp"

namespace ui {

ElementId::ElementId(std::size_t root_index)
: path_{ root_index } {}

ElementId ElementId::push(std::size_t child_index) const {
    ElementId id = *this;
    id.set_tail(child_index);
    return id;
}

void ElementId::set_tail(std::size_t child_index) {
    path_.push_back(child_index);
}

std::string ElementId::to_string() const {
    std::string out;
    for (std::size_t i = 0; i < path_.size(); ++i) {
        if (i > 0) out += '/';
        out += std::to_string(path_[i]);
    }
    return out;
}

}
