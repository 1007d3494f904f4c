#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ui {

// Path from a root of a UiTree down to one node: the root index followed by
// one child index per level. Ids are positional; the tree never removes
// nodes, so an id handed out by UiTree stays valid for the tree's lifetime.
class ElementId {
public:
    explicit ElementId(std::size_t root_index);

    // Copy extended one level down, addressing child `child_index` of the
    // node this id points at.
    ElementId push(std::size_t child_index) const;

    void set_tail(std::size_t child_index);

    std::size_t head() const { return path_.front(); }
    std::size_t tail() const { return path_.back(); }
    std::size_t depth() const { return path_.size(); }
    const std::vector<std::size_t>& path() const { return path_; }

    std::string to_string() const;

    bool operator==(const ElementId& other) const { return path_ == other.path_; }
    bool operator!=(const ElementId& other) const { return path_ != other.path_; }

private:
    std::vector<std::size_t> path_;
};

}
