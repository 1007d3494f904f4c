#pragma once

#include <SDL.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tiling {

// Fixed-size, row-major 2D storage.
template <typename T>
class TileGrid {
public:
    TileGrid() = default;

    explicit TileGrid(SDL_Point size)
    : size_{ size.x > 0 ? size.x : 0, size.y > 0 ? size.y : 0 },
      data_(static_cast<std::size_t>(size_.x) * static_cast<std::size_t>(size_.y)) {}

    SDL_Point size() const { return size_; }
    bool empty() const { return data_.empty(); }

    bool contains(SDL_Point pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < size_.x && pos.y < size_.y;
    }

    T& at(SDL_Point pos) { return data_[checked_index(pos)]; }
    const T& at(SDL_Point pos) const { return data_[checked_index(pos)]; }

    SDL_Point index_to_pos(std::size_t index) const {
        const auto w = static_cast<std::size_t>(size_.x);
        return SDL_Point{ static_cast<int>(index % w), static_cast<int>(index / w) };
    }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (std::size_t i = 0; i < data_.size(); ++i) {
            fn(index_to_pos(i), data_[i]);
        }
    }

private:
    std::size_t checked_index(SDL_Point pos) const {
        if (!contains(pos)) {
            throw std::out_of_range("TileGrid position (" + std::to_string(pos.x) + ", " +
                                    std::to_string(pos.y) + ") outside " + std::to_string(size_.x) +
                                    "x" + std::to_string(size_.y));
        }
        return static_cast<std::size_t>(pos.y) * static_cast<std::size_t>(size_.x) +
               static_cast<std::size_t>(pos.x);
    }

    SDL_Point      size_{ 0, 0 };
    std::vector<T> data_;
};

}
