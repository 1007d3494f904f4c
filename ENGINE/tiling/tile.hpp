#pragma once

#include <cstddef>

namespace tiling {

// 0 is the empty tile; anything else is a 1-based index into the loaded tile
// textures.
class Tile {
public:
    constexpr Tile() = default;

    static constexpr Tile from_index(std::size_t index) { return Tile(index + 1); }
    static constexpr Tile none() { return Tile(); }

    constexpr bool is_none() const { return id_ == 0; }
    constexpr std::size_t id() const { return id_; }
    constexpr std::size_t index() const { return id_ - 1; }

    constexpr bool operator==(const Tile& other) const { return id_ == other.id_; }
    constexpr bool operator!=(const Tile& other) const { return id_ != other.id_; }

private:
    constexpr explicit Tile(std::size_t id) : id_(id) {}

    std::size_t id_ = 0;
};

}
