#pragma once

#include <SDL.h>

#include <cstddef>

#include "tiling/tile.hpp"
#include "tiling/tile_grid.hpp"

namespace tiling {

// Tile map addressed by signed world tile coordinates. Storage grows on
// demand; `offset` maps world coordinates onto the grid (local = world +
// offset).
class Scene {
public:
    explicit Scene(SDL_Point size = SDL_Point{ 0, 0 }, SDL_Point offset = SDL_Point{ 0, 0 });

    // Grows the storage so world_pos is inside, keeping every existing tile
    // at its world position.
    void extend_to_contain(SDL_Point world_pos);

    void set(SDL_Point world_pos, Tile tile);
    Tile get(SDL_Point world_pos) const;

    SDL_Point size() const { return tiles_.size(); }
    SDL_Point offset() const { return offset_; }
    std::size_t painted_count() const;

    // fn(SDL_Point world_pos, const Tile&) for every stored cell.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        tiles_.for_each([&](SDL_Point local, const Tile& tile) {
            fn(SDL_Point{ local.x - offset_.x, local.y - offset_.y }, tile);
        });
    }

private:
    SDL_Point to_local(SDL_Point world_pos) const;

    TileGrid<Tile> tiles_;
    SDL_Point      offset_{ 0, 0 };
};

}
