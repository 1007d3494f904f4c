#include "tiling/scene.hpp"

#include <cstdlib>
#include <utility>

namespace tiling {

namespace {

int grow_distance(int local, int size) {
    if (local >= size) return local - size + 1;
    if (local < 0) return local;
    return 0;
}

}

Scene::Scene(SDL_Point size, SDL_Point offset)
: tiles_(size), offset_(offset) {}

SDL_Point Scene::to_local(SDL_Point world_pos) const {
    return SDL_Point{ world_pos.x + offset_.x, world_pos.y + offset_.y };
}

void Scene::extend_to_contain(SDL_Point world_pos) {
    const SDL_Point local = to_local(world_pos);
    const SDL_Point size = tiles_.size();
    const SDL_Point distance{ grow_distance(local.x, size.x), grow_distance(local.y, size.y) };
    if (distance.x == 0 && distance.y == 0) {
        return;
    }

    const SDL_Point new_size{ size.x + std::abs(distance.x), size.y + std::abs(distance.y) };
    const SDL_Point shift{ distance.x < 0 ? distance.x : 0, distance.y < 0 ? distance.y : 0 };

    TileGrid<Tile> grown(new_size);
    tiles_.for_each([&](SDL_Point pos, const Tile& tile) {
        grown.at(SDL_Point{ pos.x - shift.x, pos.y - shift.y }) = tile;
    });

    offset_.x -= shift.x;
    offset_.y -= shift.y;
    tiles_ = std::move(grown);
}

void Scene::set(SDL_Point world_pos, Tile tile) {
    if (tile.is_none() && !tiles_.contains(to_local(world_pos))) {
        return;
    }
    extend_to_contain(world_pos);
    tiles_.at(to_local(world_pos)) = tile;
}

Tile Scene::get(SDL_Point world_pos) const {
    const SDL_Point local = to_local(world_pos);
    if (!tiles_.contains(local)) {
        return Tile::none();
    }
    return tiles_.at(local);
}

std::size_t Scene::painted_count() const {
    std::size_t count = 0;
    tiles_.for_each([&](SDL_Point, const Tile& tile) {
        if (!tile.is_none()) ++count;
    });
    return count;
}

}
