#include "doctest/doctest.h"

#include <stdexcept>

#include "tiling/scene.hpp"
#include "tiling/tile_grid.hpp"

using tiling::Scene;
using tiling::Tile;
using tiling::TileGrid;

TEST_CASE("tile ids are one-based with zero as the empty tile") {
    CHECK(Tile().is_none());
    CHECK(Tile::none() == Tile());
    CHECK(Tile::from_index(0).id() == 1);
    CHECK(Tile::from_index(4).index() == 4);
    CHECK_FALSE(Tile::from_index(0).is_none());
}

TEST_CASE("tile grid stores row-major and rejects positions outside it") {
    TileGrid<int> grid(SDL_Point{ 3, 2 });
    grid.at(SDL_Point{ 2, 1 }) = 7;
    CHECK(grid.at(SDL_Point{ 2, 1 }) == 7);
    CHECK(grid.index_to_pos(5).x == 2);
    CHECK(grid.index_to_pos(5).y == 1);
    CHECK_THROWS_AS(grid.at(SDL_Point{ 3, 0 }), std::out_of_range);
    CHECK_THROWS_AS(grid.at(SDL_Point{ 0, -1 }), std::out_of_range);

    const TileGrid<int> negative(SDL_Point{ -4, 2 });
    CHECK(negative.empty());
    CHECK(negative.size().x == 0);
}

TEST_CASE("an empty scene grows to hold the first painted tile") {
    Scene scene;
    CHECK(scene.get(SDL_Point{ 0, 0 }).is_none());

    scene.set(SDL_Point{ 0, 0 }, Tile::from_index(0));
    CHECK(scene.size().x == 1);
    CHECK(scene.size().y == 1);
    CHECK(scene.get(SDL_Point{ 0, 0 }) == Tile::from_index(0));
}

TEST_CASE("growing toward negative coordinates keeps existing tiles in place") {
    Scene scene;
    scene.set(SDL_Point{ 0, 0 }, Tile::from_index(0));
    scene.set(SDL_Point{ -2, 3 }, Tile::from_index(1));

    CHECK(scene.size().x == 3);
    CHECK(scene.size().y == 4);
    CHECK(scene.offset().x == 2);
    CHECK(scene.offset().y == 0);
    CHECK(scene.get(SDL_Point{ 0, 0 }) == Tile::from_index(0));
    CHECK(scene.get(SDL_Point{ -2, 3 }) == Tile::from_index(1));
    CHECK(scene.get(SDL_Point{ -1, 1 }).is_none());
    CHECK(scene.painted_count() == 2);
}

TEST_CASE("erasing outside the scene does not grow it") {
    Scene scene;
    scene.set(SDL_Point{ 1, 1 }, Tile::from_index(2));
    const SDL_Point before = scene.size();

    scene.set(SDL_Point{ 100, -50 }, Tile::none());
    CHECK(scene.size().x == before.x);
    CHECK(scene.size().y == before.y);

    scene.set(SDL_Point{ 1, 1 }, Tile::none());
    CHECK(scene.get(SDL_Point{ 1, 1 }).is_none());
    CHECK(scene.painted_count() == 0);
}

TEST_CASE("for_each reports world positions") {
    Scene scene;
    scene.set(SDL_Point{ -3, -1 }, Tile::from_index(0));
    scene.set(SDL_Point{ 2, 4 }, Tile::from_index(1));

    int found = 0;
    scene.for_each([&](SDL_Point pos, const Tile& tile) {
        if (tile.is_none()) return;
        ++found;
        CHECK(scene.get(pos) == tile);
    });
    CHECK(found == 2);
}
