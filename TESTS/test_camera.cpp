#include "doctest/doctest.h"

#include "core/editor_config.hpp"
#include "editor/camera.hpp"

using editor::Camera;

TEST_CASE("the view center maps to the camera tile") {
    Camera camera(config::CameraSettings{});
    const SDL_Point window{ 640, 480 };

    const SDL_Point center = camera.screen_to_tile(SDL_Point{ 320, 240 }, window);
    CHECK(center.x == 0);
    CHECK(center.y == 0);

    const SDL_Point bottom_left = camera.screen_to_tile(SDL_Point{ 0, 480 }, window);
    CHECK(bottom_left.x == -5);
    CHECK(bottom_left.y == -5);

    const SDL_Point top_left = camera.screen_to_tile(SDL_Point{ 0, 0 }, window);
    CHECK(top_left.x == -5);
    CHECK(top_left.y == 5);
}

TEST_CASE("panning moves the tile under the cursor") {
    Camera camera(config::CameraSettings{});
    camera.pan(30.0f, -20.0f);
    CHECK(camera.pos().x == doctest::Approx(30.0f));
    CHECK(camera.pos().y == doctest::Approx(-20.0f));
    const SDL_Point center = camera.screen_to_tile(SDL_Point{ 320, 240 }, SDL_Point{ 640, 480 });
    CHECK(center.x == 30);
    CHECK(center.y == -20);
}

TEST_CASE("tile_to_view places tiles relative to the view center") {
    Camera camera(config::CameraSettings{});
    const SDL_FPoint origin = camera.tile_to_view(SDL_Point{ 0, 0 });
    CHECK(origin.x == doctest::Approx(0.5f));
    CHECK(origin.y == doctest::Approx(0.5f));

    const SDL_FPoint right = camera.tile_to_view(SDL_Point{ 2, -1 });
    CHECK(right.x == doctest::Approx(0.7f));
    CHECK(right.y == doctest::Approx(0.4f));
    CHECK(camera.tile_view_size() == doctest::Approx(0.1f));
}

TEST_CASE("zoom scales the visible height and respects the limits") {
    config::CameraSettings settings;
    Camera camera(settings);

    camera.zoom(1, 20.0f);
    CHECK(camera.height() == doctest::Approx(10.0f / 0.9f));

    camera.set_height(10.0f);
    camera.zoom(-1, 20.0f);
    CHECK(camera.height() == doctest::Approx(9.0f));

    camera.zoom(0, 20.0f);
    CHECK(camera.height() == doctest::Approx(9.0f));

    camera.set_height(1.0e6f);
    CHECK(camera.height() == doctest::Approx(settings.max_height));
    camera.set_height(0.0f);
    CHECK(camera.height() == doctest::Approx(settings.min_height));
}

TEST_CASE("pan speed grows with the square root of the height") {
    Camera camera(config::CameraSettings{});
    camera.set_height(4.0f);
    CHECK(camera.pan_step(10.0f) == doctest::Approx(0.04f));
    camera.set_height(16.0f);
    CHECK(camera.pan_step(10.0f) == doctest::Approx(0.08f));
}
