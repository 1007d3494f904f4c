#include "doctest/doctest.h"

#include <chrono>

#include "editor/editor_layout.hpp"
#include "ui/ui_node.hpp"

using namespace std::chrono_literals;
using animation::Clock;
using editor::LayoutRect;

TEST_CASE("main layout pins scene buttons to the top right") {
    const editor::MainUiLayout layout = editor::main_ui_layout(1.0f);
    CHECK(layout.next_scene.pos.x == doctest::Approx(0.92f));
    CHECK(layout.next_scene.pos.y == doctest::Approx(0.93f));
    CHECK(layout.prev_scene.pos.x == doctest::Approx(0.82f));
    CHECK(layout.next_scene.pos.y + layout.next_scene.size.y == doctest::Approx(1.0f));
    CHECK(layout.tile_button.pos.x == doctest::Approx(layout.tile_background.pos.x));
    CHECK(layout.tile_button.size.y == doctest::Approx(layout.tile_background.size.y));
    CHECK(layout.tile_frame.size.x > layout.tile_background.size.x);
}

TEST_CASE("picker panel is square on screen and centered") {
    const float aspect = 640.0f / 480.0f;
    const LayoutRect panel = editor::picker_panel_rect(aspect, 0.1f);
    CHECK(panel.size.x * 640.0f == doctest::Approx(panel.size.y * 480.0f));
    CHECK(panel.size.y == doctest::Approx(0.8f));
    CHECK(panel.pos.x == doctest::Approx(0.2f));
    CHECK(panel.pos.y == doctest::Approx(0.1f));

    const LayoutRect tall = editor::picker_panel_rect(0.5f, 0.1f);
    CHECK(tall.size.x == doctest::Approx(0.8f));
    CHECK(tall.size.y == doctest::Approx(0.4f));
}

TEST_CASE("picker tiles fill a square grid from the top left") {
    const LayoutRect first = editor::picker_tile_rect(0, 4);
    const LayoutRect last  = editor::picker_tile_rect(3, 4);
    CHECK(first.pos.x == doctest::Approx(0.045f));
    CHECK(first.pos.y + first.size.y == doctest::Approx(0.955f));
    CHECK(last.pos.x + last.size.x == doctest::Approx(0.955f));
    CHECK(last.pos.y == doctest::Approx(0.045f));
    CHECK(first.size.x == doctest::Approx(first.size.y));

    const LayoutRect only = editor::picker_tile_rect(0, 1);
    CHECK(only.size.x == doctest::Approx(0.91f));
}

TEST_CASE("picker open animation grows from a thin centered line") {
    const LayoutRect panel{ SDL_FPoint{ 0.2f, 0.1f }, SDL_FPoint{ 0.6f, 0.8f } };
    auto open = editor::picker_open_animator(panel, 200ms);
    ui::UiNode node(ui::UiElement{});

    const Clock::time_point t0 = Clock::now();
    open.reset(t0);
    open.animate(node, t0);
    CHECK(node.element().size.x == doctest::Approx(0.0f));
    CHECK(node.element().pos.x == doctest::Approx(0.5f));
    CHECK(node.element().size.y == doctest::Approx(0.8f * 0.02f));
    CHECK(node.element().pos.y == doctest::Approx(0.5f));

    CHECK(open.animate(node, t0 + 200ms) == animation::AnimationState::Over);
    CHECK(node.global_pos().x == doctest::Approx(0.2f));
    CHECK(node.global_pos().y == doctest::Approx(0.1f));
    CHECK(node.global_size().x == doctest::Approx(0.6f));
    CHECK(node.global_size().y == doctest::Approx(0.8f));
}

TEST_CASE("picker close animation is the open animation reversed") {
    const LayoutRect panel{ SDL_FPoint{ 0.2f, 0.1f }, SDL_FPoint{ 0.6f, 0.8f } };
    const auto open = editor::picker_open_animator(panel, 200ms);
    const Clock::time_point t0 = Clock::now();
    auto close = open.reversed(t0);
    ui::UiNode node(ui::UiElement{});

    close.reset(t0);
    close.animate(node, t0);
    CHECK(node.element().size.x == doctest::Approx(0.6f));
    CHECK(node.element().size.y == doctest::Approx(0.8f));

    close.animate(node, t0 + 200ms);
    CHECK(node.element().size.x == doctest::Approx(0.0f));
    CHECK(node.element().size.y == doctest::Approx(0.8f * 0.02f));
    CHECK_FALSE(close.is_playing(t0 + 200ms));
}
