#pragma once

#include <SDL.h>

#include "core/editor_config.hpp"

namespace editor {

// World position (in tiles) of the view center and how many tiles fit in
// the view vertically.
class Camera {
public:
    explicit Camera(const config::CameraSettings& settings);

    SDL_FPoint pos() const { return pos_; }
    float height() const { return height_; }

    void set_height(float height);

    // Distance covered by one frame of movement.
    float pan_step(float dt_ms) const;
    void pan(float dx, float dy);

    // direction > 0 zooms out (more tiles visible), < 0 zooms in.
    void zoom(int direction, float dt_ms);

    SDL_Point screen_to_tile(SDL_Point pixel, SDL_Point window_size) const;

    // Normalized view position (y up) of a tile's lower-left corner.
    SDL_FPoint tile_to_view(SDL_Point tile) const;
    float tile_view_size() const { return 1.0f / height_; }

private:
    config::CameraSettings settings_;
    SDL_FPoint pos_{ 0.0f, 0.0f };
    float      height_ = 10.0f;
};

}
