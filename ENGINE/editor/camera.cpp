#include "editor/camera.hpp"

#include <algorithm>
#include <cmath>

#include "utils/fpoint.hpp"

namespace editor {

namespace fp = tessera::fpoint;

Camera::Camera(const config::CameraSettings& settings)
: settings_(settings) {
    set_height(settings.height);
}

void Camera::set_height(float height) {
    height_ = std::clamp(height, settings_.min_height, settings_.max_height);
}

float Camera::pan_step(float dt_ms) const {
    return settings_.pan_speed * std::sqrt(height_) * dt_ms;
}

void Camera::pan(float dx, float dy) {
    pos_.x += dx;
    pos_.y += dy;
}

void Camera::zoom(int direction, float dt_ms) {
    if (direction == 0) {
        return;
    }
    const float zoom_scale = std::pow(settings_.zoom_base, settings_.zoom_rate * dt_ms);
    set_height(direction > 0 ? height_ / zoom_scale : height_ * zoom_scale);
}

SDL_Point Camera::screen_to_tile(SDL_Point pixel, SDL_Point window_size) const {
    SDL_FPoint pos = fp::div(fp::from_point(pixel), fp::from_point(window_size));
    pos.y = 1.0f - pos.y;
    const SDL_FPoint scaled = fp::scale(pos_, 1.0f / height_);
    const SDL_FPoint world = fp::scale(fp::offset(fp::add(pos, scaled), -0.5f), height_);
    return fp::floor_to_point(world);
}

SDL_FPoint Camera::tile_to_view(SDL_Point tile) const {
    const SDL_FPoint pos = fp::scale(fp::from_point(tile), 1.0f / height_);
    return fp::offset(fp::sub(pos, fp::scale(pos_, 1.0f / height_)), 0.5f);
}

}
