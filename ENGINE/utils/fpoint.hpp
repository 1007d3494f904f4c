#pragma once

#include <SDL.h>

#include <cmath>

// Component-wise helpers for SDL_FPoint.
namespace tessera::fpoint {

inline SDL_FPoint add(const SDL_FPoint& a, const SDL_FPoint& b) {
    return SDL_FPoint{ a.x + b.x, a.y + b.y };
}

inline SDL_FPoint sub(const SDL_FPoint& a, const SDL_FPoint& b) {
    return SDL_FPoint{ a.x - b.x, a.y - b.y };
}

inline SDL_FPoint mul(const SDL_FPoint& a, const SDL_FPoint& b) {
    return SDL_FPoint{ a.x * b.x, a.y * b.y };
}

inline SDL_FPoint div(const SDL_FPoint& a, const SDL_FPoint& b) {
    return SDL_FPoint{ a.x / b.x, a.y / b.y };
}

inline SDL_FPoint scale(const SDL_FPoint& a, float s) {
    return SDL_FPoint{ a.x * s, a.y * s };
}

inline SDL_FPoint offset(const SDL_FPoint& a, float s) {
    return SDL_FPoint{ a.x + s, a.y + s };
}

inline SDL_FPoint from_point(const SDL_Point& p) {
    return SDL_FPoint{ static_cast<float>(p.x), static_cast<float>(p.y) };
}

inline SDL_Point floor_to_point(const SDL_FPoint& p) {
    return SDL_Point{ static_cast<int>(std::floor(p.x)), static_cast<int>(std::floor(p.y)) };
}

}
