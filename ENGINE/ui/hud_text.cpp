#include "ui/hud_text.hpp"

#include <filesystem>
#include <system_error>

#include "utils/log.hpp"

namespace ui {

std::string resolve_font_path(std::initializer_list<const char*> candidates) {
    const char* fallback = nullptr;
    for (const char* path : candidates) {
        if (!path || !*path) continue;
        if (!fallback) fallback = path;
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !ec) {
            return std::string(path);
        }
    }
    return fallback ? std::string(fallback) : std::string{};
}

std::string default_sans_font() {
#ifdef _WIN32
    return resolve_font_path({
        "C:/Windows/Fonts/segoeui.ttf",
        "C:/Windows/Fonts/arial.ttf"
    });
#else
    return resolve_font_path({
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf"
    });
#endif
}

HudText::HudText(const std::string& font_path, int font_size, SDL_Color color)
: color_(color) {
    const std::string path = font_path.empty() ? default_sans_font() : font_path;
    font_.reset(TTF_OpenFont(path.c_str(), font_size));
    if (!font_) {
        tessera::log::warn("[Hud] Failed to open font '" + path + "': " + TTF_GetError() + "; overlay text disabled");
    }
}

void HudText::set_text(SDL_Renderer* renderer, const std::string& text) {
    if (!font_ || (text == text_ && texture_)) {
        return;
    }
    text_ = text;
    texture_.reset();
    width_ = height_ = 0;
    if (text_.empty()) {
        return;
    }

    SDL_Surface* surf = TTF_RenderUTF8_Blended(font_.get(), text_.c_str(), color_);
    if (!surf) {
        tessera::log::warn(std::string("[Hud] TTF_RenderUTF8_Blended failed: ") + TTF_GetError());
        return;
    }
    texture_.reset(SDL_CreateTextureFromSurface(renderer, surf));
    width_ = surf->w;
    height_ = surf->h;
    SDL_FreeSurface(surf);
    if (!texture_) {
        tessera::log::warn(std::string("[Hud] SDL_CreateTextureFromSurface failed: ") + SDL_GetError());
    }
}

void HudText::render(SDL_Renderer* renderer, SDL_Point top_left) const {
    if (!texture_) {
        return;
    }
    const SDL_Rect dst{ top_left.x, top_left.y, width_, height_ };
    if (SDL_RenderCopy(renderer, texture_.get(), nullptr, &dst) != 0) {
        tessera::log::debug(std::string("[Hud] SDL_RenderCopy failed: ") + SDL_GetError());
    }
}

}
