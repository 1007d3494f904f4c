#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <initializer_list>
#include <memory>
#include <string>

namespace ui {

// First candidate that exists on disk, else the first non-empty candidate.
std::string resolve_font_path(std::initializer_list<const char*> candidates);
std::string default_sans_font();

// One line of overlay text rendered with SDL_ttf. The texture is rebuilt only
// when the text changes.
class HudText {
public:
    HudText(const std::string& font_path, int font_size, SDL_Color color);

    HudText(const HudText&) = delete;
    HudText& operator=(const HudText&) = delete;

    bool has_font() const { return static_cast<bool>(font_); }

    void set_text(SDL_Renderer* renderer, const std::string& text);

    // Top-left corner in pixels.
    void render(SDL_Renderer* renderer, SDL_Point top_left) const;

private:
    struct FontDeleter { void operator()(TTF_Font* f) const { if (f) TTF_CloseFont(f); } };
    struct TextureDeleter { void operator()(SDL_Texture* t) const { if (t) SDL_DestroyTexture(t); } };

    std::unique_ptr<TTF_Font, FontDeleter>       font_;
    std::unique_ptr<SDL_Texture, TextureDeleter> texture_;
    SDL_Color   color_{ 255, 255, 255, 255 };
    std::string text_;
    int         width_  = 0;
    int         height_ = 0;
};

}
