#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>

#include <exception>
#include <filesystem>
#include <string>

#include "core/editor_config.hpp"
#include "core/texture_registry.hpp"
#include "editor/tile_editor.hpp"
#include "utils/log.hpp"

namespace fs = std::filesystem;

namespace {

fs::path resolve_project_path(const std::string& value) {
    fs::path path(value);
    if (path.is_relative()) {
        path = config::project_root() / path;
    }
    return path;
}

void apply_log_settings(const config::EditorSettings& settings) {
    if (!settings.log_level.empty()) {
        tessera::log::set_level(tessera::log::parse_level(settings.log_level, tessera::log::level()));
    }
    if (!settings.log_file.empty()) {
        const fs::path path = resolve_project_path(settings.log_file);
        if (!tessera::log::open_file(path.string(), true)) {
            tessera::log::warn("[Main] Could not open log file '" + path.string() + "'.");
        }
    }
}

int run(SDL_Renderer* renderer, const config::EditorSettings& settings) {
    try {
        TextureRegistry textures(renderer);
        const std::size_t tiles = textures.load_directory(resolve_project_path(settings.tiles_dir), "tiles", true);
        textures.load_directory(resolve_project_path(settings.ui_dir), "ui", false);
        if (tiles == 0) {
            tessera::log::error("[Main] No tile textures found in '" + settings.tiles_dir + "'.");
            return 1;
        }

        int width = 0;
        int height = 0;
        SDL_GetRendererOutputSize(renderer, &width, &height);

        editor::TileEditor editor(renderer, SDL_Point{ width, height }, settings, textures);
        editor.run();
    } catch (const std::exception& e) {
        tessera::log::error(std::string("[Main] ") + e.what());
        return 1;
    }
    return 0;
}

}

int main(int argc, char* argv[]) {
    tessera::log::reset_time_origin();
    tessera::log::info("[Main] Starting tile editor...");

    const fs::path config_path = (argc > 1 && argv[1]) ? fs::path(argv[1]) : config::default_config_path();
    const config::EditorSettings settings = config::load_editor_config(config_path);
    apply_log_settings(settings);
    tessera::log::info("[Main] Using config '" + config_path.string() + "'.");

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        tessera::log::error(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }

    if (TTF_Init() < 0) {
        tessera::log::error(std::string("TTF_Init failed: ") + TTF_GetError());
        SDL_Quit();
        return 1;
    }

    if (!(IMG_Init(IMG_INIT_PNG | IMG_INIT_JPG) & IMG_INIT_PNG)) {
        tessera::log::error(std::string("IMG_Init failed: ") + IMG_GetError());
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_Window* window = SDL_CreateWindow(settings.window_title.c_str(),
                                          SDL_WINDOWPOS_CENTERED,
                                          SDL_WINDOWPOS_CENTERED,
                                          settings.window_width,
                                          settings.window_height,
                                          SDL_WINDOW_SHOWN);
    if (!window) {
        tessera::log::error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer) {
        tessera::log::error(std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        SDL_DestroyWindow(window);
        IMG_Quit();
        TTF_Quit();
        SDL_Quit();
        return 1;
    }

    SDL_RendererInfo info;
    if (SDL_GetRendererInfo(renderer, &info) == 0) {
        tessera::log::info(std::string("[Main] Renderer: ") + (info.name ? info.name : "Unknown"));
    }

    const int status = run(renderer, settings);

    SDL_DestroyRenderer(renderer);
    SDL_DestroyWindow(window);
    IMG_Quit();
    TTF_Quit();
    SDL_Quit();
    if (status == 0) {
        tessera::log::info("[Main] Editor exited cleanly.");
    }
    return status;
}
