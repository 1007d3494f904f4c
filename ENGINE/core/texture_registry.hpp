#pragma once

#include <SDL.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/texture_id.hpp"
#include "tiling/tile.hpp"

// Owns every texture the editor draws. Textures are registered under a
// logical name ("ui/plus.png", "tiles/grass.png") and handed out as
// TextureId.
class TextureRegistry {
public:
    explicit TextureRegistry(SDL_Renderer* renderer);

    TextureRegistry(const TextureRegistry&) = delete;
    TextureRegistry& operator=(const TextureRegistry&) = delete;

    // Throws std::runtime_error when SDL_image cannot load the file.
    TextureId add_texture(const std::filesystem::path& path, const std::string& name);
    TextureId add_tile(const std::filesystem::path& path, const std::string& name);

    // Loads every regular file in `dir`, sorted by file name, under
    // "<prefix>/<file name>". Returns how many were loaded.
    std::size_t load_directory(const std::filesystem::path& dir, const std::string& prefix, bool as_tiles);

    // Throws std::out_of_range for an unknown name.
    TextureId texture_id(const std::string& name) const;
    TextureId tile_texture_id(tiling::Tile tile) const;
    bool contains(const std::string& name) const;

    SDL_Texture* texture(TextureId id) const;

    std::size_t tile_count() const { return tiles_.size(); }
    std::size_t size() const { return textures_.size(); }

private:
    struct TextureDeleter { void operator()(SDL_Texture* t) const { if (t) SDL_DestroyTexture(t); } };
    using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

    SDL_Renderer* renderer_ = nullptr;
    std::unordered_map<std::string, std::size_t> ids_;
    std::vector<TextureId>  tiles_;
    std::vector<TexturePtr> textures_;
};
