#include "core/texture_registry.hpp"

#include <SDL_image.h>

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "utils/log.hpp"

namespace fs = std::filesystem;

TextureRegistry::TextureRegistry(SDL_Renderer* renderer)
: renderer_(renderer) {}

TextureId TextureRegistry::add_texture(const fs::path& path, const std::string& name) {
    TexturePtr texture(IMG_LoadTexture(renderer_, path.u8string().c_str()));
    if (!texture) {
        std::ostringstream oss;
        oss << "IMG_LoadTexture failed for '" << path.u8string() << "': " << IMG_GetError();
        throw std::runtime_error(oss.str());
    }
    if (SDL_SetTextureBlendMode(texture.get(), SDL_BLENDMODE_BLEND) != 0) {
        tessera::log::warn(std::string("[Textures] Blend mode unsupported for '") + name + "': " + SDL_GetError());
    }

    const TextureId id{ textures_.size() };
    textures_.push_back(std::move(texture));
    ids_[name] = id.index;
    tessera::log::debug(std::string("[Textures] Loaded '") + name + "' as #" + std::to_string(id.index));
    return id;
}

TextureId TextureRegistry::add_tile(const fs::path& path, const std::string& name) {
    const TextureId id = add_texture(path, name);
    tiles_.push_back(id);
    return id;
}

std::size_t TextureRegistry::load_directory(const fs::path& dir, const std::string& prefix, bool as_tiles) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        std::ostringstream oss;
        oss << "Cannot read texture directory '" << dir.u8string() << "': " << ec.message();
        throw std::runtime_error(oss.str());
    }

    std::vector<fs::path> files;
    for (const auto& entry : it) {
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().u8string() < b.filename().u8string();
    });

    for (const auto& file : files) {
        const std::string name = prefix + "/" + file.filename().u8string();
        if (as_tiles) {
            add_tile(file, name);
        } else {
            add_texture(file, name);
        }
    }
    tessera::log::info("[Textures] Loaded " + std::to_string(files.size()) + " texture(s) from '" + dir.u8string() + "'");
    return files.size();
}

TextureId TextureRegistry::texture_id(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) {
        throw std::out_of_range("Unknown texture '" + name + "'");
    }
    return TextureId{ it->second };
}

TextureId TextureRegistry::tile_texture_id(tiling::Tile tile) const {
    if (tile.is_none()) {
        throw std::out_of_range("The empty tile has no texture");
    }
    return tiles_.at(tile.index());
}

bool TextureRegistry::contains(const std::string& name) const {
    return ids_.find(name) != ids_.end();
}

SDL_Texture* TextureRegistry::texture(TextureId id) const {
    return textures_.at(id.index).get();
}
