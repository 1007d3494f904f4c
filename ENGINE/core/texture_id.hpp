#pragma once

#include <cstddef>

// Index into TextureRegistry. The UI and tile layers only ever hold these.
struct TextureId {
    std::size_t index = 0;

    bool operator==(const TextureId& other) const { return index == other.index; }
    bool operator!=(const TextureId& other) const { return index != other.index; }
};
