// =============================================================================
// VOXSTREAM - GAME DATA LOADER
// Reads block/item definitions and PNG tiles from disk
// =============================================================================
#pragma once

#include "Shared/GameData.hpp"

#include <string>

namespace voxstream::server {

struct GameDataPaths {
    std::string blocks_file = "blocks.toml";   // searched like settings.toml
    std::string items_file = "items.toml";
    std::string textures_dir = "assets/textures";
};

// Returns nullptr on failure with the reason printed. Missing or unreadable
// PNG tiles fall back to a checkerboard and do not fail the load.
[[nodiscard]] GameDataPtr load_game_data(const GameDataPaths& paths = {});

} // namespace voxstream::server
