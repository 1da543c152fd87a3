// =============================================================================
// VOXSTREAM - GAME DATA
// Registries and atlas shared read-only between server and client
// =============================================================================
#pragma once

#include "Block.hpp"
#include "Registry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace voxstream {

// =============================================================================
// TEXTURE ATLAS IMAGE (RGBA8, row-major, top row first)
// =============================================================================
struct AtlasImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> rgba;

    [[nodiscard]] bool valid() const noexcept {
        return width > 0 && height > 0 && rgba.size() == static_cast<std::size_t>(width) * height * 4;
    }
};

// =============================================================================
// VOXEL MODEL (dense RGBA grid, x fastest then y then z)
// =============================================================================
struct VoxelModel {
    std::uint32_t size_x = 0;
    std::uint32_t size_y = 0;
    std::uint32_t size_z = 0;
    std::vector<std::uint32_t> voxels; // 0xAABBGGRR, alpha 0 = empty

    [[nodiscard]] std::uint32_t at(std::uint32_t x, std::uint32_t y, std::uint32_t z) const noexcept {
        return voxels[x + size_x * (y + size_y * z)];
    }
};

// =============================================================================
// ITEMS
// =============================================================================
struct Item {
    std::string name;
    std::string texture;
};

struct ItemMesh {
    std::uint32_t mesh_id = 0;   // id in GameData::models
    float scale = 1.0f;
    float mesh_center[3] = {0.0f, 0.0f, 0.0f};
};

// =============================================================================
// GAME DATA
// meshes[i] is the render mesh of block id i
// =============================================================================
struct GameData {
    Registry<Block> blocks;
    std::vector<BlockMesh> meshes;
    AtlasImage texture_atlas;
    Registry<VoxelModel> models;
    Registry<Item> items;
    std::vector<ItemMesh> item_meshes;

    [[nodiscard]] bool is_registered(BlockId id) const noexcept {
        return id < meshes.size();
    }

    [[nodiscard]] bool is_opaque(BlockId id) const noexcept {
        return id < meshes.size() && meshes[id].is_opaque();
    }
};

using GameDataPtr = std::shared_ptr<const GameData>;

} // namespace voxstream
