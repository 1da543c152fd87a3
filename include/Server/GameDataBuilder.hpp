// =============================================================================
// VOXSTREAM - GAME DATA BUILDER
// Block/item definitions, grid texture atlas and the immutable GameData
// =============================================================================
#pragma once

#include "Shared/Block.hpp"
#include "Shared/GameData.hpp"
#include "Shared/Registry.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace voxstream::server {

// =============================================================================
// DEFINITIONS (parsed from config/blocks.toml and config/items.toml)
//
//   [[blocks.grass]]
//   type = "normal_cube"
//   texture_top = "grass_top"
//   texture_side = "grass_side"
//   texture_bottom = "dirt"
//
// `texture` sets all six faces; the top/side/bottom keys override it.
// =============================================================================
struct BlockDefinition {
    std::string name;
    BlockType type = BlockType::NORMAL_CUBE;
    std::array<std::string, FACE_COUNT> face_textures{};
};

struct ItemDefinition {
    std::string name;
    std::string texture;
};

// Tables are returned in file order. On failure `error` names the offending line.
bool parse_block_definitions(std::string_view text, std::vector<BlockDefinition>& out, std::string& error);
bool parse_item_definitions(std::string_view text, std::vector<ItemDefinition>& out, std::string& error);

// Every texture name referenced by the definitions, sorted, without duplicates
[[nodiscard]] std::vector<std::string> referenced_textures(const std::vector<BlockDefinition>& blocks,
                                                           const std::vector<ItemDefinition>& items);

// =============================================================================
// TEXTURE ATLAS BUILDER
// Square tiles laid out on a grid, no packing. Tiles of the wrong size are
// replaced by a magenta/black checkerboard.
// =============================================================================
struct TextureImage {
    std::string name;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> rgba;
};

class TextureAtlasBuilder {
public:
    static constexpr std::uint32_t TILE_SIZE = 16;

    // Returns false if the name was already added
    bool add(TextureImage image);
    bool add_missing(const std::string& name);

    [[nodiscard]] std::size_t tile_count() const noexcept { return m_tiles.size(); }

    // Writes the atlas and one normalized rect per tile, in insertion order
    void build(AtlasImage& atlas, Registry<TextureRect>& rects) const;

    [[nodiscard]] static TextureImage checkerboard(std::string name);

private:
    std::vector<TextureImage> m_tiles;
};

// =============================================================================
// ITEM MODELS
// One-voxel-thick model of the item's atlas tile, y up
// =============================================================================
[[nodiscard]] VoxelModel extrude_item_model(const TextureRect& rect, const AtlasImage& atlas);

// =============================================================================
// GAME DATA
// Air is registered first with an Empty mesh. Fails on duplicate names,
// unknown textures or an invalid atlas.
// =============================================================================
[[nodiscard]] GameDataPtr build_game_data(const std::vector<BlockDefinition>& blocks,
                                          const std::vector<ItemDefinition>& items,
                                          AtlasImage atlas,
                                          const Registry<TextureRect>& textures,
                                          std::string& error);

} // namespace voxstream::server
