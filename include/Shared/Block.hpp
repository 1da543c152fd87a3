// =============================================================================
// VOXSTREAM - BLOCK DEFINITIONS
// Block types, face order and render meshes
// =============================================================================
#pragma once

#include "Types.hpp"

#include <array>
#include <cstdint>
#include <string>

namespace voxstream {

// =============================================================================
// FACE ORDER (-X, +X, -Y, +Y, -Z, +Z)
// =============================================================================
enum Face : std::uint8_t {
    FACE_NEG_X = 0,
    FACE_POS_X = 1,
    FACE_NEG_Y = 2,
    FACE_POS_Y = 3,
    FACE_NEG_Z = 4,
    FACE_POS_Z = 5,
    FACE_COUNT = 6
};

// Integer normal per face
inline constexpr std::int32_t FACE_NORMALS[FACE_COUNT][3] = {
    {-1,  0,  0}, { 1,  0,  0},
    { 0, -1,  0}, { 0,  1,  0},
    { 0,  0, -1}, { 0,  0,  1}
};

// =============================================================================
// TEXTURE RECT (normalized atlas coordinates)
// =============================================================================
struct TextureRect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] constexpr bool operator==(const TextureRect& other) const noexcept = default;
};

// =============================================================================
// BLOCK
// =============================================================================
enum class BlockType : std::uint8_t {
    AIR,
    NORMAL_CUBE
};

struct Block {
    std::string name;
    BlockType type = BlockType::AIR;
    std::array<std::string, FACE_COUNT> face_textures{}; // texture names, face order
};

// =============================================================================
// BLOCK MESH
// Render shape of a block id, indexed in parallel with the block registry
// =============================================================================
struct BlockMesh {
    enum class Kind : std::uint8_t {
        EMPTY,
        FULL_CUBE
    };

    Kind kind = Kind::EMPTY;
    std::array<TextureRect, FACE_COUNT> faces{};

    [[nodiscard]] static BlockMesh empty() noexcept { return BlockMesh{}; }

    [[nodiscard]] static BlockMesh full_cube(const std::array<TextureRect, FACE_COUNT>& rects) noexcept {
        return BlockMesh{Kind::FULL_CUBE, rects};
    }

    // Only full cubes hide neighbouring faces and block movement
    [[nodiscard]] bool is_opaque() const noexcept { return kind == Kind::FULL_CUBE; }
};

} // namespace voxstream
