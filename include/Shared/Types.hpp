// =============================================================================
// VOXSTREAM - CORE TYPES AND CONSTANTS
// Chunk geometry, block identifiers and coordinate conversions
// =============================================================================
#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>

namespace voxstream {

// =============================================================================
// WORLD COORDINATE SYSTEM
// =============================================================================
using ChunkCoord = std::int64_t;
using BlockCoord = std::int64_t;
using LocalCoord = std::int32_t;
using VoxelIndex = std::uint32_t;

// =============================================================================
// BLOCK IDENTIFIERS
// Stable for the lifetime of a registry instance, 0 is always air
// =============================================================================
using BlockId = std::uint16_t;

inline constexpr BlockId AIR_BLOCK = 0;

// =============================================================================
// CHUNK DIMENSIONS (32^3 = 32,768 blocks per chunk)
// Power-of-two for bit-shift optimizations
// =============================================================================
inline constexpr std::uint32_t CHUNK_SIZE   = 32;
inline constexpr std::uint32_t CHUNK_SHIFT  = 5;  // log2(32)
inline constexpr std::uint32_t CHUNK_MASK   = CHUNK_SIZE - 1;
inline constexpr std::uint32_t CHUNK_VOLUME = CHUNK_SIZE * CHUNK_SIZE * CHUNK_SIZE;

// Bit-shift constants for index calculation
inline constexpr std::uint32_t CHUNK_SHIFT_X = CHUNK_SHIFT * 2; // X contribution
inline constexpr std::uint32_t CHUNK_SHIFT_Z = CHUNK_SHIFT;     // Z contribution

static_assert((1u << CHUNK_SHIFT) == CHUNK_SIZE, "CHUNK_SHIFT must match CHUNK_SIZE");

// =============================================================================
// COORDINATE UTILITIES (Bit-shift only, no multiplication/division)
// =============================================================================
namespace coord {

    // Index = (x << 10) | (z << 5) | y  (Y-up, column-major)
    [[nodiscard]] constexpr VoxelIndex to_index(LocalCoord x, LocalCoord y, LocalCoord z) noexcept {
        return static_cast<VoxelIndex>(
            (static_cast<std::uint32_t>(x & CHUNK_MASK) << CHUNK_SHIFT_X) |
            (static_cast<std::uint32_t>(z & CHUNK_MASK) << CHUNK_SHIFT_Z) |
            static_cast<std::uint32_t>(y & CHUNK_MASK)
        );
    }

    [[nodiscard]] constexpr LocalCoord index_to_x(VoxelIndex index) noexcept {
        return static_cast<LocalCoord>((index >> CHUNK_SHIFT_X) & CHUNK_MASK);
    }

    [[nodiscard]] constexpr LocalCoord index_to_y(VoxelIndex index) noexcept {
        return static_cast<LocalCoord>(index & CHUNK_MASK);
    }

    [[nodiscard]] constexpr LocalCoord index_to_z(VoxelIndex index) noexcept {
        return static_cast<LocalCoord>((index >> CHUNK_SHIFT_Z) & CHUNK_MASK);
    }

    // Arithmetic right shift rounds toward negative infinity: -1 -> chunk -1
    [[nodiscard]] constexpr ChunkCoord world_to_chunk(BlockCoord world) noexcept {
        return world >> CHUNK_SHIFT;
    }

    // Two's complement mask keeps negative coordinates in [0, CHUNK_SIZE)
    [[nodiscard]] constexpr LocalCoord world_to_local(BlockCoord world) noexcept {
        return static_cast<LocalCoord>(world & CHUNK_MASK);
    }

    [[nodiscard]] constexpr BlockCoord chunk_to_world(ChunkCoord chunk) noexcept {
        return chunk * static_cast<BlockCoord>(CHUNK_SIZE);
    }

    [[nodiscard]] constexpr bool is_valid_local(LocalCoord x, LocalCoord y, LocalCoord z) noexcept {
        return (static_cast<std::uint32_t>(x) < CHUNK_SIZE) &&
               (static_cast<std::uint32_t>(y) < CHUNK_SIZE) &&
               (static_cast<std::uint32_t>(z) < CHUNK_SIZE);
    }

} // namespace coord

// =============================================================================
// CHUNK POSITION (chunk-grid units)
// =============================================================================
struct ChunkPosition {
    ChunkCoord x;
    ChunkCoord y;
    ChunkCoord z;

    constexpr ChunkPosition() noexcept : x(0), y(0), z(0) {}
    constexpr ChunkPosition(ChunkCoord cx, ChunkCoord cy, ChunkCoord cz) noexcept
        : x(cx), y(cy), z(cz) {}

    [[nodiscard]] constexpr bool operator==(const ChunkPosition& other) const noexcept = default;

    [[nodiscard]] constexpr ChunkPosition offset(ChunkCoord dx, ChunkCoord dy, ChunkCoord dz) const noexcept {
        return {x + dx, y + dy, z + dz};
    }

    // Squared distance in chunk units
    [[nodiscard]] constexpr std::int64_t distance_sq(const ChunkPosition& other) const noexcept {
        const std::int64_t dx = x - other.x;
        const std::int64_t dy = y - other.y;
        const std::int64_t dz = z - other.z;
        return dx * dx + dy * dy + dz * dz;
    }

    [[nodiscard]] constexpr std::size_t hash() const noexcept {
        // FNV-1a inspired hash
        std::size_t h = 14695981039346656037ULL;
        h ^= static_cast<std::size_t>(x);
        h *= 1099511628211ULL;
        h ^= static_cast<std::size_t>(y);
        h *= 1099511628211ULL;
        h ^= static_cast<std::size_t>(z);
        h *= 1099511628211ULL;
        return h;
    }
};

// =============================================================================
// BLOCK POSITION (block units, world space)
// =============================================================================
struct BlockPosition {
    BlockCoord x;
    BlockCoord y;
    BlockCoord z;

    constexpr BlockPosition() noexcept : x(0), y(0), z(0) {}
    constexpr BlockPosition(BlockCoord bx, BlockCoord by, BlockCoord bz) noexcept
        : x(bx), y(by), z(bz) {}

    [[nodiscard]] constexpr bool operator==(const BlockPosition& other) const noexcept = default;

    [[nodiscard]] constexpr ChunkPosition chunk() const noexcept {
        return {coord::world_to_chunk(x), coord::world_to_chunk(y), coord::world_to_chunk(z)};
    }

    [[nodiscard]] constexpr LocalCoord local_x() const noexcept { return coord::world_to_local(x); }
    [[nodiscard]] constexpr LocalCoord local_y() const noexcept { return coord::world_to_local(y); }
    [[nodiscard]] constexpr LocalCoord local_z() const noexcept { return coord::world_to_local(z); }
};

// =============================================================================
// COMPILE-TIME VALIDATION
// =============================================================================
static_assert(coord::world_to_chunk(-1) == -1, "Chunk addressing must floor on negative axes");
static_assert(coord::world_to_local(-1) == static_cast<LocalCoord>(CHUNK_SIZE - 1), "Local wrap on negative axes");
static_assert(coord::world_to_chunk(static_cast<BlockCoord>(CHUNK_SIZE)) == 1, "Chunk addressing");

} // namespace voxstream

// std::hash specialization for ChunkPosition
namespace std {
    template<>
    struct hash<voxstream::ChunkPosition> {
        [[nodiscard]] std::size_t operator()(const voxstream::ChunkPosition& pos) const noexcept {
            return pos.hash();
        }
    };
}
