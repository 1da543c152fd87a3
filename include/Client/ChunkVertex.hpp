// =============================================================================
// VOXSTREAM - CHUNK VERTEX FORMAT
// Packed local position + normal, tile UVs and atlas rect
// =============================================================================
#pragma once

#include "Shared/Block.hpp"

#include <cstdint>
#include <type_traits>

namespace voxstream::client {

// =============================================================================
// CHUNK VERTEX (28 bytes)
//
// data layout (32 bits):
//   [Bits  0-6 ]: Position X (0-32, local chunk coordinate + edge)
//   [Bits  7-13]: Position Y
//   [Bits 14-20]: Position Z
//   [Bits 21-23]: Normal index (Face order)
//
// u, v: tile coordinates spanning 0..width / 0..height of the merged quad so
//       the fragment stage repeats the tile inside `texture`
// =============================================================================
struct ChunkVertex {
    std::uint32_t data = 0;
    float u = 0.0f;
    float v = 0.0f;
    TextureRect texture{};

    static constexpr std::uint32_t POS_X_SHIFT = 0;
    static constexpr std::uint32_t POS_Y_SHIFT = 7;
    static constexpr std::uint32_t POS_Z_SHIFT = 14;
    static constexpr std::uint32_t NORMAL_SHIFT = 21;

    static constexpr std::uint32_t POS_MASK = 0x7F;    // 7 bits (0-127)
    static constexpr std::uint32_t NORMAL_MASK = 0x07; // 3 bits

    [[nodiscard]] static constexpr std::uint32_t pack(std::uint32_t x, std::uint32_t y, std::uint32_t z,
                                                      std::uint32_t normal) noexcept {
        return ((x & POS_MASK) << POS_X_SHIFT) |
               ((y & POS_MASK) << POS_Y_SHIFT) |
               ((z & POS_MASK) << POS_Z_SHIFT) |
               ((normal & NORMAL_MASK) << NORMAL_SHIFT);
    }

    [[nodiscard]] constexpr std::uint32_t x() const noexcept { return (data >> POS_X_SHIFT) & POS_MASK; }
    [[nodiscard]] constexpr std::uint32_t y() const noexcept { return (data >> POS_Y_SHIFT) & POS_MASK; }
    [[nodiscard]] constexpr std::uint32_t z() const noexcept { return (data >> POS_Z_SHIFT) & POS_MASK; }
    [[nodiscard]] constexpr Face normal() const noexcept {
        return static_cast<Face>((data >> NORMAL_SHIFT) & NORMAL_MASK);
    }

    [[nodiscard]] constexpr bool operator==(const ChunkVertex& other) const noexcept = default;
};

// =============================================================================
// COMPILE-TIME VALIDATION
// =============================================================================
static_assert(sizeof(ChunkVertex) == 28, "ChunkVertex must be 28 bytes");
static_assert(std::is_trivially_copyable_v<ChunkVertex>, "ChunkVertex must be trivially copyable");
static_assert(ChunkVertex::pack(32, 32, 32, 5) == (32u | (32u << 7) | (32u << 14) | (5u << 21)),
              "Position packing");

} // namespace voxstream::client
