// =============================================================================
// VOXSTREAM - OCCLUSION SNAPSHOT
// Opacity of a chunk plus a one-block border taken from its 26 neighbours
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Block.hpp"
#include "Shared/World.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace voxstream::client {

// =============================================================================
// OCCLUSION SNAPSHOT
// Covers local coordinates [-1, CHUNK_SIZE] on every axis. Cells in chunks
// missing from the store are non-opaque, so boundary faces toward unloaded
// space are drawn.
// =============================================================================
class OcclusionSnapshot {
public:
    static constexpr std::int32_t PADDED = static_cast<std::int32_t>(CHUNK_SIZE) + 2; // 34
    static constexpr std::size_t PADDED_VOLUME =
        static_cast<std::size_t>(PADDED) * PADDED * PADDED;

    OcclusionSnapshot() : m_opaque(PADDED_VOLUME, 0) {}

    // Capture opacity around `pos` from the chunk store
    void build(const World& world, const std::vector<BlockMesh>& meshes, ChunkPosition pos);

    // x, y, z in [-1, CHUNK_SIZE]
    [[nodiscard]] bool is_opaque(LocalCoord x, LocalCoord y, LocalCoord z) const noexcept {
        return m_opaque[index(x, y, z)] != 0;
    }

    [[nodiscard]] const ChunkPosition& position() const noexcept { return m_position; }

    // Neighbour chunks (excluding the centre) that were present at build time
    [[nodiscard]] std::uint32_t neighbours_present() const noexcept { return m_neighbours_present; }

private:
    [[nodiscard]] static std::size_t index(LocalCoord x, LocalCoord y, LocalCoord z) noexcept {
        return static_cast<std::size_t>(x + 1) * PADDED * PADDED +
               static_cast<std::size_t>(z + 1) * PADDED +
               static_cast<std::size_t>(y + 1);
    }

    std::vector<std::uint8_t> m_opaque;
    ChunkPosition m_position;
    std::uint32_t m_neighbours_present = 0;
};

} // namespace voxstream::client
