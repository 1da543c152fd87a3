// =============================================================================
// VOXSTREAM - OCCLUSION SNAPSHOT IMPLEMENTATION
// =============================================================================

#include "Client/OcclusionSnapshot.hpp"

namespace voxstream::client {

namespace {

// Padded coordinate -> (chunk offset in -1..1, local coordinate)
struct AxisSplit {
    std::int32_t chunk_offset;
    LocalCoord local;
};

constexpr AxisSplit split_axis(LocalCoord c) noexcept {
    if (c < 0) {
        return {-1, static_cast<LocalCoord>(CHUNK_SIZE) - 1};
    }
    if (c >= static_cast<LocalCoord>(CHUNK_SIZE)) {
        return {1, 0};
    }
    return {0, c};
}

} // namespace

void OcclusionSnapshot::build(const World& world, const std::vector<BlockMesh>& meshes, ChunkPosition pos) {
    m_position = pos;
    m_neighbours_present = 0;

    // Cache the 3x3x3 neighbourhood, indexed [dx+1][dy+1][dz+1]
    std::array<const Chunk*, 27> chunks{};
    for (std::int32_t dx = -1; dx <= 1; ++dx) {
        for (std::int32_t dy = -1; dy <= 1; ++dy) {
            for (std::int32_t dz = -1; dz <= 1; ++dz) {
                const Chunk* chunk = world.get_chunk(pos.offset(dx, dy, dz));
                chunks[static_cast<std::size_t>((dx + 1) * 9 + (dy + 1) * 3 + (dz + 1))] = chunk;
                if (chunk && (dx != 0 || dy != 0 || dz != 0)) {
                    ++m_neighbours_present;
                }
            }
        }
    }

    const LocalCoord lo = -1;
    const LocalCoord hi = static_cast<LocalCoord>(CHUNK_SIZE);

    for (LocalCoord x = lo; x <= hi; ++x) {
        const AxisSplit sx = split_axis(x);
        for (LocalCoord z = lo; z <= hi; ++z) {
            const AxisSplit sz = split_axis(z);
            for (LocalCoord y = lo; y <= hi; ++y) {
                const AxisSplit sy = split_axis(y);

                const Chunk* chunk = chunks[static_cast<std::size_t>(
                    (sx.chunk_offset + 1) * 9 + (sy.chunk_offset + 1) * 3 + (sz.chunk_offset + 1))];

                std::uint8_t opaque = 0;
                if (chunk) {
                    const BlockId id = chunk->get(sx.local, sy.local, sz.local);
                    opaque = (id < meshes.size() && meshes[id].is_opaque()) ? 1 : 0;
                }
                m_opaque[index(x, y, z)] = opaque;
            }
        }
    }
}

} // namespace voxstream::client
