// =============================================================================
// VOXSTREAM - MESH GENERATOR IMPLEMENTATION
// =============================================================================

#include "Client/MeshGenerator.hpp"

#include <algorithm>

namespace voxstream::client {

namespace {

// Layer axes of a face. `u` runs along a layer row, `v` across rows.
// Corners go (0,0) (w,0) (w,h) (0,h) in (u, v); `flip_v` mirrors them in v
// where that order would wind clockwise seen from outside.
struct FaceAxes {
    std::uint8_t depth;
    std::uint8_t u;
    std::uint8_t v;
    bool flip_v;
};

constexpr std::array<FaceAxes, FACE_COUNT> FACE_AXES{{
    {0, 2, 1, false},   // -X
    {0, 2, 1, true},    // +X
    {1, 0, 2, false},   // -Y
    {1, 0, 2, true},    // +Y
    {2, 0, 1, true},    // -Z
    {2, 0, 1, false},   // +Z
}};

constexpr bool is_positive(Face face) noexcept {
    return (face & 1u) != 0;
}

} // namespace

void MeshGenerator::generate(const Chunk& chunk, const std::vector<BlockMesh>& meshes,
                             const OcclusionSnapshot& occlusion, ChunkMesh& out) {
    out.reset(chunk.position());
    m_faces = 0;
    m_culled = 0;

    if (chunk.is_empty()) {
        return;
    }

    for (std::uint32_t f = 0; f < FACE_COUNT; ++f) {
        const auto face = static_cast<Face>(f);
        collect_faces(chunk, meshes, occlusion, face);
        for (std::uint32_t depth = 0; depth < SIZE; ++depth) {
            merge_layer(depth, face, meshes, out);
        }
    }
}

void MeshGenerator::collect_faces(const Chunk& chunk, const std::vector<BlockMesh>& meshes,
                                  const OcclusionSnapshot& occlusion, Face face) {
    for (Layer& layer : m_layers) {
        layer.fill(AIR_BLOCK);
    }

    const FaceAxes& axes = FACE_AXES[face];
    const std::int32_t* step = FACE_NORMALS[face];

    for (std::uint32_t x = 0; x < SIZE; ++x) {
        for (std::uint32_t z = 0; z < SIZE; ++z) {
            for (std::uint32_t y = 0; y < SIZE; ++y) {
                const auto lx = static_cast<LocalCoord>(x);
                const auto ly = static_cast<LocalCoord>(y);
                const auto lz = static_cast<LocalCoord>(z);

                const BlockId id = chunk.get(lx, ly, lz);
                if (id >= meshes.size() || !meshes[id].is_opaque()) {
                    continue;
                }

                if (occlusion.is_opaque(lx + step[0], ly + step[1], lz + step[2])) {
                    ++m_culled;
                    continue;
                }

                const std::uint32_t p[3] = {x, y, z};
                m_layers[p[axes.depth]][p[axes.v] * SIZE + p[axes.u]] = id;
                ++m_faces;
            }
        }
    }
}

void MeshGenerator::merge_layer(std::uint32_t depth, Face face, const std::vector<BlockMesh>& meshes,
                                ChunkMesh& out) {
    Layer& layer = m_layers[depth];

    for (std::uint32_t v = 0; v < SIZE; ++v) {
        for (std::uint32_t u = 0; u < SIZE; ++u) {
            const BlockId id = layer[v * SIZE + u];
            if (id == AIR_BLOCK) continue;

            std::uint32_t width = 1;
            while (u + width < SIZE && layer[v * SIZE + u + width] == id) {
                ++width;
            }

            std::uint32_t height = 1;
            for (; v + height < SIZE; ++height) {
                const BlockId* row = &layer[(v + height) * SIZE + u];
                bool same = true;
                for (std::uint32_t i = 0; i < width && same; ++i) {
                    same = row[i] == id;
                }
                if (!same) break;
            }

            // Merged cells are consumed
            for (std::uint32_t dv = 0; dv < height; ++dv) {
                std::fill_n(&layer[(v + dv) * SIZE + u], width, AIR_BLOCK);
            }

            emit_quad(out, face, depth, u, v, width, height, meshes[id].faces[face]);
        }
    }
}

void MeshGenerator::emit_quad(ChunkMesh& out, Face face, std::uint32_t depth,
                              std::uint32_t u, std::uint32_t v, std::uint32_t width, std::uint32_t height,
                              const TextureRect& texture) {
    static constexpr std::uint32_t CORNER_U[4] = {0, 1, 1, 0};
    static constexpr std::uint32_t CORNER_V[4] = {0, 0, 1, 1};

    const FaceAxes& axes = FACE_AXES[face];
    const std::uint32_t plane = depth + (is_positive(face) ? 1u : 0u);

    std::array<ChunkVertex, ChunkMesh::VERTICES_PER_QUAD> corners;
    for (std::uint32_t i = 0; i < 4; ++i) {
        const std::uint32_t du = CORNER_U[i] * width;
        const std::uint32_t dv = axes.flip_v ? (1 - CORNER_V[i]) * height : CORNER_V[i] * height;

        std::uint32_t p[3];
        p[axes.depth] = plane;
        p[axes.u] = u + du;
        p[axes.v] = v + dv;

        ChunkVertex& vertex = corners[i];
        vertex.data = ChunkVertex::pack(p[0], p[1], p[2], face);
        vertex.u = static_cast<float>(du);
        vertex.v = static_cast<float>(height - dv);  // image rows run top-down
        vertex.texture = texture;
    }

    out.add_quad(corners);
}

} // namespace voxstream::client
