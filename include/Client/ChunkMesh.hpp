// =============================================================================
// VOXSTREAM - CHUNK MESH
// Quads of one chunk in chunk-local coordinates, indexed as triangle pairs
// =============================================================================
#pragma once

#include "Client/ChunkVertex.hpp"
#include "Shared/Types.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace voxstream::client {

struct ChunkMesh {
    static constexpr std::uint32_t VERTICES_PER_QUAD = 4;
    static constexpr std::uint32_t INDICES_PER_QUAD = 6;

    ChunkPosition position;
    std::vector<ChunkVertex> vertices;
    std::vector<std::uint32_t> indices;
    std::uint32_t quad_count = 0;

    ChunkMesh() = default;

    ChunkMesh(const ChunkMesh&) = delete;
    ChunkMesh& operator=(const ChunkMesh&) = delete;
    ChunkMesh(ChunkMesh&&) noexcept = default;
    ChunkMesh& operator=(ChunkMesh&&) noexcept = default;

    // Starts a new mesh for `pos`, keeping allocated capacity
    void reset(ChunkPosition pos) noexcept {
        position = pos;
        vertices.clear();
        indices.clear();
        quad_count = 0;
    }

    void reserve(std::size_t quads) {
        vertices.reserve(quads * VERTICES_PER_QUAD);
        indices.reserve(quads * INDICES_PER_QUAD);
    }

    [[nodiscard]] bool empty() const noexcept { return quad_count == 0; }

    // World block coordinates of local vertex (0, 0, 0)
    [[nodiscard]] BlockPosition origin() const noexcept {
        return {coord::chunk_to_world(position.x),
                coord::chunk_to_world(position.y),
                coord::chunk_to_world(position.z)};
    }

    // Corners in counter-clockwise order seen from the front; triangles 0-1-2 and 2-3-0
    void add_quad(const std::array<ChunkVertex, VERTICES_PER_QUAD>& corners) {
        const auto base = static_cast<std::uint32_t>(vertices.size());
        vertices.insert(vertices.end(), corners.begin(), corners.end());
        for (std::uint32_t corner : {0u, 1u, 2u, 2u, 3u, 0u}) {
            indices.push_back(base + corner);
        }
        ++quad_count;
    }
};

} // namespace voxstream::client
