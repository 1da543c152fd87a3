// =============================================================================
// VOXSTREAM - MESH GENERATOR
// Greedy meshing with neighbour-aware face culling
// =============================================================================
#pragma once

#include "Client/ChunkMesh.hpp"
#include "Client/OcclusionSnapshot.hpp"
#include "Shared/Block.hpp"
#include "Shared/Chunk.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace voxstream::client {

// A face is emitted where an opaque block borders a non-opaque cell. Faces of
// the same block id within one layer merge into maximal rectangles, found by
// scanning rows first and extending downwards.
//
// Output order: face (-X..+Z), then layer along the face normal, then
// row-major within the layer.
class MeshGenerator {
public:
    static constexpr std::uint32_t SIZE = CHUNK_SIZE;
    static constexpr std::uint32_t SIZE_SQ = SIZE * SIZE;

    MeshGenerator() = default;

    MeshGenerator(const MeshGenerator&) = delete;
    MeshGenerator& operator=(const MeshGenerator&) = delete;

    // Replaces the contents of `out`. `occlusion` must have been built for
    // chunk.position().
    void generate(const Chunk& chunk, const std::vector<BlockMesh>& meshes,
                  const OcclusionSnapshot& occlusion, ChunkMesh& out);

    // Visible and hidden block faces counted by the last generate()
    [[nodiscard]] std::uint32_t last_faces_generated() const noexcept { return m_faces; }
    [[nodiscard]] std::uint32_t last_faces_culled() const noexcept { return m_culled; }

private:
    // Block id owning the visible face in each cell of a layer, AIR_BLOCK = none
    using Layer = std::array<BlockId, SIZE_SQ>;

    void collect_faces(const Chunk& chunk, const std::vector<BlockMesh>& meshes,
                       const OcclusionSnapshot& occlusion, Face face);
    void merge_layer(std::uint32_t depth, Face face, const std::vector<BlockMesh>& meshes, ChunkMesh& out);

    static void emit_quad(ChunkMesh& out, Face face, std::uint32_t depth,
                          std::uint32_t u, std::uint32_t v, std::uint32_t width, std::uint32_t height,
                          const TextureRect& texture);

    std::array<Layer, SIZE> m_layers{};

    std::uint32_t m_faces = 0;
    std::uint32_t m_culled = 0;
};

} // namespace voxstream::client
