// =============================================================================
// VOXSTREAM - OPENGL 4.5 RENDERER
// Receives chunk meshes from the update scheduler and draws them every frame.
// Chunk geometry is drawn relative to the camera's render origin.
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/GameData.hpp"
#include "Client/AtlasTexture.hpp"
#include "Client/Camera.hpp"
#include "Client/ChunkMesh.hpp"
#include "Client/Shader.hpp"
#include "Client/UpdateScheduler.hpp"

#include <cstdint>
#include <unordered_map>

namespace voxstream::client {

// One chunk's vertex array with immutable vertex and index buffers
class GpuChunkMesh {
public:
    GpuChunkMesh() = default;
    ~GpuChunkMesh() { release(); }

    GpuChunkMesh(const GpuChunkMesh&) = delete;
    GpuChunkMesh& operator=(const GpuChunkMesh&) = delete;
    GpuChunkMesh(GpuChunkMesh&& other) noexcept;
    GpuChunkMesh& operator=(GpuChunkMesh&& other) noexcept;

    bool upload(const ChunkMesh& mesh);
    void draw() const;

    [[nodiscard]] const BlockPosition& origin() const noexcept { return m_origin; }
    [[nodiscard]] std::uint32_t vertex_count() const noexcept { return m_vertex_count; }
    [[nodiscard]] std::uint32_t index_count() const noexcept { return m_index_count; }

private:
    void release() noexcept;

    BlockPosition m_origin;
    std::uint32_t m_vao = 0;
    std::uint32_t m_vertex_buffer = 0;
    std::uint32_t m_index_buffer = 0;
    std::uint32_t m_vertex_count = 0;
    std::uint32_t m_index_count = 0;
};

class Renderer final : public MeshSink {
public:
    Renderer() = default;
    ~Renderer() override { shutdown(); }

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    // Compiles the chunk program and uploads the block atlas
    bool initialize(const AtlasImage& atlas);
    void shutdown();

    void begin_frame();
    void set_camera(const Camera& camera);
    void render_chunks();

    // Replaces the chunk's buffers; an empty mesh only removes them
    void update_chunk_mesh(const ChunkPosition& pos, const ChunkMesh& mesh) override;

    [[nodiscard]] std::size_t uploaded_chunk_count() const noexcept { return m_chunks.size(); }
    [[nodiscard]] std::size_t total_vertices() const noexcept { return m_total_vertices; }
    [[nodiscard]] std::size_t draw_calls_last_frame() const noexcept { return m_draw_calls; }

private:
    void drop_chunk(const ChunkPosition& pos);

    bool m_initialized = false;

    ShaderProgram m_chunk_program;
    AtlasTexture m_atlas;

    math::Mat4 m_view_projection;
    WorldPosition m_render_origin;

    std::unordered_map<ChunkPosition, GpuChunkMesh> m_chunks;

    std::size_t m_total_vertices = 0;
    std::size_t m_draw_calls = 0;
};

} // namespace voxstream::client
