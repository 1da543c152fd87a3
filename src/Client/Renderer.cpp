// =============================================================================
// VOXSTREAM - OPENGL 4.5 RENDERER IMPLEMENTATION
// =============================================================================

#include "Client/Renderer.hpp"
#include "Shared/Logger.hpp"

#include <glad/glad.h>

#include <cstddef>
#include <iostream>
#include <utility>

namespace voxstream::client {

// =============================================================================
// GPU CHUNK MESH
// =============================================================================

GpuChunkMesh::GpuChunkMesh(GpuChunkMesh&& other) noexcept
    : m_origin(other.m_origin)
    , m_vao(std::exchange(other.m_vao, 0))
    , m_vertex_buffer(std::exchange(other.m_vertex_buffer, 0))
    , m_index_buffer(std::exchange(other.m_index_buffer, 0))
    , m_vertex_count(std::exchange(other.m_vertex_count, 0))
    , m_index_count(std::exchange(other.m_index_count, 0)) {}

GpuChunkMesh& GpuChunkMesh::operator=(GpuChunkMesh&& other) noexcept {
    if (this != &other) {
        release();
        m_origin = other.m_origin;
        m_vao = std::exchange(other.m_vao, 0);
        m_vertex_buffer = std::exchange(other.m_vertex_buffer, 0);
        m_index_buffer = std::exchange(other.m_index_buffer, 0);
        m_vertex_count = std::exchange(other.m_vertex_count, 0);
        m_index_count = std::exchange(other.m_index_count, 0);
    }
    return *this;
}

void GpuChunkMesh::release() noexcept {
    if (m_vao != 0) glDeleteVertexArrays(1, &m_vao);
    if (m_vertex_buffer != 0) glDeleteBuffers(1, &m_vertex_buffer);
    if (m_index_buffer != 0) glDeleteBuffers(1, &m_index_buffer);
    m_vao = m_vertex_buffer = m_index_buffer = 0;
    m_vertex_count = m_index_count = 0;
}

bool GpuChunkMesh::upload(const ChunkMesh& mesh) {
    release();

    glCreateVertexArrays(1, &m_vao);
    glCreateBuffers(1, &m_vertex_buffer);
    glCreateBuffers(1, &m_index_buffer);
    if (m_vao == 0 || m_vertex_buffer == 0 || m_index_buffer == 0) {
        release();
        return false;
    }

    // Meshes are replaced whole, never updated in place
    glNamedBufferStorage(m_vertex_buffer,
                         static_cast<GLsizeiptr>(mesh.vertices.size() * sizeof(ChunkVertex)),
                         mesh.vertices.data(), 0);
    glNamedBufferStorage(m_index_buffer,
                         static_cast<GLsizeiptr>(mesh.indices.size() * sizeof(std::uint32_t)),
                         mesh.indices.data(), 0);

    constexpr GLuint binding = 0;
    glVertexArrayVertexBuffer(m_vao, binding, m_vertex_buffer, 0, sizeof(ChunkVertex));
    glVertexArrayElementBuffer(m_vao, m_index_buffer);

    // location 0: packed position + normal
    glEnableVertexArrayAttrib(m_vao, 0);
    glVertexArrayAttribIFormat(m_vao, 0, 1, GL_UNSIGNED_INT, offsetof(ChunkVertex, data));
    glVertexArrayAttribBinding(m_vao, 0, binding);

    // location 1: tile coordinates
    glEnableVertexArrayAttrib(m_vao, 1);
    glVertexArrayAttribFormat(m_vao, 1, 2, GL_FLOAT, GL_FALSE, offsetof(ChunkVertex, u));
    glVertexArrayAttribBinding(m_vao, 1, binding);

    // location 2: atlas rectangle
    glEnableVertexArrayAttrib(m_vao, 2);
    glVertexArrayAttribFormat(m_vao, 2, 4, GL_FLOAT, GL_FALSE, offsetof(ChunkVertex, texture));
    glVertexArrayAttribBinding(m_vao, 2, binding);

    m_origin = mesh.origin();
    m_vertex_count = static_cast<std::uint32_t>(mesh.vertices.size());
    m_index_count = static_cast<std::uint32_t>(mesh.indices.size());
    return true;
}

void GpuChunkMesh::draw() const {
    glBindVertexArray(m_vao);
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(m_index_count), GL_UNSIGNED_INT, nullptr);
}

// =============================================================================
// RENDERER
// =============================================================================

bool Renderer::initialize(const AtlasImage& atlas) {
    if (m_initialized) {
        return true;
    }

    if (!m_chunk_program.build(shaders::CHUNK_VERTEX_SHADER, shaders::CHUNK_FRAGMENT_SHADER)) {
        std::cerr << "[Renderer] Chunk shader failed: " << m_chunk_program.error() << "\n";
        return false;
    }

    if (!m_atlas.upload(atlas)) {
        std::cerr << "[Renderer] Failed to upload texture atlas\n";
        return false;
    }

    glEnable(GL_DEPTH_TEST);
    glEnable(GL_CULL_FACE);
    glCullFace(GL_BACK);
    glFrontFace(GL_CCW);

    LOG("Renderer", "Initialized, atlas ", atlas.width, "x", atlas.height);
    m_initialized = true;
    return true;
}

void Renderer::shutdown() {
    if (!m_initialized) {
        return;
    }

    m_chunks.clear();
    m_total_vertices = 0;
    m_atlas.destroy();
    m_initialized = false;
}

void Renderer::begin_frame() {
    glClearColor(0.5f, 0.7f, 1.0f, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    m_draw_calls = 0;
}

void Renderer::set_camera(const Camera& camera) {
    m_view_projection = camera.view_projection();
    m_render_origin = camera.render_origin();
}

void Renderer::render_chunks() {
    if (m_chunks.empty()) {
        return;
    }

    m_chunk_program.use();
    m_chunk_program.set_mat4(shaders::LOC_VIEW_PROJECTION, m_view_projection);
    m_atlas.bind(shaders::ATLAS_UNIT);

    for (const auto& entry : m_chunks) {
        const GpuChunkMesh& gpu_mesh = entry.second;

        // Small float offsets near the camera, whatever the world position
        const BlockPosition& origin = gpu_mesh.origin();
        const math::Vec3 offset{
            static_cast<float>(static_cast<double>(origin.x) - m_render_origin.x),
            static_cast<float>(static_cast<double>(origin.y) - m_render_origin.y),
            static_cast<float>(static_cast<double>(origin.z) - m_render_origin.z)
        };
        m_chunk_program.set_vec3(shaders::LOC_CHUNK_OFFSET, offset);

        gpu_mesh.draw();
        ++m_draw_calls;
    }

    glBindVertexArray(0);
    ShaderProgram::use_none();
}

void Renderer::update_chunk_mesh(const ChunkPosition& pos, const ChunkMesh& mesh) {
    drop_chunk(pos);
    if (mesh.empty()) {
        return;
    }

    GpuChunkMesh gpu_mesh;
    if (!gpu_mesh.upload(mesh)) {
        LOG("Renderer", "Upload failed for chunk (", pos.x, ", ", pos.y, ", ", pos.z, ")");
        return;
    }

    m_total_vertices += gpu_mesh.vertex_count();
    m_chunks.emplace(pos, std::move(gpu_mesh));
}

void Renderer::drop_chunk(const ChunkPosition& pos) {
    auto it = m_chunks.find(pos);
    if (it == m_chunks.end()) {
        return;
    }
    m_total_vertices -= it->second.vertex_count();
    m_chunks.erase(it);
}

} // namespace voxstream::client
