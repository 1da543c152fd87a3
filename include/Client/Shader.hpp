// =============================================================================
// VOXSTREAM - SHADER MANAGEMENT
// OpenGL 4.5 program compilation, uniforms and the built-in chunk shader
// =============================================================================
#pragma once

#include "Client/Camera.hpp"

#include <string>
#include <string_view>
#include <cstdint>

namespace voxstream::client {

// =============================================================================
// SHADER PROGRAM
// Vertex + fragment program. Uniforms use explicit locations and are written
// with glProgramUniform*, so setting them does not require the program bound.
// =============================================================================
class ShaderProgram {
public:
    ShaderProgram() = default;
    ~ShaderProgram() { release(); }

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;
    ShaderProgram(ShaderProgram&& other) noexcept;
    ShaderProgram& operator=(ShaderProgram&& other) noexcept;

    // On failure the driver's info log is kept in error()
    bool build(std::string_view vertex_source, std::string_view fragment_source);

    [[nodiscard]] const std::string& error() const noexcept { return m_error; }
    [[nodiscard]] bool valid() const noexcept { return m_program != 0; }

    void use() const;
    static void use_none();

    void set_mat4(std::int32_t location, const math::Mat4& matrix) const;
    void set_vec3(std::int32_t location, const math::Vec3& value) const;

private:
    void release() noexcept;

    std::uint32_t m_program = 0;
    std::string m_error;
};

// =============================================================================
// BUILT-IN SHADERS
// =============================================================================
namespace shaders {

// Uniform locations and texture units shared with Renderer
inline constexpr std::int32_t LOC_VIEW_PROJECTION = 0;
inline constexpr std::int32_t LOC_CHUNK_OFFSET = 1;
inline constexpr std::uint32_t ATLAS_UNIT = 0;

constexpr const char* CHUNK_VERTEX_SHADER = R"glsl(
#version 450 core

// data: x(7) | y(7) | z(7) | normal(3)
layout(location = 0) in uint a_Data;
layout(location = 1) in vec2 a_TileUV;   // 0..w, 0..h across a merged quad
layout(location = 2) in vec4 a_Rect;     // atlas x, y, width, height

layout(location = 0) uniform mat4 u_ViewProjection;
layout(location = 1) uniform vec3 u_ChunkOffset;  // chunk origin relative to render origin

out vec3 v_Normal;
out vec2 v_TileUV;
flat out vec4 v_Rect;

void main() {
    uint x = a_Data & 0x7Fu;
    uint y = (a_Data >> 7u) & 0x7Fu;
    uint z = (a_Data >> 14u) & 0x7Fu;
    uint normalIdx = (a_Data >> 21u) & 0x7u;

    vec3 worldPos = vec3(float(x), float(y), float(z)) + u_ChunkOffset;
    gl_Position = u_ViewProjection * vec4(worldPos, 1.0);

    const vec3 NORMALS[6] = vec3[6](
        vec3(-1.0, 0.0, 0.0),
        vec3( 1.0, 0.0, 0.0),
        vec3( 0.0,-1.0, 0.0),
        vec3( 0.0, 1.0, 0.0),
        vec3( 0.0, 0.0,-1.0),
        vec3( 0.0, 0.0, 1.0)
    );

    v_Normal = NORMALS[min(normalIdx, 5u)];
    v_TileUV = a_TileUV;
    v_Rect = a_Rect;
}
)glsl";

constexpr const char* CHUNK_FRAGMENT_SHADER = R"glsl(
#version 450 core

in vec3 v_Normal;
in vec2 v_TileUV;
flat in vec4 v_Rect;

out vec4 FragColor;

layout(binding = 0) uniform sampler2D u_Atlas;

void main() {
    // Repeat the tile across the merged quad without bleeding into neighbours
    vec2 uv = v_Rect.xy + fract(v_TileUV) * v_Rect.zw;
    vec4 texColor = texture(u_Atlas, uv);

    if (texColor.a < 0.1) {
        discard;
    }

    vec3 lightDir = normalize(vec3(0.5, 1.0, 0.3));
    float ambient = 0.4;
    float diffuse = max(0.0, dot(v_Normal, lightDir));
    float lighting = ambient + diffuse * 0.6;

    FragColor = vec4(clamp(texColor.rgb * lighting, 0.0, 1.0), texColor.a);
}
)glsl";

} // namespace shaders

} // namespace voxstream::client
