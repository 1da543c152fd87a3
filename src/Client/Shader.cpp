// =============================================================================
// VOXSTREAM - SHADER PROGRAM IMPLEMENTATION
// =============================================================================

#include "Client/Shader.hpp"
#include "Shared/Logger.hpp"

#include <glad/glad.h>

#include <algorithm>
#include <utility>

namespace voxstream::client {

namespace {

// Returns the shader object, or 0 with the info log appended to `error`
GLuint compile_stage(GLenum stage, std::string_view source, std::string& error) {
    const GLuint shader = glCreateShader(stage);
    if (shader == 0) {
        error = "glCreateShader failed";
        return 0;
    }

    const GLchar* text = source.data();
    const auto size = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &text, &size);
    glCompileShader(shader);

    GLint compiled = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (compiled == GL_TRUE) {
        return shader;
    }

    GLint length = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
    std::string log(static_cast<std::size_t>(std::max(length, 1)), '\0');
    glGetShaderInfoLog(shader, length, nullptr, log.data());
    glDeleteShader(shader);

    error = (stage == GL_VERTEX_SHADER ? "vertex stage: " : "fragment stage: ") + log;
    return 0;
}

} // namespace

ShaderProgram::ShaderProgram(ShaderProgram&& other) noexcept
    : m_program(std::exchange(other.m_program, 0))
    , m_error(std::move(other.m_error)) {}

ShaderProgram& ShaderProgram::operator=(ShaderProgram&& other) noexcept {
    if (this != &other) {
        release();
        m_program = std::exchange(other.m_program, 0);
        m_error = std::move(other.m_error);
    }
    return *this;
}

void ShaderProgram::release() noexcept {
    if (m_program != 0) {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

bool ShaderProgram::build(std::string_view vertex_source, std::string_view fragment_source) {
    release();
    m_error.clear();

    const GLuint vertex = compile_stage(GL_VERTEX_SHADER, vertex_source, m_error);
    if (vertex == 0) {
        return false;
    }
    const GLuint fragment = compile_stage(GL_FRAGMENT_SHADER, fragment_source, m_error);
    if (fragment == 0) {
        glDeleteShader(vertex);
        return false;
    }

    const GLuint program = glCreateProgram();
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);

    // The program keeps the linked binary
    glDetachShader(program, vertex);
    glDetachShader(program, fragment);
    glDeleteShader(vertex);
    glDeleteShader(fragment);

    GLint linked = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (linked != GL_TRUE) {
        GLint length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        std::string log(static_cast<std::size_t>(std::max(length, 1)), '\0');
        glGetProgramInfoLog(program, length, nullptr, log.data());
        glDeleteProgram(program);

        m_error = "link: " + log;
        return false;
    }

    m_program = program;
    LOG("Shader", "Linked program ", m_program);
    return true;
}

void ShaderProgram::use() const {
    glUseProgram(m_program);
}

void ShaderProgram::use_none() {
    glUseProgram(0);
}

void ShaderProgram::set_mat4(std::int32_t location, const math::Mat4& matrix) const {
    glProgramUniformMatrix4fv(m_program, location, 1, GL_FALSE, matrix.ptr());
}

void ShaderProgram::set_vec3(std::int32_t location, const math::Vec3& value) const {
    glProgramUniform3f(m_program, location, value.x, value.y, value.z);
}

} // namespace voxstream::client
