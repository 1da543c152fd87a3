// =============================================================================
// VOXSTREAM - ATLAS TEXTURE
// GL_TEXTURE_2D holding the server-provided block atlas
// Tiles are repeated in the fragment shader, so no mipmaps and no GL_REPEAT
// =============================================================================
#pragma once

#include "Shared/GameData.hpp"

#include <cstdint>
#include <cstdio>

// glad for OpenGL functions
#include <glad/glad.h>

namespace voxstream::client {

class AtlasTexture {
public:
    AtlasTexture() = default;
    ~AtlasTexture() { destroy(); }

    AtlasTexture(const AtlasTexture&) = delete;
    AtlasTexture& operator=(const AtlasTexture&) = delete;

    // ==========================================================================
    // UPLOAD
    // ==========================================================================

    bool upload(const AtlasImage& image) {
        destroy();

        if (!image.valid()) {
            std::printf("[AtlasTexture] Invalid atlas image (%ux%u, %zu bytes)\n",
                        image.width, image.height, image.rgba.size());
            return false;
        }

        glCreateTextures(GL_TEXTURE_2D, 1, &m_texture);
        if (m_texture == 0) {
            std::printf("[AtlasTexture] Failed to create texture\n");
            return false;
        }

        glTextureStorage2D(m_texture, 1, GL_RGBA8,
                           static_cast<GLsizei>(image.width),
                           static_cast<GLsizei>(image.height));

        // Rows are tightly packed RGBA8
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTextureSubImage2D(m_texture, 0, 0, 0,
                            static_cast<GLsizei>(image.width),
                            static_cast<GLsizei>(image.height),
                            GL_RGBA, GL_UNSIGNED_BYTE, image.rgba.data());

        // Crisp pixels; clamp so tiles at the atlas edge never wrap
        glTextureParameteri(m_texture, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTextureParameteri(m_texture, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        glTextureParameteri(m_texture, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTextureParameteri(m_texture, GL_TEXTURE_MIN_FILTER, GL_NEAREST);

        m_width = image.width;
        m_height = image.height;

        std::printf("[AtlasTexture] Uploaded atlas %ux%u\n", m_width, m_height);
        return true;
    }

    void destroy() {
        if (m_texture != 0) {
            glDeleteTextures(1, &m_texture);
            m_texture = 0;
        }
        m_width = 0;
        m_height = 0;
    }

    // ==========================================================================
    // BINDING
    // ==========================================================================

    void bind(std::uint32_t unit = 0) const {
        glBindTextureUnit(unit, m_texture);
    }

    [[nodiscard]] std::uint32_t texture_id() const noexcept { return m_texture; }
    [[nodiscard]] std::uint32_t width() const noexcept { return m_width; }
    [[nodiscard]] std::uint32_t height() const noexcept { return m_height; }

private:
    std::uint32_t m_texture = 0;
    std::uint32_t m_width = 0;
    std::uint32_t m_height = 0;
};

} // namespace voxstream::client
