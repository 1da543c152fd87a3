// =============================================================================
// VOXSTREAM - CLIENT SETTINGS
// Typed view of config/settings.toml
// =============================================================================
#pragma once

#include "Shared/Settings.hpp"

#include <array>
#include <cstdint>

namespace voxstream::client {

struct ClientSettings {
    std::uint32_t window_width = 1600;
    std::uint32_t window_height = 900;
    bool invert_mouse = false;
    float mouse_sensitivity = 0.2f;
    float fov = 70.0f;
    float player_speed = 10.0f;
    // Chunks loaded around the player: x-, x+, y-, y+, z-, z+
    std::array<std::int32_t, 6> render_distance{4, 4, 2, 2, 4, 4};

    // Read known keys, keep defaults for missing or malformed ones
    [[nodiscard]] static ClientSettings from(const Settings& settings);
};

} // namespace voxstream::client
