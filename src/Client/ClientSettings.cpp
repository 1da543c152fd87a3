// =============================================================================
// VOXSTREAM - CLIENT SETTINGS IMPLEMENTATION
// =============================================================================

#include "Client/ClientSettings.hpp"

#include <cstdio>

namespace voxstream::client {

ClientSettings ClientSettings::from(const Settings& settings) {
    ClientSettings out;

    const int width = settings.get_int("window.width", static_cast<int>(out.window_width));
    const int height = settings.get_int("window.height", static_cast<int>(out.window_height));
    if (width > 0 && height > 0) {
        out.window_width = static_cast<std::uint32_t>(width);
        out.window_height = static_cast<std::uint32_t>(height);
    } else {
        std::printf("[Settings] Ignoring window size %dx%d\n", width, height);
    }

    out.invert_mouse = settings.get_bool("input.invert_mouse", out.invert_mouse);
    out.mouse_sensitivity = settings.get_float("input.mouse_sensitivity", out.mouse_sensitivity);
    out.player_speed = settings.get_float("input.player_speed", out.player_speed);
    out.fov = settings.get_float("rendering.fov", out.fov);

    if (settings.has("world.render_distance")) {
        const auto list = settings.get_int_list("world.render_distance");
        bool valid = list.size() == out.render_distance.size();
        for (int v : list) {
            if (v < 0) valid = false;
        }
        if (valid) {
            for (std::size_t i = 0; i < list.size(); ++i) {
                out.render_distance[i] = list[i];
            }
        } else {
            std::printf("[Settings] world.render_distance needs 6 non-negative values, using defaults\n");
        }
    }

    return out;
}

} // namespace voxstream::client
