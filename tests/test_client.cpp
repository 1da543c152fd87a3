/**
 * @file test_client.cpp
 * @brief Settings, input state, player movement and camera math
 */

#include "test_utils.hpp"

#include "Client/Camera.hpp"
#include "Client/ClientSettings.hpp"
#include "Client/FpsCounter.hpp"
#include "Client/Player.hpp"
#include "Shared/Settings.hpp"

using namespace voxstream;
using namespace voxstream::client;

// ============================================================
// Settings
// ============================================================

TEST(settings_parse_sections_and_values) {
    Settings settings;
    settings.parse(R"toml(
# comment line
top = 1

[window]
width = 1280   # trailing comment
title = "voxstream # not a comment"

[input]
invert_mouse = true
mouse_sensitivity = 0.35
)toml");

    ASSERT_EQ(settings.get_int("top"), 1);
    ASSERT_EQ(settings.get_int("window.width"), 1280);
    ASSERT_EQ(settings.get_string("window.title"), std::string("voxstream # not a comment"));
    ASSERT_TRUE(settings.get_bool("input.invert_mouse"));
    ASSERT_NEAR(settings.get_float("input.mouse_sensitivity"), 0.35, 1e-6);
    ASSERT_EQ(settings.size(), 5u);

    ASSERT_FALSE(settings.has("window.height"));
    ASSERT_EQ(settings.get_int("window.height", 900), 900);
    ASSERT_EQ(settings.get_int("window.title", 7), 7);
}

TEST(settings_later_keys_override) {
    Settings settings;
    settings.parse("[a]\nx = 1\n[a]\nx = 2\n");
    ASSERT_EQ(settings.get_int("a.x"), 2);
    ASSERT_EQ(settings.size(), 1u);
}

TEST(settings_int_lists) {
    Settings settings;
    settings.parse(R"toml(
[world]
distance = [4, 4, 2, 2, 4, 4]
trailing = [1, 2,]
negative = [-3, 5]
gap = [1, , 2]
word = [1, two]
scalar = 5
)toml");

    std::vector<int> expected{4, 4, 2, 2, 4, 4};
    ASSERT_TRUE(settings.get_int_list("world.distance") == expected);
    ASSERT_TRUE(settings.get_int_list("world.trailing") == (std::vector<int>{1, 2}));
    ASSERT_TRUE(settings.get_int_list("world.negative") == (std::vector<int>{-3, 5}));

    const std::vector<int> fallback{9};
    ASSERT_TRUE(settings.get_int_list("world.gap", fallback) == fallback);
    ASSERT_TRUE(settings.get_int_list("world.word", fallback) == fallback);
    ASSERT_TRUE(settings.get_int_list("world.scalar", fallback) == fallback);
    ASSERT_TRUE(settings.get_int_list("world.missing", fallback) == fallback);
}

TEST(client_settings_defaults) {
    Settings empty;
    ClientSettings cs = ClientSettings::from(empty);
    ASSERT_EQ(cs.window_width, 1600u);
    ASSERT_EQ(cs.window_height, 900u);
    ASSERT_FALSE(cs.invert_mouse);
    ASSERT_NEAR(cs.mouse_sensitivity, 0.2, 1e-6);
    ASSERT_NEAR(cs.fov, 70.0, 1e-6);
    ASSERT_NEAR(cs.player_speed, 10.0, 1e-6);
    ASSERT_TRUE(cs.render_distance == (std::array<std::int32_t, 6>{4, 4, 2, 2, 4, 4}));
}

TEST(client_settings_read_values) {
    Settings settings;
    settings.parse(R"toml(
[window]
width = 800
height = 600
[input]
invert_mouse = true
player_speed = 4.5
[rendering]
fov = 90
[world]
render_distance = [1, 2, 3, 4, 5, 6]
)toml");

    ClientSettings cs = ClientSettings::from(settings);
    ASSERT_EQ(cs.window_width, 800u);
    ASSERT_EQ(cs.window_height, 600u);
    ASSERT_TRUE(cs.invert_mouse);
    ASSERT_NEAR(cs.player_speed, 4.5, 1e-6);
    ASSERT_NEAR(cs.fov, 90.0, 1e-6);
    ASSERT_TRUE(cs.render_distance == (std::array<std::int32_t, 6>{1, 2, 3, 4, 5, 6}));
}

TEST(client_settings_reject_invalid_values) {
    Settings settings;
    settings.parse("[window]\nwidth = 0\nheight = 600\n[world]\nrender_distance = [1, 2, -3, 4, 5, 6]\n");
    ClientSettings cs = ClientSettings::from(settings);
    ASSERT_EQ(cs.window_width, 1600u);
    ASSERT_EQ(cs.window_height, 900u);
    ASSERT_EQ(cs.render_distance[2], 2);

    Settings short_list;
    short_list.parse("[world]\nrender_distance = [1, 2, 3]\n");
    ASSERT_EQ(ClientSettings::from(short_list).render_distance[0], 4);
}

// ============================================================
// Frame counter
// ============================================================

TEST(fps_counts_frames_in_two_second_window) {
    FpsCounter fps;
    const auto t0 = FpsCounter::Clock::time_point{} + std::chrono::hours(1);
    ASSERT_EQ(fps.fps(), 0u);

    for (int i = 0; i < 120; ++i) {
        fps.add_frame(t0 + std::chrono::milliseconds(i * 10));
    }
    ASSERT_EQ(fps.fps(), 60u);

    // Frames at least two seconds old fall out
    fps.add_frame(t0 + std::chrono::milliseconds(2500));
    ASSERT_EQ(fps.fps(), (120u - 51u + 1u) / 2u);

    fps.add_frame(t0 + std::chrono::seconds(10));
    ASSERT_EQ(fps.fps(), 0u);
}

// ============================================================
// Look direction
// ============================================================

TEST(yaw_pitch_defaults_and_updates) {
    YawPitch view;
    ASSERT_NEAR(view.yaw, -127.0, 1e-12);
    ASSERT_NEAR(view.pitch, -17.0, 1e-12);

    view.update_cursor(10.0, 5.0, 0.2);
    ASSERT_NEAR(view.yaw, -125.0, 1e-9);
    ASSERT_NEAR(view.pitch, -18.0, 1e-9);

    view.update_cursor(0.0, 5.0, 0.2, true);
    ASSERT_NEAR(view.pitch, -17.0, 1e-9);
}

TEST(yaw_wraps_and_pitch_clamps) {
    YawPitch view;
    view.yaw = 179.0;
    view.update_cursor(10.0, 0.0, 0.2);
    ASSERT_NEAR(view.yaw, -179.0, 1e-9);

    view.yaw = -179.0;
    view.update_cursor(-10.0, 0.0, 0.2);
    ASSERT_NEAR(view.yaw, 179.0, 1e-9);

    view.update_cursor(0.0, -10000.0, 0.2);
    ASSERT_NEAR(view.pitch, 90.0, 1e-12);
    view.update_cursor(0.0, 10000.0, 0.2);
    ASSERT_NEAR(view.pitch, -90.0, 1e-12);
}

// ============================================================
// Player
// ============================================================

TEST(player_spawn_and_bounds) {
    Player player;
    ASSERT_NEAR(player.x(), 0.4, 1e-12);
    ASSERT_NEAR(player.y(), 1.6, 1e-12);
    ASSERT_NEAR(player.z(), 0.4, 1e-12);

    AABB box = player.bounding_box();
    ASSERT_NEAR(box.min_x, 0.0, 1e-12);
    ASSERT_NEAR(box.max_x, 0.8, 1e-12);
    ASSERT_NEAR(box.min_y, 0.0, 1e-12);
    ASSERT_NEAR(box.max_y, 1.8, 1e-12);

    player.move({-1.0, 0.0, 40.0});
    ASSERT_EQ(player.chunk_position(), ChunkPosition(-1, 0, 1));
}

TEST(flying_moves_along_view_and_vertical_keys) {
    PlayerController controller(10.0);
    PlayerInput input;
    input.flying = true;
    input.yaw = 0.0;
    input.key_move_forward = true;
    input.key_move_up = true;

    Displacement d = controller.requested_displacement(input, 0.1);
    ASSERT_NEAR(d.x, 1.0, 1e-9);
    ASSERT_NEAR(d.y, 1.0, 1e-9);
    ASSERT_NEAR(d.z, 0.0, 1e-9);
    ASSERT_EQ(controller.vertical_velocity(), 0.0);

    // Diagonal input is normalized
    input.key_move_up = false;
    input.key_move_right = true;
    d = controller.requested_displacement(input, 0.1);
    ASSERT_NEAR(std::sqrt(d.x * d.x + d.z * d.z), 1.0, 1e-9);
    ASSERT_GT(d.z, 0.0);
}

TEST(walking_applies_gravity_and_jumps_from_ground) {
    PlayerController controller;
    PlayerInput input;
    input.flying = false;

    Displacement fall = controller.requested_displacement(input, 0.1);
    ASSERT_NEAR(controller.vertical_velocity(), -2.8, 1e-9);
    ASSERT_NEAR(fall.y, -0.28, 1e-9);

    // Jumping in mid-air does nothing
    input.key_move_up = true;
    (void)controller.requested_displacement(input, 0.1);
    ASSERT_NEAR(controller.vertical_velocity(), -5.6, 1e-9);

    // Landing
    controller.on_resolved({0.0, -0.56, 0.0}, {0.0, -0.1, 0.0});
    ASSERT_TRUE(controller.on_ground());
    ASSERT_EQ(controller.vertical_velocity(), 0.0);

    Displacement jump = controller.requested_displacement(input, 0.1);
    ASSERT_NEAR(controller.vertical_velocity(), PlayerController::JUMP_VELOCITY - 2.8, 1e-9);
    ASSERT_GT(jump.y, 0.0);
    ASSERT_FALSE(controller.on_ground());

    // Head hits the ceiling
    controller.on_resolved(jump, {0.0, 0.0, 0.0});
    ASSERT_FALSE(controller.on_ground());
    ASSERT_EQ(controller.vertical_velocity(), 0.0);
}

TEST(falling_speed_is_capped) {
    PlayerController controller;
    PlayerInput input;
    input.flying = false;

    Displacement d;
    for (int i = 0; i < 10; ++i) {
        d = controller.requested_displacement(input, 1.0);
        controller.on_resolved(d, d);
    }
    ASSERT_NEAR(controller.vertical_velocity(), PlayerController::MAX_FALL_SPEED, 1e-9);
    ASSERT_NEAR(d.y, PlayerController::MAX_FALL_SPEED, 1e-9);
}

// ============================================================
// Camera
// ============================================================

TEST(camera_view_maps_eye_to_origin) {
    Camera camera;
    camera.set_eye(10.0, 2.0, 3.0);
    camera.set_angles(0.0, 0.0);

    ASSERT_NEAR(camera.forward().x, 1.0, 1e-5);
    ASSERT_NEAR(camera.forward().y, 0.0, 1e-5);

    math::Mat4 view = camera.view();
    const float eye[4] = {10.0f, 2.0f, 3.0f, 1.0f};
    for (int row = 0; row < 3; ++row) {
        float sum = 0.0f;
        for (int k = 0; k < 4; ++k) {
            sum += view.at(row, k) * eye[k];
        }
        ASSERT_NEAR(sum, 0.0, 1e-4);
    }

    camera.set_angles(0.0, 120.0);
    ASSERT_NEAR(camera.pitch(), Camera::MAX_PITCH, 1e-4);
}

TEST(camera_follows_player_view) {
    Player player(1.0, 2.0, 3.0);
    YawPitch view;
    view.yaw = 90.0;
    view.pitch = 0.0;

    Camera camera;
    camera.follow(player, view);
    ASSERT_NEAR(camera.eye().y, 2.0, 1e-12);
    ASSERT_NEAR(camera.forward().z, 1.0, 1e-5);
}

TEST(camera_render_origin_follows_far_positions) {
    Camera camera;
    camera.set_eye(5000.0, 0.0, -10.0);
    ASSERT_TRUE(camera.rebase());
    ASSERT_NEAR(camera.render_origin().x, 4992.0, 1e-9);
    ASSERT_NEAR(camera.render_origin().z, -32.0, 1e-9);
    ASSERT_NEAR(camera.eye_relative().x, 8.0, 1e-4);

    ASSERT_FALSE(camera.rebase());
}

TEST(projection_maps_near_and_far_planes) {
    Camera camera;
    camera.set_lens(90.0f, 1.0f);
    math::Mat4 proj = camera.projection();

    // z_ndc = (m22 * z + m23) / -z for a point on the view axis
    auto ndc_z = [&](float z) { return (proj.at(2, 2) * z + proj.at(2, 3)) / -z; };
    ASSERT_NEAR(ndc_z(-Camera::NEAR_PLANE), -1.0, 1e-4);
    ASSERT_NEAR(ndc_z(-Camera::FAR_PLANE), 1.0, 1e-3);
    ASSERT_NEAR(proj.at(0, 0), 1.0, 1e-5);
}

int main() {
    return run_all_tests();
}
