// =============================================================================
// VOXSTREAM - PLAYER CONTROLLER IMPLEMENTATION
// =============================================================================

#include "Client/Player.hpp"

#include <cmath>

namespace voxstream::client {

namespace {

constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;

} // namespace

Displacement PlayerController::requested_displacement(const PlayerInput& input, double dt) {
    // Horizontal forward/right from yaw only
    const double yaw_rad = input.yaw * DEG_TO_RAD;
    const double front_x = std::cos(yaw_rad);
    const double front_z = std::sin(yaw_rad);
    const double right_x = -front_z;
    const double right_z = front_x;

    double move_x = 0.0, move_z = 0.0;
    if (input.key_move_forward) {
        move_x += front_x;
        move_z += front_z;
    }
    if (input.key_move_backward) {
        move_x -= front_x;
        move_z -= front_z;
    }
    if (input.key_move_right) {
        move_x += right_x;
        move_z += right_z;
    }
    if (input.key_move_left) {
        move_x -= right_x;
        move_z -= right_z;
    }

    // Normalize if moving diagonally
    const double move_len = std::sqrt(move_x * move_x + move_z * move_z);
    if (move_len > 0.001) {
        move_x /= move_len;
        move_z /= move_len;
    }

    Displacement d{move_x * m_speed * dt, 0.0, move_z * m_speed * dt};

    if (input.flying) {
        m_velocity_y = 0.0;
        m_on_ground = false;
        if (input.key_move_up) d.y += m_speed * dt;
        if (input.key_move_down) d.y -= m_speed * dt;
        return d;
    }

    // Jump (only when grounded)
    if (input.key_move_up && m_on_ground) {
        m_velocity_y = JUMP_VELOCITY;
        m_on_ground = false;
    }

    m_velocity_y += GRAVITY * dt;
    if (m_velocity_y < MAX_FALL_SPEED) {
        m_velocity_y = MAX_FALL_SPEED;
    }

    d.y = m_velocity_y * dt;
    return d;
}

void PlayerController::on_resolved(const Displacement& requested, const Displacement& actual) noexcept {
    if (requested.y == actual.y) {
        m_on_ground = false;
        return;
    }

    // Clipped vertically: landed or bumped the ceiling
    m_on_ground = requested.y < 0.0;
    m_velocity_y = 0.0;
}

} // namespace voxstream::client
