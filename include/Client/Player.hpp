// =============================================================================
// VOXSTREAM - PLAYER
// Eye position, view angles and movement intent
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Collision.hpp"

#include <cmath>

namespace voxstream::client {

// =============================================================================
// YAW / PITCH (degrees)
// yaw 0 looks toward +X, yaw -90 toward -Z; pitch positive looks up
// =============================================================================
struct YawPitch {
    static constexpr double DEFAULT_YAW = -127.0;
    static constexpr double DEFAULT_PITCH = -17.0;

    double yaw = DEFAULT_YAW;
    double pitch = DEFAULT_PITCH;

    // Apply a mouse delta in pixels. Yaw wraps into [-180, 180], pitch clamps to [-90, 90].
    void update_cursor(double dx, double dy, double sensitivity, bool invert = false) noexcept {
        yaw += sensitivity * dx;
        pitch -= sensitivity * (invert ? -dy : dy);

        if (yaw < -180.0) yaw += 360.0;
        if (yaw > 180.0) yaw -= 360.0;

        if (pitch < -90.0) pitch = -90.0;
        if (pitch > 90.0) pitch = 90.0;
    }
};

// =============================================================================
// PLAYER INPUT (one frame of movement intent)
// =============================================================================
struct PlayerInput {
    bool key_move_forward = false;
    bool key_move_left = false;
    bool key_move_backward = false;
    bool key_move_right = false;
    bool key_move_up = false;
    bool key_move_down = false;
    double yaw = YawPitch::DEFAULT_YAW;
    double pitch = YawPitch::DEFAULT_PITCH;
    bool flying = true;
};

// =============================================================================
// PLAYER (eye position in world space)
// Box is 0.8 x 1.8 x 0.8, eye 1.6 above the feet
// =============================================================================
class Player {
public:
    static constexpr double HALF_WIDTH = 0.4;
    static constexpr double EYE_HEIGHT = 1.6;
    static constexpr double HEAD_ROOM = 0.2;

    // Spawn next to the world origin, feet at y = 0
    static constexpr double SPAWN_X = 0.4;
    static constexpr double SPAWN_Y = 1.6;
    static constexpr double SPAWN_Z = 0.4;

    Player() = default;
    Player(double x, double y, double z) noexcept : m_x(x), m_y(y), m_z(z) {}

    [[nodiscard]] double x() const noexcept { return m_x; }
    [[nodiscard]] double y() const noexcept { return m_y; }
    [[nodiscard]] double z() const noexcept { return m_z; }

    [[nodiscard]] AABB bounding_box() const noexcept {
        return AABB{
            m_x - HALF_WIDTH, m_y - EYE_HEIGHT, m_z - HALF_WIDTH,
            m_x + HALF_WIDTH, m_y + HEAD_ROOM,  m_z + HALF_WIDTH
        };
    }

    void move(const Displacement& d) noexcept {
        m_x += d.x;
        m_y += d.y;
        m_z += d.z;
    }

    void set_position(double x, double y, double z) noexcept {
        m_x = x;
        m_y = y;
        m_z = z;
    }

    [[nodiscard]] BlockPosition block_position() const noexcept {
        return {static_cast<BlockCoord>(std::floor(m_x)),
                static_cast<BlockCoord>(std::floor(m_y)),
                static_cast<BlockCoord>(std::floor(m_z))};
    }

    [[nodiscard]] ChunkPosition chunk_position() const noexcept {
        return block_position().chunk();
    }

private:
    double m_x = SPAWN_X;
    double m_y = SPAWN_Y;
    double m_z = SPAWN_Z;
};

// =============================================================================
// PLAYER CONTROLLER
// Turns input into a requested displacement; the collision resolver decides
// how much of it happens
// =============================================================================
class PlayerController {
public:
    static constexpr double GRAVITY = -28.0;        // Blocks per second squared
    static constexpr double JUMP_VELOCITY = 9.0;    // Blocks per second
    static constexpr double MAX_FALL_SPEED = -50.0; // Terminal velocity
    static constexpr double DEFAULT_SPEED = 10.0;   // Blocks per second

    PlayerController() = default;
    explicit PlayerController(double speed) noexcept : m_speed(speed) {}

    [[nodiscard]] Displacement requested_displacement(const PlayerInput& input, double dt);

    // Feed back what the resolver allowed
    void on_resolved(const Displacement& requested, const Displacement& actual) noexcept;

    [[nodiscard]] double vertical_velocity() const noexcept { return m_velocity_y; }
    [[nodiscard]] bool on_ground() const noexcept { return m_on_ground; }

    void set_speed(double speed) noexcept { m_speed = speed; }
    [[nodiscard]] double speed() const noexcept { return m_speed; }

private:
    double m_speed = DEFAULT_SPEED;
    double m_velocity_y = 0.0;
    bool m_on_ground = false;
};

} // namespace voxstream::client
