// =============================================================================
// VOXSTREAM - CAMERA
// First-person view from the player's eye. Chunks are drawn relative to a
// render origin that snaps to the camera's chunk once it drifts too far.
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Client/Player.hpp"

#include <array>
#include <cmath>

namespace voxstream::client {

namespace math {

constexpr float PI = 3.14159265358979323846f;
constexpr float DEG_TO_RAD = PI / 180.0f;

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3 operator+(const Vec3& o) const noexcept { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const noexcept { return {x - o.x, y - o.y, z - o.z}; }

    [[nodiscard]] Vec3 normalized() const noexcept {
        const float len = std::sqrt(x * x + y * y + z * z);
        return len > 0.0001f ? Vec3{x / len, y / len, z / len} : Vec3{};
    }
};

[[nodiscard]] constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

[[nodiscard]] constexpr float dot(const Vec3& a, const Vec3& b) noexcept {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

// Column-major 4x4, as uploaded to GL
struct Mat4 {
    std::array<float, 16> data{1, 0, 0, 0,
                               0, 1, 0, 0,
                               0, 0, 1, 0,
                               0, 0, 0, 1};

    [[nodiscard]] float& at(int row, int col) noexcept { return data[col * 4 + row]; }
    [[nodiscard]] float at(int row, int col) const noexcept { return data[col * 4 + row]; }

    [[nodiscard]] const float* ptr() const noexcept { return data.data(); }

    [[nodiscard]] Mat4 operator*(const Mat4& rhs) const noexcept;

    [[nodiscard]] static Mat4 perspective(float fov_radians, float aspect, float near, float far) noexcept;
    [[nodiscard]] static Mat4 look_at(const Vec3& eye, const Vec3& target, const Vec3& up) noexcept;
};

} // namespace math

// World-space position kept in double precision
struct WorldPosition {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

class Camera {
public:
    static constexpr float NEAR_PLANE = 0.1f;
    static constexpr float FAR_PLANE = 1000.0f;
    static constexpr float MAX_PITCH = 89.9f;               // look_at degenerates at +-90
    static constexpr double REBASE_DISTANCE = 1024.0;        // blocks

    // Eye at the player's position, looking along the view angles (degrees)
    void follow(const Player& player, const YawPitch& view) noexcept;

    void set_eye(double x, double y, double z) noexcept;
    void set_angles(double yaw_deg, double pitch_deg) noexcept;
    void set_lens(float fov_degrees, float aspect) noexcept;

    // Snaps the render origin to the eye's chunk once the eye is further than
    // `distance` blocks from it. Returns true if the origin moved.
    bool rebase(double distance = REBASE_DISTANCE) noexcept;

    [[nodiscard]] const WorldPosition& eye() const noexcept { return m_eye; }
    [[nodiscard]] const WorldPosition& render_origin() const noexcept { return m_origin; }
    [[nodiscard]] math::Vec3 eye_relative() const noexcept;

    [[nodiscard]] const math::Vec3& forward() const noexcept { return m_forward; }
    [[nodiscard]] float pitch() const noexcept { return m_pitch; }
    [[nodiscard]] float fov() const noexcept { return m_fov; }

    [[nodiscard]] math::Mat4 view() const noexcept;
    [[nodiscard]] math::Mat4 projection() const noexcept;
    [[nodiscard]] math::Mat4 view_projection() const noexcept { return projection() * view(); }

private:
    WorldPosition m_eye;
    WorldPosition m_origin;

    float m_yaw = static_cast<float>(YawPitch::DEFAULT_YAW);
    float m_pitch = static_cast<float>(YawPitch::DEFAULT_PITCH);
    math::Vec3 m_forward{0.0f, 0.0f, -1.0f};

    float m_fov = 70.0f;
    float m_aspect = 16.0f / 9.0f;
};

} // namespace voxstream::client
