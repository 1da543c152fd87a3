// =============================================================================
// VOXSTREAM - CAMERA IMPLEMENTATION
// =============================================================================

#include "Client/Camera.hpp"

#include <algorithm>

namespace voxstream::client {

namespace math {

Mat4 Mat4::operator*(const Mat4& rhs) const noexcept {
    Mat4 out;
    for (int col = 0; col < 4; ++col) {
        for (int row = 0; row < 4; ++row) {
            float sum = 0.0f;
            for (int k = 0; k < 4; ++k) {
                sum += at(row, k) * rhs.at(k, col);
            }
            out.at(row, col) = sum;
        }
    }
    return out;
}

Mat4 Mat4::perspective(float fov_radians, float aspect, float near, float far) noexcept {
    const float f = 1.0f / std::tan(fov_radians * 0.5f);

    Mat4 m;
    m.data.fill(0.0f);
    m.at(0, 0) = f / aspect;
    m.at(1, 1) = f;
    m.at(2, 2) = (far + near) / (near - far);
    m.at(2, 3) = (2.0f * far * near) / (near - far);
    m.at(3, 2) = -1.0f;
    return m;
}

Mat4 Mat4::look_at(const Vec3& eye, const Vec3& target, const Vec3& up) noexcept {
    const Vec3 f = (target - eye).normalized();
    const Vec3 s = cross(f, up).normalized();
    const Vec3 u = cross(s, f);

    // Rows are the camera basis, translation moves the eye to the origin
    Mat4 m;
    const Vec3 rows[3] = {s, u, Vec3{-f.x, -f.y, -f.z}};
    for (int r = 0; r < 3; ++r) {
        m.at(r, 0) = rows[r].x;
        m.at(r, 1) = rows[r].y;
        m.at(r, 2) = rows[r].z;
        m.at(r, 3) = -dot(rows[r], eye);
    }
    return m;
}

} // namespace math

void Camera::follow(const Player& player, const YawPitch& view) noexcept {
    set_eye(player.x(), player.y(), player.z());
    set_angles(view.yaw, view.pitch);
}

void Camera::set_eye(double x, double y, double z) noexcept {
    m_eye = {x, y, z};
}

void Camera::set_angles(double yaw_deg, double pitch_deg) noexcept {
    m_yaw = static_cast<float>(yaw_deg);
    m_pitch = std::clamp(static_cast<float>(pitch_deg), -MAX_PITCH, MAX_PITCH);

    const float yaw = m_yaw * math::DEG_TO_RAD;
    const float pitch = m_pitch * math::DEG_TO_RAD;
    m_forward = math::Vec3{
        std::cos(yaw) * std::cos(pitch),
        std::sin(pitch),
        std::sin(yaw) * std::cos(pitch)
    }.normalized();
}

void Camera::set_lens(float fov_degrees, float aspect) noexcept {
    m_fov = std::clamp(fov_degrees, 1.0f, 179.0f);
    if (aspect > 0.0f) {
        m_aspect = aspect;
    }
}

bool Camera::rebase(double distance) noexcept {
    const double dx = m_eye.x - m_origin.x;
    const double dy = m_eye.y - m_origin.y;
    const double dz = m_eye.z - m_origin.z;
    if (dx * dx + dy * dy + dz * dz <= distance * distance) {
        return false;
    }

    const ChunkPosition chunk = BlockPosition{
        static_cast<BlockCoord>(std::floor(m_eye.x)),
        static_cast<BlockCoord>(std::floor(m_eye.y)),
        static_cast<BlockCoord>(std::floor(m_eye.z))
    }.chunk();

    m_origin = {
        static_cast<double>(coord::chunk_to_world(chunk.x)),
        static_cast<double>(coord::chunk_to_world(chunk.y)),
        static_cast<double>(coord::chunk_to_world(chunk.z))
    };
    return true;
}

math::Vec3 Camera::eye_relative() const noexcept {
    return {
        static_cast<float>(m_eye.x - m_origin.x),
        static_cast<float>(m_eye.y - m_origin.y),
        static_cast<float>(m_eye.z - m_origin.z)
    };
}

math::Mat4 Camera::view() const noexcept {
    const math::Vec3 eye = eye_relative();
    return math::Mat4::look_at(eye, eye + m_forward, math::Vec3{0.0f, 1.0f, 0.0f});
}

math::Mat4 Camera::projection() const noexcept {
    return math::Mat4::perspective(m_fov * math::DEG_TO_RAD, m_aspect, NEAR_PLANE, FAR_PLANE);
}

} // namespace voxstream::client
