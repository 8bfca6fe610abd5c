// =============================================================================
// SKYROAM - CAMERA IMPLEMENTATION
// =============================================================================

#include "Client/Camera.hpp"

#include <algorithm>
#include <cmath>

namespace skyroam::client {

namespace {
constexpr math::Vec3 WORLD_UP{0.0f, 1.0f, 0.0f};
}

Camera::Camera(const WorldPosition& position, float yaw_degrees, float pitch_degrees)
    : m_position(position)
    , m_yaw(yaw_degrees)
    , m_pitch(std::clamp(pitch_degrees, -PITCH_LIMIT, PITCH_LIMIT))
{
    update_front();
}

void Camera::set_position(const WorldPosition& pos) noexcept {
    m_position = pos;
    m_dirty = true;
}

void Camera::set_projection(float fov_degrees, float aspect, float near, float far) noexcept {
    m_fov = std::clamp(fov_degrees, 1.0f, 179.0f);
    m_aspect = aspect;
    m_near = near;
    m_far = far;
    m_dirty = true;
}

void Camera::set_aspect_ratio(float aspect) noexcept {
    if (aspect > 0.0f && aspect != m_aspect) {
        m_aspect = aspect;
        m_dirty = true;
    }
}

void Camera::process_mouse(float x_offset, float y_offset) {
    m_yaw += x_offset * m_sensitivity;
    m_pitch = std::clamp(m_pitch + y_offset * m_sensitivity, -PITCH_LIMIT, PITCH_LIMIT);
    update_front();
}

math::Mat4 Camera::view_projection_matrix() const noexcept {
    if (m_dirty) {
        const math::Vec3 eye = m_position.to_float();
        const math::Mat4 view = math::Mat4::look_at(eye, eye + m_front, WORLD_UP);
        const math::Mat4 proj = math::Mat4::perspective(m_fov * math::DEG_TO_RAD, m_aspect, m_near, m_far);
        m_view_projection = proj * view;
        m_dirty = false;
    }
    return m_view_projection;
}

void Camera::update_front() {
    const float yaw = m_yaw * math::DEG_TO_RAD;
    const float pitch = m_pitch * math::DEG_TO_RAD;
    m_front = math::Vec3{std::cos(yaw) * std::cos(pitch),
                         std::sin(pitch),
                         std::sin(yaw) * std::cos(pitch)}.normalized();
    m_dirty = true;
}

} // namespace skyroam::client
