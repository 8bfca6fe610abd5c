// =============================================================================
// SKYROAM - CAMERA SYSTEM
// First-person camera. Position is set from the player's eye every frame;
// yaw/pitch come from mouse look.
// =============================================================================
#pragma once

#include "Shared/Math.hpp"

namespace skyroam::client {

class Camera {
public:
    static constexpr float PITCH_LIMIT = 89.0f;

    // Yaw -90 looks down -z (north)
    explicit Camera(const WorldPosition& position, float yaw_degrees = -90.0f, float pitch_degrees = 0.0f);

    void set_position(const WorldPosition& pos) noexcept;
    [[nodiscard]] const WorldPosition& position() const noexcept { return m_position; }
    [[nodiscard]] double yaw_radians() const noexcept { return static_cast<double>(m_yaw) * math::DEG_TO_RAD; }

    void set_projection(float fov_degrees, float aspect, float near, float far) noexcept;
    void set_aspect_ratio(float aspect) noexcept;
    void set_sensitivity(float degrees_per_pixel) noexcept { m_sensitivity = degrees_per_pixel; }

    // Offsets in pixels; pitch is clamped to +/-PITCH_LIMIT
    void process_mouse(float x_offset, float y_offset);

    // Cached until position, look direction or projection change
    [[nodiscard]] math::Mat4 view_projection_matrix() const noexcept;

private:
    void update_front();

    WorldPosition m_position;
    float m_yaw;
    float m_pitch;
    math::Vec3 m_front{0.0f, 0.0f, -1.0f};

    float m_fov = 45.0f;
    float m_aspect = 16.0f / 9.0f;
    float m_near = 0.1f;
    float m_far = 10000.0f;
    float m_sensitivity = 0.1f;

    mutable math::Mat4 m_view_projection;
    mutable bool m_dirty = true;
};

} // namespace skyroam::client
