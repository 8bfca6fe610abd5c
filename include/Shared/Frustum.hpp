// =============================================================================
// SKYROAM - VIEW FRUSTUM
// Plane extraction from a view-projection matrix and AABB rejection
// =============================================================================
#pragma once

#include "Shared/Math.hpp"

#include <array>
#include <cmath>

namespace skyroam {

struct Plane {
    float a = 0.0f, b = 0.0f, c = 0.0f, d = 0.0f;

    [[nodiscard]] float distance(float x, float y, float z) const noexcept {
        return a * x + b * y + c * z + d;
    }
};

class Frustum {
public:
    static constexpr float MIN_NORMAL_LENGTH = 1e-6f;

    // Gribb/Hartmann: planes are sums/differences of clip-space rows.
    // A matrix that yields a zero-length plane normal produces an invalid
    // frustum, which rejects everything.
    [[nodiscard]] static Frustum from_view_projection(const math::Mat4& m) noexcept {
        Frustum f;
        auto row = [&m](int r) {
            return std::array<float, 4>{m(r, 0), m(r, 1), m(r, 2), m(r, 3)};
        };
        const auto r0 = row(0);
        const auto r1 = row(1);
        const auto r2 = row(2);
        const auto r3 = row(3);

        auto combine = [&](const std::array<float, 4>& r, float sign) {
            return Plane{r3[0] + sign * r[0], r3[1] + sign * r[1], r3[2] + sign * r[2], r3[3] + sign * r[3]};
        };

        f.m_planes[0] = combine(r0, 1.0f);    // Left
        f.m_planes[1] = combine(r0, -1.0f);   // Right
        f.m_planes[2] = combine(r1, 1.0f);    // Bottom
        f.m_planes[3] = combine(r1, -1.0f);   // Top
        f.m_planes[4] = combine(r2, 1.0f);    // Near
        f.m_planes[5] = combine(r2, -1.0f);   // Far

        f.m_valid = true;
        for (Plane& p : f.m_planes) {
            const float len = std::sqrt(p.a * p.a + p.b * p.b + p.c * p.c);
            if (len <= MIN_NORMAL_LENGTH) {
                f.m_valid = false;
                continue;
            }
            p.a /= len;
            p.b /= len;
            p.c /= len;
            p.d /= len;
        }
        return f;
    }

    // Positive-vertex test: per plane, take the corner furthest along the
    // normal; if even that corner is behind the plane the box is outside.
    [[nodiscard]] bool intersects_aabb(const math::Vec3& min, const math::Vec3& max) const noexcept {
        if (!m_valid) {
            return false;
        }
        for (const Plane& p : m_planes) {
            const float px = p.a >= 0.0f ? max.x : min.x;
            const float py = p.b >= 0.0f ? max.y : min.y;
            const float pz = p.c >= 0.0f ? max.z : min.z;
            if (p.distance(px, py, pz) < 0.0f) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] bool is_valid() const noexcept { return m_valid; }
    [[nodiscard]] const std::array<Plane, 6>& planes() const noexcept { return m_planes; }

private:
    std::array<Plane, 6> m_planes{};
    bool m_valid = false;
};

} // namespace skyroam
