// =============================================================================
// SKYROAM - MATH PRIMITIVES
// Float vectors/matrices for rendering, double positions for simulation
// =============================================================================
#pragma once

#include <cmath>
#include <array>

namespace skyroam {

namespace math {

constexpr float PI = 3.14159265358979323846f;
constexpr float DEG_TO_RAD = PI / 180.0f;
constexpr float RAD_TO_DEG = 180.0f / PI;

// 3D Vector (float)
struct Vec3 {
    float x, y, z;

    constexpr Vec3() noexcept : x(0), y(0), z(0) {}
    constexpr Vec3(float x_, float y_, float z_) noexcept : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr Vec3 operator-(const Vec3& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr Vec3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] float length() const noexcept {
        return std::sqrt(x * x + y * y + z * z);
    }

    [[nodiscard]] Vec3 normalized() const noexcept {
        const float len = length();
        if (len > 0.0001f) {
            return {x / len, y / len, z / len};
        }
        return {0, 0, 0};
    }

    [[nodiscard]] static constexpr Vec3 cross(const Vec3& a, const Vec3& b) noexcept {
        return {
            a.y * b.z - a.z * b.y,
            a.z * b.x - a.x * b.z,
            a.x * b.y - a.y * b.x
        };
    }

    [[nodiscard]] static constexpr float dot(const Vec3& a, const Vec3& b) noexcept {
        return a.x * b.x + a.y * b.y + a.z * b.z;
    }
};

// 4x4 matrix, column-major as glUniformMatrix4fv expects it untransposed
struct Mat4 {
    using Column = std::array<float, 4>;

    // Element (row, col) lives at data[col * 4 + row]
    std::array<float, 16> data{1, 0, 0, 0,
                               0, 1, 0, 0,
                               0, 0, 1, 0,
                               0, 0, 0, 1};

    [[nodiscard]] static Mat4 from_columns(const Column& c0, const Column& c1,
                                           const Column& c2, const Column& c3) noexcept {
        Mat4 m;
        for (int i = 0; i < 4; ++i) {
            m.data[i] = c0[i];
            m.data[4 + i] = c1[i];
            m.data[8 + i] = c2[i];
            m.data[12 + i] = c3[i];
        }
        return m;
    }

    [[nodiscard]] static Mat4 zero() noexcept {
        Mat4 m;
        m.data.fill(0.0f);
        return m;
    }

    [[nodiscard]] float operator()(int row, int col) const noexcept { return data[col * 4 + row]; }
    [[nodiscard]] const float* ptr() const noexcept { return data.data(); }

    // Column j of the product is this matrix applied to column j of rhs
    [[nodiscard]] Mat4 operator*(const Mat4& rhs) const noexcept {
        Mat4 out = zero();
        for (int j = 0; j < 4; ++j) {
            for (int k = 0; k < 4; ++k) {
                const float w = rhs(k, j);
                for (int i = 0; i < 4; ++i) {
                    out.data[j * 4 + i] += data[k * 4 + i] * w;
                }
            }
        }
        return out;
    }

    // Right-handed, clip depth in [-1, 1]
    [[nodiscard]] static Mat4 perspective(float fov_y, float aspect, float z_near, float z_far) noexcept {
        const float focal = 1.0f / std::tan(fov_y * 0.5f);
        const float inv_depth = 1.0f / (z_near - z_far);
        return from_columns({focal / aspect, 0, 0, 0},
                            {0, focal, 0, 0},
                            {0, 0, (z_far + z_near) * inv_depth, -1},
                            {0, 0, 2.0f * z_far * z_near * inv_depth, 0});
    }

    [[nodiscard]] static Mat4 look_at(const Vec3& eye, const Vec3& target, const Vec3& up) noexcept {
        const Vec3 fwd = (target - eye).normalized();
        const Vec3 side = Vec3::cross(fwd, up).normalized();
        const Vec3 cam_up = Vec3::cross(side, fwd);
        return from_columns({side.x, cam_up.x, -fwd.x, 0},
                            {side.y, cam_up.y, -fwd.y, 0},
                            {side.z, cam_up.z, -fwd.z, 0},
                            {-Vec3::dot(side, eye), -Vec3::dot(cam_up, eye), Vec3::dot(fwd, eye), 1});
    }
};

} // namespace math

// =============================================================================
// DOUBLE-PRECISION WORLD POSITION
// Player state is integrated in double, narrowed to float only for the GPU
// =============================================================================
struct WorldPosition {
    double x, y, z;

    constexpr WorldPosition() noexcept : x(0), y(0), z(0) {}
    constexpr WorldPosition(double x_, double y_, double z_) noexcept : x(x_), y(y_), z(z_) {}

    constexpr WorldPosition operator+(const WorldPosition& other) const noexcept {
        return {x + other.x, y + other.y, z + other.z};
    }
    constexpr WorldPosition operator-(const WorldPosition& other) const noexcept {
        return {x - other.x, y - other.y, z - other.z};
    }
    constexpr WorldPosition operator*(double scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    [[nodiscard]] math::Vec3 to_float() const noexcept {
        return {static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)};
    }
};

} // namespace skyroam
