// =============================================================================
// SKYROAM - PLAYER PHYSICS
// Sub-stepped first-person integrator with wall push-out and sliding
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Shared/Collision.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>

namespace skyroam {

struct PlayerState {
    WorldPosition position{0.0, 50.0, 0.0};   // Eye position
    WorldPosition velocity;
    bool on_ground = false;
};

// Pressed movement flags for one tick
struct MovementInput {
    bool forward = false;
    bool backward = false;
    bool left = false;
    bool right = false;
    bool jump = false;
    double yaw_radians = 0.0;
};

// Closest wall within reach found during one resolution pass
struct Penetration {
    double normal_x = 0.0;
    double normal_z = 0.0;
    double depth = 0.0;
    double distance = 0.0;
};

class PlayerPhysics {
public:
    static constexpr double MIN_DT = 0.0001;
    static constexpr double MAX_DT = 0.1;
    static constexpr double PUSH_EPSILON = 0.0001;

    explicit PlayerPhysics(const EngineConfig& config)
        : m_physics(config.physics)
        , m_player(config.player)
        , m_check_dist(static_cast<double>(config.collision_distance())) {}

    // =============================================================================
    // TICK
    // =============================================================================

    // Advance one frame. Returns the number of sub-steps taken.
    std::int32_t tick(PlayerState& state, const MovementInput& input, double dt,
                      const CollisionWorld& collision) const
    {
        dt = std::clamp(dt, MIN_DT, MAX_DT);

        // Horizontal velocity is replaced, not accumulated
        const double fx = std::cos(input.yaw_radians);
        const double fz = std::sin(input.yaw_radians);
        const double rx = -fz;
        const double rz = fx;

        double dir_x = 0.0;
        double dir_z = 0.0;
        if (input.forward)  { dir_x += fx; dir_z += fz; }
        if (input.backward) { dir_x -= fx; dir_z -= fz; }
        if (input.right)    { dir_x += rx; dir_z += rz; }
        if (input.left)     { dir_x -= rx; dir_z -= rz; }

        const double len = std::sqrt(dir_x * dir_x + dir_z * dir_z);
        if (len > 1e-9) {
            dir_x /= len;
            dir_z /= len;
        }
        state.velocity.x = dir_x * m_player.move_speed;
        state.velocity.z = dir_z * m_player.move_speed;

        state.velocity.y -= m_physics.gravity * dt;
        state.velocity.y = std::max(state.velocity.y, m_physics.terminal_velocity);

        if (input.jump && state.on_ground) {
            state.velocity.y = m_player.jump_force;
            state.on_ground = false;
        }

        double remaining = dt;
        std::int32_t steps = 0;
        while (remaining > 0.0 && steps < m_physics.max_substeps) {
            const double step = std::min(remaining, m_physics.step_size);
            remaining -= step;
            ++steps;

            state.position = state.position + state.velocity * step;
            resolve(state, collision);
            clamp_to_floor(state);
        }
        return steps;
    }

    // =============================================================================
    // COLLISION RESOLUTION
    // =============================================================================

    // Push the player out of the closest penetrating wall, up to the pass
    // budget. Returns the number of passes that found a penetration.
    std::int32_t resolve(PlayerState& state, const CollisionWorld& collision) const {
        std::int32_t passes = 0;
        for (std::int32_t i = 0; i < m_physics.resolve_passes; ++i) {
            const auto hit = find_penetration(state.position, collision);
            if (!hit) {
                break;
            }
            ++passes;

            const double dot = state.velocity.x * hit->normal_x + state.velocity.z * hit->normal_z;
            if (dot < 0.0) {
                state.velocity.x -= hit->normal_x * dot;
                state.velocity.z -= hit->normal_z * dot;
            }

            const double push = hit->depth + PUSH_EPSILON;
            state.position.x += hit->normal_x * push;
            state.position.z += hit->normal_z * push;
        }
        return passes;
    }

    // Closest wall within reach of `pos` across the 3x3 chunk block
    [[nodiscard]] std::optional<Penetration> find_penetration(
        const WorldPosition& pos, const CollisionWorld& collision) const
    {
        const double check_sq = m_check_dist * m_check_dist;
        double best_sq = check_sq;
        bool found = false;
        double best_cx = 0.0;
        double best_cz = 0.0;

        collision.neighborhood_walls(pos.x, pos.z, [&](const WallCollider& wall) {
            if (pos.y < 0.0 || pos.y > static_cast<double>(wall.height)) {
                return;
            }
            const auto [cx, cz] = closest_point_on_segment(pos.x, pos.z, wall.start, wall.end);
            const double dx = pos.x - cx;
            const double dz = pos.z - cz;
            const double d_sq = dx * dx + dz * dz;
            if (d_sq < best_sq) {
                best_sq = d_sq;
                best_cx = cx;
                best_cz = cz;
                found = true;
            }
        });

        if (!found) {
            return std::nullopt;
        }

        Penetration p;
        p.distance = std::sqrt(best_sq);
        if (p.distance > 1e-6) {
            p.normal_x = (pos.x - best_cx) / p.distance;
            p.normal_z = (pos.z - best_cz) / p.distance;
            p.depth = m_check_dist - p.distance;
        } else {
            // Degenerate push vector: fixed +x normal
            p.normal_x = 1.0;
            p.normal_z = 0.0;
            p.depth = m_check_dist;
        }
        return p;
    }

    [[nodiscard]] double check_distance() const noexcept { return m_check_dist; }

private:
    void clamp_to_floor(PlayerState& state) const noexcept {
        if (state.position.y <= m_player.eye_height) {
            state.position.y = m_player.eye_height;
            state.velocity.y = 0.0;
            state.on_ground = true;
        } else {
            state.on_ground = false;
        }
    }

    PhysicsConfig m_physics;
    PlayerConfig m_player;
    double m_check_dist;
};

} // namespace skyroam
