// =============================================================================
// SKYROAM - VISIBILITY CULLER
// Per-frame selection of resident chunks: distance test first, then the
// view frustum. No GL state is touched here.
// =============================================================================
#pragma once

#include "Shared/Frustum.hpp"
#include "Shared/Config.hpp"
#include "Server/World.hpp"

#include <cmath>
#include <vector>

namespace skyroam::client {

struct CullStats {
    std::size_t considered = 0;
    std::size_t too_far = 0;
    std::size_t outside_frustum = 0;
    std::size_t visible = 0;
};

class VisibilityCuller {
public:
    explicit VisibilityCuller(const EngineConfig& config)
        : m_draw_distance(config.render.draw_distance)
        , m_chunk_radius(std::sqrt(2.0f) * config.world.chunk_size() * 0.5f)
    {}

    // Clears `out` and appends every chunk that may be on screen
    CullStats collect(const math::Mat4& view_projection, const math::Vec3& camera_pos,
                      const server::World& world, std::vector<const server::ResidentChunk*>& out) const
    {
        out.clear();
        CullStats stats;
        const Frustum frustum = Frustum::from_view_projection(view_projection);
        const float reach = m_draw_distance + m_chunk_radius;
        const float reach_sq = reach * reach;

        world.for_each_chunk([&](const server::ResidentChunk& chunk) {
            ++stats.considered;

            // Horizontal distance to the chunk centre
            const float cx = (chunk.aabb_min.x + chunk.aabb_max.x) * 0.5f - camera_pos.x;
            const float cz = (chunk.aabb_min.z + chunk.aabb_max.z) * 0.5f - camera_pos.z;
            if (cx * cx + cz * cz > reach_sq) {
                ++stats.too_far;
                return;
            }
            if (!frustum.intersects_aabb(chunk.aabb_min, chunk.aabb_max)) {
                ++stats.outside_frustum;
                return;
            }
            out.push_back(&chunk);
        });

        stats.visible = out.size();
        return stats;
    }

    [[nodiscard]] float chunk_radius() const noexcept { return m_chunk_radius; }
    [[nodiscard]] float draw_distance() const noexcept { return m_draw_distance; }

private:
    float m_draw_distance;
    float m_chunk_radius;
};

} // namespace skyroam::client
