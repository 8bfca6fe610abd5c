// =============================================================================
// SKYROAM - SPATIAL COLLISION GRID
// Per-chunk bucket grids of wall colliders with a 3x3 chunk neighbourhood query
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace skyroam {

// =============================================================================
// SEGMENT UTILITIES
// =============================================================================

// Closest point on segment [a,b] to p; degenerate segments collapse to a
[[nodiscard]] inline std::pair<double, double> closest_point_on_segment(
    double px, double pz, const Point2& a, const Point2& b) noexcept
{
    const double ax = a.x, az = a.z;
    const double abx = static_cast<double>(b.x) - ax;
    const double abz = static_cast<double>(b.z) - az;
    const double len_sq = abx * abx + abz * abz;
    if (len_sq <= 1e-12) {
        return {ax, az};
    }
    const double t = std::clamp(((px - ax) * abx + (pz - az) * abz) / len_sq, 0.0, 1.0);
    return {ax + abx * t, az + abz * t};
}

// =============================================================================
// LOCAL COLLISION GRID
// Dense grid over one chunk, widened by at least `border` cells on every side
// and further still until every collider's reach box fits. A wall overhanging
// the chunk edge is therefore always found from the neighbour it overhangs.
// Reach box = padded AABB grown by `reach` (the player radius), so every wall
// within collision distance of a point sits in that point's bucket.
// Immutable after construction.
// =============================================================================
class LocalCollisionGrid {
public:
    using Bucket = std::vector<const WallCollider*>;

    LocalCollisionGrid(std::vector<WallCollider> walls, Point2 chunk_min,
                       float chunk_size, float cell_size, std::int32_t border = 1,
                       float reach = 0.0f)
        : m_walls(std::move(walls))
        , m_cell_size(cell_size)
        , m_reach(reach)
    {
        const double cell = static_cast<double>(cell_size);
        const double x0 = static_cast<double>(chunk_min.x);
        const double z0 = static_cast<double>(chunk_min.z);
        const double x1 = x0 + static_cast<double>(chunk_size);
        const double z1 = z0 + static_cast<double>(chunk_size);
        const std::int32_t base = static_cast<std::int32_t>(std::ceil(chunk_size / cell_size));

        std::int32_t left = border, right = border, top = border, bottom = border;
        for (const WallCollider& wall : m_walls) {
            left   = std::max(left,   cells_to_cover(x0 - (wall.min_x - m_reach), cell));
            right  = std::max(right,  cells_to_cover((wall.max_x + m_reach) - x1, cell));
            top    = std::max(top,    cells_to_cover(z0 - (wall.min_z - m_reach), cell));
            bottom = std::max(bottom, cells_to_cover((wall.max_z + m_reach) - z1, cell));
        }

        m_dim_x = base + left + right;
        m_dim_z = base + top + bottom;
        m_min_x = x0 - static_cast<double>(left) * cell;
        m_min_z = z0 - static_cast<double>(top) * cell;
        m_cells.resize(static_cast<std::size_t>(m_dim_x) * static_cast<std::size_t>(m_dim_z));

        for (const WallCollider& wall : m_walls) {
            const std::int32_t cx0 = std::clamp(to_cell(wall.min_x - m_reach - m_min_x), 0, m_dim_x - 1);
            const std::int32_t cx1 = std::clamp(to_cell(wall.max_x + m_reach - m_min_x), 0, m_dim_x - 1);
            const std::int32_t cz0 = std::clamp(to_cell(wall.min_z - m_reach - m_min_z), 0, m_dim_z - 1);
            const std::int32_t cz1 = std::clamp(to_cell(wall.max_z + m_reach - m_min_z), 0, m_dim_z - 1);

            for (std::int32_t cz = cz0; cz <= cz1; ++cz) {
                for (std::int32_t cx = cx0; cx <= cx1; ++cx) {
                    m_cells[index(cx, cz)].push_back(&wall);
                }
            }
        }
    }

    // Buckets point into m_walls; a copy would dangle
    LocalCollisionGrid(const LocalCollisionGrid&) = delete;
    LocalCollisionGrid& operator=(const LocalCollisionGrid&) = delete;
    LocalCollisionGrid(LocalCollisionGrid&&) noexcept = default;
    LocalCollisionGrid& operator=(LocalCollisionGrid&&) noexcept = default;

    // Bucket containing (x, z), or nullptr outside the covered area
    [[nodiscard]] const Bucket* walls_near(double x, double z) const noexcept {
        const auto cell = cell_of(x, z);
        if (!cell) {
            return nullptr;
        }
        return &m_cells[index(cell->first, cell->second)];
    }

    // Cell index of a world point, bounds checked
    [[nodiscard]] std::optional<std::pair<std::int32_t, std::int32_t>> cell_of(double x, double z) const noexcept {
        const double lx = x - m_min_x;
        const double lz = z - m_min_z;
        if (lx < 0.0 || lz < 0.0) {
            return std::nullopt;
        }
        const std::int32_t cx = to_cell(lx);
        const std::int32_t cz = to_cell(lz);
        if (cx >= m_dim_x || cz >= m_dim_z) {
            return std::nullopt;
        }
        return std::make_pair(cx, cz);
    }

    [[nodiscard]] std::int32_t dim_x() const noexcept { return m_dim_x; }
    [[nodiscard]] std::int32_t dim_z() const noexcept { return m_dim_z; }
    [[nodiscard]] double min_x() const noexcept { return m_min_x; }
    [[nodiscard]] double min_z() const noexcept { return m_min_z; }
    [[nodiscard]] double max_x() const noexcept { return m_min_x + static_cast<double>(m_dim_x) * m_cell_size; }
    [[nodiscard]] double max_z() const noexcept { return m_min_z + static_cast<double>(m_dim_z) * m_cell_size; }
    [[nodiscard]] float cell_size() const noexcept { return m_cell_size; }
    [[nodiscard]] float reach() const noexcept { return m_reach; }
    [[nodiscard]] const std::vector<WallCollider>& walls() const noexcept { return m_walls; }

private:
    // Whole cells needed to extend past `overhang` metres (0 when none)
    [[nodiscard]] static std::int32_t cells_to_cover(double overhang, double cell) noexcept {
        if (overhang <= 0.0) {
            return 0;
        }
        return static_cast<std::int32_t>(std::floor(overhang / cell)) + 1;
    }

    [[nodiscard]] std::int32_t to_cell(double local) const noexcept {
        return static_cast<std::int32_t>(std::floor(local / static_cast<double>(m_cell_size)));
    }

    [[nodiscard]] std::size_t index(std::int32_t cx, std::int32_t cz) const noexcept {
        return static_cast<std::size_t>(cz) * static_cast<std::size_t>(m_dim_x) + static_cast<std::size_t>(cx);
    }

    std::vector<WallCollider> m_walls;
    std::vector<Bucket> m_cells;
    float m_cell_size;
    float m_reach;
    std::int32_t m_dim_x = 0;
    std::int32_t m_dim_z = 0;
    double m_min_x = 0.0;
    double m_min_z = 0.0;
};

// =============================================================================
// COLLISION WORLD
// Sparse map of chunk grids. Filled on the consumer thread during ingestion;
// read-only for physics afterwards.
// =============================================================================
class CollisionWorld {
public:
    explicit CollisionWorld(const EngineConfig& config)
        : m_world(config.world)
        , m_physics(config.physics)
        , m_reach(config.collision_distance() - config.physics.wall_thickness)
    {}

    // Build and register the grid for a chunk. Returns false if the chunk
    // already has one.
    bool insert_chunk(ChunkPosition pos, std::vector<WallCollider> walls) {
        if (m_grids.find(pos) != m_grids.end()) {
            return false;
        }
        const Point2 origin = coord::chunk_origin(pos, m_world);
        auto [it, inserted] = m_grids.emplace(pos, LocalCollisionGrid(
            std::move(walls),
            origin,
            m_world.chunk_size(),
            m_physics.grid_cell_size,
            m_physics.grid_border_cells,
            m_reach));

        // Widen the neighbourhood if this grid reaches past the adjacent chunks
        const LocalCollisionGrid& g = it->second;
        const double size = static_cast<double>(m_world.chunk_size());
        const double overhang = std::max({
            static_cast<double>(origin.x) - g.min_x(),
            g.max_x() - (static_cast<double>(origin.x) + size),
            static_cast<double>(origin.z) - g.min_z(),
            g.max_z() - (static_cast<double>(origin.z) + size)});
        const auto chunks = static_cast<std::int32_t>(std::ceil(overhang / size));
        m_query_radius = std::max(m_query_radius, chunks);
        return inserted;
    }

    [[nodiscard]] const LocalCollisionGrid* grid(ChunkPosition pos) const {
        auto it = m_grids.find(pos);
        return it != m_grids.end() ? &it->second : nullptr;
    }

    [[nodiscard]] ChunkPosition chunk_of(double x, double z) const noexcept {
        return coord::world_to_chunk(x, z, m_world);
    }

    // Visit every bucket around (x, z) across the chunk block centred on it:
    // 3x3, or wider once some grid overhangs further than one chunk
    template<typename Fn>
    void for_each_nearby(double x, double z, Fn&& fn) const {
        const ChunkPosition center = chunk_of(x, z);
        const std::int32_t r = m_query_radius;
        for (std::int32_t dz = -r; dz <= r; ++dz) {
            for (std::int32_t dx = -r; dx <= r; ++dx) {
                const LocalCollisionGrid* g = grid({center.x + dx, center.z + dz});
                if (!g) continue;
                const LocalCollisionGrid::Bucket* bucket = g->walls_near(x, z);
                if (!bucket) continue;
                for (const WallCollider* wall : *bucket) {
                    fn(*wall);
                }
            }
        }
    }

    template<typename Fn>
    void neighborhood_walls(double x, double z, Fn&& visitor) const {
        for_each_nearby(x, z, std::forward<Fn>(visitor));
    }

    [[nodiscard]] std::vector<const WallCollider*> neighborhood_walls(double x, double z) const {
        std::vector<const WallCollider*> out;
        for_each_nearby(x, z, [&out](const WallCollider& w) { out.push_back(&w); });
        return out;
    }

    [[nodiscard]] std::int32_t query_radius() const noexcept { return m_query_radius; }
    [[nodiscard]] float reach() const noexcept { return m_reach; }
    [[nodiscard]] std::size_t chunk_count() const noexcept { return m_grids.size(); }
    [[nodiscard]] const WorldConfig& world_config() const noexcept { return m_world; }

private:
    WorldConfig m_world;
    PhysicsConfig m_physics;
    float m_reach;
    std::int32_t m_query_radius = 1;
    std::unordered_map<ChunkPosition, LocalCollisionGrid> m_grids;
};

} // namespace skyroam
