// =============================================================================
// SKYROAM - MESH BUILDER IMPLEMENTATION
// =============================================================================

#include "Server/MeshBuilder.hpp"

#include <mapbox/earcut.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace skyroam::server {

FootprintMeshStats MeshBuilder::append_footprint(const Footprint& footprint, ChunkData& chunk) const {
    FootprintMeshStats stats;
    stats.roof = append_roof(footprint, chunk);

    const std::size_t n = footprint.points.size();
    const std::size_t edges = footprint.closed ? n : n - 1;

    for (std::size_t i = 0; i < edges; ++i) {
        const Point2 a = footprint.points[i];
        const Point2 b = footprint.points[(i + 1) % n];
        if (std::abs(b.x - a.x) < MIN_EDGE && std::abs(b.z - a.z) < MIN_EDGE) {
            ++stats.skipped_edges;
            continue;
        }
        append_wall(a, b, footprint.height, footprint.color, chunk);
        chunk.walls.push_back(make_collider(a, b, footprint.height));
        ++stats.walls;
    }
    return stats;
}

bool MeshBuilder::append_roof(const Footprint& footprint, ChunkData& chunk) const {
    using EarPoint = std::array<double, 2>;
    std::vector<std::vector<EarPoint>> polygon(1);
    polygon[0].reserve(footprint.points.size());
    for (const Point2& p : footprint.points) {
        polygon[0].push_back({static_cast<double>(p.x), static_cast<double>(p.z)});
    }

    const std::vector<std::uint32_t> tris = mapbox::earcut<std::uint32_t>(polygon);
    if (tris.empty() || tris.size() % 3 != 0) {
        return false;
    }

    const auto base = static_cast<std::uint32_t>(chunk.vertices.size());
    const math::Vec3 up{0.0f, 1.0f, 0.0f};
    for (const Point2& p : footprint.points) {
        chunk.vertices.push_back({{p.x, footprint.height, p.z}, up, footprint.color});
    }
    for (std::uint32_t idx : tris) {
        chunk.indices.push_back(base + idx);
    }
    return true;
}

void MeshBuilder::append_wall(Point2 a, Point2 b, float height, const math::Vec3& color, ChunkData& chunk) const {
    const math::Vec3 normal = math::Vec3{b.z - a.z, 0.0f, -(b.x - a.x)}.normalized();

    const auto base = static_cast<std::uint32_t>(chunk.vertices.size());
    chunk.vertices.push_back({{a.x, 0.0f, a.z}, normal, color});
    chunk.vertices.push_back({{b.x, 0.0f, b.z}, normal, color});
    chunk.vertices.push_back({{b.x, height, b.z}, normal, color});
    chunk.vertices.push_back({{a.x, height, a.z}, normal, color});

    // Front face points along `normal`
    chunk.indices.insert(chunk.indices.end(), {
        base, base + 2, base + 1,
        base, base + 3, base + 2
    });
}

WallCollider MeshBuilder::make_collider(Point2 a, Point2 b, float height) const noexcept {
    WallCollider w;
    w.start = a;
    w.end = b;
    w.height = height;
    w.min_x = std::min(a.x, b.x) - m_wall_thickness;
    w.max_x = std::max(a.x, b.x) + m_wall_thickness;
    w.min_z = std::min(a.z, b.z) - m_wall_thickness;
    w.max_z = std::max(a.z, b.z) + m_wall_thickness;
    return w;
}

void MeshBuilder::append_ground(ChunkData& chunk, Point2 origin, float size) {
    const math::Vec3 up{0.0f, 1.0f, 0.0f};
    const math::Vec3 grey{GROUND_GREY, GROUND_GREY, GROUND_GREY};
    const float x0 = origin.x;
    const float z0 = origin.z;
    const float x1 = origin.x + size;
    const float z1 = origin.z + size;

    const auto base = static_cast<std::uint32_t>(chunk.vertices.size());
    chunk.vertices.push_back({{x0, GROUND_Y, z0}, up, grey});
    chunk.vertices.push_back({{x0, GROUND_Y, z1}, up, grey});
    chunk.vertices.push_back({{x1, GROUND_Y, z1}, up, grey});
    chunk.vertices.push_back({{x1, GROUND_Y, z0}, up, grey});

    // Counter-clockwise seen from above
    chunk.indices.insert(chunk.indices.end(), {
        base, base + 1, base + 2,
        base, base + 2, base + 3
    });
}

} // namespace skyroam::server
