// =============================================================================
// SKYROAM - MESH BUILDER
// Footprint -> roof triangles + extruded wall quads + wall colliders
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Server/PolygonBuilder.hpp"

#include <cstdint>

namespace skyroam::server {

struct FootprintMeshStats {
    bool roof = false;             // False when triangulation failed
    std::uint32_t walls = 0;
    std::uint32_t skipped_edges = 0;
};

class MeshBuilder {
public:
    static constexpr float MIN_EDGE = 0.01f;
    static constexpr float GROUND_Y = -0.1f;
    static constexpr float GROUND_GREY = 0.05f;

    explicit MeshBuilder(const PhysicsConfig& physics) : m_wall_thickness(physics.wall_thickness) {}

    // Append roof, walls and colliders for one footprint to `chunk`
    FootprintMeshStats append_footprint(const Footprint& footprint, ChunkData& chunk) const;

    // Flat ground tile covering the chunk square
    static void append_ground(ChunkData& chunk, Point2 origin, float size);

    // Padded collider for the edge a -> b
    [[nodiscard]] WallCollider make_collider(Point2 a, Point2 b, float height) const noexcept;

private:
    bool append_roof(const Footprint& footprint, ChunkData& chunk) const;
    void append_wall(Point2 a, Point2 b, float height, const math::Vec3& color, ChunkData& chunk) const;

    float m_wall_thickness;
};

} // namespace skyroam::server
