#include "Server/MeshBuilder.hpp"

#include <gtest/gtest.h>

using namespace skyroam;
using namespace skyroam::server;

namespace {

Footprint square_footprint(bool closed) {
    Footprint fp;
    fp.id = 1;
    fp.points = {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {0.0f, 10.0f}};
    fp.closed = closed;
    fp.height = 30.0f;
    fp.color = {0.2f, 0.2f, 0.2f};
    return fp;
}

} // namespace

TEST(MeshBuilder, ClosedSquareProducesRoofWallsAndColliders) {
    const MeshBuilder mesher(PhysicsConfig{});
    ChunkData chunk;
    const FootprintMeshStats s = mesher.append_footprint(square_footprint(true), chunk);

    EXPECT_TRUE(s.roof);
    EXPECT_EQ(s.walls, 4u);
    EXPECT_EQ(s.skipped_edges, 0u);
    EXPECT_EQ(chunk.vertices.size(), 4u + 16u);
    EXPECT_EQ(chunk.indices.size(), 6u + 24u);
    ASSERT_EQ(chunk.walls.size(), 4u);

    for (std::uint32_t idx : chunk.indices) {
        EXPECT_LT(idx, chunk.vertices.size());
    }
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(chunk.vertices[i].position.y, 30.0f);
        EXPECT_FLOAT_EQ(chunk.vertices[i].normal.y, 1.0f);
    }
    for (const WallCollider& w : chunk.walls) {
        EXPECT_FLOAT_EQ(w.height, 30.0f);
    }
}

TEST(MeshBuilder, ColliderBoundsArePaddedByWallThickness) {
    PhysicsConfig physics;
    physics.wall_thickness = 0.5f;
    const MeshBuilder mesher(physics);

    const WallCollider w = mesher.make_collider({10.0f, 2.0f}, {0.0f, 2.0f}, 12.0f);
    EXPECT_FLOAT_EQ(w.min_x, -0.5f);
    EXPECT_FLOAT_EQ(w.max_x, 10.5f);
    EXPECT_FLOAT_EQ(w.min_z, 1.5f);
    EXPECT_FLOAT_EQ(w.max_z, 2.5f);
    EXPECT_FLOAT_EQ(w.start.x, 10.0f);
    EXPECT_FLOAT_EQ(w.end.x, 0.0f);
}

TEST(MeshBuilder, OpenWayDoesNotWrapLastEdge) {
    const MeshBuilder mesher(PhysicsConfig{});
    ChunkData chunk;
    const FootprintMeshStats s = mesher.append_footprint(square_footprint(false), chunk);
    EXPECT_EQ(s.walls, 3u);
    EXPECT_EQ(chunk.walls.size(), 3u);
}

TEST(MeshBuilder, DegenerateEdgeIsSkipped) {
    const MeshBuilder mesher(PhysicsConfig{});
    Footprint fp = square_footprint(true);
    fp.points.insert(fp.points.begin() + 2, Point2{10.001f, 0.001f});

    ChunkData chunk;
    const FootprintMeshStats s = mesher.append_footprint(fp, chunk);
    EXPECT_EQ(s.skipped_edges, 1u);
    EXPECT_EQ(s.walls, 4u);
    EXPECT_EQ(chunk.walls.size(), 4u);
}

TEST(MeshBuilder, WallNormalsAreHorizontalUnitVectors) {
    const MeshBuilder mesher(PhysicsConfig{});
    ChunkData chunk;
    mesher.append_footprint(square_footprint(true), chunk);
    for (std::size_t i = 4; i < chunk.vertices.size(); ++i) {
        const math::Vec3& n = chunk.vertices[i].normal;
        EXPECT_FLOAT_EQ(n.y, 0.0f);
        EXPECT_NEAR(n.length(), 1.0f, 1e-5f);
    }
}

TEST(MeshBuilder, GroundTileAddsFourVerticesAndTwoTriangles) {
    ChunkData chunk;
    MeshBuilder::append_ground(chunk, {-625.0f, 0.0f}, 625.0f);
    ASSERT_EQ(chunk.vertices.size(), 4u);
    EXPECT_EQ(chunk.indices.size(), 6u);
    EXPECT_TRUE(chunk.walls.empty());
    for (const Vertex& v : chunk.vertices) {
        EXPECT_FLOAT_EQ(v.position.y, MeshBuilder::GROUND_Y);
        EXPECT_GE(v.position.x, -625.0f);
        EXPECT_LE(v.position.x, 0.0f);
        EXPECT_GE(v.position.z, 0.0f);
        EXPECT_LE(v.position.z, 625.0f);
    }
}
