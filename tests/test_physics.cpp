#include "Shared/Physics.hpp"

#include <gtest/gtest.h>

using namespace skyroam;

namespace {

WallCollider wall(Point2 a, Point2 b, float height) {
    WallCollider w;
    w.start = a;
    w.end = b;
    w.height = height;
    w.min_x = std::min(a.x, b.x) - 0.5f;
    w.max_x = std::max(a.x, b.x) + 0.5f;
    w.min_z = std::min(a.z, b.z) - 0.5f;
    w.max_z = std::max(a.z, b.z) + 0.5f;
    return w;
}

class PlayerPhysicsTest : public ::testing::Test {
protected:
    void SetUp() override {
        // North-south wall inside chunk (8, 8)
        collision.insert_chunk({8, 8}, {wall({100.0f, 100.0f}, {100.0f, 200.0f}, 30.0f)});
    }

    EngineConfig config;
    CollisionWorld collision{config};
    PlayerPhysics physics{config};
};

} // namespace

TEST_F(PlayerPhysicsTest, ResolvePushesPlayerOutOfWall) {
    PlayerState state;
    state.position = {100.3, 1.8, 150.0};

    const std::int32_t passes = physics.resolve(state, collision);
    EXPECT_GE(passes, 1);
    EXPECT_LE(passes, config.physics.resolve_passes);
    EXPECT_GE(state.position.x - 100.0, physics.check_distance());
    EXPECT_DOUBLE_EQ(state.position.z, 150.0);
    EXPECT_FALSE(physics.find_penetration(state.position, collision).has_value());
}

TEST_F(PlayerPhysicsTest, SlidingKeepsTangentialVelocity) {
    PlayerState state;
    state.position = {100.5, 1.8, 150.0};
    state.velocity = {-5.0, 0.0, 3.0};

    physics.resolve(state, collision);
    EXPECT_NEAR(state.velocity.x, 0.0, 1e-9);
    EXPECT_DOUBLE_EQ(state.velocity.z, 3.0);
}

TEST_F(PlayerPhysicsTest, WallIgnoredAboveItsHeight) {
    const WorldPosition above{100.3, 45.0, 150.0};
    EXPECT_FALSE(physics.find_penetration(above, collision).has_value());
}

TEST_F(PlayerPhysicsTest, WalkingIntoWallNeverPassesThrough) {
    PlayerState state;
    state.position = {103.0, 1.8, 150.0};
    state.on_ground = true;

    MovementInput input;
    input.forward = true;
    input.yaw_radians = 3.14159265358979323846;   // facing -x

    for (int i = 0; i < 120; ++i) {
        physics.tick(state, input, 1.0 / 60.0, collision);
    }
    EXPECT_GE(state.position.x - 100.0, physics.check_distance() - 1e-6);
}

TEST_F(PlayerPhysicsTest, FloorClampSetsGrounded) {
    PlayerState state;
    state.position = {0.0, 1.0, 0.0};
    physics.tick(state, MovementInput{}, 0.016, collision);
    EXPECT_DOUBLE_EQ(state.position.y, config.player.eye_height);
    EXPECT_DOUBLE_EQ(state.velocity.y, 0.0);
    EXPECT_TRUE(state.on_ground);
}

TEST_F(PlayerPhysicsTest, DeltaTimeIsClamped) {
    PlayerState state;
    state.position = {0.0, 50.0, 0.0};
    EXPECT_EQ(physics.tick(state, MovementInput{}, 5.0, collision), config.physics.max_substeps);
    EXPECT_EQ(physics.tick(state, MovementInput{}, 1e-9, collision), 1);
}

TEST_F(PlayerPhysicsTest, JumpOnlyWhenGrounded) {
    MovementInput input;
    input.jump = true;

    PlayerState airborne;
    airborne.position = {0.0, 50.0, 0.0};
    physics.tick(airborne, input, 0.016, collision);
    EXPECT_LT(airborne.velocity.y, 0.0);

    PlayerState grounded;
    grounded.position = {0.0, config.player.eye_height, 0.0};
    grounded.on_ground = true;
    physics.tick(grounded, input, 0.016, collision);
    EXPECT_GT(grounded.velocity.y, 0.0);
    EXPECT_GT(grounded.position.y, config.player.eye_height);
    EXPECT_FALSE(grounded.on_ground);
}

TEST_F(PlayerPhysicsTest, MovementReplacesHorizontalVelocity) {
    PlayerState state;
    state.position = {0.0, 1.8, 0.0};
    state.velocity = {100.0, 0.0, 100.0};

    MovementInput input;
    input.forward = true;
    input.right = true;
    input.yaw_radians = 0.0;
    physics.tick(state, input, 0.016, collision);

    const double speed = std::sqrt(state.velocity.x * state.velocity.x + state.velocity.z * state.velocity.z);
    EXPECT_NEAR(speed, config.player.move_speed, 1e-6);
}

TEST_F(PlayerPhysicsTest, PlayerOnWallCentrelineIsPushedAlongPositiveX) {
    const WorldPosition on_wall{100.0, 1.8, 150.0};
    const auto hit = physics.find_penetration(on_wall, collision);
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->distance, 0.0);
    EXPECT_DOUBLE_EQ(hit->normal_x, 1.0);
    EXPECT_DOUBLE_EQ(hit->normal_z, 0.0);
    EXPECT_DOUBLE_EQ(hit->depth, physics.check_distance());

    PlayerState state;
    state.position = on_wall;
    EXPECT_EQ(physics.resolve(state, collision), 1);
    EXPECT_NEAR(state.position.x, 100.0 + physics.check_distance() + PlayerPhysics::PUSH_EPSILON, 1e-9);
    EXPECT_DOUBLE_EQ(state.position.z, 150.0);
}
