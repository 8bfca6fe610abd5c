// =============================================================================
// SKYROAM - CORE TYPES
// Plain data shared by the ingestion worker and the simulation loop
// =============================================================================
#pragma once

#include "Shared/Math.hpp"

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <functional>
#include <vector>

namespace skyroam {

// =============================================================================
// CHUNK POSITION (2D grid cell identifier)
// =============================================================================
struct ChunkPosition {
    std::int32_t x;
    std::int32_t z;

    constexpr ChunkPosition() noexcept : x(0), z(0) {}
    constexpr ChunkPosition(std::int32_t cx, std::int32_t cz) noexcept : x(cx), z(cz) {}

    [[nodiscard]] constexpr bool operator==(const ChunkPosition& other) const noexcept = default;

    [[nodiscard]] constexpr std::size_t hash() const noexcept {
        // FNV-1a over both axes
        std::size_t h = 14695981039346656037ULL;
        h ^= static_cast<std::size_t>(static_cast<std::uint32_t>(x));
        h *= 1099511628211ULL;
        h ^= static_cast<std::size_t>(static_cast<std::uint32_t>(z));
        h *= 1099511628211ULL;
        return h;
    }
};

// =============================================================================
// 2D POINT ON THE GROUND PLANE (x east, z south)
// =============================================================================
struct Point2 {
    float x;
    float z;

    [[nodiscard]] constexpr bool operator==(const Point2& other) const noexcept = default;
};

// =============================================================================
// VERTEX (36 bytes, uploaded as-is)
// =============================================================================
struct Vertex {
    math::Vec3 position;
    math::Vec3 normal;
    math::Vec3 color;
};

static_assert(sizeof(Vertex) == 36, "Vertex must be tightly packed");
static_assert(std::is_trivially_copyable_v<Vertex>, "Vertex must be trivially copyable");

// =============================================================================
// WALL COLLIDER
// One per footprint edge. AABB is the segment bounds padded by wall thickness.
// =============================================================================
struct WallCollider {
    Point2 start;
    Point2 end;
    float height = 0.0f;

    float min_x = 0.0f;
    float max_x = 0.0f;
    float min_z = 0.0f;
    float max_z = 0.0f;
};

// =============================================================================
// CHUNK DATA
// Unit of streaming. Built wholly by the ingestion worker and moved to the
// consumer exactly once.
// =============================================================================
struct ChunkData {
    ChunkPosition coord;
    std::vector<Vertex> vertices;
    std::vector<std::uint32_t> indices;
    std::vector<WallCollider> walls;

    ChunkData() = default;
    explicit ChunkData(ChunkPosition c) : coord(c) {}

    ChunkData(const ChunkData&) = delete;
    ChunkData& operator=(const ChunkData&) = delete;
    ChunkData(ChunkData&&) noexcept = default;
    ChunkData& operator=(ChunkData&&) noexcept = default;

    [[nodiscard]] bool empty() const noexcept {
        return indices.empty() && walls.empty();
    }
};

} // namespace skyroam

namespace std {
    template<>
    struct hash<skyroam::ChunkPosition> {
        [[nodiscard]] std::size_t operator()(const skyroam::ChunkPosition& pos) const noexcept {
            return pos.hash();
        }
    };
}
