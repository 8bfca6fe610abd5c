// =============================================================================
// SKYROAM - WORLD
// Resident chunk store on the main thread. Drains the loader channel,
// hands geometry to the uploader and registers collision grids.
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Shared/Collision.hpp"
#include "Shared/LoaderMessage.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyroam::server {

// Opaque id of uploaded GPU geometry, 0 = none
using GeometryHandle = std::uint32_t;

// =============================================================================
// UPLOADER INTERFACE
// Implemented by the renderer; tests use a recording fake
// =============================================================================
class ChunkUploader {
public:
    virtual ~ChunkUploader() = default;

    // Called once per chunk on the thread that owns the graphics context
    virtual GeometryHandle upload(const ChunkData& chunk) = 0;
};

// =============================================================================
// RESIDENT CHUNK
// =============================================================================
struct ResidentChunk {
    ChunkPosition coord;
    GeometryHandle geometry = 0;
    math::Vec3 aabb_min;
    math::Vec3 aabb_max;
    std::uint32_t index_count = 0;
    const LocalCollisionGrid* collision = nullptr;
};

struct PumpResult {
    std::size_t messages = 0;
    std::size_t chunks = 0;
};

class World {
public:
    using ChunkMap = std::unordered_map<ChunkPosition, ResidentChunk>;
    using ChunkConstCallback = std::function<void(const ResidentChunk&)>;

    explicit World(const EngineConfig& config);

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // =============================================================================
    // INGESTION
    // =============================================================================

    // Upload geometry and register colliders. False if the chunk is already
    // resident or lies outside the world.
    bool ingest(ChunkData&& chunk, ChunkUploader& uploader);

    // Drain the channel until it is empty or at least `max_chunks` chunks were
    // ingested this call. A batch is never split.
    PumpResult pump(LoaderChannel& channel, ChunkUploader& uploader, std::size_t max_chunks);

    [[nodiscard]] bool finished() const noexcept { return m_finished; }
    [[nodiscard]] const std::string& status() const noexcept { return m_status; }
    [[nodiscard]] float progress() const noexcept { return m_progress; }

    // =============================================================================
    // QUERIES
    // =============================================================================

    [[nodiscard]] const CollisionWorld& collision() const noexcept { return m_collision; }
    [[nodiscard]] const WorldConfig& world_config() const noexcept { return m_config.world; }

    [[nodiscard]] std::size_t chunk_count() const noexcept { return m_chunks.size(); }
    [[nodiscard]] bool has_chunk(ChunkPosition pos) const { return m_chunks.find(pos) != m_chunks.end(); }
    [[nodiscard]] const ResidentChunk* get_chunk(ChunkPosition pos) const;

    void for_each_chunk(const ChunkConstCallback& callback) const;

    [[nodiscard]] std::uint64_t total_vertices() const noexcept { return m_total_vertices; }
    [[nodiscard]] std::uint64_t total_indices() const noexcept { return m_total_indices; }

private:
    void apply(LoaderMessage& message, ChunkUploader& uploader, PumpResult& result);

    EngineConfig m_config;
    ChunkMap m_chunks;
    CollisionWorld m_collision;

    std::string m_status;
    float m_progress = 0.0f;
    bool m_finished = false;

    std::uint64_t m_total_vertices = 0;
    std::uint64_t m_total_indices = 0;
};

} // namespace skyroam::server
