// =============================================================================
// SKYROAM - CHUNK PARTITIONER
// Buckets footprints by centroid into the fixed world grid; each bucket is
// meshed into its own ChunkData with no shared buffers between chunks.
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Server/PolygonBuilder.hpp"
#include "Server/MeshBuilder.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace skyroam::server {

struct ChunkBuildStats {
    std::uint32_t footprints = 0;
    std::uint32_t roofs_failed = 0;
    std::uint32_t walls = 0;
};

class ChunkPartitioner {
public:
    explicit ChunkPartitioner(const WorldConfig& world);

    [[nodiscard]] static Point2 centroid(const std::vector<Point2>& points) noexcept;

    // Chunk owning this footprint, or nullopt outside the modelled world
    [[nodiscard]] std::optional<ChunkPosition> assign(const Footprint& footprint) const noexcept;

    // Takes the footprint into its chunk bucket. False if it was dropped.
    bool add(Footprint footprint);

    // Non-empty chunks in row-major order (z outer, x inner)
    [[nodiscard]] std::vector<ChunkPosition> occupied() const;

    [[nodiscard]] std::size_t footprint_count(ChunkPosition pos) const;

    // Mesh one chunk: ground tile first, then every footprint it owns.
    // Safe to call concurrently for different chunks.
    [[nodiscard]] ChunkData build_chunk(ChunkPosition pos, const MeshBuilder& mesher,
                                        ChunkBuildStats* stats = nullptr) const;

    [[nodiscard]] std::size_t accepted() const noexcept { return m_accepted; }
    [[nodiscard]] std::size_t dropped() const noexcept { return m_dropped; }

private:
    WorldConfig m_world;
    std::vector<std::vector<Footprint>> m_buckets;   // chunk_index -> footprints
    std::size_t m_accepted = 0;
    std::size_t m_dropped = 0;
};

} // namespace skyroam::server
