// =============================================================================
// SKYROAM - CHUNK PARTITIONER IMPLEMENTATION
// =============================================================================

#include "Server/ChunkPartitioner.hpp"

namespace skyroam::server {

ChunkPartitioner::ChunkPartitioner(const WorldConfig& world)
    : m_world(world)
    , m_buckets(static_cast<std::size_t>(world.chunks_per_axis) * static_cast<std::size_t>(world.chunks_per_axis))
{}

Point2 ChunkPartitioner::centroid(const std::vector<Point2>& points) noexcept {
    if (points.empty()) {
        return {0.0f, 0.0f};
    }
    double sx = 0.0;
    double sz = 0.0;
    for (const Point2& p : points) {
        sx += p.x;
        sz += p.z;
    }
    const auto n = static_cast<double>(points.size());
    return {static_cast<float>(sx / n), static_cast<float>(sz / n)};
}

std::optional<ChunkPosition> ChunkPartitioner::assign(const Footprint& footprint) const noexcept {
    const Point2 c = centroid(footprint.points);
    const ChunkPosition pos = coord::world_to_chunk(c.x, c.z, m_world);
    if (!coord::is_valid_chunk(pos, m_world)) {
        return std::nullopt;
    }
    return pos;
}

bool ChunkPartitioner::add(Footprint footprint) {
    const auto pos = assign(footprint);
    if (!pos) {
        ++m_dropped;
        return false;
    }
    m_buckets[coord::chunk_index(*pos, m_world)].push_back(std::move(footprint));
    ++m_accepted;
    return true;
}

std::vector<ChunkPosition> ChunkPartitioner::occupied() const {
    std::vector<ChunkPosition> result;
    for (std::int32_t z = 0; z < m_world.chunks_per_axis; ++z) {
        for (std::int32_t x = 0; x < m_world.chunks_per_axis; ++x) {
            if (!m_buckets[coord::chunk_index({x, z}, m_world)].empty()) {
                result.emplace_back(x, z);
            }
        }
    }
    return result;
}

std::size_t ChunkPartitioner::footprint_count(ChunkPosition pos) const {
    if (!coord::is_valid_chunk(pos, m_world)) {
        return 0;
    }
    return m_buckets[coord::chunk_index(pos, m_world)].size();
}

ChunkData ChunkPartitioner::build_chunk(ChunkPosition pos, const MeshBuilder& mesher, ChunkBuildStats* stats) const {
    ChunkData chunk(pos);
    MeshBuilder::append_ground(chunk, coord::chunk_origin(pos, m_world), m_world.chunk_size());

    if (!coord::is_valid_chunk(pos, m_world)) {
        return chunk;
    }

    ChunkBuildStats local;
    for (const Footprint& fp : m_buckets[coord::chunk_index(pos, m_world)]) {
        const FootprintMeshStats s = mesher.append_footprint(fp, chunk);
        ++local.footprints;
        local.walls += s.walls;
        if (!s.roof) {
            ++local.roofs_failed;
        }
    }
    if (stats) {
        *stats = local;
    }
    return chunk;
}

} // namespace skyroam::server
