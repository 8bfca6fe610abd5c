// =============================================================================
// SKYROAM - WORLD IMPLEMENTATION
// =============================================================================

#include "Server/World.hpp"
#include "Shared/Logger.hpp"

#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace skyroam::server {

World::World(const EngineConfig& config)
    : m_config(config)
    , m_collision(config)
{}

// =============================================================================
// INGESTION
// =============================================================================

bool World::ingest(ChunkData&& chunk, ChunkUploader& uploader) {
    const ChunkPosition pos = chunk.coord;
    if (!coord::is_valid_chunk(pos, m_config.world)) {
        LOG("World", "Rejected chunk outside world (", pos.x, ", ", pos.z, ")");
        return false;
    }
    if (has_chunk(pos)) {
        LOG("World", "Duplicate chunk (", pos.x, ", ", pos.z, ") ignored");
        return false;
    }

    const Point2 origin = coord::chunk_origin(pos, m_config.world);
    const float size = m_config.world.chunk_size();

    ResidentChunk resident;
    resident.coord = pos;
    resident.aabb_min = {origin.x, m_config.world.chunk_min_y, origin.z};
    resident.aabb_max = {origin.x + size, m_config.world.chunk_max_y, origin.z + size};
    resident.index_count = static_cast<std::uint32_t>(chunk.indices.size());

    if (!chunk.empty()) {
        resident.geometry = uploader.upload(chunk);
    }

    m_total_vertices += chunk.vertices.size();
    m_total_indices += chunk.indices.size();

    m_collision.insert_chunk(pos, std::move(chunk.walls));
    resident.collision = m_collision.grid(pos);

    m_chunks.emplace(pos, resident);
    return true;
}

PumpResult World::pump(LoaderChannel& channel, ChunkUploader& uploader, std::size_t max_chunks) {
    PumpResult result;
    while (result.chunks < max_chunks) {
        std::optional<LoaderMessage> message = channel.try_pop();
        if (!message) {
            break;
        }
        apply(*message, uploader, result);
        ++result.messages;
    }
    return result;
}

void World::apply(LoaderMessage& message, ChunkUploader& uploader, PumpResult& result) {
    std::visit([&](auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, StatusMessage>) {
            m_status = std::move(m.text);
        } else if constexpr (std::is_same_v<T, ProgressMessage>) {
            if (m.fraction > m_progress) {
                m_progress = m.fraction;
            }
        } else if constexpr (std::is_same_v<T, BatchLoadedMessage>) {
            for (ChunkData& chunk : m.chunks) {
                if (ingest(std::move(chunk), uploader)) {
                    ++result.chunks;
                }
            }
        } else if constexpr (std::is_same_v<T, DoneMessage>) {
            m_finished = true;
            LOG("World", "Loading finished: ", m_chunks.size(), " chunks, ",
                m_total_vertices, " vertices, ", m_total_indices, " indices");
        }
    }, message);
}

// =============================================================================
// QUERIES
// =============================================================================

const ResidentChunk* World::get_chunk(ChunkPosition pos) const {
    auto it = m_chunks.find(pos);
    return it != m_chunks.end() ? &it->second : nullptr;
}

void World::for_each_chunk(const ChunkConstCallback& callback) const {
    for (const auto& [pos, chunk] : m_chunks) {
        callback(chunk);
    }
}

} // namespace skyroam::server
