// =============================================================================
// SKYROAM - MAP LOADER IMPLEMENTATION
// =============================================================================

#include "Server/MapLoader.hpp"
#include "Server/CoordinateProjector.hpp"
#include "Server/MeshBuilder.hpp"
#include "Shared/Logger.hpp"
#include "Shared/ThreadPool.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

namespace skyroam::server {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace

// =============================================================================
// CONSTRUCTION
// =============================================================================

MapLoader::MapLoader(const EngineConfig& config, std::unique_ptr<ElementSource> source, LoaderChannel& channel)
    : m_config(config)
    , m_source(std::move(source))
    , m_channel(channel)
{}

MapLoader::~MapLoader() {
    request_stop();
    join();
}

void MapLoader::start() {
    if (m_thread.joinable()) {
        return;
    }
    m_running.store(true, std::memory_order_release);
    m_thread = std::thread([this] { run(); });
}

void MapLoader::join() {
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

// =============================================================================
// PIPELINE
// =============================================================================

void MapLoader::run() {
    m_running.store(true, std::memory_order_release);
    const auto t0 = Clock::now();
    ProgressReporter progress(m_channel);

    LOG_SEP();
    LOG("Loader", "Ingesting from ", m_source ? m_source->describe() : std::string("<none>"));

    bool ok = false;
    std::string error;
    try {
        ok = run_pipeline(progress);
        if (!ok) {
            error = m_source ? m_source->error() : std::string("no source");
        }
    } catch (const std::exception& e) {
        error = e.what();
        ok = false;
    }

    if (!ok) {
        m_stats.source_failed = true;
        send_fallback(error, progress);
    }

    progress.force(1.0f);
    progress.status("Done");
    m_channel.push(DoneMessage{});

    log_summary();
    LOG_TIMING("Loader", "Ingestion", elapsed_ms(t0));
    m_running.store(false, std::memory_order_release);
}

bool MapLoader::run_pipeline(ProgressReporter& progress) {
    if (!m_source || !m_source->open()) {
        return false;
    }

    NodeIndex nodes;
    if (!read_nodes(nodes, progress)) {
        return false;
    }

    progress.status("Sorting Nodes...");
    progress.force(SORTED);
    const auto t_sort = Clock::now();
    nodes.finalize();
    LOG_TIMING("Loader", "Node sort", elapsed_ms(t_sort));

    ChunkPartitioner partitioner(m_config.world);
    if (!read_ways(nodes, partitioner, progress)) {
        return false;
    }

    progress.status("Meshing...");
    progress.force(MESHING);
    stream_chunks(partitioner, progress);
    return true;
}

bool MapLoader::read_nodes(NodeIndex& nodes, ProgressReporter& progress) {
    progress.status("Reading Nodes...");
    const auto t0 = Clock::now();

    const CoordinateProjector projector(m_config.world);
    nodes.reserve(m_source->size_hint());

    const bool ok = m_source->read(ElementMask::Nodes,
        [&](const RawNode& node) {
            nodes.add(node.id, projector.project(node.lat, node.lon));
        },
        nullptr,
        [&](float f) { progress.report(f * NODES_END); });

    m_stats.nodes = nodes.size();
    LOG("Loader", "Nodes read: ", m_stats.nodes);
    LOG_TIMING("Loader", "Node pass", elapsed_ms(t0));
    return ok;
}

bool MapLoader::read_ways(const NodeIndex& nodes, ChunkPartitioner& partitioner, ProgressReporter& progress) {
    progress.status("Parsing Ways...");
    progress.force(WAYS_BEGIN);
    const auto t0 = Clock::now();

    const PolygonBuilder builder(m_config.building);
    Footprint footprint;

    const bool ok = m_source->read(ElementMask::Ways,
        nullptr,
        [&](const RawWay& way) {
            ++m_stats.ways;
            switch (builder.build(way, nodes, footprint)) {
                case BuildResult::Ok:
                    if (partitioner.add(std::move(footprint))) {
                        ++m_stats.buildings;
                    } else {
                        ++m_stats.outside_world;
                    }
                    footprint = Footprint{};
                    break;
                case BuildResult::MissingNode:
                    ++m_stats.missing_node;
                    break;
                case BuildResult::TooFewPoints:
                    ++m_stats.too_few_points;
                    break;
                case BuildResult::NotBuilding:
                    break;
            }
        },
        [&](float f) { progress.report(WAYS_BEGIN + f * (WAYS_END - WAYS_BEGIN)); });

    LOG_TIMING("Loader", "Way pass", elapsed_ms(t0));
    return ok;
}

void MapLoader::stream_chunks(const ChunkPartitioner& partitioner, ProgressReporter& progress) {
    const auto t0 = Clock::now();
    const std::vector<ChunkPosition> occupied = partitioner.occupied();
    const MeshBuilder mesher(m_config.physics);
    ThreadPool pool(static_cast<std::size_t>(std::max(0, m_config.loader.worker_threads)));

    const auto batch_size = static_cast<std::size_t>(m_config.loader.batch_size);
    const std::size_t group_size = batch_size * pool.size();
    const std::size_t total = occupied.size();

    LOG("Loader", "Meshing ", total, " chunks on ", pool.size(), " threads");
    if (total > 0) {
        progress.status("Streaming...");
    }

    for (std::size_t group_begin = 0; group_begin < total; group_begin += group_size) {
        if (m_stop.load(std::memory_order_relaxed)) {
            LOG("Loader", "Stop requested, ", total - group_begin, " chunks not streamed");
            break;
        }

        const std::size_t count = std::min(group_size, total - group_begin);
        std::vector<ChunkBuildStats> chunk_stats(count);
        std::vector<ChunkData> meshed = pool.map_ordered(count, [&](std::size_t i) {
            return partitioner.build_chunk(occupied[group_begin + i], mesher, &chunk_stats[i]);
        });

        for (const ChunkBuildStats& s : chunk_stats) {
            m_stats.roofs_failed += s.roofs_failed;
        }

        // Hand over in batches, preserving row-major order
        for (std::size_t b = 0; b < meshed.size(); b += batch_size) {
            BatchLoadedMessage batch;
            const std::size_t end = std::min(b + batch_size, meshed.size());
            batch.chunks.reserve(end - b);
            for (std::size_t i = b; i < end; ++i) {
                batch.chunks.push_back(std::move(meshed[i]));
            }
            m_stats.chunks += batch.chunks.size();
            ++m_stats.batches;
            m_channel.push(std::move(batch));
        }

        progress.report(MESHING + (1.0f - MESHING) *
            static_cast<float>(group_begin + count) / static_cast<float>(total));
    }

    LOG_TIMING("Loader", "Meshing + streaming", elapsed_ms(t0));
}

// =============================================================================
// FAILURE PATH
// =============================================================================

void MapLoader::send_fallback(const std::string& reason, ProgressReporter& progress) {
    LOG("Loader", "Source error: ", reason);
    progress.status("Error: " + reason);

    if (!m_config.loader.fallback_ground) {
        return;
    }

    const ChunkPosition center = coord::world_to_chunk(0.0, 0.0, m_config.world);
    ChunkData ground(center);
    MeshBuilder::append_ground(ground, coord::chunk_origin(center, m_config.world), m_config.world.chunk_size());

    BatchLoadedMessage batch;
    batch.chunks.push_back(std::move(ground));
    m_stats.chunks += 1;
    ++m_stats.batches;
    m_channel.push(std::move(batch));
}

void MapLoader::log_summary() const {
    LOG("Loader", "Ways seen: ", m_stats.ways);
    LOG("Loader", "Buildings: ", m_stats.buildings);
    LOG("Loader", "Discarded (missing node): ", m_stats.missing_node);
    LOG("Loader", "Discarded (too few points): ", m_stats.too_few_points);
    LOG("Loader", "Dropped (outside world): ", m_stats.outside_world);
    LOG("Loader", "Roofs skipped: ", m_stats.roofs_failed);
    LOG("Loader", "Chunks streamed: ", m_stats.chunks, " in ", m_stats.batches, " batches");
}

} // namespace skyroam::server
