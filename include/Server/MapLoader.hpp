// =============================================================================
// SKYROAM - MAP LOADER (INGESTION WORKER)
// Runs the whole ingestion pipeline on its own thread and reports through
// a LoaderChannel: Status/Progress while working, BatchLoaded per group of
// meshed chunks, and always a final Done.
// =============================================================================
#pragma once

#include "Shared/Config.hpp"
#include "Shared/LoaderMessage.hpp"
#include "Server/ElementSource.hpp"
#include "Server/ChunkPartitioner.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace skyroam::server {

struct LoaderStats {
    std::size_t nodes = 0;
    std::size_t ways = 0;
    std::size_t buildings = 0;
    std::size_t missing_node = 0;
    std::size_t too_few_points = 0;
    std::size_t outside_world = 0;
    std::size_t roofs_failed = 0;
    std::size_t chunks = 0;
    std::size_t batches = 0;
    bool source_failed = false;
};

class MapLoader {
public:
    // Phase boundaries on the progress bar
    static constexpr float NODES_END = 0.50f;
    static constexpr float SORTED = 0.52f;
    static constexpr float WAYS_BEGIN = 0.55f;
    static constexpr float WAYS_END = 0.95f;
    static constexpr float MESHING = 0.95f;

    MapLoader(const EngineConfig& config, std::unique_ptr<ElementSource> source, LoaderChannel& channel);
    ~MapLoader();

    MapLoader(const MapLoader&) = delete;
    MapLoader& operator=(const MapLoader&) = delete;

    // Spawn the worker thread
    void start();

    // Run the pipeline on the calling thread
    void run();

    void join();

    // Stop streaming at the next batch boundary. Done is still sent.
    void request_stop() noexcept { m_stop.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool is_running() const noexcept { return m_running.load(std::memory_order_acquire); }

    // Only meaningful once the worker has finished
    [[nodiscard]] const LoaderStats& stats() const noexcept { return m_stats; }

private:
    bool run_pipeline(ProgressReporter& progress);
    bool read_nodes(NodeIndex& nodes, ProgressReporter& progress);
    bool read_ways(const NodeIndex& nodes, ChunkPartitioner& partitioner, ProgressReporter& progress);
    void stream_chunks(const ChunkPartitioner& partitioner, ProgressReporter& progress);
    void send_fallback(const std::string& reason, ProgressReporter& progress);
    void log_summary() const;

    EngineConfig m_config;
    std::unique_ptr<ElementSource> m_source;
    LoaderChannel& m_channel;

    std::thread m_thread;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_running{false};
    LoaderStats m_stats;
};

} // namespace skyroam::server
