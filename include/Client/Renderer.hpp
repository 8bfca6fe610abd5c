// =============================================================================
// SKYROAM - OPENGL 4.5 RENDERER
// Per-chunk immutable DSA buffers, one indexed draw per visible chunk
// =============================================================================
#pragma once

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Server/World.hpp"
#include "Client/Camera.hpp"
#include "Client/Shader.hpp"

#include <cstdint>
#include <vector>

namespace skyroam::client {

// =============================================================================
// CHUNK GPU DATA
// =============================================================================
struct ChunkGPUData {
    std::uint32_t vao = 0;
    std::uint32_t vbo = 0;
    std::uint32_t ebo = 0;

    std::uint32_t vertex_count = 0;
    std::uint32_t index_count = 0;

    ChunkPosition position;
    bool valid = false;
};

// One entry per draw call this frame
struct DrawItem {
    std::uint32_t vao = 0;
    std::uint32_t index_count = 0;
};

// =============================================================================
// RENDERER
// =============================================================================
class Renderer final : public server::ChunkUploader {
public:
    explicit Renderer(const RenderConfig& config);
    ~Renderer() override;

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool initialize();
    void shutdown();

    [[nodiscard]] bool is_initialized() const noexcept { return m_initialized; }

    // =============================================================================
    // FRAME
    // =============================================================================

    void begin_frame();
    void set_camera(const Camera& camera);

    // Draw resident chunks that passed culling
    void render(const std::vector<const server::ResidentChunk*>& visible);

    // =============================================================================
    // UPLOAD
    // =============================================================================

    // Returns a 1-based handle, 0 if the chunk had nothing to draw
    server::GeometryHandle upload(const ChunkData& chunk) override;

    // =============================================================================
    // STATISTICS
    // =============================================================================

    [[nodiscard]] std::size_t uploaded_chunk_count() const noexcept { return m_chunks.size(); }
    [[nodiscard]] std::size_t total_vertices() const noexcept { return m_total_vertices; }
    [[nodiscard]] std::size_t total_indices() const noexcept { return m_total_indices; }
    [[nodiscard]] std::size_t draw_calls_last_frame() const noexcept { return m_draw_calls; }

    void set_wireframe(bool enabled);
    [[nodiscard]] bool wireframe() const noexcept { return m_wireframe; }

    static constexpr math::Vec3 SKY_COLOR{0.53f, 0.71f, 0.92f};
    static constexpr math::Vec3 LIGHT_DIR{0.4f, 1.0f, 0.3f};

private:
    bool create_chunk_buffers(ChunkGPUData& gpu_data, const ChunkData& chunk);
    static void destroy_chunk_data(ChunkGPUData& data);

private:
    RenderConfig m_config;
    bool m_initialized = false;

    Shader m_world_shader;

    math::Mat4 m_view_projection;
    math::Vec3 m_camera_pos;

    // handle - 1 -> GPU data
    std::vector<ChunkGPUData> m_chunks;
    std::vector<DrawItem> m_draw_list;

    std::size_t m_total_vertices = 0;
    std::size_t m_total_indices = 0;
    std::size_t m_draw_calls = 0;

    bool m_wireframe = false;
};

} // namespace skyroam::client
