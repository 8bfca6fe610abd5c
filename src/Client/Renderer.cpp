// =============================================================================
// SKYROAM - OPENGL 4.5 RENDERER IMPLEMENTATION
// =============================================================================

#include "Client/Renderer.hpp"
#include "Shared/Logger.hpp"

#include <glad/glad.h>

#include <cstddef>
#include <iostream>

namespace skyroam::client {

Renderer::Renderer(const RenderConfig& config)
    : m_config(config)
{}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::initialize() {
    if (m_initialized) {
        return true;
    }

    if (!m_world_shader.compile(shaders::WORLD_VERTEX_SHADER, shaders::WORLD_FRAGMENT_SHADER)) {
        std::cerr << "[Renderer] Failed to compile world shader: " << m_world_shader.error() << "\n";
        return false;
    }

    std::cout << "[Renderer] Initialized successfully\n";
    m_initialized = true;
    return true;
}

void Renderer::shutdown() {
    for (ChunkGPUData& data : m_chunks) {
        destroy_chunk_data(data);
    }
    m_chunks.clear();
    m_draw_list.clear();
    m_total_vertices = 0;
    m_total_indices = 0;
    m_initialized = false;
}

// =============================================================================
// FRAME
// =============================================================================

void Renderer::begin_frame() {
    glClearColor(SKY_COLOR.x, SKY_COLOR.y, SKY_COLOR.z, 1.0f);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    m_draw_calls = 0;
}

void Renderer::set_camera(const Camera& camera) {
    m_view_projection = camera.view_projection_matrix();
    m_camera_pos = camera.position().to_float();
}

void Renderer::render(const std::vector<const server::ResidentChunk*>& visible) {
    const std::size_t old_capacity = m_draw_list.capacity();
    m_draw_list.clear();

    for (const server::ResidentChunk* chunk : visible) {
        if (chunk->geometry == 0 || chunk->geometry > m_chunks.size()) {
            continue;
        }
        const ChunkGPUData& gpu = m_chunks[chunk->geometry - 1];
        if (!gpu.valid || gpu.index_count == 0) {
            continue;
        }
        m_draw_list.push_back({gpu.vao, gpu.index_count});
    }

    if (m_draw_list.capacity() != old_capacity) {
        LOG("Renderer", "Draw list capacity grew to ", m_draw_list.capacity());
    }

    if (m_draw_list.empty()) {
        return;
    }

    m_world_shader.bind();
    m_world_shader.set_mat4("u_ViewProjection", m_view_projection);
    m_world_shader.set_vec3("u_CameraPos", m_camera_pos);
    m_world_shader.set_vec3("u_LightDir", LIGHT_DIR);
    m_world_shader.set_vec3("u_FogColor", SKY_COLOR);
    m_world_shader.set_float("u_FogStart", m_config.fog_start);
    m_world_shader.set_float("u_FogEnd", m_config.fog_end);

    for (const DrawItem& item : m_draw_list) {
        glBindVertexArray(item.vao);
        glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(item.index_count), GL_UNSIGNED_INT, nullptr);
        ++m_draw_calls;
    }

    glBindVertexArray(0);
    Shader::unbind();
}

// =============================================================================
// UPLOAD
// =============================================================================

server::GeometryHandle Renderer::upload(const ChunkData& chunk) {
    if (chunk.vertices.empty() || chunk.indices.empty()) {
        return 0;
    }

    ChunkGPUData gpu_data;
    gpu_data.position = chunk.coord;
    if (!create_chunk_buffers(gpu_data, chunk)) {
        std::cerr << "[Renderer] Failed to create buffers for chunk ("
                  << chunk.coord.x << ", " << chunk.coord.z << ")\n";
        return 0;
    }

    m_total_vertices += gpu_data.vertex_count;
    m_total_indices += gpu_data.index_count;
    m_chunks.push_back(gpu_data);
    return static_cast<server::GeometryHandle>(m_chunks.size());
}

bool Renderer::create_chunk_buffers(ChunkGPUData& gpu_data, const ChunkData& chunk) {
    glCreateVertexArrays(1, &gpu_data.vao);
    if (gpu_data.vao == 0) {
        return false;
    }

    glCreateBuffers(1, &gpu_data.vbo);
    glNamedBufferStorage(gpu_data.vbo,
        static_cast<GLsizeiptr>(chunk.vertices.size() * sizeof(Vertex)),
        chunk.vertices.data(),
        0);

    glCreateBuffers(1, &gpu_data.ebo);
    glNamedBufferStorage(gpu_data.ebo,
        static_cast<GLsizeiptr>(chunk.indices.size() * sizeof(std::uint32_t)),
        chunk.indices.data(),
        0);

    // 0: position, 1: normal, 2: colour
    glEnableVertexArrayAttrib(gpu_data.vao, 0);
    glVertexArrayAttribFormat(gpu_data.vao, 0, 3, GL_FLOAT, GL_FALSE, offsetof(Vertex, position));
    glVertexArrayAttribBinding(gpu_data.vao, 0, 0);

    glEnableVertexArrayAttrib(gpu_data.vao, 1);
    glVertexArrayAttribFormat(gpu_data.vao, 1, 3, GL_FLOAT, GL_FALSE, offsetof(Vertex, normal));
    glVertexArrayAttribBinding(gpu_data.vao, 1, 0);

    glEnableVertexArrayAttrib(gpu_data.vao, 2);
    glVertexArrayAttribFormat(gpu_data.vao, 2, 3, GL_FLOAT, GL_FALSE, offsetof(Vertex, color));
    glVertexArrayAttribBinding(gpu_data.vao, 2, 0);

    glVertexArrayVertexBuffer(gpu_data.vao, 0, gpu_data.vbo, 0, sizeof(Vertex));
    glVertexArrayElementBuffer(gpu_data.vao, gpu_data.ebo);

    gpu_data.vertex_count = static_cast<std::uint32_t>(chunk.vertices.size());
    gpu_data.index_count = static_cast<std::uint32_t>(chunk.indices.size());
    gpu_data.valid = true;
    return true;
}

void Renderer::destroy_chunk_data(ChunkGPUData& data) {
    if (data.vao != 0) {
        glDeleteVertexArrays(1, &data.vao);
        data.vao = 0;
    }
    if (data.vbo != 0) {
        glDeleteBuffers(1, &data.vbo);
        data.vbo = 0;
    }
    if (data.ebo != 0) {
        glDeleteBuffers(1, &data.ebo);
        data.ebo = 0;
    }
    data.valid = false;
}

void Renderer::set_wireframe(bool enabled) {
    m_wireframe = enabled;
    glPolygonMode(GL_FRONT_AND_BACK, enabled ? GL_LINE : GL_FILL);
}

} // namespace skyroam::client
