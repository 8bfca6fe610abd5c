// =============================================================================
// SKYROAM - SHADER MANAGEMENT
// OpenGL 4.5 shader compilation and uniform handling
// =============================================================================
#pragma once

#include "Shared/Math.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace skyroam::client {

// =============================================================================
// SHADER PROGRAM
// =============================================================================
class Shader {
public:
    Shader();
    ~Shader();

    Shader(const Shader&) = delete;
    Shader& operator=(const Shader&) = delete;
    Shader(Shader&& other) noexcept;
    Shader& operator=(Shader&& other) noexcept;

    // Compile and link; on failure `error()` holds the driver log
    bool compile(std::string_view vertex_source, std::string_view fragment_source);

    [[nodiscard]] const std::string& error() const noexcept { return m_error; }

    void bind() const;
    static void unbind();

    [[nodiscard]] std::uint32_t id() const noexcept { return m_program; }
    [[nodiscard]] bool is_valid() const noexcept { return m_program != 0; }

    // =============================================================================
    // UNIFORMS
    // =============================================================================

    [[nodiscard]] std::int32_t uniform_location(const std::string& name);

    void set_float(const std::string& name, float value);
    void set_vec3(const std::string& name, const math::Vec3& vec);
    void set_mat4(const std::string& name, const math::Mat4& matrix);

private:
    std::uint32_t compile_shader(std::uint32_t type, std::string_view source);
    void destroy();

private:
    std::uint32_t m_program = 0;
    std::unordered_map<std::string, std::int32_t> m_uniform_cache;
    std::string m_error;
};

// =============================================================================
// BUILT-IN SHADERS
// =============================================================================
namespace shaders {

// Vertex layout matches skyroam::Vertex: position, normal, colour (3 floats each)
constexpr const char* WORLD_VERTEX_SHADER = R"glsl(
#version 450 core

layout(location = 0) in vec3 a_Position;
layout(location = 1) in vec3 a_Normal;
layout(location = 2) in vec3 a_Color;

uniform mat4 u_ViewProjection;
uniform vec3 u_CameraPos;

out vec3 v_Normal;
out vec3 v_Color;
out float v_Distance;

void main() {
    gl_Position = u_ViewProjection * vec4(a_Position, 1.0);
    v_Normal = a_Normal;
    v_Color = a_Color;
    v_Distance = length(a_Position - u_CameraPos);
}
)glsl";

constexpr const char* WORLD_FRAGMENT_SHADER = R"glsl(
#version 450 core

in vec3 v_Normal;
in vec3 v_Color;
in float v_Distance;

out vec4 FragColor;

uniform vec3 u_LightDir;
uniform vec3 u_FogColor;
uniform float u_FogStart;
uniform float u_FogEnd;

void main() {
    // Two-sided Lambert: walls and roofs are drawn without culling
    float diffuse = abs(dot(normalize(v_Normal), normalize(u_LightDir)));
    vec3 lit = v_Color * (0.35 + 0.65 * diffuse);

    float fog = clamp((v_Distance - u_FogStart) / max(u_FogEnd - u_FogStart, 0.001), 0.0, 1.0);
    FragColor = vec4(mix(lit, u_FogColor, fog), 1.0);
}
)glsl";

} // namespace shaders

} // namespace skyroam::client
