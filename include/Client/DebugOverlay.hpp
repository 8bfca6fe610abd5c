// =============================================================================
// SKYROAM - IMGUI OVERLAYS
// Loading screen while the map streams in, F3 debug panel afterwards
// =============================================================================
#pragma once

#include "imgui.h"

#include <cstdint>
#include <string>

namespace skyroam::client {

struct DebugOverlayData {
    // Performance
    float fps = 0.0f;
    float frame_time_ms = 0.0f;
    std::uint32_t draw_calls = 0;

    // Player
    double player_x = 0.0;
    double player_y = 0.0;
    double player_z = 0.0;
    double velocity_x = 0.0;
    double velocity_y = 0.0;
    double velocity_z = 0.0;
    bool on_ground = false;
    std::int32_t chunk_x = 0;
    std::int32_t chunk_z = 0;
    std::uint32_t nearby_walls = 0;

    // World
    std::uint32_t resident_chunks = 0;
    std::uint32_t visible_chunks = 0;
    std::uint64_t total_vertices = 0;

    // Loader
    std::string status;
    float progress = 0.0f;
    bool loading_done = false;
};

class DebugOverlay {
public:
    DebugOverlay() = default;

    void begin_frame() {
        ImGui::NewFrame();
    }

    // Centred progress panel with the latest loader status
    void render_loading(const std::string& status, float progress) {
        const ImGuiIO& io = ImGui::GetIO();
        ImGui::SetNextWindowPos(ImVec2(io.DisplaySize.x * 0.5f, io.DisplaySize.y * 0.5f),
                                ImGuiCond_Always, ImVec2(0.5f, 0.5f));
        ImGui::SetNextWindowSize(ImVec2(420.0f, 0.0f));
        ImGui::SetNextWindowBgAlpha(0.9f);

        if (ImGui::Begin("Loading", nullptr,
                         ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                         ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoTitleBar)) {
            ImGui::TextColored(ImVec4(0.0f, 1.0f, 0.0f, 1.0f), "SkyRoam OSM");
            ImGui::Separator();
            ImGui::TextUnformatted(status.empty() ? "Starting..." : status.c_str());
            ImGui::ProgressBar(progress, ImVec2(-1.0f, 0.0f));
        }
        ImGui::End();
    }

    void render(const DebugOverlayData& data) {
        if (!m_visible) return;

        ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
        ImGui::SetNextWindowBgAlpha(0.85f);

        if (ImGui::Begin("Debug Overlay (F3)", &m_visible,
                         ImGuiWindowFlags_NoMove | ImGuiWindowFlags_AlwaysAutoResize)) {

            // === PERFORMANCE ===
            ImGui::TextColored(ImVec4(1.0f, 1.0f, 0.5f, 1.0f), "Performance");
            ImGui::Text("FPS: %.1f", static_cast<double>(data.fps));
            ImGui::Text("Frame Time: %.2f ms", static_cast<double>(data.frame_time_ms));
            ImGui::Text("Draw Calls: %u", data.draw_calls);

            ImGui::Separator();

            // === PLAYER ===
            ImGui::TextColored(ImVec4(1.0f, 1.0f, 0.5f, 1.0f), "Player");
            ImGui::Text("Position: (%.2f, %.2f, %.2f)", data.player_x, data.player_y, data.player_z);
            ImGui::Text("Velocity: (%.2f, %.2f, %.2f)", data.velocity_x, data.velocity_y, data.velocity_z);
            ImGui::Text("On Ground: %s", data.on_ground ? "Yes" : "No");
            ImGui::Text("Chunk: (%d, %d)", data.chunk_x, data.chunk_z);
            ImGui::Text("Nearby Walls: %u", data.nearby_walls);

            ImGui::Separator();

            // === WORLD ===
            ImGui::TextColored(ImVec4(1.0f, 1.0f, 0.5f, 1.0f), "World");
            ImGui::Text("Chunks: %u resident, %u visible", data.resident_chunks, data.visible_chunks);
            ImGui::Text("Vertices: %llu", static_cast<unsigned long long>(data.total_vertices));
            ImGui::Text("Loader: %s (%.0f%%)", data.status.c_str(), static_cast<double>(data.progress * 100.0f));
            if (!data.loading_done) {
                ImGui::TextColored(ImVec4(1.0f, 0.6f, 0.2f, 1.0f), "Streaming...");
            }

            ImGui::Separator();
            ImGui::TextColored(ImVec4(0.5f, 0.5f, 0.5f, 1.0f), "F3 toggle | Click capture | Esc release");
        }
        ImGui::End();
    }

    void end_frame() {
        ImGui::Render();
    }

    void toggle_visibility() { m_visible = !m_visible; }
    [[nodiscard]] bool is_visible() const { return m_visible; }

private:
    bool m_visible = false;
};

} // namespace skyroam::client
