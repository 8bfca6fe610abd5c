// =============================================================================
// SKYROAM - ENTRY POINT
// Walk through an OpenStreetMap city extract at street level
// =============================================================================

#include "Shared/Types.hpp"
#include "Shared/Config.hpp"
#include "Shared/Settings.hpp"
#include "Shared/Logger.hpp"
#include "Shared/LoaderMessage.hpp"
#include "Shared/Physics.hpp"
#include "Server/OsmFileSource.hpp"
#include "Server/MapLoader.hpp"
#include "Server/World.hpp"
#include "Client/Window.hpp"
#include "Client/Camera.hpp"
#include "Client/Renderer.hpp"
#include "Client/VisibilityCuller.hpp"
#include "Client/DebugOverlay.hpp"

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace skyroam;
using namespace skyroam::server;
using namespace skyroam::client;

namespace {

constexpr const char* WINDOW_TITLE = "SkyRoam OSM";

// =============================================================================
// APPLICATION STATE
// =============================================================================
struct AppState {
    explicit AppState(const EngineConfig& cfg)
        : config(cfg)
        , camera(WorldPosition{0.0, 50.0, 0.0})
        , renderer(cfg.render)
        , world(cfg)
        , culler(cfg)
        , physics(cfg)
    {}

    EngineConfig config;
    Camera camera;
    Renderer renderer;
    World world;
    VisibilityCuller culler;
    PlayerPhysics physics;
    PlayerState player;
    DebugOverlay overlay;

    std::vector<const ResidentChunk*> visible;
    CullStats cull_stats;

    // Timing
    double last_time = 0.0;
    double delta_time = 0.0;
    double fps_time = 0.0;
    int fps_count = 0;
    int current_fps = 0;

    bool world_shown = false;
};

// =============================================================================
// INPUT PROCESSING
// =============================================================================
void process_input(AppState& app, Window& window) {
    const InputState& input = window.input();

    if (input.mouse_captured) {
        // Screen y grows downwards
        app.camera.process_mouse(static_cast<float>(input.mouse_dx),
                                 static_cast<float>(-input.mouse_dy));
        if (window.is_key_pressed(GLFW_KEY_ESCAPE)) {
            window.capture_mouse(false);
        }
    } else if (app.world_shown && window.is_mouse_pressed(GLFW_MOUSE_BUTTON_LEFT) &&
               !ImGui::GetIO().WantCaptureMouse) {
        window.capture_mouse(true);
    }

    if (window.is_key_pressed(GLFW_KEY_F3)) {
        app.overlay.toggle_visibility();
    }
    if (window.is_key_pressed(GLFW_KEY_F4)) {
        app.renderer.set_wireframe(!app.renderer.wireframe());
    }
}

MovementInput gather_movement(const AppState& app, const Window& window) {
    MovementInput move;
    move.forward = window.is_key_down(GLFW_KEY_W);
    move.backward = window.is_key_down(GLFW_KEY_S);
    move.left = window.is_key_down(GLFW_KEY_A);
    move.right = window.is_key_down(GLFW_KEY_D);
    move.jump = window.is_key_down(GLFW_KEY_SPACE);
    move.yaw_radians = app.camera.yaw_radians();
    return move;
}

void update_fps(AppState& app, Window& window) {
    app.fps_count++;
    app.fps_time += app.delta_time;
    if (app.fps_time >= 1.0) {
        app.current_fps = app.fps_count;
        app.fps_count = 0;
        app.fps_time = 0.0;

        const std::string title = std::string(WINDOW_TITLE) + " | FPS: " + std::to_string(app.current_fps);
        window.set_title(title);
    }
}

DebugOverlayData collect_debug_data(const AppState& app) {
    DebugOverlayData d;
    d.fps = static_cast<float>(app.current_fps);
    d.frame_time_ms = static_cast<float>(app.delta_time * 1000.0);
    d.draw_calls = static_cast<std::uint32_t>(app.renderer.draw_calls_last_frame());

    d.player_x = app.player.position.x;
    d.player_y = app.player.position.y;
    d.player_z = app.player.position.z;
    d.velocity_x = app.player.velocity.x;
    d.velocity_y = app.player.velocity.y;
    d.velocity_z = app.player.velocity.z;
    d.on_ground = app.player.on_ground;

    const ChunkPosition chunk = app.world.collision().chunk_of(app.player.position.x, app.player.position.z);
    d.chunk_x = chunk.x;
    d.chunk_z = chunk.z;
    d.nearby_walls = static_cast<std::uint32_t>(
        app.world.collision().neighborhood_walls(app.player.position.x, app.player.position.z).size());

    d.resident_chunks = static_cast<std::uint32_t>(app.world.chunk_count());
    d.visible_chunks = static_cast<std::uint32_t>(app.cull_stats.visible);
    d.total_vertices = app.world.total_vertices();

    d.status = app.world.status();
    d.progress = app.world.progress();
    d.loading_done = app.world.finished();
    return d;
}

} // namespace

// =============================================================================
// MAIN
// =============================================================================
int main(int argc, char* argv[]) {
    Logger::instance().open("skyroam.log");

    Settings settings;
    const bool settings_loaded = settings.load_first_of({
        "config/settings.toml",
        "../config/settings.toml",
        "../../config/settings.toml",
        "../../../config/settings.toml"
    });
    if (settings_loaded) {
        std::printf("[Settings] Loaded %zu values from %s\n", settings.size(), settings.source().c_str());
    } else {
        std::printf("[Settings] Could not find settings.toml, using defaults\n");
    }

    EngineConfig config = EngineConfig::from_settings(settings);
    if (argc > 1) {
        config.loader.map_file = argv[1];
    }
    std::printf("[Settings] map_file = %s\n", config.loader.map_file.c_str());
    std::printf("[Settings] world = %.0f m, %d x %d chunks\n",
                static_cast<double>(config.world.size), config.world.chunks_per_axis, config.world.chunks_per_axis);
    LOG("Main", "Map file: ", config.loader.map_file);

    if (!initialize_glfw()) {
        std::fprintf(stderr, "[Main] Failed to initialize GLFW\n");
        return 1;
    }

    Window window;
    if (!window.create(1280, 720, WINDOW_TITLE)) {
        std::fprintf(stderr, "[Main] Failed to create window\n");
        terminate_glfw();
        return 1;
    }
    window.set_vsync(config.render.vsync);

    // Heap-allocated so GL objects are released before the window goes away
    auto app = std::make_unique<AppState>(config);
    app->camera.set_projection(config.render.fov, window.aspect_ratio(), config.render.z_near, config.render.z_far);
    app->camera.set_sensitivity(config.player.mouse_sensitivity);

    if (!app->renderer.initialize()) {
        std::fprintf(stderr, "[Main] Failed to initialize renderer\n");
        app.reset();
        window.destroy();
        terminate_glfw();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui_ImplGlfw_InitForOpenGL(window.handle(), true);
    ImGui_ImplOpenGL3_Init("#version 450");

    // Ingestion runs on its own thread and streams chunks back
    LoaderChannel channel;
    auto loader = std::make_unique<MapLoader>(
        config, std::make_unique<OsmFileSource>(config.loader.map_file), channel);
    loader->start();

    std::printf("Controls:\n");
    std::printf("WASD:     Move\n");
    std::printf("SPACE:    Jump\n");
    std::printf("Click:    Capture mouse\n");
    std::printf("ESC:      Release mouse\n");
    std::printf("F3:       Debug overlay\n");
    std::printf("F4:       Wireframe\n");

    app->last_time = Window::get_time();

    while (!window.should_close()) {
        const double now = Window::get_time();
        app->delta_time = now - app->last_time;
        app->last_time = now;

        window.poll_events();
        update_fps(*app, window);

        app->world.pump(channel, app->renderer, static_cast<std::size_t>(config.loader.max_chunks_per_frame));
        if (!app->world_shown && (app->world.chunk_count() > 0 || app->world.finished())) {
            app->world_shown = true;
            LOG("Main", "World visible after ", now, " s");
        }

        process_input(*app, window);

        if (app->world_shown) {
            app->physics.tick(app->player, gather_movement(*app, window), app->delta_time, app->world.collision());
        }
        app->camera.set_position(app->player.position);
        app->camera.set_aspect_ratio(window.aspect_ratio());

        app->renderer.begin_frame();
        if (app->world_shown) {
            app->renderer.set_camera(app->camera);
            app->cull_stats = app->culler.collect(app->camera.view_projection_matrix(),
                                                  app->player.position.to_float(),
                                                  app->world, app->visible);
            app->renderer.render(app->visible);
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        app->overlay.begin_frame();
        if (app->world_shown) {
            app->overlay.render(collect_debug_data(*app));
        } else {
            app->overlay.render_loading(app->world.status(), app->world.progress());
        }
        app->overlay.end_frame();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        window.swap_buffers();
    }

    // Stop streaming before tearing down the consumer
    loader->request_stop();
    loader->join();
    loader.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    app.reset();
    window.destroy();
    terminate_glfw();

    LOG("Main", "Shutdown complete");
    Logger::instance().close();
    return 0;
}
