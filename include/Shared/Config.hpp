// =============================================================================
// SKYROAM - ENGINE CONFIGURATION
// Immutable parameter block handed to every component at construction
// =============================================================================
#pragma once

#include "Shared/Settings.hpp"
#include "Shared/Logger.hpp"
#include "Shared/Types.hpp"

#include <cmath>
#include <cstdint>
#include <string>

namespace skyroam {

// =============================================================================
// WORLD LAYOUT
// =============================================================================
struct WorldConfig {
    double origin_lat = 40.771220;
    double origin_lon = -73.979577;
    float size = 10000.0f;            // Edge length of the square world (m)
    std::int32_t chunks_per_axis = 16;
    float chunk_min_y = -20.0f;       // Vertical bounds used for culling AABBs
    float chunk_max_y = 450.0f;

    [[nodiscard]] float chunk_size() const noexcept {
        return size / static_cast<float>(chunks_per_axis);
    }
    [[nodiscard]] float half_size() const noexcept { return size * 0.5f; }
};

// =============================================================================
// COLLISION + INTEGRATION
// =============================================================================
struct PhysicsConfig {
    float grid_cell_size = 50.0f;
    std::int32_t grid_border_cells = 1;
    float wall_thickness = 0.5f;
    double step_size = 0.01;
    std::int32_t max_substeps = 10;
    std::int32_t resolve_passes = 5;
    double gravity = 35.0;
    double terminal_velocity = -50.0;
};

struct PlayerConfig {
    float radius = 0.3f;
    double eye_height = 1.8;
    double move_speed = 15.0;
    double jump_force = 12.0;
    float mouse_sensitivity = 0.1f;
};

// =============================================================================
// BUILDING HEIGHT INFERENCE
// =============================================================================
struct BuildingConfig {
    float level_height = 3.0f;
    float fallback_min_height = 10.0f;
    float fallback_max_height = 40.0f;
};

struct RenderConfig {
    float fov = 45.0f;
    float z_near = 0.1f;
    float z_far = 10000.0f;
    float draw_distance = 3500.0f;
    float fog_start = 1000.0f;
    float fog_end = 2500.0f;
    bool vsync = true;
};

struct LoaderConfig {
    std::string map_file = "nyc.osm.pbf";
    std::int32_t batch_size = 4;
    std::int32_t max_chunks_per_frame = 16;
    bool fallback_ground = true;
    std::int32_t worker_threads = 0;   // 0 = hardware concurrency
};

// =============================================================================
// ENGINE CONFIG
// =============================================================================
struct EngineConfig {
    WorldConfig world;
    PhysicsConfig physics;
    PlayerConfig player;
    BuildingConfig building;
    RenderConfig render;
    LoaderConfig loader;

    // Distance at which a player touches a wall centreline
    [[nodiscard]] float collision_distance() const noexcept {
        return player.radius + physics.wall_thickness;
    }

    // Build from parsed settings; anything absent keeps its default
    static EngineConfig from_settings(const Settings& s) {
        EngineConfig c;

        c.world.origin_lat = s.get_double("world.origin_lat", c.world.origin_lat);
        c.world.origin_lon = s.get_double("world.origin_lon", c.world.origin_lon);
        c.world.size = s.get_float("world.size", c.world.size);
        c.world.chunks_per_axis = s.get_int("world.chunks_per_axis", c.world.chunks_per_axis);
        c.world.chunk_min_y = s.get_float("world.chunk_min_y", c.world.chunk_min_y);
        c.world.chunk_max_y = s.get_float("world.chunk_max_y", c.world.chunk_max_y);

        c.physics.grid_cell_size = s.get_float("physics.grid_cell_size", c.physics.grid_cell_size);
        c.physics.grid_border_cells = s.get_int("physics.grid_border_cells", c.physics.grid_border_cells);
        c.physics.wall_thickness = s.get_float("physics.wall_thickness", c.physics.wall_thickness);
        c.physics.step_size = s.get_double("physics.step_size", c.physics.step_size);
        c.physics.max_substeps = s.get_int("physics.max_substeps", c.physics.max_substeps);
        c.physics.resolve_passes = s.get_int("physics.resolve_passes", c.physics.resolve_passes);
        c.physics.gravity = s.get_double("physics.gravity", c.physics.gravity);
        c.physics.terminal_velocity = s.get_double("physics.terminal_velocity", c.physics.terminal_velocity);

        c.player.radius = s.get_float("player.radius", c.player.radius);
        c.player.eye_height = s.get_double("player.eye_height", c.player.eye_height);
        c.player.move_speed = s.get_double("player.move_speed", c.player.move_speed);
        c.player.jump_force = s.get_double("player.jump_force", c.player.jump_force);
        c.player.mouse_sensitivity = s.get_float("player.mouse_sensitivity", c.player.mouse_sensitivity);

        c.building.level_height = s.get_float("building.level_height", c.building.level_height);
        c.building.fallback_min_height = s.get_float("building.fallback_min_height", c.building.fallback_min_height);
        c.building.fallback_max_height = s.get_float("building.fallback_max_height", c.building.fallback_max_height);

        c.render.fov = s.get_float("render.fov", c.render.fov);
        c.render.z_near = s.get_float("render.z_near", c.render.z_near);
        c.render.z_far = s.get_float("render.z_far", c.render.z_far);
        c.render.draw_distance = s.get_float("render.draw_distance", c.render.draw_distance);
        c.render.fog_start = s.get_float("render.fog_start", c.render.fog_start);
        c.render.fog_end = s.get_float("render.fog_end", c.render.fog_end);
        c.render.vsync = s.get_bool("render.vsync", c.render.vsync);

        c.loader.map_file = s.get_string("loader.map_file", c.loader.map_file);
        c.loader.batch_size = s.get_int("loader.batch_size", c.loader.batch_size);
        c.loader.max_chunks_per_frame = s.get_int("loader.max_chunks_per_frame", c.loader.max_chunks_per_frame);
        c.loader.fallback_ground = s.get_bool("loader.fallback_ground", c.loader.fallback_ground);
        c.loader.worker_threads = s.get_int("loader.worker_threads", c.loader.worker_threads);

        c.validate();
        return c;
    }

    // Replace values that would break index arithmetic with their defaults
    void validate() {
        const EngineConfig d;
        if (world.chunks_per_axis < 1) {
            LOG("Config", "world.chunks_per_axis must be >= 1, using ", d.world.chunks_per_axis);
            world.chunks_per_axis = d.world.chunks_per_axis;
        }
        if (!(world.size > 0.0f)) {
            LOG("Config", "world.size must be > 0, using ", d.world.size);
            world.size = d.world.size;
        }
        if (!(physics.grid_cell_size > 0.0f)) {
            LOG("Config", "physics.grid_cell_size must be > 0, using ", d.physics.grid_cell_size);
            physics.grid_cell_size = d.physics.grid_cell_size;
        }
        if (physics.grid_border_cells < 0) {
            physics.grid_border_cells = 0;
        }
        if (!(physics.step_size > 0.0)) {
            LOG("Config", "physics.step_size must be > 0, using ", d.physics.step_size);
            physics.step_size = d.physics.step_size;
        }
        if (physics.max_substeps < 1) physics.max_substeps = d.physics.max_substeps;
        if (physics.resolve_passes < 1) physics.resolve_passes = d.physics.resolve_passes;
        if (loader.batch_size < 1) loader.batch_size = d.loader.batch_size;
        if (building.fallback_max_height < building.fallback_min_height) {
            building.fallback_max_height = building.fallback_min_height;
        }
    }
};

// =============================================================================
// COORDINATE UTILITIES
// The one place world positions are mapped to chunk cells
// =============================================================================
namespace coord {

    // floor((p + size/2) / chunk_size) per axis; may fall outside the world
    [[nodiscard]] inline ChunkPosition world_to_chunk(double x, double z, const WorldConfig& w) noexcept {
        const double half = static_cast<double>(w.half_size());
        const double cs = static_cast<double>(w.chunk_size());
        return {
            static_cast<std::int32_t>(std::floor((x + half) / cs)),
            static_cast<std::int32_t>(std::floor((z + half) / cs))
        };
    }

    [[nodiscard]] inline bool is_valid_chunk(ChunkPosition c, const WorldConfig& w) noexcept {
        return c.x >= 0 && c.x < w.chunks_per_axis && c.z >= 0 && c.z < w.chunks_per_axis;
    }

    // World-space corner with the smallest x and z
    [[nodiscard]] inline Point2 chunk_origin(ChunkPosition c, const WorldConfig& w) noexcept {
        return {
            static_cast<float>(c.x) * w.chunk_size() - w.half_size(),
            static_cast<float>(c.z) * w.chunk_size() - w.half_size()
        };
    }

    // Row-major slot in a dense per-chunk array
    [[nodiscard]] inline std::size_t chunk_index(ChunkPosition c, const WorldConfig& w) noexcept {
        return static_cast<std::size_t>(c.z) * static_cast<std::size_t>(w.chunks_per_axis)
             + static_cast<std::size_t>(c.x);
    }

} // namespace coord

} // namespace skyroam
