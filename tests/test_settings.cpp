#include "Shared/Settings.hpp"
#include "Shared/Config.hpp"

#include <gtest/gtest.h>

using namespace skyroam;

TEST(Settings, ParsesSectionsTypesAndComments) {
    Settings s;
    s.parse(
        "# header comment\n"
        "[world]\n"
        "origin_lat = 40.5   # trailing comment\n"
        "chunks_per_axis = 8\n"
        "\n"
        "[loader]\n"
        "map_file = \"maps/a#b.osm.pbf\"\n"
        "fallback_ground = false\n");

    EXPECT_DOUBLE_EQ(s.get_double("world.origin_lat"), 40.5);
    EXPECT_EQ(s.get_int("world.chunks_per_axis"), 8);
    EXPECT_EQ(s.get_string("loader.map_file"), "maps/a#b.osm.pbf");
    EXPECT_FALSE(s.get_bool("loader.fallback_ground", true));
    EXPECT_EQ(s.size(), 4u);
}

TEST(Settings, MissingKeysFallBackToDefaults) {
    Settings s;
    s.parse("[render]\nfov = abc\n");
    EXPECT_FLOAT_EQ(s.get_float("render.fov", 45.0f), 45.0f);
    EXPECT_EQ(s.get_int("render.missing", 7), 7);
    EXPECT_TRUE(s.get_bool("render.vsync", true));
    EXPECT_FALSE(s.has("render.vsync"));
}

TEST(Settings, MissingFileIsReported) {
    Settings s;
    EXPECT_FALSE(s.load("definitely/not/here/settings.toml"));
    EXPECT_FALSE(s.load_first_of({"nope_a.toml", "nope_b.toml"}));
    EXPECT_EQ(s.size(), 0u);
}

TEST(EngineConfig, DefaultsMatchOriginalConstants) {
    const EngineConfig c = EngineConfig::from_settings(Settings{});
    EXPECT_DOUBLE_EQ(c.world.origin_lat, 40.771220);
    EXPECT_DOUBLE_EQ(c.world.origin_lon, -73.979577);
    EXPECT_FLOAT_EQ(c.world.size, 10000.0f);
    EXPECT_EQ(c.world.chunks_per_axis, 16);
    EXPECT_FLOAT_EQ(c.world.chunk_size(), 625.0f);
    EXPECT_FLOAT_EQ(c.collision_distance(), 0.8f);
    EXPECT_EQ(c.loader.batch_size, 4);
    EXPECT_FLOAT_EQ(c.render.draw_distance, 3500.0f);
}

TEST(EngineConfig, InvalidValuesAreReplaced) {
    Settings s;
    s.parse(
        "[world]\nchunks_per_axis = 0\nsize = -5\n"
        "[physics]\ngrid_cell_size = 0\nstep_size = 0\n"
        "[loader]\nbatch_size = 0\n");
    const EngineConfig c = EngineConfig::from_settings(s);
    EXPECT_EQ(c.world.chunks_per_axis, 16);
    EXPECT_FLOAT_EQ(c.world.size, 10000.0f);
    EXPECT_FLOAT_EQ(c.physics.grid_cell_size, 50.0f);
    EXPECT_DOUBLE_EQ(c.physics.step_size, 0.01);
    EXPECT_EQ(c.loader.batch_size, 4);
}

TEST(Coord, WorldToChunkAtBoundaries) {
    const WorldConfig w;   // 10000 m, 16 chunks of 625 m
    EXPECT_EQ(coord::world_to_chunk(-5000.0, -5000.0, w), (ChunkPosition{0, 0}));
    EXPECT_EQ(coord::world_to_chunk(0.0, 0.0, w), (ChunkPosition{8, 8}));
    EXPECT_EQ(coord::world_to_chunk(-0.001, 0.0, w), (ChunkPosition{7, 8}));
    EXPECT_EQ(coord::world_to_chunk(4999.9, 4999.9, w), (ChunkPosition{15, 15}));

    EXPECT_FALSE(coord::is_valid_chunk(coord::world_to_chunk(5000.0, 0.0, w), w));
    EXPECT_FALSE(coord::is_valid_chunk(coord::world_to_chunk(-5000.1, 0.0, w), w));

    const Point2 o = coord::chunk_origin({8, 8}, w);
    EXPECT_FLOAT_EQ(o.x, 0.0f);
    EXPECT_FLOAT_EQ(o.z, 0.0f);
}
