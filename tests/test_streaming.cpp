#include "Server/World.hpp"
#include "Server/MeshBuilder.hpp"
#include "Shared/LoaderMessage.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

using namespace skyroam;
using namespace skyroam::server;

namespace {

class RecordingUploader final : public ChunkUploader {
public:
    GeometryHandle upload(const ChunkData& chunk) override {
        uploaded.push_back(chunk.coord);
        return static_cast<GeometryHandle>(uploaded.size());
    }

    std::vector<ChunkPosition> uploaded;
};

ChunkData ground_chunk(ChunkPosition pos) {
    const WorldConfig w;
    ChunkData chunk(pos);
    MeshBuilder::append_ground(chunk, coord::chunk_origin(pos, w), w.chunk_size());
    return chunk;
}

BatchLoadedMessage batch_of(std::initializer_list<ChunkPosition> positions) {
    BatchLoadedMessage batch;
    for (ChunkPosition p : positions) {
        batch.chunks.push_back(ground_chunk(p));
    }
    return batch;
}

} // namespace

TEST(MessageChannel, IsFifo) {
    MessageChannel<int> channel;
    EXPECT_TRUE(channel.empty());
    for (int i = 0; i < 5; ++i) {
        channel.push(i);
    }
    EXPECT_EQ(channel.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        const auto v = channel.try_pop();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(ProgressReporter, IsMonotoneAndStepGated) {
    LoaderChannel channel;
    ProgressReporter progress(channel, 0.05f);

    progress.report(0.10f);
    progress.report(0.12f);   // Below step
    progress.report(0.05f);   // Backwards
    progress.report(0.20f);
    progress.force(0.15f);    // Backwards, even when forced
    progress.force(0.21f);
    progress.report(2.0f);    // Clamped to 1

    std::vector<float> seen;
    while (auto m = channel.try_pop()) {
        ASSERT_TRUE(std::holds_alternative<ProgressMessage>(*m));
        seen.push_back(std::get<ProgressMessage>(*m).fraction);
    }
    EXPECT_THAT(seen, ::testing::ElementsAre(0.10f, 0.20f, 0.21f, 1.0f));
    EXPECT_FLOAT_EQ(progress.last(), 1.0f);
}

TEST(WorldStreaming, DrainsMessagesInOrder) {
    LoaderChannel channel;
    channel.push(ProgressMessage{0.1f});
    channel.push(batch_of({{1, 1}, {2, 1}}));
    channel.push(ProgressMessage{0.5f});
    channel.push(batch_of({{3, 1}}));
    channel.push(DoneMessage{});

    World world(EngineConfig{});
    RecordingUploader uploader;
    const PumpResult r = world.pump(channel, uploader, 100);

    EXPECT_EQ(r.messages, 5u);
    EXPECT_EQ(r.chunks, 3u);
    EXPECT_TRUE(world.finished());
    EXPECT_FLOAT_EQ(world.progress(), 0.5f);
    EXPECT_EQ(world.chunk_count(), 3u);
    EXPECT_THAT(uploader.uploaded, ::testing::ElementsAre(
        ChunkPosition{1, 1}, ChunkPosition{2, 1}, ChunkPosition{3, 1}));
    EXPECT_EQ(world.total_vertices(), 12u);
    EXPECT_EQ(world.total_indices(), 18u);

    const ResidentChunk* c = world.get_chunk({2, 1});
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->geometry, 2u);
    EXPECT_EQ(c->index_count, 6u);
    EXPECT_NE(c->collision, nullptr);
    EXPECT_FLOAT_EQ(c->aabb_min.x, -3750.0f);
    EXPECT_FLOAT_EQ(c->aabb_max.x, -3125.0f);
}

TEST(WorldStreaming, EmptyMapFinishesWithNoChunks) {
    LoaderChannel channel;
    channel.push(StatusMessage{"Done"});
    channel.push(DoneMessage{});

    World world(EngineConfig{});
    RecordingUploader uploader;
    world.pump(channel, uploader, 16);

    EXPECT_TRUE(world.finished());
    EXPECT_EQ(world.status(), "Done");
    EXPECT_EQ(world.chunk_count(), 0u);
    EXPECT_TRUE(uploader.uploaded.empty());
}

TEST(WorldStreaming, ChunkBudgetNeverSplitsBatch) {
    LoaderChannel channel;
    channel.push(batch_of({{0, 0}, {1, 0}, {2, 0}}));
    channel.push(batch_of({{3, 0}}));
    channel.push(DoneMessage{});

    World world(EngineConfig{});
    RecordingUploader uploader;

    const PumpResult first = world.pump(channel, uploader, 1);
    EXPECT_EQ(first.messages, 1u);
    EXPECT_EQ(first.chunks, 3u);
    EXPECT_FALSE(world.finished());

    const PumpResult second = world.pump(channel, uploader, 1);
    EXPECT_EQ(second.chunks, 1u);
    EXPECT_FALSE(world.finished());

    world.pump(channel, uploader, 1);
    EXPECT_TRUE(world.finished());
    EXPECT_EQ(world.chunk_count(), 4u);
}

TEST(WorldStreaming, DuplicateAndOutOfWorldChunksAreIgnored) {
    World world(EngineConfig{});
    RecordingUploader uploader;

    EXPECT_TRUE(world.ingest(ground_chunk({4, 4}), uploader));
    EXPECT_FALSE(world.ingest(ground_chunk({4, 4}), uploader));
    EXPECT_FALSE(world.ingest(ChunkData(ChunkPosition{16, 0}), uploader));
    EXPECT_FALSE(world.ingest(ChunkData(ChunkPosition{-1, 3}), uploader));

    EXPECT_EQ(world.chunk_count(), 1u);
    EXPECT_EQ(uploader.uploaded.size(), 1u);
}

TEST(WorldStreaming, EmptyChunkIsResidentWithoutGeometry) {
    World world(EngineConfig{});
    RecordingUploader uploader;

    EXPECT_TRUE(world.ingest(ChunkData(ChunkPosition{5, 5}), uploader));
    const ResidentChunk* c = world.get_chunk({5, 5});
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->geometry, 0u);
    EXPECT_TRUE(uploader.uploaded.empty());
}

TEST(WorldStreaming, WallsBecomeCollidable) {
    World world(EngineConfig{});
    RecordingUploader uploader;

    ChunkData chunk = ground_chunk({8, 8});
    const MeshBuilder mesher(PhysicsConfig{});
    chunk.walls.push_back(mesher.make_collider({100.0f, 100.0f}, {100.0f, 200.0f}, 20.0f));
    ASSERT_TRUE(world.ingest(std::move(chunk), uploader));

    EXPECT_EQ(world.collision().neighborhood_walls(100.2, 150.0).size(), 1u);
    EXPECT_EQ(world.collision().chunk_count(), 1u);
}
