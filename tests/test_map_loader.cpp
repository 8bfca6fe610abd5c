#include "Server/MapLoader.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace skyroam;
using namespace skyroam::server;

namespace {

constexpr double LAT0 = 40.771220;
constexpr double LON0 = -73.979577;

RawWay make_way(ElementId id, std::vector<ElementId> refs,
                std::initializer_list<std::pair<const std::string, std::string>> tags) {
    RawWay way;
    way.id = id;
    way.node_ids = std::move(refs);
    way.tags = tags;
    return way;
}

// One building just south-east of the origin, one far outside the world,
// one way that is not a building and one with a dangling node reference
std::unique_ptr<MemorySource> small_map() {
    auto source = std::make_unique<MemorySource>();
    source->add(RawNode{1, LAT0 - 0.0001, LON0 + 0.0001});
    source->add(RawNode{2, LAT0 - 0.0001, LON0 + 0.0002});
    source->add(RawNode{3, LAT0 - 0.0002, LON0 + 0.0002});
    source->add(RawNode{4, LAT0 - 0.0002, LON0 + 0.0001});
    source->add(RawNode{10, LAT0 + 1.0, LON0});
    source->add(RawNode{11, LAT0 + 1.0, LON0 + 0.0001});
    source->add(RawNode{12, LAT0 + 1.0001, LON0 + 0.0001});

    source->add(make_way(100, {1, 2, 3, 4, 1}, {{"building", "yes"}, {"height", "30"}}));
    source->add(make_way(101, {10, 11, 12, 10}, {{"building", "yes"}}));
    source->add(make_way(102, {1, 2, 3}, {{"highway", "footway"}}));
    source->add(make_way(103, {1, 2, 999, 1}, {{"building", "house"}}));
    return source;
}

class FailingSource final : public ElementSource {
public:
    bool open() override {
        m_error = "File not found: missing.osm.pbf";
        return false;
    }
    bool read(ElementMask, const NodeVisitor&, const WayVisitor&, const ProgressFn&) override {
        return false;
    }
    [[nodiscard]] std::string describe() const override { return "missing.osm.pbf"; }
};

std::vector<LoaderMessage> drain(LoaderChannel& channel) {
    std::vector<LoaderMessage> out;
    while (auto m = channel.try_pop()) {
        out.push_back(std::move(*m));
    }
    return out;
}

EngineConfig test_config() {
    EngineConfig config;
    config.loader.worker_threads = 2;
    return config;
}

} // namespace

TEST(MapLoader, StreamsBuildingChunkAndFinishesWithDone) {
    LoaderChannel channel;
    MapLoader loader(test_config(), small_map(), channel);
    loader.run();

    const std::vector<LoaderMessage> messages = drain(channel);
    ASSERT_FALSE(messages.empty());
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));

    std::size_t batches = 0;
    std::size_t dones = 0;
    float last_progress = -1.0f;
    std::vector<std::string> statuses;
    for (const LoaderMessage& m : messages) {
        if (const auto* b = std::get_if<BatchLoadedMessage>(&m)) {
            ++batches;
            ASSERT_EQ(b->chunks.size(), 1u);
            const ChunkData& chunk = b->chunks.front();
            EXPECT_EQ(chunk.coord, (ChunkPosition{8, 8}));
            EXPECT_EQ(chunk.vertices.size(), 24u);
            EXPECT_EQ(chunk.indices.size(), 36u);
            ASSERT_EQ(chunk.walls.size(), 4u);
            EXPECT_FLOAT_EQ(chunk.walls.front().height, 30.0f);
        } else if (const auto* p = std::get_if<ProgressMessage>(&m)) {
            EXPECT_GT(p->fraction, last_progress);
            last_progress = p->fraction;
        } else if (const auto* s = std::get_if<StatusMessage>(&m)) {
            statuses.push_back(s->text);
        } else {
            ++dones;
        }
    }
    EXPECT_EQ(batches, 1u);
    EXPECT_EQ(dones, 1u);
    EXPECT_FLOAT_EQ(last_progress, 1.0f);
    ASSERT_FALSE(statuses.empty());
    EXPECT_EQ(statuses.front(), "Reading Nodes...");
    EXPECT_EQ(statuses.back(), "Done");

    const LoaderStats& stats = loader.stats();
    EXPECT_FALSE(stats.source_failed);
    EXPECT_EQ(stats.nodes, 7u);
    EXPECT_EQ(stats.ways, 4u);
    EXPECT_EQ(stats.buildings, 1u);
    EXPECT_EQ(stats.outside_world, 1u);
    EXPECT_EQ(stats.missing_node, 1u);
    EXPECT_EQ(stats.chunks, 1u);
    EXPECT_EQ(stats.batches, 1u);
}

TEST(MapLoader, EmptySourceSendsOnlyProgressStatusAndDone) {
    LoaderChannel channel;
    MapLoader loader(test_config(), std::make_unique<MemorySource>(), channel);
    loader.run();

    const std::vector<LoaderMessage> messages = drain(channel);
    ASSERT_FALSE(messages.empty());
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));
    for (const LoaderMessage& m : messages) {
        EXPECT_FALSE(std::holds_alternative<BatchLoadedMessage>(m));
    }
    EXPECT_EQ(loader.stats().chunks, 0u);
}

TEST(MapLoader, SourceErrorSendsFallbackGround) {
    LoaderChannel channel;
    MapLoader loader(test_config(), std::make_unique<FailingSource>(), channel);
    loader.run();

    const std::vector<LoaderMessage> messages = drain(channel);
    ASSERT_GE(messages.size(), 5u);

    const auto* error = std::get_if<StatusMessage>(&messages[0]);
    ASSERT_NE(error, nullptr);
    EXPECT_EQ(error->text.rfind("Error:", 0), 0u);
    EXPECT_NE(error->text.find("missing.osm.pbf"), std::string::npos);

    const auto* batch = std::get_if<BatchLoadedMessage>(&messages[1]);
    ASSERT_NE(batch, nullptr);
    ASSERT_EQ(batch->chunks.size(), 1u);
    EXPECT_EQ(batch->chunks.front().coord, (ChunkPosition{8, 8}));
    EXPECT_EQ(batch->chunks.front().indices.size(), 6u);
    EXPECT_TRUE(batch->chunks.front().walls.empty());

    const auto* progress = std::get_if<ProgressMessage>(&messages[messages.size() - 3]);
    ASSERT_NE(progress, nullptr);
    EXPECT_FLOAT_EQ(progress->fraction, 1.0f);
    const auto* done_status = std::get_if<StatusMessage>(&messages[messages.size() - 2]);
    ASSERT_NE(done_status, nullptr);
    EXPECT_EQ(done_status->text, "Done");
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));

    EXPECT_TRUE(loader.stats().source_failed);
}

TEST(MapLoader, SourceErrorWithoutFallbackSendsNoBatch) {
    EngineConfig config = test_config();
    config.loader.fallback_ground = false;

    LoaderChannel channel;
    MapLoader loader(config, std::make_unique<FailingSource>(), channel);
    loader.run();

    const std::vector<LoaderMessage> messages = drain(channel);
    for (const LoaderMessage& m : messages) {
        EXPECT_FALSE(std::holds_alternative<BatchLoadedMessage>(m));
    }
    ASSERT_FALSE(messages.empty());
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));
}

TEST(MapLoader, StopBeforeStreamingStillSendsDone) {
    LoaderChannel channel;
    MapLoader loader(test_config(), small_map(), channel);
    loader.request_stop();
    loader.run();

    const std::vector<LoaderMessage> messages = drain(channel);
    for (const LoaderMessage& m : messages) {
        EXPECT_FALSE(std::holds_alternative<BatchLoadedMessage>(m));
    }
    ASSERT_FALSE(messages.empty());
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));
    EXPECT_EQ(loader.stats().buildings, 1u);
    EXPECT_EQ(loader.stats().chunks, 0u);
}

TEST(MapLoader, WorkerThreadDeliversThroughChannel) {
    LoaderChannel channel;
    MapLoader loader(test_config(), small_map(), channel);
    loader.start();
    loader.join();
    EXPECT_FALSE(loader.is_running());

    const std::vector<LoaderMessage> messages = drain(channel);
    ASSERT_FALSE(messages.empty());
    EXPECT_TRUE(std::holds_alternative<DoneMessage>(messages.back()));
    EXPECT_EQ(loader.stats().chunks, 1u);
}
