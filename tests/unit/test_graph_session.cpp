#include <gtest/gtest.h>
#include "session/graph_session.hpp"
#include "test_doubles.hpp"
#include <chrono>
#include <string>
#include <vector>

using namespace gv;
using gv::test_support::FakeDataSource;
using gv::test_support::ScriptedTransport;
using gv::test_support::make_node;

class GraphSessionTest : public ::testing::Test {
protected:
    FakeDataSource source;
    ScriptedTransport transport;
    ManualClock clock;
    EngineConfig config;

    void SetUp() override {
        config.streaming.chunk_size = 100.0;
        config.streaming.prefetch_distance = 0;
        config.virtualization.buffer_zone = 0.0;
        config.edge_cases.retry_delay_ms = 1;
    }

    static void pump_until_idle(GraphSession& session) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        do {
            session.pump(std::chrono::milliseconds(10));
        } while ((session.streamer().loading_count() > 0 || session.streamer().deferred_count() > 0) &&
                 std::chrono::steady_clock::now() < deadline);
    }
};

// ==========================================
// Construction Tests
// ==========================================

TEST_F(GraphSessionTest, InvalidConfigThrows) {
    config.streaming.chunk_size = -1;
    EXPECT_THROW(GraphSession session(config, source, transport, clock), std::invalid_argument);
}

// ==========================================
// Streaming Tests
// ==========================================

TEST_F(GraphSessionTest, ViewportStreamsChunksIntoIndex) {
    GraphSession session(config, source, transport, clock);

    session.update_viewport(0, 0, 100, 100, 1.0);
    EXPECT_EQ(session.streamer().loading_count(), 4);

    pump_until_idle(session);

    EXPECT_EQ(session.streamer().loaded_count(), 4);
    EXPECT_EQ(session.index().size(), 4);
    EXPECT_TRUE(session.virtualizer().is_node_visible("chunk_0_0:center"));
    EXPECT_FALSE(session.virtualizer().is_node_visible("chunk_1_1:center"));

    PerformanceMetrics metrics = session.get_performance_metrics();
    EXPECT_EQ(metrics.node_count, 4);
    EXPECT_EQ(metrics.cached_chunks, 4);
    EXPECT_EQ(metrics.loading_chunks, 0);
    EXPECT_EQ(metrics.visible_node_count, 1);
    EXPECT_DOUBLE_EQ(metrics.cache_hit_ratio, 1.0);
    EXPECT_GT(metrics.data_streaming_rate, 0.0);
}

TEST_F(GraphSessionTest, LoadedChunkFeedsAdjacencyAndEdges) {
    ChunkData data;
    data.nodes.push_back(make_node("a", 10, 10, 0, {"b"}));
    data.nodes.push_back(make_node("b", 20, 20));
    GraphEdge edge;
    edge.id = "e1";
    edge.source = "b";
    edge.target = "a";
    data.edges.push_back(edge);
    source.set_chunk("chunk_0_0", data);

    GraphSession session(config, source, transport, clock);
    session.update_viewport(0, 0, 50, 50, 1.0);
    pump_until_idle(session);

    EXPECT_EQ(session.adjacency().at("a"), std::vector<std::string>({"b"}));
    EXPECT_EQ(session.adjacency().at("b"), std::vector<std::string>({"a"}));
    EXPECT_EQ(session.virtualizer().edge_count(), 1);
    EXPECT_TRUE(session.virtualizer().is_edge_visible("e1"));
    EXPECT_TRUE(session.virtualizer().is_edge_visible("a-b"));

    // Expiry withdraws everything the chunk contributed
    clock.advance(std::chrono::minutes(6));
    EXPECT_GE(session.pump(), 1);

    EXPECT_FALSE(session.index().contains("a"));
    EXPECT_EQ(session.adjacency().count("a"), 0);
    EXPECT_EQ(session.virtualizer().edge_count(), 0);
    EXPECT_FALSE(session.virtualizer().is_node_visible("a"));
}

TEST_F(GraphSessionTest, SharedNodeSurvivesOlderChunkExpiry) {
    ChunkData first;
    first.nodes.push_back(make_node("acct", 10, 10, 0, {"x"}));
    source.set_chunk("chunk_0_0", first);

    ChunkData second;
    second.nodes.push_back(make_node("acct", 150, 10, 0, {"y"}));
    second.nodes.push_back(make_node("y", 160, 20));
    source.set_chunk("chunk_1_0", second);

    GraphSession session(config, source, transport, clock);
    ChunkStreamer& streamer = session.streamer();
    const auto wait = std::chrono::milliseconds(2000);

    streamer.wait_for_chunk(streamer.load_chunk("chunk_0_0", chunk_bounds(0, 0, 100)), wait);
    clock.advance(std::chrono::minutes(3));
    streamer.wait_for_chunk(streamer.load_chunk("chunk_1_0", chunk_bounds(1, 0, 100)), wait);
    EXPECT_EQ(session.adjacency().at("acct"), std::vector<std::string>({"y"}));

    // chunk_0_0 expires; chunk_1_0 is still cached and keeps its copy
    clock.advance(std::chrono::minutes(3));
    session.pump();

    EXPECT_EQ(streamer.get_chunk("chunk_0_0"), nullptr);
    ASSERT_NE(streamer.get_chunk("chunk_1_0"), nullptr);
    ASSERT_TRUE(session.index().contains("acct"));
    EXPECT_DOUBLE_EQ(session.index().find("acct")->x, 150.0);
    EXPECT_EQ(session.adjacency().at("acct"), std::vector<std::string>({"y"}));

    session.update_viewport(140, 0, 50, 50, 1.0);
    EXPECT_TRUE(session.virtualizer().is_node_visible("acct"));
    EXPECT_TRUE(session.virtualizer().is_edge_visible("acct-y"));
}

TEST_F(GraphSessionTest, InjectedNodeOutlivesChunkThatDeliveredIt) {
    GraphSession session(config, source, transport, clock);
    session.update_viewport(0, 0, 50, 50, 1.0);
    pump_until_idle(session);
    ASSERT_TRUE(session.index().contains("chunk_0_0:center"));

    // A direct write takes the node away from its chunk
    session.add_nodes({make_node("chunk_0_0:center", 40, 40)});

    clock.advance(std::chrono::minutes(6));
    session.pump();

    EXPECT_EQ(session.streamer().get_chunk("chunk_0_0"), nullptr);
    ASSERT_TRUE(session.index().contains("chunk_0_0:center"));
    EXPECT_DOUBLE_EQ(session.index().find("chunk_0_0:center")->x, 40.0);
}

// ==========================================
// Direct Injection Tests
// ==========================================

TEST_F(GraphSessionTest, AddAndRemoveNodes) {
    GraphSession session(config, source, transport, clock);
    session.update_viewport(5000, 5000, 100, 100, 1.0);
    pump_until_idle(session);

    size_t accepted = session.add_nodes({
        make_node("x", 5010, 5010, 0, {"y"}),
        make_node("y", 5020, 5020),
        make_node("lost", 99999, 0)
    });
    EXPECT_EQ(accepted, 2);
    EXPECT_TRUE(session.virtualizer().is_node_visible("x"));
    EXPECT_TRUE(session.virtualizer().is_edge_visible("x-y"));

    EXPECT_EQ(session.remove_nodes({"x", "missing"}), 1);
    EXPECT_FALSE(session.virtualizer().is_node_visible("x"));
    EXPECT_FALSE(session.virtualizer().is_edge_visible("x-y"));
    EXPECT_EQ(session.adjacency().count("x"), 0);
}

// ==========================================
// Navigation Tests
// ==========================================

TEST_F(GraphSessionTest, NavigateCentersViewport) {
    GraphSession session(config, source, transport, clock);
    session.add_nodes({make_node("target", 500, 500)});
    session.update_viewport(0, 0, 200, 100, 0.5);

    NavigationResult result = session.navigate_to("target");

    EXPECT_EQ(result.outcome, NavigationResult::Outcome::Navigated);
    EXPECT_TRUE(result.centered);
    EXPECT_FALSE(result.cycle.has_value());
    EXPECT_EQ(result.trail, std::vector<std::string>({"target"}));

    EXPECT_EQ(session.virtualizer().viewport(), BoundingBox(400, 450, 600, 550));
    EXPECT_DOUBLE_EQ(session.virtualizer().zoom(), 0.5);
    EXPECT_EQ(session.operations().status("navigate:target"), OperationStatus::Completed);
}

TEST_F(GraphSessionTest, NavigateToUnknownNodeStillTrails) {
    GraphSession session(config, source, transport, clock);

    NavigationResult result = session.navigate_to("ghost");
    EXPECT_EQ(result.outcome, NavigationResult::Outcome::Navigated);
    EXPECT_FALSE(result.centered);
    EXPECT_EQ(session.trail(), std::vector<std::string>({"ghost"}));
}

TEST_F(GraphSessionTest, DuplicateNavigationIsRejected) {
    GraphSession session(config, source, transport, clock);

    ASSERT_TRUE(session.operations().track_operation(
        "navigate:a", OperationType::Navigation, config.edge_cases.navigation_priority));

    NavigationResult result = session.navigate_to("a");
    EXPECT_EQ(result.outcome, NavigationResult::Outcome::Rejected);
    EXPECT_EQ(result.outcome_string(), "rejected");
    EXPECT_TRUE(session.trail().empty());
}

TEST_F(GraphSessionTest, PreemptedNavigationIsCancelled) {
    GraphSession session(config, source, transport, clock);
    session.navigate_to("a");

    // A more urgent navigation arrives while the cycle is being handled
    session.cycles().set_circular_reference_handler([&](const CircularReference&) {
        session.operations().track_operation("navigate:urgent", OperationType::Navigation, 99);
    });

    NavigationResult result = session.navigate_to("a");
    EXPECT_EQ(result.outcome, NavigationResult::Outcome::Cancelled);
    EXPECT_EQ(session.operations().status("navigate:a"), OperationStatus::Cancelled);
}

TEST_F(GraphSessionTest, CycleReroutesTrail) {
    GraphSession session(config, source, transport, clock);
    session.add_nodes({
        make_node("A", 10, 10, 0, {"B"}),
        make_node("B", 20, 20, 0, {"C"}),
        make_node("C", 30, 30, 0, {"D"}),
        make_node("D", 40, 40, 0, {"A"})
    });

    session.navigate_to("A");
    session.navigate_to("B");
    session.navigate_to("C");

    NavigationResult result = session.navigate_to("A");

    ASSERT_TRUE(result.cycle.has_value());
    EXPECT_EQ(result.cycle->path, std::vector<std::string>({"A", "B", "C"}));
    ASSERT_TRUE(result.alternate_path.has_value());
    EXPECT_EQ(*result.alternate_path, std::vector<std::string>({"C", "D", "A"}));
    EXPECT_EQ(session.trail(), std::vector<std::string>({"C", "D", "A"}));
    EXPECT_EQ(session.cycles().reference_count(), 1);
}

TEST_F(GraphSessionTest, CycleWithoutAlternateTruncatesTrail) {
    GraphSession session(config, source, transport, clock);

    session.navigate_to("A");
    session.navigate_to("B");
    session.navigate_to("C");

    NavigationResult result = session.navigate_to("B");

    ASSERT_TRUE(result.cycle.has_value());
    EXPECT_EQ(result.cycle->depth, 2);
    EXPECT_FALSE(result.alternate_path.has_value());
    EXPECT_EQ(session.trail(), std::vector<std::string>({"A", "B"}));

    auto j = result.to_json();
    EXPECT_EQ(j["outcome"], "navigated");
    EXPECT_TRUE(j.contains("cycle"));
    EXPECT_FALSE(j.contains("alternate_path"));
}

// ==========================================
// Statistics / Reset Tests
// ==========================================

TEST_F(GraphSessionTest, StatisticsAndReset) {
    GraphSession session(config, source, transport, clock);
    session.update_viewport(0, 0, 100, 100, 1.0);
    pump_until_idle(session);
    session.navigate_to("chunk_0_0:center");

    auto stats = session.get_statistics();
    EXPECT_EQ(stats["performance"]["cached_chunks"], 4);
    EXPECT_EQ(stats["streaming"]["source"], "fake");
    EXPECT_EQ(stats["trail_length"], 1);
    EXPECT_EQ(stats["network_failures"], 0);
    EXPECT_TRUE(stats["index"].contains("regions"));
    EXPECT_TRUE(stats["operations"].contains("race_conditions"));

    pump_until_idle(session);
    session.reset();

    EXPECT_TRUE(session.index().empty());
    EXPECT_EQ(session.streamer().chunk_count(), 0);
    EXPECT_TRUE(session.trail().empty());
    EXPECT_TRUE(session.adjacency().empty());
    EXPECT_FALSE(session.virtualizer().has_viewport());
    EXPECT_FALSE(session.operations().get_operation("navigate:chunk_0_0:center").has_value());
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
