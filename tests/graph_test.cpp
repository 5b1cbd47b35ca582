#include "TestSupport.hpp"

namespace FrameFlow::Test {

class GraphTest : public ::testing::Test {
protected:
    TempDir dir;
    Graph graph;
};

TEST_F(GraphTest, TwoNodeCycleIsRejected)
{
    graph.addNode(makeNode("A", { "B" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("B", { "A" }, PassThroughKind {}, dir.path()));
    try {
        graph.validate();
        FAIL() << "expected CycleDetected";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CycleDetected);
        EXPECT_EQ(std::string(e.what()), "cycle detected: A -> B -> A");
    }
    EXPECT_THROW(graph.link(), FlowError);
    EXPECT_FALSE(graph.linked());
}

TEST_F(GraphTest, SelfLoopIsACycle)
{
    graph.addNode(makeNode("A", { "A" }, PassThroughKind {}, dir.path()));
    try {
        graph.validate();
        FAIL() << "expected CycleDetected";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CycleDetected);
    }
}

TEST_F(GraphTest, CycleBehindAnAcyclicPrefixIsNamed)
{
    graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 4));
    graph.addNode(makeNode("sink", { "X" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("X", { "Y", "src" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("Y", { "Z" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("Z", { "X" }, PassThroughKind {}, dir.path()));
    try {
        graph.validate();
        FAIL() << "expected CycleDetected";
    } catch (const FlowError& e) {
        EXPECT_EQ(std::string(e.what()), "cycle detected: X -> Y -> Z -> X");
    }
}

TEST_F(GraphTest, DuplicateNamesAreRejected)
{
    graph.addNode(makeSource("src", dir.path("a/{0}.png"), 1));
    EXPECT_THROW(graph.addNode(makeSource("src", dir.path("b/{0}.png"), 1)), FlowError);
    EXPECT_EQ(graph.size(), 1u);
}

TEST_F(GraphTest, UnknownInputIsInvalidGraph)
{
    graph.addNode(makeNode("p", { "ghost" }, PassThroughKind {}, dir.path()));
    try {
        graph.validate();
        FAIL() << "expected InvalidGraph";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidGraph);
    }
}

TEST_F(GraphTest, InputsMayBeDeclaredBeforeTheirProducers)
{
    graph.addNode(makeNode("p", { "src" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 6));
    EXPECT_NO_THROW(graph.link());
    EXPECT_EQ(graph.node("p").range, (FrameRange { 0, 6 }));
    EXPECT_EQ(graph.inputNode(0, 0), 1u);
}

TEST_F(GraphTest, TopologicalOrderPutsProducersFirst)
{
    graph.addNode(makeNode("merge", { "left", "right" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("left", { "src" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeNode("right", { "src" }, PassThroughKind {}, dir.path()));
    graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 3));

    const auto order = graph.topologicalOrder();
    ASSERT_EQ(order.size(), 4u);
    auto pos = [&](const std::string& name) {
        return std::find(order.begin(), order.end(), graph.indexOf(name)) - order.begin();
    };
    EXPECT_LT(pos("src"), pos("left"));
    EXPECT_LT(pos("src"), pos("right"));
    EXPECT_LT(pos("left"), pos("merge"));
    EXPECT_LT(pos("right"), pos("merge"));
}

TEST_F(GraphTest, MergedRangeIsTheIntersection)
{
    graph.addNode(makeSource("long", dir.path("l/{0:04}.png"), 10));
    graph.addNode(makeSource("short", dir.path("s/{0:04}.png"), 4));
    graph.addNode(makeNode("merge", { "long", "short" }, PassThroughKind {}, dir.path()));
    graph.link();
    EXPECT_EQ(graph.node("merge").range, (FrameRange { 0, 4 }));
    EXPECT_EQ(graph.node("merge").inputRanges.size(), 2u);
}

TEST_F(GraphTest, FadeLongerThanItsInputIsRejected)
{
    graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 3));
    FadeKind fade;
    fade.duration = 5;
    graph.addNode(makeNode("fade", { "src" }, fade, dir.path()));
    EXPECT_THROW(graph.link(), FlowError);
}

TEST_F(GraphTest, DiscoveredSourceWithNoFramesIsMissingInput)
{
    graph.addNode(makeSource("src", dir.path("empty/{0:04}.png")));
    graph.addNode(makeNode("p", { "src" }, PassThroughKind {}, dir.path()));
    try {
        graph.link();
        FAIL() << "expected MissingInput";
    } catch (const FlowError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingInput);
        EXPECT_NE(std::string(e.what()).find("'src'"), std::string::npos);
    }
    EXPECT_FALSE(graph.linked());

    Graph found;
    found.addNode(makeSource("src", dir.path("full/{0:04}.png")));
    writeFrames(found.node("src").output, 3);
    EXPECT_NO_THROW(found.link());
    EXPECT_EQ(found.node("src").range, (FrameRange { 0, 3 }));
}

TEST_F(GraphTest, FixedCountSourceNeedsNoFilesToLink)
{
    graph.addNode(makeSource("src", dir.path("later/{0:04}.png"), 5));
    EXPECT_NO_THROW(graph.link());
    EXPECT_EQ(graph.node("src").range, (FrameRange { 0, 5 }));
}

TEST_F(GraphTest, DotListsEveryEdge)
{
    graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 3));
    graph.addNode(makeNode("blur", { "src" }, PassThroughKind {}, dir.path()));
    const std::string dot = graph.toDot();
    EXPECT_EQ(dot.rfind("digraph G {", 0), 0u);
    EXPECT_NE(dot.find("\"src\";"), std::string::npos);
    EXPECT_NE(dot.find("\"src\" -> \"blur\";"), std::string::npos);
}

} // namespace FrameFlow::Test
