#include "TestSupport.hpp"
#include "FrameFlowWorkers.hpp"

#include <set>

namespace FrameFlow::Test {

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        graph.addNode(makeSource("src", dir.path("src/{0:04}.png"), 100));
        graph.addNode(makeNode("copy", { "src" }, PassThroughKind {}, dir.path()));
        graph.link();
        writeFrames(graph.node("src").output, 100);
    }

    TempDir dir;
    Graph graph;
};

TEST_F(WorkerPoolTest, HundredIndependentTasksOnFourWorkers)
{
    RecordingRunner runner;
    runner.delay = std::chrono::milliseconds(2);
    const Node& node = graph.node("copy");
    const Stream& src = graph.node("src").output;

    std::vector<std::future<TaskResult>> futures;
    {
        WorkerPool pool(4);
        EXPECT_EQ(pool.size(), 4u);
        for (FrameIndex f = 0; f < 100; ++f) {
            const std::vector<std::string> paths { src.pathFor(f) };
            futures.push_back(pool.submit({ 1, f }, [&node, &runner, f, paths] { return node.execute(f, paths, runner); }));
        }
        pool.shutdown();
    }

    std::set<std::string> outputs;
    for (auto& fut : futures) {
        const TaskResult r = fut.get();
        ASSERT_TRUE(r.ok) << r.message;
        EXPECT_EQ(r.key.node, 1u);
        outputs.insert(r.outputPath);
    }
    EXPECT_EQ(outputs.size(), 100u);
    EXPECT_EQ(countFiles(dir.path("copy")), 100u);
    EXPECT_LE(runner.peakConcurrency(), 4);
}

TEST_F(WorkerPoolTest, OutputCountDoesNotDependOnPoolSize)
{
    for (unsigned workers : { 1u, 3u, 8u }) {
        fs::remove_all(dir.path("copy"));
        RecordingRunner runner;
        const Node& node = graph.node("copy");
        const Stream& src = graph.node("src").output;

        WorkerPool pool(workers);
        for (FrameIndex f = 0; f < 100; ++f) {
            const std::vector<std::string> paths { src.pathFor(f) };
            pool.submit({ 1, f }, [&node, &runner, f, paths] { return node.execute(f, paths, runner); });
        }
        size_t received = 0;
        TaskResult r;
        while (received < 100 && pool.nextResult(r)) {
            EXPECT_TRUE(r.ok) << r.message;
            ++received;
        }
        pool.shutdown();
        EXPECT_EQ(received, 100u);
        EXPECT_EQ(countFiles(dir.path("copy")), 100u) << workers << " workers";
    }
}

TEST_F(WorkerPoolTest, ThrowingJobBecomesTransformFailed)
{
    WorkerPool pool(2);
    auto fut = pool.submit({ 7, 3 }, []() -> TaskResult { throw std::runtime_error("boom"); });
    const TaskResult r = fut.get();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, ErrorCode::TransformFailed);
    EXPECT_EQ(r.key, (TaskKey { 7, 3 }));
    EXPECT_EQ(r.message, "boom");
}

TEST_F(WorkerPoolTest, SubmitAfterShutdownThrows)
{
    WorkerPool pool(1);
    pool.shutdown();
    const TaskKey key { 0, 0 };
    EXPECT_THROW(pool.submit(key, [] { return TaskResult {}; }), std::logic_error);
    TaskResult r;
    EXPECT_FALSE(pool.nextResult(r));
}

TEST(ChannelTest, DrainsAfterClose)
{
    Channel<int> ch;
    EXPECT_TRUE(ch.push(1));
    EXPECT_TRUE(ch.push(2));
    ch.close();
    EXPECT_FALSE(ch.push(3));

    int v = 0;
    EXPECT_TRUE(ch.pop(v));
    EXPECT_EQ(v, 1);
    EXPECT_TRUE(ch.tryPop(v));
    EXPECT_EQ(v, 2);
    EXPECT_FALSE(ch.pop(v));
    EXPECT_FALSE(ch.tryPop(v));
}

} // namespace FrameFlow::Test
