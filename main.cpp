// main.cpp
//
// FrameFlow command line. Parses CLI (CLI11), loads the JSON flow, plans the
// requested frames of the sink and materialises whatever is missing:
// - --plan prints what would run without running it
// - --dot prints the stream graph in Graphviz format
// Exit status: 0 all frames present, 1 some frame failed, 2 bad flow/graph.
#include "FrameFlowConfig.hpp"
#include "FrameFlowScheduler.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>

namespace {

// Flow files are looked up relative to the working directory, then one and two
// levels up so the binary can run from a build directory.
std::string locateFlow(const std::string& flowPath) {
    for (const std::string prefix : {"", "../", "../../"}) {
        if (std::ifstream(prefix + flowPath).good()) return prefix + flowPath;
    }
    return flowPath;
}

void printPlan(const FrameFlow::Graph& graph, const FrameFlow::Plan& plan, bool verbose) {
    using FrameFlow::TaskStatus;
    std::map<size_t, std::map<TaskStatus, size_t>> perNode;
    for (const auto& kv : plan.tasks) ++perNode[kv.first.node][kv.second.status];
    for (size_t n : graph.topologicalOrder()) {
        auto it = perNode.find(n);
        if (it == perNode.end()) continue;
        const auto& node = graph.node(n);
        std::string counts;
        for (const auto& sc : it->second) {
            counts += fmt::format(" {}={}", FrameFlow::taskStatusName(sc.first), sc.second);
        }
        fmt::print("[Plan] {} ({}, range [{}, {})):{}\n", node.name, node.type, node.range.begin, node.range.end, counts);
    }
    if (verbose) {
        for (const auto& kv : plan.tasks) {
            if (kv.second.status != TaskStatus::Failed) continue;
            fmt::print("[Plan]   {} frame {}: {}\n", graph.node(kv.first.node).name, kv.first.frame, kv.second.message);
        }
    }
    fmt::print("[Plan] {} task(s) to run, {} cached\n", plan.pendingCount(), plan.cachedCount());
}

} // namespace

int main(int argc, char** argv) {
    std::string flowPath;
    std::string sink;
    std::optional<long long> begin;
    std::optional<long long> end;
    unsigned jobs = 0;
    bool keepGoing = false;
    bool noCache = false;
    bool planOnly = false;
    bool dot = false;
    bool verbose = false;
    CLI::App app{"FrameFlow"};
    try {
        app.add_option("--graph,--flow", flowPath, "Path to flow JSON file")->required();
        app.add_option("--sink", sink, "Node whose frames are requested (default: flow sink)");
        app.add_option("--begin", begin, "First frame index (default: start of the sink range)");
        app.add_option("--end", end, "One past the last frame index (default: end of the sink range)");
        app.add_option("--jobs,-j", jobs, "Concurrent external commands (0=hardware threads)");
        app.add_flag("--keep-going,-k", keepGoing, "Keep running frames unrelated to a failure");
        app.add_flag("--no-cache", noCache, "Recompute frames whose output already exists");
        app.add_flag("--plan", planOnly, "Print the plan and exit without running anything");
        app.add_flag("--dot", dot, "Print the graph in Graphviz dot format and exit");
        app.add_flag("--verbose,-v", verbose, "Log every finished frame");
        app.allow_extras(false);
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    FrameFlow::Flow flow;
    try {
        flow = FrameFlow::loadFromFile(locateFlow(flowPath));
        if (dot) {
            fmt::print("{}", flow.graph.toDot());
            return 0;
        }
        flow.graph.link();
    } catch (const FrameFlow::FlowError& e) {
        fmt::print(stderr, "[FrameFlow] {}: {}\n", FrameFlow::errorCodeName(e.code()), e.what());
        return 2;
    }
    if (sink.empty()) sink = flow.sink;

    FrameFlow::ProcessRunner runner(!verbose);
    FrameFlow::Scheduler::Options opt;
    opt.workers = jobs;
    opt.keepGoing = keepGoing;
    opt.useCache = !noCache;
    size_t finished = 0;
    opt.onResult = [&](const FrameFlow::Node& node, const FrameFlow::TaskResult& r) {
        ++finished;
        if (!r.ok) {
            fmt::print(stderr, "[Run] {} frame {} failed: {}\n", node.name, r.key.frame, r.message);
        } else if (verbose) {
            fmt::print("[Run] {} frame {} -> {}\n", node.name, r.key.frame, r.outputPath);
        }
        if (finished % 100 == 0) fmt::print("[Run] {} frame(s) done\n", finished);
    };
    FrameFlow::Scheduler scheduler(flow.graph, runner, opt);

    FrameFlow::Plan plan;
    try {
        const FrameFlow::FrameRange full = flow.graph.node(sink).range;
        const FrameFlow::FrameRange range{begin.value_or(full.begin), end.value_or(full.end)};
        fmt::print("[FrameFlow] flow='{}' sink='{}' frames [{}, {})\n", flowPath, sink, range.begin, range.end);
        plan = scheduler.plan(sink, range);
    } catch (const FrameFlow::FlowError& e) {
        fmt::print(stderr, "[FrameFlow] {}: {}\n", FrameFlow::errorCodeName(e.code()), e.what());
        return 2;
    }
    if (planOnly) {
        printPlan(flow.graph, plan, verbose);
        return 0;
    }

    const auto t0 = std::chrono::steady_clock::now();
    const FrameFlow::RunReport report = scheduler.run(plan);
    const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    fmt::print("[FrameFlow] planned={} cached={} succeeded={} failed={} cancelled={} skipped={} ({:.2f}s)\n",
               report.planned, report.cached, report.succeeded, report.failed, report.cancelled,
               report.skipped, secs);
    for (const auto& f : report.failures) {
        if (f.rootNode == f.node && f.rootFrame == f.frame) {
            fmt::print(stderr, "[FrameFlow] {} frame {}: {} ({})\n", f.node, f.frame, f.message,
                       FrameFlow::errorCodeName(f.error));
        } else if (verbose) {
            fmt::print(stderr, "[FrameFlow] {} frame {}: blocked by {} frame {}\n", f.node, f.frame, f.rootNode, f.rootFrame);
        }
    }
    if (!report.cancelledFrames.empty()) {
        const auto& first = report.cancelledFrames.front();
        fmt::print(stderr, "[FrameFlow] {} frame(s) not run after {} frame {} failed\n",
                   report.cancelledFrames.size(), first.rootNode, first.rootFrame);
        if (verbose) {
            for (const auto& c : report.cancelledFrames) {
                fmt::print(stderr, "[FrameFlow] {} frame {}: cancelled\n", c.node, c.frame);
            }
        }
    }
    return report.ok() ? 0 : 1;
}
