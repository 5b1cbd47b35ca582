// FrameFlowScheduler.cpp
//
// Demand resolution (planning) and dependency-ordered dispatch (execution).
#include "FrameFlowScheduler.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <deque>

namespace FrameFlow {

const char* taskStatusName(TaskStatus status) {
    switch (status) {
        case TaskStatus::NotNeeded: return "NotNeeded";
        case TaskStatus::Pending: return "Pending";
        case TaskStatus::Ready: return "Ready";
        case TaskStatus::Dispatched: return "Dispatched";
        case TaskStatus::Done: return "Done";
        case TaskStatus::Failed: return "Failed";
        case TaskStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

const TaskRecord* Plan::find(TaskKey key) const {
    auto it = tasks.find(key);
    return it == tasks.end() ? nullptr : &it->second;
}

TaskStatus Plan::status(TaskKey key) const {
    const TaskRecord* rec = find(key);
    return rec ? rec->status : TaskStatus::NotNeeded;
}

size_t Plan::pendingCount() const {
    return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(), [](const auto& kv) {
        return !kv.second.source && (kv.second.status == TaskStatus::Pending || kv.second.status == TaskStatus::Ready);
    }));
}

size_t Plan::cachedCount() const {
    return static_cast<size_t>(std::count_if(tasks.begin(), tasks.end(), [](const auto& kv) {
        return !kv.second.source && kv.second.cached;
    }));
}

Scheduler::Scheduler(Graph& g, CommandRunner& r, Options options)
    : graph(g), runner(r), opt(std::move(options)) {
    if (!graph.linked()) graph.link();
}

// Memoised top-down walk. A record is inserted before recursing so shared
// upstream frames are resolved once; the graph being acyclic guarantees the
// recursion only ever moves to other nodes.
TaskStatus Scheduler::resolve(Plan& plan, TaskKey key) const {
    auto found = plan.tasks.find(key);
    if (found != plan.tasks.end()) return found->second.status;

    TaskRecord& rec = plan.tasks[key];
    const Node& node = graph.node(key.node);
    auto fail = [&](ErrorCode code, std::string message) {
        rec.status = TaskStatus::Failed;
        rec.error = code;
        rec.message = std::move(message);
        return rec.status;
    };

    try {
        if (node.isSource()) {
            rec.source = true;
            if (node.output.exists(key.frame)) {
                rec.status = TaskStatus::Done;
                rec.cached = true;
                return rec.status;
            }
            return fail(ErrorCode::MissingInput, fmt::format("{}: source frame {} missing ({})",
                                                             node.name, key.frame, node.output.pathFor(key.frame)));
        }

        if (opt.useCache && node.output.exists(key.frame)) {
            rec.status = TaskStatus::Done;
            rec.cached = true;
            return rec.status;
        }

        const FrameDemand demand = node.requiredInputs(key.frame);
        if (demand.skipped) {
            rec.status = TaskStatus::NotNeeded;
            return rec.status;
        }

        for (const auto& ref : demand.inputs) {
            const TaskKey dep{graph.inputNode(key.node, ref.input), ref.frame};
            const Node& upstream = graph.node(dep.node);
            rec.inputPaths.push_back(upstream.output.pathFor(dep.frame));
            if (std::find(rec.deps.begin(), rec.deps.end(), dep) == rec.deps.end()) rec.deps.push_back(dep);

            const TaskStatus st = resolve(plan, dep);
            if (st == TaskStatus::Failed || st == TaskStatus::NotNeeded) {
                const TaskRecord& depRec = plan.tasks.at(dep);
                rec.rootCause = depRec.rootCause ? *depRec.rootCause : dep;
                return fail(ErrorCode::MissingInput,
                            fmt::format("{}: frame {} needs {} frame {}, which {}", node.name, key.frame, upstream.name,
                                        dep.frame, st == TaskStatus::Failed ? "cannot be produced" : "was skipped"));
            }
        }
        rec.status = TaskStatus::Pending;
        return rec.status;
    } catch (const FlowError& e) {
        return fail(e.code(), e.what());
    }
}

Plan Scheduler::plan(const std::string& sink, FrameRange range) const {
    if (!graph.linked()) graph.link();
    Plan p;
    p.sink = graph.indexOf(sink);
    p.range = range;
    for (FrameIndex f = range.begin; f < range.end; ++f) resolve(p, {p.sink, f});
    return p;
}

// Every task that (transitively) reads `failed` can no longer run
void Scheduler::failDependents(Plan& plan, TaskKey failed, std::deque<TaskKey>& ready) const {
    const TaskRecord& root = plan.tasks.at(failed);
    const TaskKey cause = root.rootCause ? *root.rootCause : failed;
    std::deque<TaskKey> work(root.dependents.begin(), root.dependents.end());
    while (!work.empty()) {
        const TaskKey key = work.front();
        work.pop_front();
        TaskRecord& rec = plan.tasks.at(key);
        if (rec.status != TaskStatus::Pending && rec.status != TaskStatus::Ready) continue;
        if (rec.status == TaskStatus::Ready) {
            ready.erase(std::remove(ready.begin(), ready.end(), key), ready.end());
        }
        rec.status = TaskStatus::Failed;
        rec.error = ErrorCode::MissingInput;
        rec.rootCause = cause;
        rec.message = fmt::format("{}: frame {} depends on {} frame {}, which failed",
                                  graph.node(key.node).name, key.frame, graph.node(cause.node).name, cause.frame);
        work.insert(work.end(), rec.dependents.begin(), rec.dependents.end());
    }
}

RunReport Scheduler::run(Plan& plan) {
    // Wire the task-level dependency edges
    std::deque<TaskKey> ready;
    bool aborted = false;
    std::optional<TaskKey> abortCause;
    for (auto& kv : plan.tasks) kv.second.dependents.clear();
    for (auto& kv : plan.tasks) {
        TaskRecord& rec = kv.second;
        if (rec.status == TaskStatus::Failed && !opt.keepGoing && !aborted) {
            aborted = true;
            abortCause = rec.rootCause ? *rec.rootCause : kv.first;
        }
        if (rec.status != TaskStatus::Pending && rec.status != TaskStatus::Ready) continue;
        rec.waiting = 0;
        for (const auto& dep : rec.deps) {
            TaskRecord& d = plan.tasks.at(dep);
            if (d.status == TaskStatus::Done) continue;
            ++rec.waiting;
            d.dependents.push_back(kv.first);
        }
    }
    for (auto& kv : plan.tasks) {
        TaskRecord& rec = kv.second;
        if (rec.status == TaskStatus::Ready) rec.status = TaskStatus::Pending;
        if (rec.status == TaskStatus::Pending && rec.waiting == 0) {
            rec.status = TaskStatus::Ready;
            ready.push_back(kv.first);
        }
    }

    size_t inFlight = 0;
    size_t dispatched = 0;
    {
        WorkerPool pool(opt.workers);
        // At most one task per worker is handed over, so an abort leaves
        // everything not yet started in the Ready/Pending state
        const size_t capacity = pool.size();
        for (;;) {
            while (!aborted && !ready.empty() && inFlight < capacity) {
                const TaskKey key = ready.front();
                ready.pop_front();
                TaskRecord& rec = plan.tasks.at(key);
                rec.status = TaskStatus::Dispatched;
                const Node& node = graph.node(key.node);
                const FrameIndex frame = key.frame;
                const std::vector<std::string> paths = rec.inputPaths;
                CommandRunner& r = runner;
                pool.submit(key, [&node, frame, paths, &r] { return node.execute(frame, paths, r); });
                ++inFlight;
                ++dispatched;
            }
            if (inFlight == 0) break;

            TaskResult result;
            if (!pool.nextResult(result)) break;
            --inFlight;

            TaskRecord& rec = plan.tasks.at(result.key);
            if (result.ok) {
                rec.status = TaskStatus::Done;
                for (const auto& d : rec.dependents) {
                    TaskRecord& dr = plan.tasks.at(d);
                    if (dr.status == TaskStatus::Pending && --dr.waiting == 0) {
                        dr.status = TaskStatus::Ready;
                        ready.push_back(d);
                    }
                }
            } else {
                rec.status = TaskStatus::Failed;
                rec.error = result.error;
                rec.message = result.message;
                failDependents(plan, result.key, ready);
                // In-flight tasks still run to completion; nothing new is issued
                if (!opt.keepGoing && !aborted) {
                    aborted = true;
                    abortCause = result.key;
                }
            }
            if (opt.onResult) opt.onResult(graph.node(result.key.node), result);
        }
        pool.shutdown();
    }

    for (auto& kv : plan.tasks) {
        if (kv.second.status == TaskStatus::Pending || kv.second.status == TaskStatus::Ready) {
            TaskRecord& rec = kv.second;
            rec.status = TaskStatus::Cancelled;
            if (abortCause) {
                rec.rootCause = *abortCause;
                rec.message = fmt::format("{}: frame {} not run, the run was aborted after {} frame {} failed",
                                          graph.node(kv.first.node).name, kv.first.frame,
                                          graph.node(abortCause->node).name, abortCause->frame);
            }
        }
    }
    return summarize(plan, dispatched);
}

RunReport Scheduler::summarize(const Plan& plan, size_t dispatched) const {
    RunReport report;
    report.dispatched = dispatched;
    for (const auto& kv : plan.tasks) {
        const TaskKey& key = kv.first;
        const TaskRecord& rec = kv.second;
        if (!rec.source) {
            if (rec.status == TaskStatus::NotNeeded) {
                ++report.skipped;
                continue;
            }
            ++report.planned;
            if (rec.status == TaskStatus::Done) {
                if (rec.cached) ++report.cached;
                else ++report.succeeded;
            } else if (rec.status == TaskStatus::Cancelled) {
                ++report.cancelled;
            }
        }
        if (rec.status != TaskStatus::Failed && rec.status != TaskStatus::Cancelled) continue;

        TaskFailure failure;
        failure.node = graph.node(key.node).name;
        failure.frame = key.frame;
        failure.error = rec.error;
        failure.message = rec.message;
        const TaskKey root = rec.rootCause ? *rec.rootCause : key;
        failure.rootNode = graph.node(root.node).name;
        failure.rootFrame = root.frame;
        if (rec.status == TaskStatus::Cancelled) {
            report.cancelledFrames.push_back(std::move(failure));
        } else {
            ++report.failed;
            report.failures.push_back(std::move(failure));
        }
    }
    return report;
}

RunReport Scheduler::materialize(const std::string& sink, FrameRange range) {
    Plan p = plan(sink, range);
    return run(p);
}

} // namespace FrameFlow
