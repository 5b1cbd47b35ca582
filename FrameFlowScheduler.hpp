// FrameFlowScheduler.hpp
//
// Lazy pull engine. Planning walks demand top-down from the sink's requested
// frames, memoising one record per (node, frame) and stopping at frames whose
// output already exists. Execution then runs bottom-up: a task is dispatched
// only once every (node, frame) it reads is Done.
//
// The task map is owned by the scheduler thread alone; workers only see the
// node, the frame and the resolved input paths of the task they run.
#pragma once
#include "FrameFlowCore.hpp"
#include "FrameFlowWorkers.hpp"
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace FrameFlow {

enum class TaskStatus { NotNeeded, Pending, Ready, Dispatched, Done, Failed, Cancelled };

const char* taskStatusName(TaskStatus status);

struct TaskRecord {
    TaskStatus status = TaskStatus::Pending;
    bool source = false;  // leaf frame, never dispatched
    bool cached = false;  // output was already on disk
    ErrorCode error = ErrorCode::None;
    std::string message;
    std::optional<TaskKey> rootCause; // first failure this one derives from

    std::vector<TaskKey> deps;        // distinct upstream tasks
    std::vector<std::string> inputPaths; // one per required input, in demand order
    std::vector<TaskKey> dependents;
    size_t waiting = 0;               // deps not yet Done
};

// Output of the planning phase; inspectable without running anything
struct Plan {
    size_t sink = 0;
    FrameRange range;
    std::map<TaskKey, TaskRecord> tasks;

    const TaskRecord* find(TaskKey key) const;
    TaskStatus status(TaskKey key) const; // NotNeeded when absent
    // Tasks that would be dispatched
    size_t pendingCount() const;
    size_t cachedCount() const;
};

struct TaskFailure {
    std::string node;
    FrameIndex frame = 0;
    ErrorCode error = ErrorCode::None;
    std::string message;
    std::string rootNode;
    FrameIndex rootFrame = 0;
};

struct RunReport {
    size_t planned = 0;   // non-source tasks in the plan
    size_t cached = 0;    // already on disk
    size_t succeeded = 0;
    size_t failed = 0;
    size_t cancelled = 0; // left undispatched after an abort
    size_t skipped = 0;   // absorbed by a skip edge policy
    size_t dispatched = 0;
    std::vector<TaskFailure> failures;
    // Frames never run because of an abort; root is the failure that aborted
    std::vector<TaskFailure> cancelledFrames;

    bool ok() const { return failed == 0 && cancelled == 0; }
};

class Scheduler {
public:
    struct Options {
        unsigned workers = 0;   // 0: hardware concurrency
        bool keepGoing = false; // keep dispatching tasks unrelated to a failure
        bool useCache = true;   // treat existing outputs as done
        // Called on the scheduler thread for every finished task
        std::function<void(const Node&, const TaskResult&)> onResult;
    };

    // The graph must outlive the scheduler; it is linked here if needed
    Scheduler(Graph& graph, CommandRunner& runner, Options options);
    Scheduler(Graph& graph, CommandRunner& runner) : Scheduler(graph, runner, Options{}) {}

    // Planning only: no command is run, nothing is written
    Plan plan(const std::string& sink, FrameRange range) const;
    // Executes a plan in dependency order and reports the outcome
    RunReport run(Plan& plan);
    RunReport materialize(const std::string& sink, FrameRange range);

    const Graph& getGraph() const { return graph; }

private:
    Graph& graph;
    CommandRunner& runner;
    Options opt;

    TaskStatus resolve(Plan& plan, TaskKey key) const;
    void failDependents(Plan& plan, TaskKey failed, std::deque<TaskKey>& ready) const;
    RunReport summarize(const Plan& plan, size_t dispatched) const;
};

} // namespace FrameFlow
