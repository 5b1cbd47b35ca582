// FrameFlowWorkers.cpp
#include "FrameFlowWorkers.hpp"
#include <exception>
#include <stdexcept>

namespace FrameFlow {

unsigned defaultWorkerCount() {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

WorkerPool::WorkerPool(unsigned workers) {
    if (workers == 0) workers = defaultWorkerCount();
    threads.reserve(workers);
    for (unsigned i = 0; i < workers; ++i) threads.emplace_back([this] { workerLoop(); });
}

WorkerPool::~WorkerPool() { shutdown(); }

std::future<TaskResult> WorkerPool::submit(TaskKey key, Job job) {
    Pending p{key, std::move(job), std::promise<TaskResult>{}};
    auto fut = p.promise.get_future();
    if (!queue.push(std::move(p))) throw std::logic_error("WorkerPool::submit after shutdown");
    return fut;
}

bool WorkerPool::nextResult(TaskResult& out) {
    return completions.pop(out);
}

void WorkerPool::shutdown() {
    if (stopped) return;
    stopped = true;
    queue.close();
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    completions.close();
}

void WorkerPool::workerLoop() {
    Pending p;
    while (queue.pop(p)) {
        TaskResult result;
        try {
            result = p.job();
        } catch (const std::exception& e) {
            result = TaskResult::failure(p.key, ErrorCode::TransformFailed, e.what());
        }
        result.key = p.key;
        p.promise.set_value(result);
        completions.push(std::move(result));
    }
}

} // namespace FrameFlow
