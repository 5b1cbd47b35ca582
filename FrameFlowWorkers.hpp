// FrameFlowWorkers.hpp
//
// Fixed-size worker pool. Workers pull jobs from a shared queue, run them
// (each job blocks on its own external process) and hand the results back
// through a future and through a completion channel the scheduler drains.
// Jobs share nothing; the pool imposes no order among them.
#pragma once
#include "FrameFlowTypes.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace FrameFlow {

// Unbounded multi-producer queue with close semantics
template <class T>
class Channel {
public:
    bool push(T v) {
        {
            std::lock_guard<std::mutex> lk(m);
            if (closed) return false;
            q.push_back(std::move(v));
        }
        cv.notify_one();
        return true;
    }

    // Blocks until an item arrives; false once closed and drained
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [&] { return closed || !q.empty(); });
        if (q.empty()) return false;
        out = std::move(q.front());
        q.pop_front();
        return true;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lk(m);
        if (q.empty()) return false;
        out = std::move(q.front());
        q.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m);
            closed = true;
        }
        cv.notify_all();
    }

private:
    std::mutex m;
    std::condition_variable cv;
    std::deque<T> q;
    bool closed = false;
};

class WorkerPool {
public:
    using Job = std::function<TaskResult()>;

    // 0 workers: one per hardware thread
    explicit WorkerPool(unsigned workers = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::future<TaskResult> submit(TaskKey key, Job job);
    // Next completed result in completion order; blocks while jobs are running.
    // Returns false after shutdown once every result has been taken.
    bool nextResult(TaskResult& out);
    // Stop accepting jobs, let queued and running ones finish, join the workers
    void shutdown();

    unsigned size() const { return static_cast<unsigned>(threads.size()); }

private:
    struct Pending {
        TaskKey key;
        Job job;
        std::promise<TaskResult> promise;
    };

    Channel<Pending> queue;
    Channel<TaskResult> completions;
    std::vector<std::thread> threads;
    bool stopped = false;

    void workerLoop();
};

unsigned defaultWorkerCount();

} // namespace FrameFlow
