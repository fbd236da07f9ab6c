#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace toolpipe::pipeline {

// Fixed set of workers that runs batches of independent tool calls.
//
// A batch is `count` jobs addressed by index. At most `window` of them run
// at the same time, and a finished job immediately frees its slot for the
// next index. The calling thread works the batch too, so a batch always
// completes: on a stopped pool, or with every worker busy, it simply runs
// on the caller.
class WorkerPool {
public:
    using Job = std::function<void(size_t index)>;

    explicit WorkerPool(size_t num_workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks until job(i) has run for every i in [0, count). Slot i of the
    // result holds what job(i) threw, or nullptr. A window of 0 counts as 1.
    std::vector<std::exception_ptr> run_batch(size_t count, size_t window, const Job& job);

    size_t size() const { return workers_.size(); }
    size_t batches_run() const;
    size_t jobs_run() const;

    // Finishes queued lanes, then joins the workers
    void shutdown();

private:
    struct Batch;

    void worker_loop();
    bool post(std::function<void()> lane);
    void work(Batch& batch);

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> lanes_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    size_t batches_run_ = 0;
    size_t jobs_run_ = 0;
};

}  // namespace toolpipe::pipeline
