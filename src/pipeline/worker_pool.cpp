#include "toolpipe/pipeline/worker_pool.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

namespace toolpipe::pipeline {

// Progress of one run_batch call, shared with the lanes working on it
struct WorkerPool::Batch {
    const Job* job = nullptr;
    size_t count = 0;
    size_t next = 0;
    size_t finished = 0;
    std::vector<std::exception_ptr> errors;

    std::mutex mutex;
    std::condition_variable done;
};

WorkerPool::WorkerPool(size_t num_workers) {
    num_workers = std::max<size_t>(1, num_workers);
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> lane;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait(lock, [this] { return stopping_ || !lanes_.empty(); });
            if (lanes_.empty()) {
                return;
            }
            lane = std::move(lanes_.front());
            lanes_.pop_front();
        }
        lane();
    }
}

bool WorkerPool::post(std::function<void()> lane) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        lanes_.push_back(std::move(lane));
    }
    wake_.notify_one();
    return true;
}

void WorkerPool::work(Batch& batch) {
    while (true) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            if (batch.next >= batch.count) {
                return;
            }
            index = batch.next++;
        }

        std::exception_ptr error;
        try {
            (*batch.job)(index);
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(batch.mutex);
            batch.errors[index] = error;
            if (++batch.finished == batch.count) {
                batch.done.notify_all();
            }
        }
    }
}

std::vector<std::exception_ptr> WorkerPool::run_batch(size_t count, size_t window, const Job& job) {
    if (count == 0) {
        return {};
    }

    auto batch = std::make_shared<Batch>();
    batch->job = &job;
    batch->count = count;
    batch->errors.resize(count);

    // The caller is one lane; the rest go to the workers
    size_t lanes = std::min(count, std::max<size_t>(1, window));
    size_t posted = 0;
    for (size_t i = 1; i < lanes; ++i) {
        if (!post([this, batch] { work(*batch); })) {
            spdlog::warn("Worker pool stopped, running {} remaining calls on the caller", count);
            break;
        }
        ++posted;
    }

    work(*batch);

    {
        std::unique_lock<std::mutex> lock(batch->mutex);
        batch->done.wait(lock, [&batch] { return batch->finished == batch->count; });
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        batches_run_ += 1;
        jobs_run_ += count;
    }

    spdlog::debug("Batch of {} calls done on {} lanes", count, posted + 1);
    return std::move(batch->errors);
}

size_t WorkerPool::batches_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_run_;
}

size_t WorkerPool::jobs_run() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_run_;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    wake_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

}  // namespace toolpipe::pipeline
