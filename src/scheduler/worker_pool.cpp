// src/scheduler/worker_pool.cpp
#include "abstractchain/scheduler/worker_pool.h"

namespace abstractchain {

WorkerPool::WorkerPool(size_t num_workers) {
    if (num_workers == 0) num_workers = 1;
    threads_.reserve(num_workers);
    for (size_t n = 0; n < num_workers; ++n) {
        threads_.push_back(make_worker());
    }
}

WorkerPool::~WorkerPool() {
    stop_all();
}

void WorkerPool::enqueue(task_t task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::stop_all() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

WorkerPool::task_t WorkerPool::next() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return stop_ || !pending_tasks_.empty(); });

    if (pending_tasks_.empty()) {
        return nullptr;
    }
    auto task = std::move(pending_tasks_.front());
    pending_tasks_.pop_front();
    return task;
}

std::thread WorkerPool::make_worker() {
    return std::thread([this] {
        while (auto task = next()) {
            task();
        }
    });
}

} // namespace abstractchain
