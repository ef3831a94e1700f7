// abstractchain/scheduler/worker_pool.h
#ifndef ABSTRACTCHAIN_SCHEDULER_WORKER_POOL_H
#define ABSTRACTCHAIN_SCHEDULER_WORKER_POOL_H

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace abstractchain {

// Fixed set of worker threads draining a FIFO of tasks. Tasks must not throw.
class WorkerPool {
public:
    using task_t = std::function<void()>;

    explicit WorkerPool(size_t num_workers = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void enqueue(task_t task);

    // Lets queued tasks finish, then joins every worker
    void stop_all();

    size_t size() const { return threads_.size(); }

private:
    // Blocks until a task is available; returns an empty task on shutdown
    task_t next();
    std::thread make_worker();

    std::vector<std::thread> threads_;
    std::deque<task_t> pending_tasks_;
    std::condition_variable condition_;
    std::mutex mutex_;
    bool stop_ = false;
};

} // namespace abstractchain

#endif // ABSTRACTCHAIN_SCHEDULER_WORKER_POOL_H
