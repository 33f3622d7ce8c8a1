#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size thread pool with a FIFO task queue.
// Exceptions thrown by a job reach the caller through the job's future.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads);

    // Drains the queue, then joins the workers
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    std::future<void> submit(std::function<void()> job);

    // Splits [0, count) into contiguous chunks, runs fn(begin, end) for each on
    // the workers and blocks until all finish. Rethrows the first failure.
    // Must not be called from inside a job.
    void run_chunked(size_t count, const std::function<void(size_t, size_t)>& fn);

    size_t size() const { return workers_.size(); }

    struct Stats {
        size_t active_workers = 0;  // workers currently running a job
        size_t queue_size = 0;
        size_t completed_tasks = 0;
        size_t failed_tasks = 0;
    };
    Stats get_stats() const;

private:
    struct Task {
        std::function<void()> job;
        std::promise<void> result;
    };

    void worker_thread();
    void run_task(Task& task);

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> shutdown_{false};

    mutable std::mutex stats_mutex_;
    Stats stats_{};
};

// Runs fn over [0, count) on the pool, or inline on the calling thread when pool is null
void for_each_chunk(WorkerPool* pool, size_t count, const std::function<void(size_t, size_t)>& fn);
