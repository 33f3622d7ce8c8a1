#include "WorkerPool.hpp"
#include <algorithm>
#include <exception>
#include <iostream>

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) num_threads = 1;

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&WorkerPool::worker_thread, this);
    }

    std::cout << "[WorkerPool] Started with " << num_threads << " workers\n";
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutdown_ = true;
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::future<void> WorkerPool::submit(std::function<void()> job) {
    Task task;
    task.job = std::move(job);

    auto future = task.result.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));

        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.queue_size = task_queue_.size();
    }

    queue_cv_.notify_one();

    return future;
}

void WorkerPool::run_chunked(size_t count, const std::function<void(size_t, size_t)>& fn) {
    if (count == 0) return;

    size_t chunks = std::min(count, workers_.size());
    size_t chunk_size = (count + chunks - 1) / chunks;

    std::vector<std::future<void>> pending;
    pending.reserve(chunks);
    for (size_t begin = 0; begin < count; begin += chunk_size) {
        size_t end = std::min(count, begin + chunk_size);
        pending.push_back(submit([&fn, begin, end]() { fn(begin, end); }));
    }

    // Wait for every chunk before rethrowing; fn is borrowed by all of them
    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

WorkerPool::Stats WorkerPool::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void WorkerPool::worker_thread() {
    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        queue_cv_.wait(lock, [this]() {
            return shutdown_ || !task_queue_.empty();
        });

        if (shutdown_ && task_queue_.empty()) break;

        Task task = std::move(task_queue_.front());
        task_queue_.pop();

        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            stats_.queue_size = task_queue_.size();
            stats_.active_workers++;
        }

        lock.unlock();

        run_task(task);
    }
}

void WorkerPool::run_task(Task& task) {
    std::exception_ptr error;
    try {
        task.job();
    } catch (const std::exception& e) {
        std::cerr << "[WorkerPool] Task failed: " << e.what() << "\n";
        error = std::current_exception();
    } catch (...) {
        std::cerr << "[WorkerPool] Task failed with a non-standard exception\n";
        error = std::current_exception();
    }

    // Stats are final before the submitter can observe the result
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.active_workers--;
        if (error) {
            stats_.failed_tasks++;
        } else {
            stats_.completed_tasks++;
        }
    }

    if (error) {
        task.result.set_exception(error);
    } else {
        task.result.set_value();
    }
}

void for_each_chunk(WorkerPool* pool, size_t count, const std::function<void(size_t, size_t)>& fn) {
    if (pool == nullptr || pool->size() < 2 || count < 2) {
        fn(0, count);
        return;
    }
    pool->run_chunked(count, fn);
}
