/**
 * @file blocking_pool.cpp
 * @brief BlockingPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/blocking_pool.hpp"

namespace proc_sandbox {

BlockingPool::BlockingPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 4;  // fallback
    }

    std::lock_guard lock(queue_mutex_);
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        spawn_worker_locked();
    }
}

BlockingPool::~BlockingPool() {
    {
        std::lock_guard lock(queue_mutex_);
        for (auto& worker : workers_) {
            worker.request_stop();
        }
    }
    queue_cv_.notify_all();

    // Join here, not in the jthread destructors: workers_ outlives the queue,
    // mutex and condition variable the workers are still using.
    for (auto& worker : workers_) {
        worker.join();
    }
}

void BlockingPool::worker_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, stop, [this] { return !task_queue_.empty(); });

            // Drain before exiting: a queued task owns a promise someone waits on.
            if (task_queue_.empty()) {
                if (stop.stop_requested()) {
                    --idle_workers_;
                    return;
                }
                continue;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            --idle_workers_;
        }

        ++active_tasks_;
        task();
        --active_tasks_;

        std::lock_guard lock(queue_mutex_);
        ++idle_workers_;
    }
}

// A worker counts as idle from the moment it is started.
void BlockingPool::spawn_worker_locked() {
    ++idle_workers_;
    workers_.emplace_back([this](std::stop_token stop) {
        worker_loop(stop);
    });
}

size_t BlockingPool::active_count() const noexcept {
    return active_tasks_.load();
}

size_t BlockingPool::queued_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return task_queue_.size();
}

size_t BlockingPool::thread_count() const noexcept {
    std::lock_guard lock(queue_mutex_);
    return workers_.size();
}

}  // namespace proc_sandbox
