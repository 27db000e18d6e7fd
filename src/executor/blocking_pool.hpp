/**
 * @file blocking_pool.hpp
 * @brief std::jthread worker pool for blocking process waits.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace proc_sandbox {

/**
 * @brief Runs blocking calls (waitpid, pipe draining) off the caller's thread.
 *
 * The caller keeps a std::future and may race it against a deadline with
 * wait_for(). A submitted task never waits for a busy worker: when no idle
 * worker can take it, the pool starts another one, so a deadline measured
 * from submit() is also measured from the start of the work. Work already
 * queued when the pool is destroyed still runs, so no future is left with a
 * broken promise.
 */
class BlockingPool {
public:
    /// Starts @p num_threads workers up front (0 = hardware_concurrency).
    explicit BlockingPool(size_t num_threads = 0);
    ~BlockingPool();

    // Non-copyable, non-movable
    BlockingPool(const BlockingPool&) = delete;
    BlockingPool& operator=(const BlockingPool&) = delete;

    /// Submit a callable for execution.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t active_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);
    void spawn_worker_locked();

    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    size_t idle_workers_{0};            ///< Guarded by queue_mutex_
    std::atomic<size_t> active_tasks_{0};
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> BlockingPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(queue_mutex_);
        task_queue_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
        if (task_queue_.size() > idle_workers_) spawn_worker_locked();
    }
    queue_cv_.notify_one();
    return future;
}

}  // namespace proc_sandbox
