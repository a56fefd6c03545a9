#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace core {

/**
 * @brief Fixed pool of workers for blocking native calls.
 *
 * Callers that must not stall (the polling worker, command threads) hand
 * the OS call to a worker and wait on the returned future. Exceptions
 * thrown by a task are delivered through that future.
 */
class ThreadPool {
public:
    /**
     * @brief Construct a ThreadPool with the specified number of workers.
     * @param num_threads Number of worker threads (default: 2)
     */
    explicit ThreadPool(size_t num_threads = 2) : stop_(false) {
        if (num_threads == 0) num_threads = 1;
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this]() {
                worker_loop();
            });
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Submit a callable and get a future for its return value.
     *
     * After shutdown() the future holds a std::runtime_error instead.
     */
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) {
                std::promise<R> rejected;
                rejected.set_exception(std::make_exception_ptr(
                    std::runtime_error("ThreadPool is stopped")));
                return rejected.get_future();
            }
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return future;
    }

    /**
     * @brief Gracefully shutdown the pool, waiting for queued tasks to complete.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (stop_) return;
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    void worker_loop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                condition_.wait(lock, [this]() {
                    return stop_ || !tasks_.empty();
                });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            // packaged_task captures exceptions into the future
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;
};

} // namespace core
