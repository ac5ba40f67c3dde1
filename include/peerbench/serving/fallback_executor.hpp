#pragma once

/**
 * @file fallback_executor.hpp
 * @brief Bounded worker pool for on-the-fly (RawFallback) computations
 *
 * Callers submit a task and wait on the returned future with a timeout. A
 * task that outlives its caller keeps running on the worker until its next
 * cancellation checkpoint, so abandoned requests never block the caller and
 * the number of concurrent raw computations stays bounded by the pool size.
 */

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace peerbench {

class FallbackExecutor {
public:
    explicit FallbackExecutor(size_t workers);

    /// Stops accepting work, drains the queue and joins the workers
    ~FallbackExecutor();

    FallbackExecutor(const FallbackExecutor&) = delete;
    FallbackExecutor& operator=(const FallbackExecutor&) = delete;

    /**
     * @brief Queue a task
     * @return Future carrying the result or the task's exception
     * @throws std::runtime_error after shutdown
     */
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using Result = std::invoke_result_t<std::decay_t<F>>;

        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(task));
        std::future<Result> future = packaged->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("FallbackExecutor is shut down");
            }
            queue_.emplace([packaged]() { (*packaged)(); });
        }
        cv_.notify_one();
        return future;
    }

    size_t worker_count() const { return workers_.size(); }

    /// Tasks waiting for a worker
    size_t pending() const;

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace peerbench
