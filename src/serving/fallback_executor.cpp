#include "peerbench/serving/fallback_executor.hpp"
#include <algorithm>

namespace peerbench {

FallbackExecutor::FallbackExecutor(size_t workers) {
    const size_t count = std::max<size_t>(workers, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { worker_loop(); });
    }
}

FallbackExecutor::~FallbackExecutor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t FallbackExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void FallbackExecutor::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace peerbench
