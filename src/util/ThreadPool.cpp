/**
 * @file ThreadPool.cpp
 * @brief ThreadPool implementation
 */

#include "util/ThreadPool.hpp"

#include <algorithm>

namespace util {

ThreadPool::ThreadPool(size_t thread_count) {
    const size_t count = std::max<size_t>(thread_count, 1);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mutex_);
    idle_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            work_available_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            ++active_;
        }

        // packaged_task captures exceptions into the future
        task();

        {
            std::lock_guard lock(mutex_);
            --active_;
            if (tasks_.empty() && active_ == 0) {
                idle_.notify_all();
            }
        }
    }
}

}  // namespace util
