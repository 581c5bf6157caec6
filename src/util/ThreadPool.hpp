/**
 * @file ThreadPool.hpp
 * @brief Fixed-size worker pool owned by a single job
 */

#pragma once

#include "util/Result.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace util {

/**
 * @class ThreadPool
 * @brief Runs submitted tasks on a fixed set of worker threads
 *
 * The pool is created per job and destroyed with it. The destructor drains
 * the queue and joins every worker, so tasks must observe the job's cancel
 * flag to finish quickly on cancellation.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t thread_count);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task and get a future for its return value
     * @return Future, or ResourceExhausted if the pool is shutting down
     */
    template<typename Fn>
    [[nodiscard]] auto submit(Fn&& fn)
        -> std::expected<std::future<std::invoke_result_t<Fn>>, Error> {
        using Ret = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return std::unexpected(
                    Error{"Thread pool is shutting down", 0, ErrorKind::ResourceExhausted});
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        work_available_.notify_one();
        return future;
    }

    /**
     * @brief Block until the queue is empty and no task is running
     */
    void wait_idle();

    [[nodiscard]] auto size() const -> size_t { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    size_t active_ = 0;
    bool stopping_ = false;
};

}  // namespace util
