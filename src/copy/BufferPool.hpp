/**
 * @file BufferPool.hpp
 * @brief Fixed set of pre-allocated I/O buffers bounding in-flight memory
 */

#pragma once

#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

class BufferPool;

/**
 * @class BufferLease
 * @brief Move-only handle to one pooled buffer; returns it on destruction
 */
class BufferLease {
public:
    BufferLease() = default;
    ~BufferLease();

    BufferLease(const BufferLease&) = delete;
    BufferLease& operator=(const BufferLease&) = delete;
    BufferLease(BufferLease&& other) noexcept;
    BufferLease& operator=(BufferLease&& other) noexcept;

    [[nodiscard]] auto data() -> std::span<uint8_t>;
    [[nodiscard]] auto is_valid() const noexcept -> bool { return pool_ != nullptr; }

    void release();

private:
    friend class BufferPool;
    BufferLease(BufferPool* pool, size_t index) : pool_(pool), index_(index) {}

    BufferPool* pool_ = nullptr;
    size_t index_ = 0;
};

/**
 * @class BufferPool
 * @brief Hands out at most pool_size buffers at a time
 *
 * acquire() blocks until a buffer is free, the timeout expires
 * (ResourceExhausted) or the cancel flag is raised (Cancelled).
 * The pool must outlive every lease.
 */
class BufferPool {
public:
    static constexpr size_t DEFAULT_POOL_SIZE = 4;
    static constexpr size_t DEFAULT_BUFFER_SIZE = 10 * 1024 * 1024;
    static constexpr auto DEFAULT_ACQUIRE_TIMEOUT = std::chrono::seconds{30};

    BufferPool(size_t pool_size, size_t buffer_size);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    [[nodiscard]] auto acquire(std::chrono::milliseconds timeout,
                               const std::atomic<bool>* cancel_flag = nullptr)
        -> std::expected<BufferLease, util::Error>;

    [[nodiscard]] auto pool_size() const noexcept -> size_t { return buffers_.size(); }
    [[nodiscard]] auto buffer_size() const noexcept -> size_t { return buffer_size_; }
    [[nodiscard]] auto in_use() const -> size_t;
    [[nodiscard]] auto peak_in_use() const -> size_t;

private:
    friend class BufferLease;

    static constexpr auto WAIT_SLICE = std::chrono::milliseconds{100};

    void give_back(size_t index);
    [[nodiscard]] auto buffer(size_t index) -> std::span<uint8_t>;

    size_t buffer_size_;
    std::vector<std::unique_ptr<uint8_t[]>> buffers_;
    std::vector<size_t> free_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    size_t peak_in_use_ = 0;
};
