/**
 * @file BufferPool.cpp
 * @brief Pooled buffer allocation
 */

#include "copy/BufferPool.hpp"

#include "util/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <utility>

namespace {
constexpr auto COMPONENT = "BufferPool";
}

// ============================================================================
// BufferLease
// ============================================================================

BufferLease::~BufferLease() {
    release();
}

BufferLease::BufferLease(BufferLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), index_(other.index_) {}

BufferLease& BufferLease::operator=(BufferLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = std::exchange(other.pool_, nullptr);
        index_ = other.index_;
    }
    return *this;
}

auto BufferLease::data() -> std::span<uint8_t> {
    if (pool_ == nullptr) {
        return {};
    }
    return pool_->buffer(index_);
}

void BufferLease::release() {
    if (auto* pool = std::exchange(pool_, nullptr)) {
        pool->give_back(index_);
    }
}

// ============================================================================
// BufferPool
// ============================================================================

BufferPool::BufferPool(size_t pool_size, size_t buffer_size)
    : buffer_size_(std::max<size_t>(buffer_size, 1)) {
    pool_size = std::max<size_t>(pool_size, 1);
    buffers_.reserve(pool_size);
    free_.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        buffers_.push_back(std::make_unique<uint8_t[]>(buffer_size_));
        free_.push_back(pool_size - 1 - i);
    }
    LOG_DEBUG(COMPONENT, std::format("Allocated {} buffers of {} bytes", pool_size, buffer_size_));
}

auto BufferPool::acquire(std::chrono::milliseconds timeout, const std::atomic<bool>* cancel_flag)
    -> std::expected<BufferLease, util::Error> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock lock{mutex_};
    while (free_.empty()) {
        if (cancel_flag != nullptr && cancel_flag->load()) {
            return std::unexpected(util::cancelled_error("Buffer acquisition"));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::unexpected(util::Error{
                std::format("No buffer became free within {} ms ({} in use)", timeout.count(),
                            buffers_.size()),
                ETIMEDOUT, util::ErrorKind::ResourceExhausted});
        }
        available_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(
                                      WAIT_SLICE, deadline - now));
    }

    const size_t index = free_.back();
    free_.pop_back();
    peak_in_use_ = std::max(peak_in_use_, buffers_.size() - free_.size());
    return BufferLease{this, index};
}

auto BufferPool::in_use() const -> size_t {
    std::lock_guard lock{mutex_};
    return buffers_.size() - free_.size();
}

auto BufferPool::peak_in_use() const -> size_t {
    std::lock_guard lock{mutex_};
    return peak_in_use_;
}

void BufferPool::give_back(size_t index) {
    {
        std::lock_guard lock{mutex_};
        free_.push_back(index);
    }
    available_.notify_one();
}

auto BufferPool::buffer(size_t index) -> std::span<uint8_t> {
    return {buffers_[index].get(), buffer_size_};
}
