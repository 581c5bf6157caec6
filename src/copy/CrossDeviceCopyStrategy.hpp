/**
 * @file CrossDeviceCopyStrategy.hpp
 * @brief Overlapped read/write between two physical devices
 */

#pragma once

#include "copy/BufferPool.hpp"
#include "copy/ICopyStrategy.hpp"

#include <chrono>
#include <cstddef>

/**
 * @class CrossDeviceCopyStrategy
 * @brief A reader thread and a writer thread joined by a bounded buffer queue
 *
 * The reader fills pooled buffers from the source device while the writer
 * drains them into partial files on the destination device, so both devices
 * stay busy. A third thread settles each finished partial (fsync, read-back,
 * rename) without holding any buffer, so a long verification never starves
 * the reader. At most pool_size buffers exist for the job. A buffer that
 * cannot be obtained within the acquire timeout fails the job with
 * ResourceExhausted.
 */
class CrossDeviceCopyStrategy final : public ICopyStrategy {
public:
    explicit CrossDeviceCopyStrategy(
        size_t pool_size = BufferPool::DEFAULT_POOL_SIZE,
        size_t buffer_size = BufferPool::DEFAULT_BUFFER_SIZE,
        std::chrono::milliseconds acquire_timeout = BufferPool::DEFAULT_ACQUIRE_TIMEOUT);

    auto execute(const CopyContext& context) -> std::expected<CopyResult, util::Error> override;

    [[nodiscard]] auto kind() const -> CopyStrategyKind override {
        return CopyStrategyKind::CROSS_DEVICE;
    }

    /// One reader plus one writer; the verifier holds no buffers and is not counted
    [[nodiscard]] auto thread_count() const -> int override { return 2; }

    /// Highest number of buffers held at once during the last execute()
    [[nodiscard]] auto last_peak_buffers() const -> size_t { return last_peak_buffers_; }

private:
    size_t pool_size_;
    size_t buffer_size_;
    std::chrono::milliseconds acquire_timeout_;
    size_t last_peak_buffers_ = 0;
};
