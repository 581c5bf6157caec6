/**
 * @file StrategySelector.hpp
 * @brief Chooses the copy strategy for a source/destination storage pair
 */

#pragma once

#include "copy/BufferPool.hpp"
#include "copy/ICopyStrategy.hpp"
#include "models/StorageInfo.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace strategy_selector {

/**
 * @struct StrategyChoice
 * @brief Selected strategy, its thread count and the audit explanation
 */
struct StrategyChoice {
    CopyStrategyKind kind = CopyStrategyKind::SEQUENTIAL;
    int thread_count = 1;
    std::string reason;
};

/**
 * @brief Apply the selection rules in order; the first match wins
 *
 * 1. HDD-class destination: Sequential
 * 2. exactly one file: Sequential
 * 3. solid-state on both sides of the same device: Parallel
 * 4. different solid-state devices: Parallel, or CrossDevice when one side
 *    is an external SSD that cannot sustain many concurrent streams
 * 5. HDD-class source into solid-state: Parallel for queued read-ahead
 * 6. anything else: Sequential
 *
 * A positive thread_override replaces the computed Parallel thread count.
 * A Parallel choice with one thread degrades to Sequential.
 */
[[nodiscard]] auto select_strategy(const StorageInfo& source, const StorageInfo& destination,
                                   size_t file_count, unsigned cpu_threads,
                                   int thread_override = 0) -> StrategyChoice;

struct CrossDeviceTuning {
    size_t pool_size = BufferPool::DEFAULT_POOL_SIZE;
    size_t buffer_size = BufferPool::DEFAULT_BUFFER_SIZE;
    std::chrono::milliseconds acquire_timeout = BufferPool::DEFAULT_ACQUIRE_TIMEOUT;
};

[[nodiscard]] auto make_strategy(const StrategyChoice& choice,
                                 const CrossDeviceTuning& tuning = {})
    -> std::unique_ptr<ICopyStrategy>;

}  // namespace strategy_selector
