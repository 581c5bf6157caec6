/**
 * @file ParallelCopyStrategy.hpp
 * @brief Per-file copies distributed over a job-owned thread pool
 */

#pragma once

#include "copy/ICopyStrategy.hpp"

/**
 * @class ParallelCopyStrategy
 * @brief Copies whole files concurrently on solid-state storage
 *
 * Progress is cumulative bytes across all workers. A sustained throughput
 * drop from the observed peak is reported in CopyResult::diagnostics.
 */
class ParallelCopyStrategy final : public ICopyStrategy {
public:
    explicit ParallelCopyStrategy(int thread_count);

    auto execute(const CopyContext& context) -> std::expected<CopyResult, util::Error> override;

    [[nodiscard]] auto kind() const -> CopyStrategyKind override {
        return CopyStrategyKind::PARALLEL;
    }
    [[nodiscard]] auto thread_count() const -> int override { return thread_count_; }

private:
    int thread_count_;
};
