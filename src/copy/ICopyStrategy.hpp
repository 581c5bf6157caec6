/**
 * @file ICopyStrategy.hpp
 * @brief Base interface for copy strategy implementations
 */

#pragma once

#include "models/CopyTypes.hpp"
#include "util/Result.hpp"

#include <expected>
#include <string>

/**
 * @enum CopyStrategyKind
 * @brief The closed set of copy strategies
 */
enum class CopyStrategyKind {
    SEQUENTIAL,
    PARALLEL,
    CROSS_DEVICE
};

[[nodiscard]] inline auto copy_strategy_name(CopyStrategyKind kind) -> std::string {
    switch (kind) {
        case CopyStrategyKind::SEQUENTIAL:
            return "Sequential";
        case CopyStrategyKind::PARALLEL:
            return "Parallel";
        case CopyStrategyKind::CROSS_DEVICE:
            return "CrossDevice";
    }
    return "Sequential";
}

/**
 * @class ICopyStrategy
 * @brief Interface for copy strategies
 *
 * Every strategy fsyncs each destination file and, when verification is
 * requested, re-reads it from disk and compares its digest against the digest
 * of the bytes read from the source.
 */
class ICopyStrategy {
public:
    virtual ~ICopyStrategy() = default;

    /**
     * @brief Copy every file of the context
     * @return Result with per-file errors, or an operation-level error
     *         (cancellation, resource exhaustion, destination unavailable)
     */
    virtual auto execute(const CopyContext& context) -> std::expected<CopyResult, util::Error> = 0;

    [[nodiscard]] virtual auto kind() const -> CopyStrategyKind = 0;

    [[nodiscard]] virtual auto thread_count() const -> int = 0;

    [[nodiscard]] auto name() const -> std::string { return copy_strategy_name(kind()); }
};
