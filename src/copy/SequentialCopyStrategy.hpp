/**
 * @file SequentialCopyStrategy.hpp
 * @brief One file at a time in the calling thread
 */

#pragma once

#include "copy/ICopyStrategy.hpp"

/**
 * @class SequentialCopyStrategy
 * @brief Used for spinning destinations, single files and unrecognized storage
 */
class SequentialCopyStrategy final : public ICopyStrategy {
public:
    auto execute(const CopyContext& context) -> std::expected<CopyResult, util::Error> override;

    [[nodiscard]] auto kind() const -> CopyStrategyKind override {
        return CopyStrategyKind::SEQUENTIAL;
    }
    [[nodiscard]] auto thread_count() const -> int override { return 1; }
};
