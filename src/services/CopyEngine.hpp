/**
 * @file CopyEngine.hpp
 * @brief Storage-aware verified copying
 */

#pragma once

#include "interfaces/IStorageDetector.hpp"
#include "models/CopyTypes.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <expected>
#include <filesystem>
#include <memory>
#include <vector>

/**
 * @class CopyEngine
 * @brief Plans a copy, classifies both ends and runs the selected strategy
 */
class CopyEngine {
public:
    explicit CopyEngine(std::shared_ptr<IStorageDetector> detector,
                        unsigned cpu_threads = default_cpu_threads());

    /**
     * @brief Copy files and directories into a destination directory
     *
     * The destination directory is created if needed. Per-file failures are
     * returned in CopyResult::per_file_errors; only cancellation, resource
     * exhaustion, an unusable destination or an empty source set fail the
     * call itself.
     */
    [[nodiscard]] auto copy(const std::vector<std::filesystem::path>& sources,
                            const std::filesystem::path& destination, const CopyOptions& options,
                            const std::atomic<bool>& cancel_flag,
                            const ProgressCallback& progress = {}) const
        -> std::expected<CopyResult, util::Error>;

    [[nodiscard]] static auto default_cpu_threads() -> unsigned;

private:
    std::shared_ptr<IStorageDetector> detector_;
    unsigned cpu_threads_;
};
