/**
 * @file HashEngine.hpp
 * @brief File digests, batch hashing and two-sided verification
 */

#pragma once

#include "interfaces/IStorageDetector.hpp"
#include "models/HashTypes.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

/**
 * @class HashEngine
 * @brief Storage-aware hashing
 *
 * Thread counts come from the injected detector through thread_calculator.
 * Every call takes the caller's cancel flag; nothing is cached between calls
 * apart from what the detector itself caches.
 */
class HashEngine {
public:
    static constexpr size_t MAX_CHUNK_SIZE = 100;
    static constexpr int CHUNK_FACTOR = 3;

    explicit HashEngine(std::shared_ptr<IStorageDetector> detector,
                        unsigned cpu_threads = default_cpu_threads());

    /**
     * @brief Digest one file
     * @return HashResult, or a HashCalculation/Cancelled error
     */
    [[nodiscard]] auto hash_file(const std::filesystem::path& path, HashAlgorithm algorithm,
                                 const std::atomic<bool>& cancel_flag) const -> FileHashOutcome;

    /**
     * @brief Digest every file under the given paths
     *
     * Per-file failures are recorded in the map. The call itself fails only
     * when nothing was found, on cancellation, or with fail_fast on the first
     * per-file error. Progress reaches 100 only when no file failed; a batch
     * with failures ends at 99, as a copy with failures does.
     */
    [[nodiscard]] auto hash_files(const std::vector<std::filesystem::path>& paths,
                                  HashAlgorithm algorithm, const HashOptions& options,
                                  const std::atomic<bool>& cancel_flag,
                                  const ProgressCallback& progress = {}) const
        -> std::expected<HashBatch, util::Error>;

    /**
     * @brief Hash both sides and classify every relative path
     *
     * Files are paired by their path relative to each side's common root.
     * The report always contains every file from both sides. A named file
     * that does not exist is missing on its side rather than an error.
     * Progress reaches 100 once the report is built; the outcomes carry the
     * verdict.
     */
    [[nodiscard]] auto verify(const std::vector<std::filesystem::path>& source_paths,
                              const std::vector<std::filesystem::path>& target_paths,
                              HashAlgorithm algorithm, const HashOptions& options,
                              const std::atomic<bool>& cancel_flag,
                              const ProgressCallback& progress = {}) const
        -> std::expected<VerificationReport, util::Error>;

    /**
     * @brief Threads this engine would use for a side on the given storage
     */
    [[nodiscard]] auto thread_count_for(const StorageInfo& storage,
                                        const HashOptions& options) const -> int;

    [[nodiscard]] static auto default_cpu_threads() -> unsigned;

private:
    using ResultMap = std::map<std::filesystem::path, FileHashOutcome>;

    /// files_done, bytes_done
    using AdvanceCallback = std::function<void(size_t, uint64_t)>;

    [[nodiscard]] auto hash_one(const std::filesystem::path& path,
                                const std::filesystem::path& relative, HashAlgorithm algorithm,
                                const HashOptions& options, const std::atomic<bool>& cancel_flag,
                                const std::function<void(uint64_t)>& on_bytes) const
        -> FileHashOutcome;

    [[nodiscard]] auto run_batch(const std::vector<std::filesystem::path>& files,
                                 const std::filesystem::path& root, HashAlgorithm algorithm,
                                 const HashOptions& options, int thread_count,
                                 const std::atomic<bool>& cancel_flag,
                                 const AdvanceCallback& advance) const
        -> std::expected<ResultMap, util::Error>;

    std::shared_ptr<IStorageDetector> detector_;
    unsigned cpu_threads_;
};
