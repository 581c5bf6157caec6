/**
 * @file FileCopier.hpp
 * @brief Per-file copy, fsync and read-back verification shared by all strategies
 */

#pragma once

#include "models/CopyTypes.hpp"
#include "services/ProgressReporting.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Result.hpp"

#include <sys/stat.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class CopyStrategyKind;

namespace file_copier {

/// Receives the size of each chunk written to a destination
using ByteSink = std::function<void(uint64_t)>;

struct OpenedPair {
    util::FileDescriptor source;
    util::FileDescriptor destination;
    struct stat source_stat{};
};

/**
 * @brief Name a copy is written under until it has been verified
 */
[[nodiscard]] auto partial_path(const std::filesystem::path& destination)
    -> std::filesystem::path;

/**
 * @brief Open the source and create/truncate the partial destination (parents included)
 */
[[nodiscard]] auto open_pair(const CopyItem& item) -> std::expected<OpenedPair, util::Error>;

/**
 * @brief fsync, copy permission bits and timestamps, then close
 */
[[nodiscard]] auto finalize_destination(util::FileDescriptor& destination,
                                        const struct stat& source_stat,
                                        const std::filesystem::path& path)
    -> std::expected<void, util::Error>;

/**
 * @brief Digest a just-written file by reading it back from the device
 *
 * The page cache of the file is dropped first so the bytes come from disk
 * rather than from memory filled by the copy.
 */
[[nodiscard]] auto read_back_digest(const std::filesystem::path& path, HashAlgorithm algorithm,
                                    size_t buffer_size, const std::atomic<bool>* cancel_flag)
    -> std::expected<std::string, util::Error>;

/**
 * @brief Verify a finalized partial and rename it over the destination
 *
 * The partial is read back and compared with the source digest when
 * verification is on. On any failure the partial is removed, so the
 * destination name only ever holds a complete copy.
 */
[[nodiscard]] auto commit_copy(const CopyItem& item, const std::string& source_digest,
                               const CopyContext& context)
    -> std::expected<CopiedFile, util::Error>;

/**
 * @brief Copy one file in the calling thread
 *
 * The source digest is computed from the bytes read for the copy; the
 * destination digest from a separate read-back after fsync. Failures leave
 * neither the destination nor its partial behind.
 */
[[nodiscard]] auto copy_file(const CopyItem& item, const CopyContext& context,
                             const ByteSink& sink) -> std::expected<CopiedFile, util::Error>;

/**
 * @brief Remove the partial of a destination, if any
 */
void discard_partial(const std::filesystem::path& path);

/**
 * @brief The destination root still exists and accepts writes
 */
[[nodiscard]] auto destination_available(const std::filesystem::path& root) -> bool;

/**
 * @class CopyTracker
 * @brief Job-scoped accumulator of copy results and progress
 *
 * One mutex guards the byte counter and the result lists. Progress is
 * cumulative bytes over total bytes, forwarded through ThrottledProgress
 * after that mutex is released.
 */
class CopyTracker {
public:
    CopyTracker(const CopyContext& context, bool monitor_throughput);

    void add_bytes(uint64_t bytes);

    void file_copied(CopiedFile file);

    /**
     * @brief Record a per-file failure
     * @return DestinationUnavailable error when the job must stop
     */
    [[nodiscard]] auto file_failed(const CopyItem& item, util::Error error)
        -> std::optional<util::Error>;

    [[nodiscard]] auto bytes_copied() const -> uint64_t;

    /**
     * @brief Build the final result; emits 100% only when every file succeeded
     */
    [[nodiscard]] auto finish(CopyStrategyKind kind, int thread_count) -> CopyResult;

private:
    void build_result_locked(CopyResult& result) const;

    const CopyContext& context_;
    bool monitor_throughput_;
    uint64_t total_bytes_;
    std::chrono::steady_clock::time_point start_;

    mutable std::mutex mutex_;
    uint64_t bytes_copied_ = 0;
    std::vector<CopiedFile> copied_;
    std::vector<CopyFileError> errors_;
    std::vector<std::string> diagnostics_;

    ThrottledProgress progress_;
    ThroughputMonitor monitor_;
};

}  // namespace file_copier
