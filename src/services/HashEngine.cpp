/**
 * @file HashEngine.cpp
 * @brief Hash engine implementation
 */

#include "services/HashEngine.hpp"

#include "services/Digest.hpp"
#include "services/FileDiscovery.hpp"
#include "services/ProgressReporting.hpp"
#include "services/ThreadCalculator.hpp"
#include "util/FileDescriptor.hpp"
#include "util/Logger.hpp"
#include "util/ThreadPool.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <format>
#include <future>
#include <set>
#include <thread>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "HashEngine";

auto side_percent(uint64_t bytes_done, uint64_t total_bytes, size_t files_done,
                  size_t total_files) -> double {
    if (total_bytes > 0) {
        return static_cast<double>(bytes_done) * 100.0 / static_cast<double>(total_bytes);
    }
    if (total_files > 0) {
        return static_cast<double>(files_done) * 100.0 / static_cast<double>(total_files);
    }
    return 0.0;
}

auto total_size(const std::vector<fs::path>& files) -> uint64_t {
    uint64_t total = 0;
    for (const auto& file : files) {
        std::error_code ec;
        const auto size = fs::file_size(file, ec);
        if (!ec) {
            total += size;
        }
    }
    return total;
}

auto with_path(util::Error error, const fs::path& path) -> util::Error {
    error.message = std::format("{}: {}", path.string(), error.message);
    return error;
}

/**
 * @brief Key used in verification maps: generic relative path
 */
auto verification_key(const fs::path& relative) -> std::string {
    return relative.generic_string();
}

}  // namespace

// ============================================================================
// Construction / policy
// ============================================================================

HashEngine::HashEngine(std::shared_ptr<IStorageDetector> detector, unsigned cpu_threads)
    : detector_(std::move(detector)), cpu_threads_(std::max(cpu_threads, 1U)) {}

auto HashEngine::default_cpu_threads() -> unsigned {
    return std::max(std::thread::hardware_concurrency(), 1U);
}

auto HashEngine::thread_count_for(const StorageInfo& storage, const HashOptions& options) const
    -> int {
    if (options.thread_override > 0) {
        return options.thread_override;
    }
    if (!options.parallel_hint) {
        return 1;
    }
    return thread_calculator::optimal_threads(storage, cpu_threads_);
}

// ============================================================================
// Single file
// ============================================================================

auto HashEngine::hash_file(const fs::path& path, HashAlgorithm algorithm,
                           const std::atomic<bool>& cancel_flag) const -> FileHashOutcome {
    return hash_one(path, path.filename(), algorithm, HashOptions{}, cancel_flag, {});
}

auto HashEngine::hash_one(const fs::path& path, const fs::path& relative,
                          HashAlgorithm algorithm, const HashOptions& options,
                          const std::atomic<bool>& cancel_flag,
                          const std::function<void(uint64_t)>& on_bytes) const
    -> FileHashOutcome {
    if (cancel_flag.load()) {
        return std::unexpected(util::cancelled_error(std::format("Hashing {}", path.string())));
    }

    const auto start = std::chrono::steady_clock::now();

    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    if (!fd) {
        return std::unexpected(util::errno_error(std::format("Cannot open {}", path.string()),
                                                 util::ErrorKind::HashCalculation));
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return std::unexpected(util::errno_error(std::format("Cannot stat {}", path.string()),
                                                 util::ErrorKind::HashCalculation));
    }
    if (S_ISDIR(st.st_mode)) {
        return std::unexpected(util::Error{std::format("{} is a directory", path.string()),
                                           EISDIR, util::ErrorKind::HashCalculation});
    }
    (void)::posix_fadvise(fd.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

    const auto size = static_cast<uint64_t>(std::max<off_t>(st.st_size, 0));
    digest::StreamOptions stream{
        .buffer_size = digest::effective_buffer_size(size, options.buffer_size_override),
        .cancel_flag = &cancel_flag,
        .deadline = start + options.per_file_timeout,
        .on_bytes = on_bytes,
    };

    auto streamed = digest::hash_descriptor(fd.get(), algorithm, stream);
    if (!streamed) {
        return std::unexpected(with_path(streamed.error(), path));
    }

    const auto elapsed = std::chrono::steady_clock::now() - start;
    const double seconds = std::chrono::duration<double>(elapsed).count();

    HashResult result;
    result.path = path;
    result.relative_path = relative;
    result.algorithm = algorithm;
    result.digest_hex = std::move(streamed->digest_hex);
    result.size_bytes = streamed->bytes_read;
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed);
    result.speed_mbps = seconds > 0.0
                            ? static_cast<double>(result.size_bytes) / (1024.0 * 1024.0) / seconds
                            : 0.0;
    return result;
}

// ============================================================================
// Batches
// ============================================================================

auto HashEngine::run_batch(const std::vector<fs::path>& files, const fs::path& root,
                           HashAlgorithm algorithm, const HashOptions& options, int thread_count,
                           const std::atomic<bool>& cancel_flag,
                           const AdvanceCallback& advance) const
    -> std::expected<ResultMap, util::Error> {
    ResultMap results;
    std::atomic<uint64_t> bytes_done{0};
    std::atomic<size_t> files_done{0};

    auto on_bytes = [&bytes_done, &advance, &files_done](uint64_t n) {
        const auto total = bytes_done.fetch_add(n) + n;
        if (advance) {
            advance(files_done.load(), total);
        }
    };

    auto record = [&](const fs::path& file, FileHashOutcome outcome)
        -> std::expected<void, util::Error> {
        if (!outcome) {
            if (outcome.error().is_cancelled() || cancel_flag.load()) {
                return std::unexpected(util::cancelled_error("Hash batch"));
            }
            LOG_WARNING(COMPONENT, std::format("Hash failed: {}", outcome.error().message));
            if (options.fail_fast) {
                return std::unexpected(outcome.error());
            }
        }
        results.insert_or_assign(file, std::move(outcome));
        const auto done = files_done.fetch_add(1) + 1;
        if (advance) {
            advance(done, bytes_done.load());
        }
        return {};
    };

    if (thread_count <= 1 || files.size() <= 1) {
        for (const auto& file : files) {
            if (cancel_flag.load()) {
                return std::unexpected(util::cancelled_error("Hash batch"));
            }
            auto outcome = hash_one(file, file_discovery::relative_to(file, root), algorithm,
                                    options, cancel_flag, on_bytes);
            if (auto recorded = record(file, std::move(outcome)); !recorded) {
                return std::unexpected(recorded.error());
            }
        }
        return results;
    }

    const auto pool_size = std::min(static_cast<size_t>(thread_count), files.size());
    const auto chunk_size =
        std::min(static_cast<size_t>(thread_count) * CHUNK_FACTOR, MAX_CHUNK_SIZE);
    LOG_DEBUG(COMPONENT, std::format("Hashing {} files on {} workers, chunks of {}", files.size(),
                                     pool_size, chunk_size));

    util::ThreadPool pool{pool_size};
    std::atomic<bool> stop_batch{false};

    for (size_t offset = 0; offset < files.size(); offset += chunk_size) {
        if (cancel_flag.load()) {
            return std::unexpected(util::cancelled_error("Hash batch"));
        }

        const auto chunk_end = std::min(offset + chunk_size, files.size());
        std::vector<std::pair<fs::path, std::future<FileHashOutcome>>> in_flight;
        in_flight.reserve(chunk_end - offset);

        for (size_t i = offset; i < chunk_end; ++i) {
            const auto& file = files[i];
            auto submitted = pool.submit([this, &file, &root, algorithm, &options, &cancel_flag,
                                          &on_bytes, &stop_batch]() -> FileHashOutcome {
                if (stop_batch.load()) {
                    return std::unexpected(util::cancelled_error("Hashing"));
                }
                return hash_one(file, file_discovery::relative_to(file, root), algorithm, options,
                                cancel_flag, on_bytes);
            });
            if (!submitted) {
                stop_batch.store(true);
                return std::unexpected(submitted.error());
            }
            in_flight.emplace_back(file, std::move(*submitted));
        }

        std::optional<util::Error> batch_error;
        for (auto& [file, future] : in_flight) {
            FileHashOutcome outcome;
            try {
                outcome = future.get();
            } catch (const std::exception& e) {
                outcome = std::unexpected(util::Error{
                    std::format("{}: {}", file.string(), e.what()), 0,
                    util::ErrorKind::HashCalculation});
            }
            if (batch_error) {
                continue;  // drain remaining futures of this chunk
            }
            if (auto recorded = record(file, std::move(outcome)); !recorded) {
                stop_batch.store(true);
                batch_error = recorded.error();
            }
        }
        if (batch_error) {
            return std::unexpected(*batch_error);
        }
    }

    return results;
}

auto HashEngine::hash_files(const std::vector<fs::path>& paths, HashAlgorithm algorithm,
                            const HashOptions& options, const std::atomic<bool>& cancel_flag,
                            const ProgressCallback& progress) const
    -> std::expected<HashBatch, util::Error> {
    const auto start = std::chrono::steady_clock::now();
    const auto files = file_discovery::expand_paths(paths);
    if (files.empty()) {
        return std::unexpected(
            util::Error{"No files found to hash", ENOENT, util::ErrorKind::InvalidInput});
    }

    const auto root = file_discovery::common_root(paths);

    HashBatch batch;
    batch.storage = detector_->analyze(root);
    batch.thread_count = thread_count_for(batch.storage, options);
    batch.total_bytes = total_size(files);

    LOG_INFO(COMPONENT, std::format("Hashing {} files ({} bytes) with {} on {}, {} threads",
                                    files.size(), batch.total_bytes,
                                    digest::algorithm_name(algorithm), batch.storage.describe(),
                                    batch.thread_count));

    ThrottledProgress reporter{progress};
    reporter.report(OperationProgress{.percent = 0,
                                      .message = "Starting hash calculation",
                                      .total_bytes = batch.total_bytes,
                                      .total_files = files.size()});

    const auto total_files = files.size();
    const auto total_bytes = batch.total_bytes;
    auto advance = [&reporter, total_files, total_bytes](size_t files_done, uint64_t bytes_done) {
        reporter.report(OperationProgress{
            .percent = static_cast<int>(side_percent(bytes_done, total_bytes, files_done,
                                                     total_files)),
            .message = std::format("Hashing {}/{} files", files_done, total_files),
            .bytes_processed = bytes_done,
            .total_bytes = total_bytes,
            .files_processed = files_done,
            .total_files = total_files,
        });
    };

    auto results =
        run_batch(files, root, algorithm, options, batch.thread_count, cancel_flag, advance);
    if (!results) {
        LOG_WARNING(COMPONENT, std::format("Hash batch ended early: {}", results.error().message));
        return std::unexpected(results.error());
    }

    batch.results = std::move(*results);
    batch.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    // 100% means every file was hashed, as for copies
    const auto failed = batch.failed_count();
    if (failed == 0) {
        reporter.complete(std::format("Hashed {} files", batch.results.size()));
    } else {
        reporter.report(OperationProgress{
            .percent = 99,
            .message = std::format("Hashed {} files, {} failed", batch.results.size() - failed,
                                   failed),
            .bytes_processed = batch.total_bytes,
            .total_bytes = batch.total_bytes,
            .files_processed = batch.results.size(),
            .total_files = batch.results.size(),
        });
        reporter.flush();
    }
    LOG_INFO(COMPONENT, std::format("Hash batch finished: {} files, {} failed", batch.results.size(),
                                    failed));
    return batch;
}

// ============================================================================
// Verification
// ============================================================================

namespace {

// An explicitly named file that does not exist is missing, not unreadable
auto is_absent(const FileHashOutcome& outcome) -> bool {
    return !outcome && outcome.error().code == ENOENT;
}

}  // namespace

auto HashEngine::verify(const std::vector<fs::path>& source_paths,
                        const std::vector<fs::path>& target_paths, HashAlgorithm algorithm,
                        const HashOptions& options, const std::atomic<bool>& cancel_flag,
                        const ProgressCallback& progress) const
    -> std::expected<VerificationReport, util::Error> {
    const auto start = std::chrono::steady_clock::now();

    const auto source_files = file_discovery::expand_paths(source_paths);
    const auto target_files = file_discovery::expand_paths(target_paths);
    if (source_files.empty() && target_files.empty()) {
        return std::unexpected(
            util::Error{"No files found to verify", ENOENT, util::ErrorKind::InvalidInput});
    }

    const auto source_root = file_discovery::common_root(source_paths);
    const auto target_root = file_discovery::common_root(target_paths);

    // Two single files are compared directly regardless of their names
    std::error_code ec;
    const bool single_pair = source_paths.size() == 1 && target_paths.size() == 1 &&
                             source_files.size() == 1 && target_files.size() == 1 &&
                             !fs::is_directory(source_paths.front(), ec) &&
                             !fs::is_directory(target_paths.front(), ec);

    const auto source_storage = detector_->analyze(source_root);
    const auto target_storage = detector_->analyze(target_root);

    VerificationReport report;
    report.algorithm = algorithm;
    report.source_thread_count = thread_count_for(source_storage, options);
    report.target_thread_count = thread_count_for(target_storage, options);

    // Two sides on one spinning disk would only seek against each other
    const bool same_device = !source_storage.device_id.empty() &&
                             source_storage.device_id == target_storage.device_id;
    const bool concurrent =
        !source_files.empty() && !target_files.empty() &&
        (!same_device || (thread_calculator::is_solid_state(source_storage.drive_type) &&
                          thread_calculator::is_solid_state(target_storage.drive_type)));

    LOG_INFO(COMPONENT,
             std::format("Verifying {} source files ({}, {} threads) against {} target files "
                         "({}, {} threads), {}",
                         source_files.size(), source_storage.describe(),
                         report.source_thread_count, target_files.size(),
                         target_storage.describe(), report.target_thread_count,
                         concurrent ? "concurrently" : "one side at a time"));

    ThrottledProgress reporter{progress};
    reporter.report(OperationProgress{.percent = 0, .message = "Starting verification"});

    WeightedProgress weights{{static_cast<double>(source_files.size()),
                              static_cast<double>(target_files.size())}};
    const uint64_t source_bytes = total_size(source_files);
    const uint64_t target_bytes = total_size(target_files);

    auto side_advance = [&](size_t side, size_t total_files, uint64_t total_bytes,
                            const char* label) -> AdvanceCallback {
        return [&, side, total_files, total_bytes, label](size_t files_done, uint64_t bytes_done) {
            const double combined =
                weights.update(side, side_percent(bytes_done, total_bytes, files_done, total_files));
            reporter.report(OperationProgress{
                .percent = static_cast<int>(combined),
                .message = std::format("Hashing {} files {}/{}", label, files_done, total_files),
            });
        };
    };

    auto hash_source = [&]() {
        return run_batch(source_files, source_root, algorithm, options,
                         report.source_thread_count, cancel_flag,
                         side_advance(0, source_files.size(), source_bytes, "source"));
    };
    auto hash_target = [&]() {
        return run_batch(target_files, target_root, algorithm, options,
                         report.target_thread_count, cancel_flag,
                         side_advance(1, target_files.size(), target_bytes, "target"));
    };

    std::expected<ResultMap, util::Error> source_results = ResultMap{};
    std::expected<ResultMap, util::Error> target_results = ResultMap{};
    if (concurrent) {
        auto target_future = std::async(std::launch::async, hash_target);
        source_results = hash_source();
        target_results = target_future.get();
    } else {
        source_results = hash_source();
        if (source_results) {
            target_results = hash_target();
        }
    }
    if (!source_results) {
        return std::unexpected(source_results.error());
    }
    if (!target_results) {
        return std::unexpected(target_results.error());
    }

    // Index target side by relative key
    std::map<std::string, std::pair<fs::path, FileHashOutcome*>> targets_by_key;
    for (auto& [path, outcome] : *target_results) {
        const auto key = single_pair ? verification_key(source_files.front().filename())
                                     : verification_key(file_discovery::relative_to(path, target_root));
        targets_by_key.emplace(key, std::make_pair(path, &outcome));
    }

    std::set<std::string> matched_keys;
    for (auto& [path, outcome] : *source_results) {
        const auto key = single_pair ? verification_key(path.filename())
                                     : verification_key(file_discovery::relative_to(path, source_root));
        VerificationResult entry;
        if (outcome) {
            entry.source = *outcome;
        }

        const auto target_it = targets_by_key.find(key);
        if (target_it == targets_by_key.end()) {
            entry.outcome = outcome ? VerificationOutcome::MISSING_TARGET : VerificationOutcome::ERROR;
            if (outcome) {
                entry.notes = "No matching file in target";
            } else if (is_absent(outcome)) {
                entry.notes = std::format("Source does not exist: {}", outcome.error().message);
            } else {
                entry.notes = std::format("Source unreadable: {}", outcome.error().message);
            }
            report.results.insert_or_assign(key, std::move(entry));
            continue;
        }

        matched_keys.insert(key);
        const auto& target_outcome = *target_it->second.second;
        if (target_outcome) {
            entry.target = *target_outcome;
        }

        if (is_absent(outcome) && is_absent(target_outcome)) {
            entry.outcome = VerificationOutcome::ERROR;
            entry.notes = "Neither source nor target exists";
        } else if (is_absent(target_outcome) && outcome) {
            entry.outcome = VerificationOutcome::MISSING_TARGET;
            entry.notes = "No matching file in target";
        } else if (is_absent(outcome) && target_outcome) {
            entry.outcome = VerificationOutcome::MISSING_SOURCE;
            entry.notes = "No matching file in source";
        } else if (!outcome) {
            entry.outcome = VerificationOutcome::ERROR;
            entry.notes = std::format("Source unreadable: {}", outcome.error().message);
        } else if (!target_outcome) {
            entry.outcome = VerificationOutcome::ERROR;
            entry.notes = std::format("Target unreadable: {}", target_outcome.error().message);
        } else if (outcome->digest_hex == target_outcome->digest_hex) {
            entry.outcome = VerificationOutcome::EXACT_MATCH;
        } else {
            entry.outcome = VerificationOutcome::MISMATCH;
            entry.notes = std::format("{} differs: {} != {}", digest::algorithm_name(algorithm),
                                      outcome->digest_hex, target_outcome->digest_hex);
        }
        report.results.insert_or_assign(key, std::move(entry));
    }

    for (const auto& [key, target] : targets_by_key) {
        if (matched_keys.contains(key)) {
            continue;
        }
        VerificationResult entry;
        entry.outcome = VerificationOutcome::MISSING_SOURCE;
        if (*target.second) {
            entry.target = **target.second;
            entry.notes = "No matching file in source";
        } else {
            entry.notes = std::format("Only in target, unreadable: {}", target.second->error().message);
        }
        report.results.insert_or_assign(key, std::move(entry));
    }

    report.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    const auto summary = std::format(
        "Verified {} paths: {} match, {} mismatch, {} missing in target, {} missing in source, "
        "{} errors",
        report.results.size(), report.count(VerificationOutcome::EXACT_MATCH),
        report.count(VerificationOutcome::MISMATCH),
        report.count(VerificationOutcome::MISSING_TARGET),
        report.count(VerificationOutcome::MISSING_SOURCE), report.count(VerificationOutcome::ERROR));
    LOG_INFO(COMPONENT, summary);
    reporter.complete(summary);
    return report;
}
