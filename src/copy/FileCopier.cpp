/**
 * @file FileCopier.cpp
 * @brief Shared copy routines
 */

#include "copy/FileCopier.hpp"

#include "copy/ICopyStrategy.hpp"
#include "services/Digest.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <span>
#include <vector>
#include <format>

namespace fs = std::filesystem;

namespace file_copier {

namespace {
constexpr auto COMPONENT = "FileCopier";

auto copy_error(std::string_view what, const fs::path& path) -> util::Error {
    return util::errno_error(std::format("{} {}", what, path.string()), util::ErrorKind::Copy);
}

auto to_mbps(uint64_t bytes_per_sec) -> double {
    return static_cast<double>(bytes_per_sec) / (1024.0 * 1024.0);
}

}  // namespace

auto partial_path(const fs::path& destination) -> fs::path {
    auto partial = destination;
    partial += ".partial";
    return partial;
}

auto open_pair(const CopyItem& item) -> std::expected<OpenedPair, util::Error> {
    OpenedPair pair;
    pair.source = util::FileDescriptor::open(item.source, O_RDONLY);
    if (!pair.source) {
        return std::unexpected(copy_error("Cannot open source", item.source));
    }
    if (::fstat(pair.source.get(), &pair.source_stat) != 0) {
        return std::unexpected(copy_error("Cannot stat source", item.source));
    }
    (void)::posix_fadvise(pair.source.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

    std::error_code ec;
    fs::create_directories(item.destination.parent_path(), ec);
    if (ec) {
        return std::unexpected(util::Error{
            std::format("Cannot create {}: {}", item.destination.parent_path().string(),
                        ec.message()),
            ec.value(), util::ErrorKind::Copy});
    }

    const auto partial = partial_path(item.destination);
    pair.destination = util::FileDescriptor::open(partial, O_WRONLY | O_CREAT | O_TRUNC,
                                                  pair.source_stat.st_mode & 07777);
    if (!pair.destination) {
        return std::unexpected(copy_error("Cannot create destination", partial));
    }
    return pair;
}

auto finalize_destination(util::FileDescriptor& destination, const struct stat& source_stat,
                          const fs::path& path) -> std::expected<void, util::Error> {
    if (::fsync(destination.get()) != 0) {
        return std::unexpected(copy_error("fsync failed for", path));
    }

    // Metadata is best effort, as with copystat on filesystems without permissions
    if (::fchmod(destination.get(), source_stat.st_mode & 07777) != 0) {
        LOG_DEBUG(COMPONENT, std::format("fchmod({}) failed: {}", path.string(),
                                         std::strerror(errno)));
    }
    const struct timespec times[2] = {source_stat.st_atim, source_stat.st_mtim};
    if (::futimens(destination.get(), times) != 0) {
        LOG_DEBUG(COMPONENT, std::format("futimens({}) failed: {}", path.string(),
                                         std::strerror(errno)));
    }

    if (destination.close() != 0) {
        return std::unexpected(copy_error("close failed for", path));
    }
    return {};
}

auto read_back_digest(const fs::path& path, HashAlgorithm algorithm, size_t buffer_size,
                      const std::atomic<bool>* cancel_flag)
    -> std::expected<std::string, util::Error> {
    auto fd = util::FileDescriptor::open(path, O_RDONLY);
    if (!fd) {
        return std::unexpected(copy_error("Cannot reopen destination", path));
    }
    util::drop_page_cache(fd.get());

    digest::StreamOptions options{.buffer_size = buffer_size, .cancel_flag = cancel_flag};
    auto streamed = digest::hash_descriptor(fd.get(), algorithm, options);
    if (!streamed) {
        auto error = streamed.error();
        if (!error.is_cancelled()) {
            error.kind = util::ErrorKind::Copy;
        }
        error.message = std::format("Read-back of {} failed: {}", path.string(), error.message);
        return std::unexpected(error);
    }
    return std::move(streamed->digest_hex);
}

auto commit_copy(const CopyItem& item, const std::string& source_digest,
                 const CopyContext& context) -> std::expected<CopiedFile, util::Error> {
    const auto partial = partial_path(item.destination);
    CopiedFile copied{
        .source = item.source,
        .destination = item.destination,
        .size_bytes = item.size_bytes,
        .source_digest = source_digest,
    };

    if (context.verify) {
        const auto buffer = digest::effective_buffer_size(item.size_bytes, context.buffer_size);
        auto destination_digest =
            read_back_digest(partial, context.algorithm, buffer, context.cancel_flag);
        if (!destination_digest) {
            discard_partial(item.destination);
            return std::unexpected(destination_digest.error());
        }

        copied.destination_digest = std::move(*destination_digest);
        if (copied.destination_digest != copied.source_digest) {
            discard_partial(item.destination);
            return std::unexpected(util::Error{
                std::format("Verification failed for {}: source {} != destination {}",
                            item.destination.string(), copied.source_digest,
                            copied.destination_digest),
                EIO, util::ErrorKind::Copy});
        }
        copied.verified = true;
    }

    std::error_code ec;
    fs::rename(partial, item.destination, ec);
    if (ec) {
        discard_partial(item.destination);
        return std::unexpected(util::Error{
            std::format("Cannot rename {} to {}: {}", partial.string(),
                        item.destination.filename().string(), ec.message()),
            ec.value(), util::ErrorKind::Copy});
    }
    return copied;
}

void discard_partial(const fs::path& destination) {
    std::error_code ec;
    fs::remove(partial_path(destination), ec);
    if (ec) {
        LOG_DEBUG(COMPONENT, std::format("Cannot remove partial of {}: {}", destination.string(),
                                         ec.message()));
    }
}

namespace {

// Streams source to partial and returns the source digest (empty without verification)
auto write_partial(const CopyItem& item, const CopyContext& context, const ByteSink& sink)
    -> std::expected<std::string, util::Error> {
    auto pair = open_pair(item);
    if (!pair) {
        return std::unexpected(pair.error());
    }

    std::optional<digest::Hasher> hasher;
    if (context.verify) {
        auto created = digest::Hasher::create(context.algorithm);
        if (!created) {
            return std::unexpected(created.error());
        }
        hasher.emplace(std::move(*created));
    }

    const auto size = static_cast<uint64_t>(std::max<off_t>(pair->source_stat.st_size, 0));
    std::vector<uint8_t> buffer(digest::effective_buffer_size(size, context.buffer_size));

    while (true) {
        if (context.is_cancelled()) {
            return std::unexpected(util::cancelled_error("Copy"));
        }

        const auto got = util::read_full(pair->source.get(), buffer.data(), buffer.size());
        if (got < 0) {
            return std::unexpected(copy_error("Read failed for", item.source));
        }
        if (got == 0) {
            break;
        }

        const auto chunk = std::span<const uint8_t>{buffer.data(), static_cast<size_t>(got)};
        if (hasher) {
            if (auto updated = hasher->update(chunk); !updated) {
                return std::unexpected(updated.error());
            }
        }
        if (!util::write_all(pair->destination.get(), chunk.data(), chunk.size())) {
            return std::unexpected(copy_error("Write failed for", item.destination));
        }
        if (sink) {
            sink(chunk.size());
        }
    }

    if (auto finalized = finalize_destination(pair->destination, pair->source_stat,
                                              partial_path(item.destination));
        !finalized) {
        return std::unexpected(finalized.error());
    }

    if (!hasher) {
        return std::string{};
    }
    return hasher->finish();
}

}  // namespace

auto copy_file(const CopyItem& item, const CopyContext& context, const ByteSink& sink)
    -> std::expected<CopiedFile, util::Error> {
    if (context.is_cancelled()) {
        return std::unexpected(util::cancelled_error("Copy"));
    }

    auto source_digest = write_partial(item, context, sink);
    if (!source_digest) {
        discard_partial(item.destination);
        return std::unexpected(source_digest.error());
    }
    return commit_copy(item, *source_digest, context);
}

auto destination_available(const fs::path& root) -> bool {
    struct stat st{};
    if (::stat(root.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) {
        return false;
    }
    return ::access(root.c_str(), W_OK) == 0;
}

// ============================================================================
// CopyTracker
// ============================================================================

CopyTracker::CopyTracker(const CopyContext& context, bool monitor_throughput)
    : context_(context), monitor_throughput_(monitor_throughput),
      total_bytes_(context.total_bytes()), start_(std::chrono::steady_clock::now()),
      progress_(context.progress), monitor_(start_) {
    progress_.report(OperationProgress{
        .percent = 0,
        .message = std::format("Copying {} files", context.files.size()),
        .total_bytes = total_bytes_,
        .total_files = context.files.size(),
    });
}

void CopyTracker::add_bytes(uint64_t bytes) {
    OperationProgress update;
    {
        std::lock_guard lock{mutex_};
        bytes_copied_ += bytes;

        if (auto warning = monitor_.record(bytes_copied_); warning && monitor_throughput_) {
            LOG_WARNING(COMPONENT, *warning);
            diagnostics_.push_back(std::move(*warning));
        }

        const int percent =
            total_bytes_ > 0
                ? static_cast<int>(static_cast<double>(bytes_copied_) * 100.0 /
                                   static_cast<double>(total_bytes_))
                : 0;
        update = OperationProgress{
            .percent = percent,
            .message = std::format("Copying {}/{} files", copied_.size() + errors_.size(),
                                   context_.files.size()),
            .bytes_processed = bytes_copied_,
            .total_bytes = total_bytes_,
            .files_processed = copied_.size() + errors_.size(),
            .total_files = context_.files.size(),
            .speed_bytes_per_sec = monitor_.average_bytes_per_sec(),
        };
    }
    // Never call into the caller while holding mutex_
    progress_.report(std::move(update));
}

void CopyTracker::file_copied(CopiedFile file) {
    std::optional<OperationProgress> update;
    {
        std::lock_guard lock{mutex_};
        LOG_DEBUG(COMPONENT, std::format("Copied {} -> {} ({} bytes{})", file.source.string(),
                                         file.destination.string(), file.size_bytes,
                                         file.verified ? ", verified" : ""));
        copied_.push_back(std::move(file));

        // Zero-byte files never move the byte counter; advance on file count instead
        if (total_bytes_ == 0 && !context_.files.empty()) {
            update = OperationProgress{
                .percent = static_cast<int>((copied_.size() + errors_.size()) * 100 /
                                            context_.files.size()),
                .message = std::format("Copying {}/{} files", copied_.size() + errors_.size(),
                                       context_.files.size()),
                .files_processed = copied_.size() + errors_.size(),
                .total_files = context_.files.size(),
            };
        }
    }
    if (update) {
        progress_.report(std::move(*update));
    }
}

auto CopyTracker::file_failed(const CopyItem& item, util::Error error)
    -> std::optional<util::Error> {
    LOG_WARNING(COMPONENT, std::format("Copy of {} failed: {}", item.source.string(),
                                       error.message));
    {
        std::lock_guard lock{mutex_};
        errors_.push_back(CopyFileError{item.source, item.destination, error});
    }

    if (!destination_available(context_.destination_root)) {
        return util::Error{
            std::format("Destination {} is no longer available ({})",
                        context_.destination_root.string(), error.message),
            error.code, util::ErrorKind::DestinationUnavailable};
    }
    return std::nullopt;
}

auto CopyTracker::bytes_copied() const -> uint64_t {
    std::lock_guard lock{mutex_};
    return bytes_copied_;
}

auto CopyTracker::finish(CopyStrategyKind kind, int thread_count) -> CopyResult {
    CopyResult result;
    {
        std::lock_guard lock{mutex_};
        build_result_locked(result);
    }
    result.strategy_name = copy_strategy_name(kind);
    result.thread_count = thread_count;

    if (result.success) {
        progress_.complete(std::format("Copied {} files", result.files_copied));
    } else {
        progress_.flush();
    }
    return result;
}

void CopyTracker::build_result_locked(CopyResult& result) const {
    result.files_copied = copied_.size();
    result.bytes_copied = bytes_copied_;
    result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    const double seconds = std::chrono::duration<double>(result.duration).count();
    result.throughput_mbps =
        seconds > 0.0 ? static_cast<double>(bytes_copied_) / (1024.0 * 1024.0) / seconds : 0.0;
    result.peak_throughput_mbps =
        std::max(to_mbps(monitor_.peak_bytes_per_sec()), result.throughput_mbps);
    result.copied_files = copied_;
    result.per_file_errors = errors_;
    result.diagnostics = diagnostics_;
    result.success = errors_.empty() && copied_.size() == context_.files.size();
}

}  // namespace file_copier
