/**
 * @file CrossDeviceCopyStrategy.cpp
 * @brief Reader/writer/verifier pipeline over pooled buffers
 */

#include "copy/CrossDeviceCopyStrategy.hpp"

#include "copy/FileCopier.hpp"
#include "services/Digest.hpp"
#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "CrossDeviceCopy";

/**
 * A slice of one file in flight. Every file ends with exactly one chunk that
 * has end_of_file or error set.
 */
struct Chunk {
    size_t file_index = 0;
    BufferLease lease;
    size_t length = 0;
    bool end_of_file = false;
    std::optional<util::Error> error;
    struct stat source_stat{};
    std::string source_digest;
};

/**
 * A written and closed partial waiting for fsync, read-back and rename.
 * Holds no descriptor so a backlog of small files cannot exhaust them.
 */
struct PendingCommit {
    size_t file_index = 0;
    struct stat source_stat{};
    std::string source_digest;
};

/**
 * Unbounded in count; the buffer pool bounds the chunks that carry data.
 */
template <typename T>
class BlockingQueue {
public:
    void push(T item) {
        {
            std::lock_guard lock{mutex_};
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
    }

    void close() {
        {
            std::lock_guard lock{mutex_};
            closed_ = true;
        }
        ready_.notify_all();
    }

    /// nullopt once closed and drained
    auto pop() -> std::optional<T> {
        std::unique_lock lock{mutex_};
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
};

auto source_error(const CopyItem& item) -> util::Error {
    return util::errno_error(std::format("Cannot read source {}", item.source.string()),
                             util::ErrorKind::Copy);
}

}  // namespace

CrossDeviceCopyStrategy::CrossDeviceCopyStrategy(size_t pool_size, size_t buffer_size,
                                                 std::chrono::milliseconds acquire_timeout)
    : pool_size_(std::max<size_t>(pool_size, 1)), buffer_size_(std::max<size_t>(buffer_size, 1)),
      acquire_timeout_(acquire_timeout) {}

auto CrossDeviceCopyStrategy::execute(const CopyContext& context)
    -> std::expected<CopyResult, util::Error> {
    const size_t buffer_size = context.buffer_size > 0 ? context.buffer_size : buffer_size_;
    LOG_INFO(COMPONENT, std::format("Copying {} files ({} bytes), {} x {} byte buffers",
                                    context.files.size(), context.total_bytes(), pool_size_,
                                    buffer_size));

    BufferPool pool{pool_size_, buffer_size};
    BlockingQueue<Chunk> queue;
    BlockingQueue<PendingCommit> commits;
    file_copier::CopyTracker tracker{context, false};

    std::atomic<bool> abort{false};
    std::optional<util::Error> reader_failure;
    std::optional<util::Error> writer_failure;
    std::optional<util::Error> verifier_failure;

    // ------------------------------------------------------------------------
    // Reader: source device -> pooled buffers
    // ------------------------------------------------------------------------
    auto read_file = [&](size_t index) -> bool {
        const auto& item = context.files[index];
        Chunk header{.file_index = index};

        auto fd = util::FileDescriptor::open(item.source, O_RDONLY);
        if (!fd || ::fstat(fd.get(), &header.source_stat) != 0) {
            header.error = source_error(item);
            queue.push(std::move(header));
            return true;
        }
        (void)::posix_fadvise(fd.get(), 0, 0, POSIX_FADV_SEQUENTIAL);

        std::optional<digest::Hasher> hasher;
        if (context.verify) {
            auto created = digest::Hasher::create(context.algorithm);
            if (!created) {
                header.error = created.error();
                queue.push(std::move(header));
                return true;
            }
            hasher.emplace(std::move(*created));
        }

        while (!abort.load()) {
            auto lease = pool.acquire(acquire_timeout_, context.cancel_flag);
            if (!lease) {
                reader_failure = lease.error();
                return false;
            }

            auto buffer = lease->data();
            const auto got = util::read_full(fd.get(), buffer.data(), buffer.size());
            if (got < 0) {
                header.error = source_error(item);
                queue.push(std::move(header));
                return true;
            }
            if (got == 0) {
                header.end_of_file = true;
                if (hasher) {
                    auto finished = hasher->finish();
                    if (!finished) {
                        header.error = finished.error();
                    } else {
                        header.source_digest = std::move(*finished);
                    }
                }
                queue.push(std::move(header));
                return true;
            }

            const auto length = static_cast<size_t>(got);
            if (hasher) {
                if (auto updated = hasher->update(buffer.first(length)); !updated) {
                    header.error = updated.error();
                    queue.push(std::move(header));
                    return true;
                }
            }
            queue.push(Chunk{.file_index = index, .lease = std::move(*lease), .length = length});
        }
        return false;
    };

    std::thread reader([&]() {
        for (size_t index = 0; index < context.files.size(); ++index) {
            if (abort.load() || context.is_cancelled() || !read_file(index)) {
                break;
            }
        }
        queue.close();
    });

    // ------------------------------------------------------------------------
    // Writer: pooled buffers -> partial files on the destination device
    // ------------------------------------------------------------------------
    std::thread writer([&]() {
        std::optional<size_t> current;
        util::FileDescriptor destination;
        bool skipping = false;

        auto drop_open_partial = [&]() {
            if (current && destination) {
                destination.reset();
                file_copier::discard_partial(context.files[*current].destination);
            }
        };

        auto fail_current = [&](util::Error error) {
            const auto& item = context.files[*current];
            destination.reset();
            file_copier::discard_partial(item.destination);
            skipping = true;
            if (auto fatal = tracker.file_failed(item, std::move(error))) {
                writer_failure = std::move(fatal);
                abort.store(true);
            }
        };

        // Drain until the reader closes so that no lease is left waiting
        while (auto chunk = queue.pop()) {
            if (abort.load()) {
                drop_open_partial();
                continue;
            }
            if (context.is_cancelled()) {
                abort.store(true);
                drop_open_partial();
                continue;
            }

            if (!current || *current != chunk->file_index) {
                drop_open_partial();
                current = chunk->file_index;
                skipping = false;
                const auto& item = context.files[*current];

                std::error_code ec;
                fs::create_directories(item.destination.parent_path(), ec);
                if (ec) {
                    fail_current(util::Error{
                        std::format("Cannot create {}: {}", item.destination.parent_path().string(),
                                    ec.message()),
                        ec.value(), util::ErrorKind::Copy});
                    continue;
                }
                const auto partial = file_copier::partial_path(item.destination);
                destination = util::FileDescriptor::open(partial, O_WRONLY | O_CREAT | O_TRUNC);
                if (!destination) {
                    fail_current(util::errno_error(
                        std::format("Cannot create destination {}", partial.string()),
                        util::ErrorKind::Copy));
                    continue;
                }
            }
            if (skipping) {
                continue;
            }

            const auto& item = context.files[*current];
            if (chunk->error) {
                fail_current(*chunk->error);
                continue;
            }

            if (chunk->length > 0) {
                auto buffer = chunk->lease.data();
                if (!util::write_all(destination.get(), buffer.data(), chunk->length)) {
                    fail_current(util::errno_error(
                        std::format("Write failed for {}", item.destination.string()),
                        util::ErrorKind::Copy));
                    continue;
                }
                chunk->lease.release();
                tracker.add_bytes(chunk->length);
            }

            if (chunk->end_of_file) {
                if (destination.close() != 0) {
                    fail_current(util::errno_error(
                        std::format("close failed for {}", item.destination.string()),
                        util::ErrorKind::Copy));
                    continue;
                }
                commits.push(PendingCommit{.file_index = chunk->file_index,
                                           .source_stat = chunk->source_stat,
                                           .source_digest = std::move(chunk->source_digest)});
                skipping = true;
            }
        }

        // The reader stopped mid-file
        drop_open_partial();
        commits.close();
    });

    // ------------------------------------------------------------------------
    // Verifier: fsync, read-back and rename, off the buffer path
    // ------------------------------------------------------------------------
    auto settle = [&](const PendingCommit& pending) -> std::expected<CopiedFile, util::Error> {
        const auto& item = context.files[pending.file_index];
        const auto partial = file_copier::partial_path(item.destination);
        auto fd = util::FileDescriptor::open(partial, O_WRONLY);
        if (!fd) {
            return std::unexpected(util::errno_error(
                std::format("Cannot reopen {}", partial.string()), util::ErrorKind::Copy));
        }
        if (auto finalized = file_copier::finalize_destination(fd, pending.source_stat, partial);
            !finalized) {
            return std::unexpected(finalized.error());
        }
        return file_copier::commit_copy(item, pending.source_digest, context);
    };

    std::thread verifier([&]() {
        while (auto pending = commits.pop()) {
            const auto& item = context.files[pending->file_index];
            if (abort.load() || context.is_cancelled()) {
                file_copier::discard_partial(item.destination);
                continue;
            }

            auto settled = settle(*pending);
            if (!settled) {
                file_copier::discard_partial(item.destination);
                if (settled.error().is_cancelled()) {
                    abort.store(true);
                    continue;
                }
                if (auto fatal = tracker.file_failed(item, settled.error())) {
                    verifier_failure = std::move(fatal);
                    abort.store(true);
                }
                continue;
            }
            tracker.file_copied(std::move(*settled));
        }
    });

    reader.join();
    writer.join();
    verifier.join();
    last_peak_buffers_ = pool.peak_in_use();
    LOG_DEBUG(COMPONENT, std::format("Peak buffers in use: {}/{}", last_peak_buffers_,
                                     pool.pool_size()));

    if (context.is_cancelled() || (reader_failure && reader_failure->is_cancelled())) {
        LOG_INFO(COMPONENT, "Copy cancelled");
        return std::unexpected(util::cancelled_error("Copy"));
    }
    if (writer_failure || verifier_failure) {
        const auto& failure = writer_failure ? *writer_failure : *verifier_failure;
        LOG_ERROR(COMPONENT, failure.message);
        return std::unexpected(failure);
    }
    if (reader_failure) {
        LOG_ERROR(COMPONENT, reader_failure->message);
        return std::unexpected(*reader_failure);
    }
    return tracker.finish(kind(), thread_count());
}
