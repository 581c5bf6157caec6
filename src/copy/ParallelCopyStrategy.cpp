/**
 * @file ParallelCopyStrategy.cpp
 */

#include "copy/ParallelCopyStrategy.hpp"

#include "copy/FileCopier.hpp"
#include "util/Logger.hpp"
#include "util/ThreadPool.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <future>
#include <mutex>
#include <optional>
#include <vector>

namespace {
constexpr auto COMPONENT = "ParallelCopy";
}

ParallelCopyStrategy::ParallelCopyStrategy(int thread_count)
    : thread_count_(std::max(thread_count, 1)) {}

auto ParallelCopyStrategy::execute(const CopyContext& context)
    -> std::expected<CopyResult, util::Error> {
    const auto workers = std::min<size_t>(static_cast<size_t>(thread_count_),
                                          std::max<size_t>(context.files.size(), 1));
    LOG_INFO(COMPONENT, std::format("Copying {} files ({} bytes) with {} threads",
                                    context.files.size(), context.total_bytes(), workers));

    file_copier::CopyTracker tracker{context, true};
    const file_copier::ByteSink sink = [&tracker](uint64_t bytes) { tracker.add_bytes(bytes); };

    std::atomic<bool> stop{false};
    std::mutex fatal_mutex;
    std::optional<util::Error> fatal;

    auto copy_one = [&](const CopyItem& item) {
        if (stop.load() || context.is_cancelled()) {
            return;
        }
        auto copied = file_copier::copy_file(item, context, sink);
        if (copied) {
            tracker.file_copied(std::move(*copied));
            return;
        }
        if (copied.error().is_cancelled()) {
            stop.store(true);
            return;
        }
        if (auto destination_lost = tracker.file_failed(item, copied.error())) {
            std::lock_guard lock{fatal_mutex};
            if (!fatal) {
                fatal = std::move(destination_lost);
            }
            stop.store(true);
        }
    };

    {
        util::ThreadPool pool{workers};
        std::vector<std::future<void>> pending;
        pending.reserve(context.files.size());

        for (const auto& item : context.files) {
            auto submitted = pool.submit([&copy_one, &item]() { copy_one(item); });
            if (!submitted) {
                stop.store(true);
                pool.wait_idle();
                return std::unexpected(submitted.error());
            }
            pending.push_back(std::move(*submitted));
        }

        for (auto& future : pending) {
            try {
                future.get();
            } catch (const std::exception& e) {
                LOG_ERROR(COMPONENT, std::format("Copy worker failed: {}", e.what()));
                std::lock_guard lock{fatal_mutex};
                if (!fatal) {
                    fatal = util::Error{std::format("Copy worker failed: {}", e.what()), 0,
                                        util::ErrorKind::Copy};
                }
                stop.store(true);
            }
        }
    }

    if (context.is_cancelled()) {
        LOG_INFO(COMPONENT, "Copy cancelled");
        return std::unexpected(util::cancelled_error("Copy"));
    }
    if (fatal) {
        LOG_ERROR(COMPONENT, fatal->message);
        return std::unexpected(*fatal);
    }
    return tracker.finish(kind(), thread_count_);
}
