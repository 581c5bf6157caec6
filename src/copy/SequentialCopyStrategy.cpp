/**
 * @file SequentialCopyStrategy.cpp
 */

#include "copy/SequentialCopyStrategy.hpp"

#include "copy/FileCopier.hpp"
#include "util/Logger.hpp"

#include <format>

namespace {
constexpr auto COMPONENT = "SequentialCopy";
}

auto SequentialCopyStrategy::execute(const CopyContext& context)
    -> std::expected<CopyResult, util::Error> {
    LOG_INFO(COMPONENT, std::format("Copying {} files ({} bytes)", context.files.size(),
                                    context.total_bytes()));

    file_copier::CopyTracker tracker{context, false};
    const auto sink = [&tracker](uint64_t bytes) { tracker.add_bytes(bytes); };

    for (const auto& item : context.files) {
        auto copied = file_copier::copy_file(item, context, sink);
        if (copied) {
            tracker.file_copied(std::move(*copied));
            continue;
        }
        if (copied.error().is_cancelled() || context.is_cancelled()) {
            LOG_INFO(COMPONENT, "Copy cancelled");
            return std::unexpected(util::cancelled_error("Copy"));
        }
        if (auto fatal = tracker.file_failed(item, copied.error())) {
            LOG_ERROR(COMPONENT, fatal->message);
            return std::unexpected(*fatal);
        }
    }

    return tracker.finish(kind(), thread_count());
}
