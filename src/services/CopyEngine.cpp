/**
 * @file CopyEngine.cpp
 * @brief Copy orchestration
 */

#include "services/CopyEngine.hpp"

#include "copy/FileCopier.hpp"
#include "copy/StrategySelector.hpp"
#include "services/FileDiscovery.hpp"
#include "services/ThreadCalculator.hpp"
#include "util/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <thread>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "CopyEngine";
}

CopyEngine::CopyEngine(std::shared_ptr<IStorageDetector> detector, unsigned cpu_threads)
    : detector_(std::move(detector)), cpu_threads_(std::max(cpu_threads, 1U)) {}

auto CopyEngine::default_cpu_threads() -> unsigned {
    return std::max(std::thread::hardware_concurrency(), 1U);
}

auto CopyEngine::copy(const std::vector<fs::path>& sources, const fs::path& destination,
                      const CopyOptions& options, const std::atomic<bool>& cancel_flag,
                      const ProgressCallback& progress) const
    -> std::expected<CopyResult, util::Error> {
    if (sources.empty()) {
        return std::unexpected(
            util::Error{"No source paths given", EINVAL, util::ErrorKind::InvalidInput});
    }
    if (cancel_flag.load()) {
        return std::unexpected(util::cancelled_error("Copy"));
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec || !file_copier::destination_available(destination)) {
        return std::unexpected(util::Error{
            std::format("Destination {} is not a writable directory{}", destination.string(),
                        ec ? std::format(": {}", ec.message()) : std::string{}),
            ec ? ec.value() : EACCES, util::ErrorKind::DestinationUnavailable});
    }

    auto plan = file_discovery::plan_copy(sources, destination, options.preserve_structure);
    if (plan.items.empty() && plan.errors.empty()) {
        return std::unexpected(
            util::Error{"No files found to copy", ENOENT, util::ErrorKind::InvalidInput});
    }

    const auto source_info = detector_->analyze(plan.source_root);
    const auto destination_info = detector_->analyze(destination);

    auto choice = strategy_selector::select_strategy(source_info, destination_info,
                                                     plan.items.size(), cpu_threads_,
                                                     options.thread_override);
    const auto thread_reason = thread_calculator::describe_copy_threads(
        source_info, destination_info, plan.items.size(), cpu_threads_);
    LOG_INFO(COMPONENT, std::format("Selected {} ({} threads): {}", copy_strategy_name(choice.kind),
                                    choice.thread_count, choice.reason));

    CopyContext context{
        .files = std::move(plan.items),
        .source_root = plan.source_root,
        .destination_root = destination,
        .preserve_structure = options.preserve_structure,
        .algorithm = options.algorithm,
        .verify = options.verify,
        .buffer_size = options.buffer_size_override,
        .cancel_flag = &cancel_flag,
    };

    // Files that could not be planned keep the job below 100%
    const bool planning_failed = !plan.errors.empty();
    if (progress) {
        context.progress = [progress, planning_failed](const OperationProgress& update) {
            if (planning_failed && update.percent >= 100) {
                auto capped = update;
                capped.percent = 99;
                progress(capped);
                return;
            }
            progress(update);
        };
    }

    auto strategy = strategy_selector::make_strategy(
        choice, strategy_selector::CrossDeviceTuning{
                    .pool_size = options.cross_device_pool_size,
                    .buffer_size = options.cross_device_buffer_size,
                    .acquire_timeout = options.buffer_acquire_timeout,
                });

    auto result = strategy->execute(context);
    if (!result) {
        LOG_WARNING(COMPONENT, std::format("{} copy ended early: {}", strategy->name(),
                                           result.error().message));
        return std::unexpected(result.error());
    }

    for (auto& error : plan.errors) {
        LOG_WARNING(COMPONENT, std::format("Not copied {}: {}", error.source.string(),
                                           error.error.message));
    }
    result->per_file_errors.insert(result->per_file_errors.begin(),
                                   std::make_move_iterator(plan.errors.begin()),
                                   std::make_move_iterator(plan.errors.end()));
    result->success = result->success && !planning_failed;
    result->selection_reason = std::format("{}; {}", choice.reason, thread_reason);

    LOG_INFO(COMPONENT,
             std::format("{} copy finished: {} files, {} bytes, {:.1f} MB/s, {} errors",
                         result->strategy_name, result->files_copied, result->bytes_copied,
                         result->throughput_mbps, result->per_file_errors.size()));
    return result;
}
