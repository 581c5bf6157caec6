/**
 * @file StrategySelector.cpp
 */

#include "copy/StrategySelector.hpp"

#include "copy/CrossDeviceCopyStrategy.hpp"
#include "copy/ParallelCopyStrategy.hpp"
#include "copy/SequentialCopyStrategy.hpp"
#include "services/ThreadCalculator.hpp"

#include <format>

namespace strategy_selector {

namespace {

auto same_device(const StorageInfo& source, const StorageInfo& destination) -> bool {
    return !source.device_id.empty() && source.device_id == destination.device_id;
}

auto sequential(std::string reason) -> StrategyChoice {
    return StrategyChoice{CopyStrategyKind::SEQUENTIAL, 1, std::move(reason)};
}

auto parallel(int threads, int thread_override, std::string reason) -> StrategyChoice {
    if (thread_override > 0) {
        reason += std::format(", thread override {}", thread_override);
        threads = thread_override;
    }
    if (threads <= 1) {
        return sequential(reason + ", one thread");
    }
    return StrategyChoice{CopyStrategyKind::PARALLEL, threads, std::move(reason)};
}

}  // namespace

auto select_strategy(const StorageInfo& source, const StorageInfo& destination,
                     size_t file_count, unsigned cpu_threads, int thread_override)
    -> StrategyChoice {
    using thread_calculator::is_hdd_class;
    using thread_calculator::is_solid_state;

    const auto pair = std::format("{} -> {}", source.describe(), destination.describe());

    if (is_hdd_class(destination.drive_type)) {
        return sequential(std::format("{}: destination is a spinning disk", pair));
    }
    if (file_count == 1) {
        return sequential(std::format("{}: single file", pair));
    }

    const int threads =
        thread_calculator::optimal_copy_threads(source, destination, file_count, cpu_threads);
    const bool both_solid =
        is_solid_state(source.drive_type) && is_solid_state(destination.drive_type);

    if (both_solid && same_device(source, destination)) {
        return parallel(threads, thread_override,
                        std::format("{}: solid-state, same device ({})", pair, source.device_id));
    }
    if (both_solid) {
        if (source.drive_type == DriveType::EXTERNAL_SSD ||
            destination.drive_type == DriveType::EXTERNAL_SSD) {
            return StrategyChoice{
                CopyStrategyKind::CROSS_DEVICE, 2,
                std::format("{}: different devices, external SSD limits concurrent streams, "
                            "overlapping reads and writes",
                            pair)};
        }
        return parallel(threads, thread_override,
                        std::format("{}: different solid-state devices", pair));
    }
    if (is_hdd_class(source.drive_type) && is_solid_state(destination.drive_type)) {
        return parallel(threads, thread_override,
                        std::format("{}: spinning source, solid-state destination", pair));
    }
    return sequential(std::format("{}: storage not recognized, copying conservatively", pair));
}

auto make_strategy(const StrategyChoice& choice, const CrossDeviceTuning& tuning)
    -> std::unique_ptr<ICopyStrategy> {
    switch (choice.kind) {
        case CopyStrategyKind::PARALLEL:
            return std::make_unique<ParallelCopyStrategy>(choice.thread_count);
        case CopyStrategyKind::CROSS_DEVICE:
            return std::make_unique<CrossDeviceCopyStrategy>(tuning.pool_size, tuning.buffer_size,
                                                             tuning.acquire_timeout);
        case CopyStrategyKind::SEQUENTIAL:
            break;
    }
    return std::make_unique<SequentialCopyStrategy>();
}

}  // namespace strategy_selector
