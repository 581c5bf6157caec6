/**
 * @file ThreadCalculator.cpp
 * @brief Thread count policy
 */

#include "services/ThreadCalculator.hpp"

#include <algorithm>
#include <format>

namespace thread_calculator {

namespace {

auto nvme_threads(unsigned cpu_threads) -> int {
    return std::clamp(static_cast<int>(cpu_threads) * 2, MIN_NVME_THREADS, MAX_NVME_THREADS);
}

enum class CopyRule {
    HDD_DESTINATION,
    SINGLE_FILE,
    HDD_TO_FAST,
    NVME_TO_NVME,
    SOLID_STATE_PAIR,
    FALLBACK
};

auto match_copy_rule(const StorageInfo& source, const StorageInfo& destination,
                     size_t file_count) -> CopyRule {
    if (is_hdd_class(destination.drive_type)) {
        return CopyRule::HDD_DESTINATION;
    }
    if (file_count == 1) {
        return CopyRule::SINGLE_FILE;
    }
    if (is_hdd_class(source.drive_type) && is_solid_state(destination.drive_type)) {
        return CopyRule::HDD_TO_FAST;
    }
    if (source.drive_type == DriveType::NVME && destination.drive_type == DriveType::NVME) {
        return CopyRule::NVME_TO_NVME;
    }
    if (is_solid_state(source.drive_type) && is_solid_state(destination.drive_type)) {
        return CopyRule::SOLID_STATE_PAIR;
    }
    return CopyRule::FALLBACK;
}

}  // namespace

auto is_hdd_class(DriveType type) -> bool {
    return type == DriveType::HDD || type == DriveType::EXTERNAL_HDD;
}

auto is_solid_state(DriveType type) -> bool {
    return type == DriveType::SSD || type == DriveType::NVME || type == DriveType::EXTERNAL_SSD;
}

auto optimal_threads(const StorageInfo& info, unsigned cpu_threads) -> int {
    switch (info.drive_type) {
        case DriveType::NVME:
            return nvme_threads(cpu_threads);
        case DriveType::SSD:
            return SATA_SSD_THREADS;
        case DriveType::EXTERNAL_SSD:
            return EXTERNAL_SSD_THREADS;
        case DriveType::HDD:
        case DriveType::EXTERNAL_HDD:
        case DriveType::NETWORK:
        case DriveType::UNKNOWN:
            return 1;
    }
    return 1;
}

auto optimal_copy_threads(const StorageInfo& source, const StorageInfo& destination,
                          size_t file_count, unsigned cpu_threads) -> int {
    switch (match_copy_rule(source, destination, file_count)) {
        case CopyRule::HDD_DESTINATION:
        case CopyRule::SINGLE_FILE:
        case CopyRule::FALLBACK:
            return 1;
        case CopyRule::HDD_TO_FAST:
            return HDD_TO_FAST_THREADS;
        case CopyRule::NVME_TO_NVME:
            return nvme_threads(cpu_threads);
        case CopyRule::SOLID_STATE_PAIR:
            return (source.drive_type == DriveType::NVME ||
                    destination.drive_type == DriveType::NVME)
                       ? MIXED_NVME_THREADS
                       : SATA_SSD_THREADS;
    }
    return 1;
}

auto describe_copy_threads(const StorageInfo& source, const StorageInfo& destination,
                           size_t file_count, unsigned cpu_threads) -> std::string {
    const int threads = optimal_copy_threads(source, destination, file_count, cpu_threads);
    const auto pair = std::format("{} -> {}", source.describe(), destination.describe());

    switch (match_copy_rule(source, destination, file_count)) {
        case CopyRule::HDD_DESTINATION:
            return std::format("{}: destination is a spinning disk, writes are serialized ({} thread)",
                               pair, threads);
        case CopyRule::SINGLE_FILE:
            return std::format("{}: single file, no parallelism available ({} thread)", pair,
                               threads);
        case CopyRule::HDD_TO_FAST:
            return std::format("{}: slow source, fast destination, queued reads benefit from "
                               "read-ahead ({} threads)",
                               pair, threads);
        case CopyRule::NVME_TO_NVME:
            return std::format("{}: NVMe on both sides, {} CPU threads ({} threads)", pair,
                               cpu_threads, threads);
        case CopyRule::SOLID_STATE_PAIR:
            return std::format("{}: solid-state on both sides ({} threads)", pair, threads);
        case CopyRule::FALLBACK:
            return std::format("{}: storage not recognized, copying conservatively ({} thread)",
                               pair, threads);
    }
    return pair;
}

}  // namespace thread_calculator
