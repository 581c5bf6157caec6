/**
 * @file ThreadCalculator.hpp
 * @brief Worker thread counts derived from storage classification
 *
 * Every thread count used by the hash and copy engines comes from here.
 */

#pragma once

#include "models/StorageInfo.hpp"

#include <cstddef>
#include <string>

namespace thread_calculator {

inline constexpr int MIN_NVME_THREADS = 2;
inline constexpr int MAX_NVME_THREADS = 64;
inline constexpr int SATA_SSD_THREADS = 16;
inline constexpr int EXTERNAL_SSD_THREADS = 8;
inline constexpr int HDD_TO_FAST_THREADS = 8;
inline constexpr int MIXED_NVME_THREADS = 32;

[[nodiscard]] auto is_hdd_class(DriveType type) -> bool;

/// SSD, NVMe or external SSD
[[nodiscard]] auto is_solid_state(DriveType type) -> bool;

/**
 * @brief Threads for reading one side (hashing)
 */
[[nodiscard]] auto optimal_threads(const StorageInfo& info, unsigned cpu_threads) -> int;

/**
 * @brief Threads for a copy from source to destination
 *
 * Rules apply in strict order; the first match wins.
 */
[[nodiscard]] auto optimal_copy_threads(const StorageInfo& source, const StorageInfo& destination,
                                        size_t file_count, unsigned cpu_threads) -> int;

/**
 * @brief Human readable explanation of optimal_copy_threads() for audit records
 */
[[nodiscard]] auto describe_copy_threads(const StorageInfo& source,
                                         const StorageInfo& destination, size_t file_count,
                                         unsigned cpu_threads) -> std::string;

}  // namespace thread_calculator
