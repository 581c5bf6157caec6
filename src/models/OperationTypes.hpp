/**
 * @file OperationTypes.hpp
 * @brief Progress events and engine settings shared by every job type
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

/**
 * @enum HashAlgorithm
 * @brief Supported digest algorithms
 */
enum class HashAlgorithm {
    SHA256,
    SHA1,
    MD5
};

/**
 * @struct OperationProgress
 * @brief One progress event; percent never decreases within a job
 */
struct OperationProgress {
    int percent = 0;                    ///< 0..100, 100 only on success
    std::string message;
    uint64_t bytes_processed = 0;
    uint64_t total_bytes = 0;
    size_t files_processed = 0;
    size_t total_files = 0;
    uint64_t speed_bytes_per_sec = 0;

    auto operator==(const OperationProgress&) const -> bool = default;
};

using ProgressCallback = std::function<void(const OperationProgress&)>;

/**
 * @struct EngineSettings
 * @brief User preferences pulled from the settings provider at job start
 */
struct EngineSettings {
    HashAlgorithm default_algorithm = HashAlgorithm::SHA256;
    int thread_override = 0;           ///< 0 = ask ThreadCalculator
    size_t buffer_size_override = 0;   ///< 0 = adaptive, otherwise clamped to 8KB..10MB
    bool preserve_structure = true;
    bool verify_copies = true;
    std::string log_level = "info";

    auto operator==(const EngineSettings&) const -> bool = default;
};
