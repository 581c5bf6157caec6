/**
 * @file CopyTypes.hpp
 * @brief Copy job parameters and results
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @struct CopyItem
 * @brief One planned file copy
 */
struct CopyItem {
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t size_bytes = 0;
};

/**
 * @struct CopyContext
 * @brief Everything a strategy needs to run a job
 *
 * The cancel flag and progress sink are owned by the job; the context only
 * borrows them for the duration of execute().
 */
struct CopyContext {
    std::vector<CopyItem> files;
    std::filesystem::path source_root;
    std::filesystem::path destination_root;
    bool preserve_structure = true;
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    bool verify = true;
    size_t buffer_size = 0;             ///< 0 = adaptive per file
    const std::atomic<bool>* cancel_flag = nullptr;
    ProgressCallback progress;

    [[nodiscard]] auto is_cancelled() const -> bool {
        return cancel_flag != nullptr && cancel_flag->load();
    }

    [[nodiscard]] auto total_bytes() const -> uint64_t {
        uint64_t total = 0;
        for (const auto& item : files) {
            total += item.size_bytes;
        }
        return total;
    }
};

/**
 * @struct CopyFileError
 */
struct CopyFileError {
    std::filesystem::path source;
    std::filesystem::path destination;
    util::Error error;
};

/**
 * @struct CopiedFile
 * @brief Audit record of one successful copy
 */
struct CopiedFile {
    std::filesystem::path source;
    std::filesystem::path destination;
    uint64_t size_bytes = 0;
    std::string source_digest;
    std::string destination_digest;
    bool verified = false;
};

/**
 * @struct CopyResult
 */
struct CopyResult {
    bool success = false;
    size_t files_copied = 0;
    uint64_t bytes_copied = 0;
    std::chrono::nanoseconds duration{0};
    double throughput_mbps = 0.0;
    double peak_throughput_mbps = 0.0;
    std::string strategy_name;
    int thread_count = 1;
    std::string selection_reason;
    std::vector<CopyFileError> per_file_errors;
    std::vector<CopiedFile> copied_files;
    std::vector<std::string> diagnostics;
};

/**
 * @struct CopyOptions
 * @brief Per-job copy parameters, already merged with user settings
 */
struct CopyOptions {
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    bool verify = true;
    bool preserve_structure = true;
    int thread_override = 0;                 ///< 0 = strategy selector decides
    size_t buffer_size_override = 0;         ///< 0 = adaptive
    size_t cross_device_pool_size = 4;
    size_t cross_device_buffer_size = 10 * 1024 * 1024;
    std::chrono::milliseconds buffer_acquire_timeout{30000};
};
