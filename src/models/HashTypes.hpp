/**
 * @file HashTypes.hpp
 * @brief Results of hashing and set verification
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "models/StorageInfo.hpp"
#include "util/Result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

/**
 * @struct HashResult
 * @brief Digest of one file
 */
struct HashResult {
    std::filesystem::path path;
    std::filesystem::path relative_path;
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    std::string digest_hex;                   ///< Lowercase hex
    uint64_t size_bytes = 0;
    std::chrono::nanoseconds duration{0};
    double speed_mbps = 0.0;

    auto operator==(const HashResult&) const -> bool = default;
};

using FileHashOutcome = std::expected<HashResult, util::Error>;

/**
 * @struct HashBatch
 * @brief Result map of a batch plus how it was executed
 *
 * Per-file failures are values in the map, they do not fail the batch.
 */
struct HashBatch {
    std::map<std::filesystem::path, FileHashOutcome> results;
    int thread_count = 1;
    StorageInfo storage;
    uint64_t total_bytes = 0;
    std::chrono::nanoseconds duration{0};

    [[nodiscard]] auto failed_count() const -> size_t {
        size_t failed = 0;
        for (const auto& [path, outcome] : results) {
            if (!outcome) {
                ++failed;
            }
        }
        return failed;
    }
};

/**
 * @enum VerificationOutcome
 */
enum class VerificationOutcome {
    EXACT_MATCH,
    MISMATCH,
    MISSING_TARGET,  ///< Present in source only
    MISSING_SOURCE,  ///< Present in target only
    ERROR            ///< One side could not be hashed
};

[[nodiscard]] inline auto verification_outcome_name(VerificationOutcome outcome) -> std::string {
    switch (outcome) {
        case VerificationOutcome::EXACT_MATCH:
            return "exact_match";
        case VerificationOutcome::MISMATCH:
            return "mismatch";
        case VerificationOutcome::MISSING_TARGET:
            return "missing_target";
        case VerificationOutcome::MISSING_SOURCE:
            return "missing_source";
        case VerificationOutcome::ERROR:
            return "error";
    }
    return "error";
}

/**
 * @struct VerificationResult
 * @brief Pairing of one relative path across the two sides
 */
struct VerificationResult {
    std::optional<HashResult> source;
    std::optional<HashResult> target;
    VerificationOutcome outcome = VerificationOutcome::ERROR;
    std::string notes;
};

/**
 * @struct VerificationReport
 * @brief Full verification map keyed by relative path
 *
 * The engine never turns this into pass/fail, all_matched() is a convenience
 * for callers that want the strict policy.
 */
struct VerificationReport {
    std::map<std::string, VerificationResult> results;
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    int source_thread_count = 1;
    int target_thread_count = 1;
    std::chrono::nanoseconds duration{0};

    [[nodiscard]] auto count(VerificationOutcome outcome) const -> size_t {
        size_t n = 0;
        for (const auto& [key, entry] : results) {
            if (entry.outcome == outcome) {
                ++n;
            }
        }
        return n;
    }

    [[nodiscard]] auto all_matched() const -> bool {
        return !results.empty() && count(VerificationOutcome::EXACT_MATCH) == results.size();
    }
};

/**
 * @struct HashOptions
 */
struct HashOptions {
    bool parallel_hint = true;
    bool fail_fast = false;             ///< First per-file error aborts the batch
    int thread_override = 0;            ///< 0 = from storage detection
    size_t buffer_size_override = 0;    ///< 0 = adaptive
    std::chrono::seconds per_file_timeout{300};
};
