/**
 * @file IntegrityService.hpp
 * @brief Job submission front door for hashing, verification and copying
 */

#pragma once

#include "interfaces/ISettingsProvider.hpp"
#include "interfaces/IStorageDetector.hpp"
#include "models/CopyTypes.hpp"
#include "models/HashTypes.hpp"
#include "services/CopyEngine.hpp"
#include "services/HashEngine.hpp"
#include "services/JobHandle.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

/**
 * @struct CopyJobOptions
 * @brief Caller overrides for a copy job; unset fields come from settings
 */
struct CopyJobOptions {
    std::optional<HashAlgorithm> algorithm;
    std::optional<bool> verify;
    std::optional<bool> preserve_structure;
    int thread_override = 0;
    size_t buffer_size_override = 0;
};

/**
 * @class IntegrityService
 * @brief Runs each request as a background job
 *
 * Settings are pulled once per submission. The detector (and its cache) is
 * shared by every job of the service.
 */
class IntegrityService {
public:
    IntegrityService(std::shared_ptr<IStorageDetector> detector,
                     std::shared_ptr<ISettingsProvider> settings,
                     unsigned cpu_threads = HashEngine::default_cpu_threads());

    [[nodiscard]] auto submit_hash_job(std::vector<std::filesystem::path> paths,
                                       std::optional<HashAlgorithm> algorithm = std::nullopt,
                                       HashOptions options = {}) const
        -> JobHandle<HashBatch>;

    [[nodiscard]] auto submit_verify_job(std::vector<std::filesystem::path> source_paths,
                                         std::vector<std::filesystem::path> target_paths,
                                         std::optional<HashAlgorithm> algorithm = std::nullopt,
                                         HashOptions options = {}) const
        -> JobHandle<VerificationReport>;

    [[nodiscard]] auto submit_copy_job(std::vector<std::filesystem::path> sources,
                                       std::filesystem::path destination,
                                       CopyJobOptions options = {}) const
        -> JobHandle<CopyResult>;

    /**
     * @brief Merge caller options over the current settings
     */
    [[nodiscard]] auto resolve_copy_options(const CopyJobOptions& options) const -> CopyOptions;
    [[nodiscard]] auto resolve_hash_options(HashOptions options) const -> HashOptions;

private:
    std::shared_ptr<ISettingsProvider> settings_;
    std::shared_ptr<HashEngine> hash_engine_;
    std::shared_ptr<CopyEngine> copy_engine_;
};
