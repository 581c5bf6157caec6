/**
 * @file IntegrityService.cpp
 */

#include "services/IntegrityService.hpp"

#include "services/Digest.hpp"
#include "util/Logger.hpp"

#include <format>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "IntegrityService";
}

IntegrityService::IntegrityService(std::shared_ptr<IStorageDetector> detector,
                                   std::shared_ptr<ISettingsProvider> settings,
                                   unsigned cpu_threads)
    : settings_(std::move(settings)),
      hash_engine_(std::make_shared<HashEngine>(detector, cpu_threads)),
      copy_engine_(std::make_shared<CopyEngine>(detector, cpu_threads)) {}

auto IntegrityService::resolve_hash_options(HashOptions options) const -> HashOptions {
    const auto settings = settings_->get_settings();
    if (options.thread_override <= 0) {
        options.thread_override = settings.thread_override;
    }
    if (options.buffer_size_override == 0) {
        options.buffer_size_override = settings.buffer_size_override;
    }
    return options;
}

auto IntegrityService::resolve_copy_options(const CopyJobOptions& options) const -> CopyOptions {
    const auto settings = settings_->get_settings();
    return CopyOptions{
        .algorithm = options.algorithm.value_or(settings.default_algorithm),
        .verify = options.verify.value_or(settings.verify_copies),
        .preserve_structure = options.preserve_structure.value_or(settings.preserve_structure),
        .thread_override =
            options.thread_override > 0 ? options.thread_override : settings.thread_override,
        .buffer_size_override = options.buffer_size_override > 0
                                    ? options.buffer_size_override
                                    : settings.buffer_size_override,
    };
}

auto IntegrityService::submit_hash_job(std::vector<fs::path> paths,
                                       std::optional<HashAlgorithm> algorithm,
                                       HashOptions options) const -> JobHandle<HashBatch> {
    const auto resolved_algorithm =
        algorithm.value_or(settings_->get_settings().default_algorithm);
    const auto resolved = resolve_hash_options(options);
    LOG_INFO(COMPONENT, std::format("Submitting hash job: {} paths, {}", paths.size(),
                                    digest::algorithm_name(resolved_algorithm)));

    return JobHandle<HashBatch>::launch(
        "hash job", [engine = hash_engine_, paths = std::move(paths), resolved_algorithm,
                     resolved](const std::atomic<bool>& cancel, const ProgressCallback& progress) {
            return engine->hash_files(paths, resolved_algorithm, resolved, cancel, progress);
        });
}

auto IntegrityService::submit_verify_job(std::vector<fs::path> source_paths,
                                         std::vector<fs::path> target_paths,
                                         std::optional<HashAlgorithm> algorithm,
                                         HashOptions options) const
    -> JobHandle<VerificationReport> {
    const auto resolved_algorithm =
        algorithm.value_or(settings_->get_settings().default_algorithm);
    const auto resolved = resolve_hash_options(options);
    LOG_INFO(COMPONENT, std::format("Submitting verify job: {} source paths, {} target paths",
                                    source_paths.size(), target_paths.size()));

    return JobHandle<VerificationReport>::launch(
        "verify job",
        [engine = hash_engine_, sources = std::move(source_paths),
         targets = std::move(target_paths), resolved_algorithm,
         resolved](const std::atomic<bool>& cancel, const ProgressCallback& progress) {
            return engine->verify(sources, targets, resolved_algorithm, resolved, cancel,
                                  progress);
        });
}

auto IntegrityService::submit_copy_job(std::vector<fs::path> sources, fs::path destination,
                                       CopyJobOptions options) const -> JobHandle<CopyResult> {
    const auto resolved = resolve_copy_options(options);
    LOG_INFO(COMPONENT, std::format("Submitting copy job: {} paths -> {}", sources.size(),
                                    destination.string()));

    return JobHandle<CopyResult>::launch(
        "copy job", [engine = copy_engine_, sources = std::move(sources),
                     destination = std::move(destination),
                     resolved](const std::atomic<bool>& cancel, const ProgressCallback& progress) {
            return engine->copy(sources, destination, resolved, cancel, progress);
        });
}
