/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "cli/ProgressDisplay.hpp"
#include "config.h"
#include "services/Digest.hpp"
#include "services/IntegrityService.hpp"
#include "services/KeyFileSettingsProvider.hpp"
#include "services/StorageDetector.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>

#include <getopt.h>

namespace cli {

namespace {

// Global for signal handling
std::atomic<bool> g_cancel_requested{false};

void signal_handler(int /*signal*/) {
    g_cancel_requested.store(true);
}

constexpr auto APP_NAME = "forensic-copy";
constexpr auto COMPONENT = "CLI";

// Command line options
const struct option long_options[] = {
    {     "help",       no_argument, nullptr, 'h'},
    {  "version",       no_argument, nullptr, 'V'},
    {  "verbose",       no_argument, nullptr, 'v'},
    {   "detect", required_argument, nullptr, 'd'},
    {     "hash",       no_argument, nullptr, 'H'},
    {   "verify", required_argument, nullptr, 'c'},
    {  "against", required_argument, nullptr, 'g'},
    {     "copy",       no_argument, nullptr, 'C'},
    {       "to", required_argument, nullptr, 't'},
    {"algorithm", required_argument, nullptr, 'a'},
    {  "threads", required_argument, nullptr, 'j'},
    {"no-verify",       no_argument, nullptr, 'n'},
    {     "flat",       no_argument, nullptr, 'f'},
    {   "config", required_argument, nullptr, 'k'},
    {    nullptr,                 0, nullptr,   0}
};

void set_command(CliOptions& options, Command command) {
    if (options.command != Command::NONE && options.command != command) {
        options.usage_error = "Only one of --detect, --hash, --verify, --copy may be given";
    }
    options.command = command;
}

/**
 * Poll the job so SIGINT can be turned into a cancellation
 */
template<typename T>
auto wait_for_job(JobHandle<T>& job) -> typename JobHandle<T>::Outcome {
    while (!job.wait_for(std::chrono::milliseconds{50})) {
        if (g_cancel_requested.load()) {
            std::cerr << "\nCancellation requested..." << std::endl;
            return job.cancel_and_wait();
        }
    }
    return job.result();
}

auto exit_code_for(const util::Error& error) -> int {
    return error.is_cancelled() ? EXIT_CANCELLED : EXIT_FAILED;
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto log_dir = std::filesystem::path(g_get_user_data_dir()) / APP_NAME / "logs";
    util::Logger::instance().initialize(log_dir, APP_NAME);

    auto options = parse_args(argc, argv);

    if (options.show_help) {
        print_help();
        return EXIT_OK;
    }

    if (options.show_version) {
        print_version();
        return EXIT_OK;
    }

    if (!options.usage_error.empty()) {
        std::cerr << "Error: " << options.usage_error << "\n"
                  << "Run with --help for usage.\n";
        return EXIT_USAGE;
    }

    setup(options);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    switch (options.command) {
        case Command::DETECT:
            return cmd_detect(options);
        case Command::HASH:
            return cmd_hash(options);
        case Command::VERIFY:
            return cmd_verify(options);
        case Command::COPY:
            return cmd_copy(options);
        case Command::NONE:
            break;
    }

    print_help();
    return EXIT_USAGE;
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Full getopt re-initialization, parse_args may run more than once per process
    optind = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVvd:Hc:g:Ct:a:j:nfk:", long_options, nullptr)) !=
           -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'v':
                options.verbose = true;
                break;
            case 'd':
                set_command(options, Command::DETECT);
                options.detect_path = optarg;
                break;
            case 'H':
                set_command(options, Command::HASH);
                break;
            case 'c':
                set_command(options, Command::VERIFY);
                options.verify_source = optarg;
                break;
            case 'g':
                options.verify_target = optarg;
                break;
            case 'C':
                set_command(options, Command::COPY);
                break;
            case 't':
                options.destination = optarg;
                break;
            case 'a':
                options.algorithm = digest::parse_algorithm(optarg);
                if (!options.algorithm) {
                    options.usage_error = std::format("Unknown algorithm '{}'", optarg);
                }
                break;
            case 'j': {
                const std::string_view text{optarg};
                int value = 0;
                auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec != std::errc{} || ptr != text.data() + text.size() || value < 1) {
                    options.usage_error = std::format("Invalid thread count '{}'", text);
                } else {
                    options.threads = value;
                }
                break;
            }
            case 'n':
                options.no_verify = true;
                break;
            case 'f':
                options.flat = true;
                break;
            case 'k':
                options.config_path = optarg;
                break;
            default:
                options.usage_error = "Unrecognized option";
                break;
        }
    }

    for (int i = optind; i < argc; ++i) {
        options.paths.emplace_back(argv[i]);
    }

    if (!options.usage_error.empty()) {
        return options;
    }

    switch (options.command) {
        case Command::HASH:
            if (options.paths.empty()) {
                options.usage_error = "--hash needs at least one path";
            }
            break;
        case Command::VERIFY:
            if (options.verify_target.empty()) {
                options.usage_error = "--verify needs --against";
            }
            break;
        case Command::COPY:
            if (options.paths.empty() || options.destination.empty()) {
                options.usage_error = "--copy needs source paths and --to";
            }
            break;
        case Command::DETECT:
        case Command::NONE:
            break;
    }
    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " COMMAND [OPTIONS]\n\n"
              << "Storage-aware forensic copy and verification\n\n"
              << "Commands:\n"
              << "  -d, --detect <path>           Classify the storage behind a path\n"
              << "  -H, --hash <path>...          Hash files and directories\n"
              << "  -c, --verify <src> --against <dst>\n"
              << "                                Compare two file sets by relative path\n"
              << "  -C, --copy <src>... --to <dst>\n"
              << "                                Copy with read-back verification\n\n"
              << "Options:\n"
              << "  -a, --algorithm <name>        sha256 (default), sha1 or md5\n"
              << "  -j, --threads <n>             Override the detected thread count\n"
              << "  -n, --no-verify               Copy without read-back verification\n"
              << "  -f, --flat                    Copy every file directly into the destination\n"
              << "  -k, --config <file>           Settings file\n"
              << "  -v, --verbose                 Debug logging to stderr\n"
              << "  -h, --help                    Show this help message\n"
              << "  -V, --version                 Show version information\n\n"
              << "Exit codes: 0 success, 1 failure or mismatch, 2 usage error, 130 cancelled\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << " --detect /mnt/evidence\n"
              << "  " << APP_NAME << " --hash --algorithm sha1 /mnt/evidence\n"
              << "  " << APP_NAME << " --verify /mnt/evidence --against /srv/case42\n"
              << "  " << APP_NAME << " --copy /mnt/evidence/disk1 --to /srv/case42\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Storage-aware forensic copy and verification\n";
}

void CliApplication::setup(const CliOptions& options) {
    auto settings = std::make_shared<KeyFileSettingsProvider>(
        options.config_path.empty() ? KeyFileSettingsProvider::default_path()
                                    : options.config_path);

    auto& logger = util::Logger::instance();
    if (auto level = util::parse_log_level(settings->get_settings().log_level)) {
        logger.set_min_level(*level);
    }
    if (options.verbose) {
        logger.set_min_level(util::LogLevel::DEBUG);
        logger.set_console_output(true);
    }

    detector_ = std::make_shared<StorageDetector>();
    service_ = std::make_unique<IntegrityService>(detector_, settings);
}

auto CliApplication::cmd_detect(const CliOptions& options) -> int {
    const auto info = detector_->analyze(options.detect_path);

    std::cout << "Path:          " << options.detect_path.string() << "\n"
              << "Drive type:    " << drive_type_name(info.drive_type) << "\n"
              << "Bus:           " << bus_type_name(info.bus_type) << "\n"
              << "Device:        " << (info.device_name.empty() ? "-" : info.device_name) << " ("
              << (info.device_id.empty() ? "?" : info.device_id) << ")\n"
              << "Removable:     " << (info.is_removable ? "yes" : "no") << "\n"
              << "Performance:   " << info.performance_class << "/5\n"
              << std::format("Confidence:    {:.2f}\n", info.confidence)
              << "Method:        " << info.detection_method << "\n";
    if (info.probe_write_mbps > 0.0 || info.probe_read_mbps > 0.0) {
        std::cout << std::format("Probe:         write {:.1f} MB/s, read {:.1f} MB/s\n",
                                 info.probe_write_mbps, info.probe_read_mbps);
    }
    return EXIT_OK;
}

auto CliApplication::cmd_hash(const CliOptions& options) -> int {
    HashOptions hash_options;
    hash_options.thread_override = options.threads;

    ProgressDisplay display("Hashing", std::format("{} path(s)", options.paths.size()));
    auto job = service_->submit_hash_job(options.paths, options.algorithm, hash_options);
    job.on_progress([&display](const OperationProgress& p) { display.update(p); });

    auto outcome = wait_for_job(job);
    if (!outcome) {
        LOG_ERROR(COMPONENT, std::format("Hash job failed: {}", outcome.error().message));
        display.complete(false, outcome.error().message);
        return exit_code_for(outcome.error());
    }

    const auto failed = outcome->failed_count();
    display.complete(failed == 0,
                     std::format("{} files, {} failed, {} threads on {}", outcome->results.size(),
                                 failed, outcome->thread_count, outcome->storage.describe()));

    for (const auto& [path, result] : outcome->results) {
        if (result) {
            std::cout << result->digest_hex << "  " << path.string() << "\n";
        } else {
            std::cerr << path.string() << ": " << result.error().message << "\n";
        }
    }
    return failed == 0 ? EXIT_OK : EXIT_FAILED;
}

auto CliApplication::cmd_verify(const CliOptions& options) -> int {
    HashOptions hash_options;
    hash_options.thread_override = options.threads;

    ProgressDisplay display("Verifying", std::format("{} against {}",
                                                     options.verify_source.string(),
                                                     options.verify_target.string()));
    auto job = service_->submit_verify_job({options.verify_source}, {options.verify_target},
                                           options.algorithm, hash_options);
    job.on_progress([&display](const OperationProgress& p) { display.update(p); });

    auto outcome = wait_for_job(job);
    if (!outcome) {
        LOG_ERROR(COMPONENT, std::format("Verify job failed: {}", outcome.error().message));
        display.complete(false, outcome.error().message);
        return exit_code_for(outcome.error());
    }

    const auto& report = *outcome;
    display.complete(report.all_matched(),
                     std::format("{} matched, {} mismatched, {} missing in target, {} missing in "
                                 "source, {} errors",
                                 report.count(VerificationOutcome::EXACT_MATCH),
                                 report.count(VerificationOutcome::MISMATCH),
                                 report.count(VerificationOutcome::MISSING_TARGET),
                                 report.count(VerificationOutcome::MISSING_SOURCE),
                                 report.count(VerificationOutcome::ERROR)));

    for (const auto& [key, entry] : report.results) {
        if (entry.outcome == VerificationOutcome::EXACT_MATCH) {
            continue;
        }
        std::cout << std::format("{:<15} {}", verification_outcome_name(entry.outcome), key);
        if (!entry.notes.empty()) {
            std::cout << "  (" << entry.notes << ")";
        }
        std::cout << "\n";
    }
    return report.all_matched() ? EXIT_OK : EXIT_FAILED;
}

auto CliApplication::cmd_copy(const CliOptions& options) -> int {
    CopyJobOptions copy_options;
    copy_options.algorithm = options.algorithm;
    copy_options.thread_override = options.threads;
    if (options.no_verify) {
        copy_options.verify = false;
    }
    if (options.flat) {
        copy_options.preserve_structure = false;
    }

    ProgressDisplay display("Copying", std::format("{} path(s) to {}", options.paths.size(),
                                                   options.destination.string()));
    auto job = service_->submit_copy_job(options.paths, options.destination, copy_options);
    job.on_progress([&display](const OperationProgress& p) { display.update(p); });

    auto outcome = wait_for_job(job);
    if (!outcome) {
        LOG_ERROR(COMPONENT, std::format("Copy job failed: {}", outcome.error().message));
        display.complete(false, outcome.error().message);
        return exit_code_for(outcome.error());
    }

    const auto& result = *outcome;
    display.complete(result.success,
                     std::format("{} files, {} with {} ({} threads), {:.1f} MB/s",
                                 result.files_copied, ProgressDisplay::format_bytes(result.bytes_copied),
                                 result.strategy_name, result.thread_count,
                                 result.throughput_mbps));

    std::cout << "Strategy: " << result.selection_reason << "\n";
    for (const auto& note : result.diagnostics) {
        std::cout << "Note: " << note << "\n";
    }
    for (const auto& failure : result.per_file_errors) {
        std::cerr << failure.source.string() << ": " << failure.error.message << "\n";
    }
    return result.success ? EXIT_OK : EXIT_FAILED;
}

}  // namespace cli
