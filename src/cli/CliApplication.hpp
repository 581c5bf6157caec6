/**
 * @file CliApplication.hpp
 * @brief Command-line front end for detection, hashing, verification and copying
 */

#pragma once

#include "models/OperationTypes.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class IntegrityService;
class StorageDetector;

namespace cli {

enum class Command {
    NONE,
    DETECT,
    HASH,
    VERIFY,
    COPY
};

/// Process exit codes
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_CANCELLED = 130;

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
    Command command = Command::NONE;
    std::vector<std::filesystem::path> paths;   ///< Positional paths (hash, copy sources)
    std::filesystem::path detect_path;
    std::filesystem::path verify_source;
    std::filesystem::path verify_target;
    std::filesystem::path destination;
    std::optional<HashAlgorithm> algorithm;
    int threads = 0;
    bool no_verify = false;
    bool flat = false;
    std::filesystem::path config_path;
    std::string usage_error;                     ///< Non-empty when arguments are invalid
};

/**
 * @class CliApplication
 * @brief Command-line application for forensic copying
 *
 * Provides command-line interface for:
 * - Classifying the storage behind a path
 * - Hashing files and directories
 * - Verifying two file sets against each other
 * - Copying with read-back verification
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @return Exit code (EXIT_OK, EXIT_FAILED, EXIT_USAGE or EXIT_CANCELLED)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    static void print_help();

    static void print_version();

private:
    auto cmd_detect(const CliOptions& options) -> int;
    auto cmd_hash(const CliOptions& options) -> int;
    auto cmd_verify(const CliOptions& options) -> int;
    auto cmd_copy(const CliOptions& options) -> int;

    void setup(const CliOptions& options);

    std::shared_ptr<StorageDetector> detector_;
    std::unique_ptr<IntegrityService> service_;
};

}  // namespace cli
