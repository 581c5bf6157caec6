/**
 * @file Logger.hpp
 * @brief Thread-safe component logger with size-based file rotation
 *
 * Lines look like:
 * `2026-03-02T10:15:04.211Z [INFO ] [CopyEngine] Selected Parallel (16 threads)`
 *
 * Until initialize() succeeds nothing is written to disk, which is how the
 * engine runs inside tests and embedding hosts that own their own logging.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace util {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @brief Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
 */
[[nodiscard]] auto parse_log_level(std::string_view text) -> std::optional<LogLevel>;

struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;
    int max_files = 7;
};

/**
 * @class Logger
 * @brief Process-wide logger
 *
 * @code
 * util::Logger::instance().initialize(log_dir, "forensic-copy");
 * LOG_WARNING("HashEngine", std::format("Skipping {}: {}", path.string(), err.message));
 * @endcode
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log, creating the directory if needed
     * @return false if the directory or file cannot be opened
     *
     * Rotated files are named {app_name}.1.log ... {app_name}.N.log.
     */
    auto initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                    LogLevel min_level = LogLevel::INFO,
                    LogRotationPolicy policy = {}) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /// Mirror every line to stderr
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto timestamp_now() -> std::string;
    [[nodiscard]] static auto level_tag(LogLevel level) -> std::string_view;

    [[nodiscard]] auto active_path() const -> std::filesystem::path;
    [[nodiscard]] auto rotated_path(int index) const -> std::filesystem::path;

    void rotate_locked();
    auto open_locked() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t bytes_in_file_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
