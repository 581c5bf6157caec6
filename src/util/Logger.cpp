/**
 * @file Logger.cpp
 * @brief Logger implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>

namespace util {

auto parse_log_level(std::string_view text) -> std::optional<LogLevel> {
    std::string lowered(text);
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::DEBUG;
    }
    if (lowered == "info") {
        return LogLevel::INFO;
    }
    if (lowered == "warning" || lowered == "warn") {
        return LogLevel::WARNING;
    }
    if (lowered == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::initialize(const std::filesystem::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }
    initialized_ = false;

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << std::format("Logger: cannot create {}: {}\n", log_dir_.string(), ec.message());
        return false;
    }

    if (!open_locked()) {
        return false;
    }
    initialized_ = true;

    const auto line = std::format("{} [{}] [Logger] Opened {} (level={}, rotate at {} bytes x {})\n",
                                  timestamp_now(), level_tag(LogLevel::INFO),
                                  active_path().string(), level_tag(min_level_),
                                  policy_.max_file_size_bytes, policy_.max_files);
    file_ << line << std::flush;
    bytes_in_file_ += line.size();
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::active_path() const -> std::filesystem::path {
    return log_dir_ / (app_name_ + ".log");
}

auto Logger::rotated_path(int index) const -> std::filesystem::path {
    return log_dir_ / std::format("{}.{}.log", app_name_, index);
}

auto Logger::open_locked() -> bool {
    const auto path = active_path();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << std::format("Logger: cannot open {}\n", path.string());
        return false;
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    bytes_in_file_ = ec ? 0 : static_cast<size_t>(size);
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);

    if (level < min_level_) {
        return;
    }

    const auto line =
        std::format("{} [{}] [{}] {}\n", timestamp_now(), level_tag(level), component, message);

    if (initialized_ && file_.is_open()) {
        if (bytes_in_file_ >= policy_.max_file_size_bytes) {
            rotate_locked();
        }
        if (file_.is_open()) {
            file_ << line;
            file_.flush();
            bytes_in_file_ += line.size();
        }
    }

    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::debug(std::string_view component, std::string_view message) {
    log(LogLevel::DEBUG, component, message);
}

void Logger::info(std::string_view component, std::string_view message) {
    log(LogLevel::INFO, component, message);
}

void Logger::warning(std::string_view component, std::string_view message) {
    log(LogLevel::WARNING, component, message);
}

void Logger::error(std::string_view component, std::string_view message) {
    log(LogLevel::ERROR, component, message);
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard lock(mutex_);
    min_level_ = level;
}

auto Logger::get_min_level() const -> LogLevel {
    std::lock_guard lock(mutex_);
    return min_level_;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard lock(mutex_);
    console_output_ = enable;
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    return initialized_ ? active_path() : std::filesystem::path{};
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (initialized_ && file_.is_open()) {
        file_ << std::format("{} [{}] [Logger] Closing log\n", timestamp_now(),
                             level_tag(LogLevel::INFO));
        file_.close();
    }
    initialized_ = false;
}

auto Logger::timestamp_now() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::floor<std::chrono::seconds>(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    return std::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", seconds, millis);
}

auto Logger::level_tag(LogLevel level) -> std::string_view {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO ";
        case LogLevel::WARNING:
            return "WARN ";
        case LogLevel::ERROR:
            return "ERROR";
    }
    return "?????";
}

void Logger::rotate_locked() {
    file_.close();

    std::error_code ec;
    std::filesystem::remove(rotated_path(policy_.max_files), ec);
    for (int index = policy_.max_files - 1; index >= 1; --index) {
        if (std::filesystem::exists(rotated_path(index), ec)) {
            std::filesystem::rename(rotated_path(index), rotated_path(index + 1), ec);
        }
    }
    std::filesystem::rename(active_path(), rotated_path(1), ec);

    if (!open_locked()) {
        initialized_ = false;
    }
}

}  // namespace util
