/**
 * @file ProgressDisplay.cpp
 * @brief Terminal progress display implementation
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>
#include <utility>

namespace cli {

namespace {

// ANSI color codes
constexpr auto RESET = "\033[0m";
constexpr auto BOLD = "\033[1m";
constexpr auto GREEN = "\033[32m";
constexpr auto RED = "\033[31m";
constexpr auto CYAN = "\033[36m";

}  // namespace

ProgressDisplay::ProgressDisplay(std::string operation, std::string subject)
    : operation_(std::move(operation)), subject_(std::move(subject)),
      start_time_(std::chrono::steady_clock::now()) {
    color_enabled_ = is_terminal();
}

auto ProgressDisplay::is_terminal() -> bool {
    return isatty(STDOUT_FILENO) != 0;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

void ProgressDisplay::update(const OperationProgress& progress) {
    if (!header_printed_) {
        std::cout << "\n";
        if (color_enabled_) {
            std::cout << BOLD;
        }
        std::cout << operation_ << " " << subject_ << "\n";
        if (color_enabled_) {
            std::cout << RESET;
        }
        std::cout << std::flush;
        header_printed_ = true;
    }

    // Without a terminal every redraw becomes a new line; only print changes
    if (!is_terminal() && progress.percent == last_printed_percent_) {
        return;
    }
    last_printed_percent_ = progress.percent;

    std::string status_line =
        std::format("{} {:3d}%", generate_progress_bar(progress.percent), progress.percent);

    if (progress.total_files > 0) {
        status_line += std::format("  |  {}/{} files", progress.files_processed,
                                   progress.total_files);
    }

    if (progress.speed_bytes_per_sec > 0) {
        status_line += "  |  " + format_speed(progress.speed_bytes_per_sec);
        if (progress.total_bytes > progress.bytes_processed) {
            const auto remaining = progress.total_bytes - progress.bytes_processed;
            status_line += "  |  ETA: " + format_duration(static_cast<int64_t>(
                                              remaining / progress.speed_bytes_per_sec));
        }
    }

    clear_line();
    if (color_enabled_ && !progress.message.empty()) {
        std::cout << CYAN << progress.message << RESET << "  ";
    } else if (!progress.message.empty()) {
        std::cout << progress.message << "  ";
    }
    std::cout << status_line << std::flush;
}

void ProgressDisplay::complete(bool success, const std::string& message) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_);

    clear_line();
    std::cout << "\n";

    if (color_enabled_) {
        std::cout << (success ? GREEN : RED) << BOLD;
    }

    std::cout << (success ? "[OK] " : "[FAILED] ") << message << " ("
              << format_duration(elapsed.count()) << ")";

    if (color_enabled_) {
        std::cout << RESET;
    }

    std::cout << "\n" << std::endl;
}

auto ProgressDisplay::format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;
    constexpr uint64_t TB = GB * 1024;

    if (bytes >= TB) {
        return std::format("{:.1f} TB", static_cast<double>(bytes) / static_cast<double>(TB));
    } else if (bytes >= GB) {
        return std::format("{:.1f} GB", static_cast<double>(bytes) / static_cast<double>(GB));
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / static_cast<double>(MB));
    } else if (bytes >= KB) {
        return std::format("{:.1f} KB", static_cast<double>(bytes) / static_cast<double>(KB));
    }
    return std::format("{} B", bytes);
}

auto ProgressDisplay::format_speed(uint64_t bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }

    const int64_t hours = seconds / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    if (hours > 0) {
        return std::format("{}:{:02d}:{:02d}", hours, minutes, secs);
    }
    return std::format("{:02d}:{:02d}", minutes, secs);
}

auto ProgressDisplay::generate_progress_bar(double percentage) const -> std::string {
    int filled = static_cast<int>(std::round(percentage / 100.0 * BAR_WIDTH));
    filled = std::clamp(filled, 0, BAR_WIDTH);

    std::string bar = "[";
    if (color_enabled_) {
        bar += GREEN;
    }
    for (int i = 0; i < filled; ++i) {
        bar += "█";
    }
    if (color_enabled_) {
        bar += RESET;
    }
    for (int i = filled; i < BAR_WIDTH; ++i) {
        bar += "░";
    }
    bar += "]";
    return bar;
}

void ProgressDisplay::clear_line() {
    if (is_terminal()) {
        std::cout << "\r\033[K";
    } else {
        std::cout << "\n";
    }
}

}  // namespace cli
