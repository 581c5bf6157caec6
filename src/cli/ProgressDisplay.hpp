/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for CLI jobs
 */

#pragma once

#include "models/OperationTypes.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Displays a progress bar with percentage, file count, speed and ETA.
 * Falls back to one line per update when stdout is not a terminal.
 */
class ProgressDisplay {
public:
    /**
     * @param operation Verb shown in the header (e.g. "Copying")
     * @param subject What is being processed
     */
    ProgressDisplay(std::string operation, std::string subject);

    void update(const OperationProgress& progress);

    /**
     * @brief Mark the operation as complete
     * @param success Whether the operation succeeded
     * @param message Final status message
     */
    void complete(bool success, const std::string& message);

    void set_color_enabled(bool enable);

    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief Format bytes as human-readable string (e.g., "245.0 MB")
     */
    [[nodiscard]] static auto format_bytes(uint64_t bytes) -> std::string;

    [[nodiscard]] static auto format_speed(uint64_t bytes_per_sec) -> std::string;

    /**
     * @brief Format duration as human-readable string (e.g., "12:34")
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto generate_progress_bar(double percentage) const -> std::string;

    void clear_line();

    std::string operation_;
    std::string subject_;
    bool color_enabled_ = true;
    bool header_printed_ = false;
    int last_printed_percent_ = -1;
    std::chrono::steady_clock::time_point start_time_;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
