/**
 * @file ProgressDisplay.hpp
 * @brief Terminal progress display for a running fill job
 */

#pragma once

#include "models/FillTypes.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace cli {

/**
 * @class ProgressDisplay
 * @brief ANSI terminal progress bar display
 *
 * Renders the controller's job state on every poll: status, size against
 * target, files created, speed and ETA. Speed is averaged over the sizes
 * observed since the first update. Uses ANSI escape codes for cursor control
 * and formatting when stdout is a terminal.
 */
class ProgressDisplay {
public:
    /**
     * @brief Construct a progress display
     * @param work_dir Directory being filled (for display)
     * @param target_size_bytes Target directory size
     * @param chunk_size_bytes Size of each chunk file
     */
    ProgressDisplay(std::string work_dir, double target_size_bytes, int64_t chunk_size_bytes);

    /**
     * @brief Update the progress display
     * @param state Current job state
     */
    void update(const JobState& state);

    /**
     * @brief Print the final line for a job that stopped writing
     */
    void complete(const JobState& state);

    /**
     * @brief Enable or disable ANSI color output
     * @param enable Whether to use colors
     */
    void set_color_enabled(bool enable);

    /**
     * @brief Check if terminal supports ANSI codes
     * @return true if terminal supports ANSI
     */
    [[nodiscard]] static auto is_terminal() -> bool;

    /**
     * @brief min(100, size / target * 100); 100 for a non-positive target
     */
    [[nodiscard]] static auto percentage(double size_bytes, double target_bytes) -> double;

    /**
     * @brief Format bytes as human-readable string (e.g., "245.0 MB")
     */
    [[nodiscard]] static auto format_bytes(double bytes) -> std::string;

    /**
     * @brief Format duration as human-readable string (e.g., "12:34")
     */
    [[nodiscard]] static auto format_duration(int64_t seconds) -> std::string;

private:
    [[nodiscard]] auto render_bar(double percent) const -> std::string;
    [[nodiscard]] auto paint(std::string_view text, std::string_view color) const -> std::string;

    // "\r" plus erase on a terminal, a plain newline when redirected
    static void rewind_line();

    std::string work_dir_;
    double target_size_bytes_;
    int64_t chunk_size_bytes_;
    bool color_enabled_ = true;
    bool header_printed_ = false;

    bool have_baseline_ = false;
    double baseline_size_bytes_ = 0.0;
    std::chrono::steady_clock::time_point baseline_time_;

    static constexpr int BAR_WIDTH = 30;
};

}  // namespace cli
