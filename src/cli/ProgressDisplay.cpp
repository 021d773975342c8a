/**
 * @file ProgressDisplay.cpp
 * @brief Single-line progress rendering for `storage-filler --start`
 */

#include "cli/ProgressDisplay.hpp"

#include <unistd.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>

namespace cli {

namespace {

namespace ansi {
constexpr std::string_view RESET = "\033[0m";
constexpr std::string_view BOLD = "\033[1m";
constexpr std::string_view GREEN = "\033[32m";
constexpr std::string_view YELLOW = "\033[33m";
constexpr std::string_view CYAN = "\033[36m";
constexpr std::string_view ERASE_LINE = "\r\033[K";
}  // namespace ansi

auto fixed(double value, int precision) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

auto two_digits(int64_t value) -> std::string {
    return value < 10 ? "0" + std::to_string(value) : std::to_string(value);
}

}  // namespace

ProgressDisplay::ProgressDisplay(std::string work_dir, double target_size_bytes,
                                 int64_t chunk_size_bytes)
    : work_dir_(std::move(work_dir)), target_size_bytes_(target_size_bytes),
      chunk_size_bytes_(chunk_size_bytes), color_enabled_(is_terminal()) {}

auto ProgressDisplay::is_terminal() -> bool {
    return ::isatty(STDOUT_FILENO) == 1;
}

void ProgressDisplay::set_color_enabled(bool enable) {
    color_enabled_ = enable;
}

auto ProgressDisplay::percentage(double size_bytes, double target_bytes) -> double {
    if (target_bytes <= 0.0) {
        return 100.0;
    }
    return std::clamp(size_bytes / target_bytes * 100.0, 0.0, 100.0);
}

void ProgressDisplay::update(const JobState& state) {
    if (!header_printed_) {
        std::cout << '\n'
                  << paint("Filling " + work_dir_ + "\nTarget: " + format_bytes(target_size_bytes_) +
                               ", chunk size: " +
                               format_bytes(static_cast<double>(chunk_size_bytes_)),
                           ansi::BOLD)
                  << std::endl;
        header_printed_ = true;
    }

    const double size_bytes = state.current_size_gb * BYTES_PER_GB;
    const auto observed_at = std::chrono::steady_clock::now();
    if (!have_baseline_) {
        have_baseline_ = true;
        baseline_size_bytes_ = size_bytes;
        baseline_time_ = observed_at;
    }

    std::string label = state.writing ? "Writing in progress" : "Idle";
    if (state.writing && state.stop_requested) {
        label += " (stopping)";
    }

    const double percent = percentage(size_bytes, target_size_bytes_);
    std::ostringstream line;
    line << paint(label, state.writing ? ansi::CYAN : ansi::YELLOW) << ' ' << render_bar(percent)
         << ' ' << std::setw(6) << (fixed(percent, 1) + "%");
    line << "  |  " << format_bytes(size_bytes) << " / " << format_bytes(target_size_bytes_);
    line << "  |  " << state.file_count << " files";
    if (state.error_count > 0) {
        line << ", " << state.error_count << " errors";
    }

    // Averaged since the first update of this display
    const double seconds = std::chrono::duration<double>(observed_at - baseline_time_).count();
    const double gained = size_bytes - baseline_size_bytes_;
    if (seconds > 0.0 && gained > 0.0) {
        const double rate = gained / seconds;
        line << "  |  " << format_bytes(rate) << "/s";
        if (size_bytes < target_size_bytes_) {
            auto eta = static_cast<int64_t>(std::ceil((target_size_bytes_ - size_bytes) / rate));
            line << "  |  ETA: " << format_duration(eta);
        }
    }

    rewind_line();
    std::cout << line.str() << std::flush;
}

void ProgressDisplay::complete(const JobState& state) {
    rewind_line();

    std::string_view verdict = "[STOPPED] Cancelled: ";
    if (state.terminal == TerminalState::DONE) {
        verdict = "[OK] Target reached: ";
    } else if (state.worker_exited_without_status) {
        verdict = "[STOPPED] Worker exited without reporting a final status: ";
    }

    std::string summary(verdict);
    summary += fixed(state.current_size_gb, 3) + " GB (" +
               format_bytes(state.current_size_gb * BYTES_PER_GB) + ") in " +
               std::to_string(state.file_count) + " files";
    if (state.error_count > 0) {
        summary += ", " + std::to_string(state.error_count) + " failed chunk writes";
    }

    std::string style(state.terminal == TerminalState::DONE ? ansi::GREEN : ansi::YELLOW);
    style += ansi::BOLD;
    std::cout << '\n' << paint(summary, style) << "\n\n" << std::flush;
}

auto ProgressDisplay::format_bytes(double bytes) -> std::string {
    static constexpr std::string_view UNITS[] = {"KB", "MB", "GB", "TB"};

    if (bytes < 1024.0) {
        return std::to_string(static_cast<int64_t>(std::max(bytes, 0.0))) + " B";
    }
    size_t unit = 0;
    double scaled = bytes / 1024.0;
    while (scaled >= 1024.0 && unit + 1 < std::size(UNITS)) {
        scaled /= 1024.0;
        ++unit;
    }
    return fixed(scaled, 1) + " " + std::string(UNITS[unit]);
}

auto ProgressDisplay::format_duration(int64_t seconds) -> std::string {
    if (seconds < 0) {
        return "--:--";
    }
    const auto h = seconds / 3600;
    const auto m = seconds / 60 % 60;
    const auto s = seconds % 60;
    if (h == 0) {
        return two_digits(m) + ":" + two_digits(s);
    }
    return std::to_string(h) + ":" + two_digits(m) + ":" + two_digits(s);
}

auto ProgressDisplay::render_bar(double percent) const -> std::string {
    const int cells = std::clamp(static_cast<int>(std::lround(percent * BAR_WIDTH / 100.0)), 0,
                                 BAR_WIDTH);

    std::string done;
    std::string pending;
    for (int cell = 0; cell < BAR_WIDTH; ++cell) {
        if (cell < cells) {
            done += color_enabled_ ? "█" : "#";
        } else {
            pending += color_enabled_ ? "░" : ".";
        }
    }
    return "[" + paint(done, ansi::GREEN) + pending + "]";
}

auto ProgressDisplay::paint(std::string_view text, std::string_view color) const -> std::string {
    if (!color_enabled_ || color.empty()) {
        return std::string(text);
    }
    return std::string(color) + std::string(text) + std::string(ansi::RESET);
}

void ProgressDisplay::rewind_line() {
    std::cout << (is_terminal() ? ansi::ERASE_LINE : std::string_view{"\n"});
}

}  // namespace cli
