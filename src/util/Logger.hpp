/**
 * @file Logger.hpp
 * @brief Process-wide log file shared by the controller and the worker
 *
 * Lines look like
 *
 *     2026-10-19T14:32:45.123Z [INFO ] [run=1a2b] [FillService] Chunk 3 written
 *
 * The run tag only appears once a run context is set, so a worker log can be
 * matched against the RUN line of status.txt.
 */

#pragma once

#include "util/Result.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,  ///< Failed chunk, stale status file
    ERROR
};

/**
 * @brief When {app}.log is rolled over and how many old files survive
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;
    int max_files = 5;  ///< {app}.1.log is the newest rolled file
};

/**
 * @class Logger
 * @brief Singleton appending to {log_dir}/{app_name}.log
 *
 * Until initialize() succeeds nothing reaches disk; lines go to stderr only
 * if console output is on. Unit tests rely on that.
 */
class Logger {
public:
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Open {log_dir}/{app_name}.log for appending, closing any previous file
     * @return Error if the directory cannot be created or the file opened
     */
    auto initialize(const std::filesystem::path& log_dir, std::string_view app_name,
                    LogLevel min_level = LogLevel::INFO, LogRotationPolicy policy = {})
        -> Result<void>;

    [[nodiscard]] auto is_initialized() const -> bool;

    void log(LogLevel level, std::string_view component, std::string_view message);

    void set_min_level(LogLevel level);
    void set_console_output(bool enable);

    /**
     * @brief Tag subsequent lines with "[run=<id>]"; an empty id removes the tag
     */
    void set_run_context(std::string_view run_id);

    /**
     * @brief Active log file, or an empty path before initialize()
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] auto file_path(int generation) const -> std::filesystem::path;
    [[nodiscard]] auto compose(LogLevel level, std::string_view component,
                               std::string_view message) const -> std::string;

    // mutex_ held by the caller
    auto reopen() -> bool;
    void roll_over();
    void append(const std::string& line);

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    std::string run_tag_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t file_bytes_ = 0;
};

}  // namespace util

#define LOG_DEBUG(component, msg) ::util::Logger::instance().log(::util::LogLevel::DEBUG, component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().log(::util::LogLevel::INFO, component, msg)
#define LOG_WARNING(component, msg) \
    ::util::Logger::instance().log(::util::LogLevel::WARNING, component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().log(::util::LogLevel::ERROR, component, msg)
