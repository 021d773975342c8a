/**
 * @file Logger.cpp
 * @brief Log file writer with size based rollover
 */

#include "util/Logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace util {

namespace {

auto level_name(LogLevel level) -> std::string_view {
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

auto utc_timestamp() -> std::string {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto since_epoch = duration_cast<milliseconds>(now.time_since_epoch());
    std::time_t whole_seconds = system_clock::to_time_t(now);

    std::tm parts{};
    gmtime_r(&whole_seconds, &parts);

    std::ostringstream out;
    out << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << (since_epoch.count() % 1000) << 'Z';
    return out.str();
}

}  // namespace

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::initialize(const std::filesystem::path& log_dir, std::string_view app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> Result<void> {
    std::lock_guard guard(mutex_);

    file_.close();
    initialized_ = false;
    log_dir_ = log_dir;
    app_name_.assign(app_name);
    min_level_ = min_level;
    policy_ = policy;

    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        return make_error("Cannot create log directory " + log_dir_.string() + ": " + ec.message(),
                          ec.value());
    }
    if (!reopen()) {
        return make_error("Cannot open log file " + file_path(0).string());
    }

    initialized_ = true;
    append(compose(LogLevel::INFO, "Logger", "Opened " + file_path(0).string()));
    return {};
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard guard(mutex_);
    return initialized_;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard guard(mutex_);
    if (level < min_level_) {
        return;
    }

    auto line = compose(level, component, message);
    if (initialized_) {
        if (file_bytes_ >= policy_.max_file_size_bytes) {
            roll_over();
        }
        if (initialized_) {
            append(line);
        }
    }
    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard guard(mutex_);
    min_level_ = level;
}

void Logger::set_console_output(bool enable) {
    std::lock_guard guard(mutex_);
    console_output_ = enable;
}

void Logger::set_run_context(std::string_view run_id) {
    std::lock_guard guard(mutex_);
    run_tag_ = run_id.empty() ? std::string{} : "[run=" + std::string(run_id) + "] ";
}

auto Logger::get_log_file_path() const -> std::filesystem::path {
    std::lock_guard guard(mutex_);
    return initialized_ ? file_path(0) : std::filesystem::path{};
}

void Logger::shutdown() {
    std::lock_guard guard(mutex_);
    if (initialized_) {
        append(compose(LogLevel::INFO, "Logger", "Closed"));
    }
    file_.close();
    initialized_ = false;
    run_tag_.clear();
}

auto Logger::file_path(int generation) const -> std::filesystem::path {
    if (generation == 0) {
        return log_dir_ / (app_name_ + ".log");
    }
    return log_dir_ / (app_name_ + "." + std::to_string(generation) + ".log");
}

auto Logger::compose(LogLevel level, std::string_view component, std::string_view message) const
    -> std::string {
    std::string line = utc_timestamp();
    line += " [";
    line += level_name(level);
    line += "] ";
    line += run_tag_;
    line += '[';
    line += component;
    line += "] ";
    line += message;
    line += '\n';
    return line;
}

auto Logger::reopen() -> bool {
    file_.open(file_path(0), std::ios::out | std::ios::app);
    if (!file_) {
        return false;
    }
    std::error_code ec;
    auto existing = std::filesystem::file_size(file_path(0), ec);
    file_bytes_ = ec ? 0 : static_cast<size_t>(existing);
    return true;
}

void Logger::roll_over() {
    file_.close();

    // Oldest generation falls off, the rest shift up, the active file becomes .1
    std::error_code ec;
    std::filesystem::remove(file_path(policy_.max_files), ec);
    for (int generation = policy_.max_files; generation > 1; --generation) {
        std::filesystem::rename(file_path(generation - 1), file_path(generation), ec);
    }
    if (policy_.max_files > 0) {
        std::filesystem::rename(file_path(0), file_path(1), ec);
    } else {
        std::filesystem::remove(file_path(0), ec);
    }

    if (!reopen()) {
        initialized_ = false;
        std::cerr << "Logger: cannot reopen " << file_path(0) << " after rollover" << std::endl;
        return;
    }
    append(compose(LogLevel::INFO, "Logger", "Rolled over"));
}

void Logger::append(const std::string& line) {
    file_ << line << std::flush;
    file_bytes_ += line.size();
}

}  // namespace util
