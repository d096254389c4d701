/**
 * @file Logger.cpp
 * @brief Component logger implementation
 */

#include "util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <iostream>

namespace fs = std::filesystem;

namespace util {

Logger::~Logger() {
    shutdown();
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

auto Logger::initialize(const fs::path& log_dir, const std::string& app_name,
                        LogLevel min_level, LogRotationPolicy policy) -> bool {
    std::lock_guard lock(mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    log_dir_ = log_dir;
    app_name_ = app_name;
    min_level_ = min_level;
    policy_ = policy;
    initialized_ = false;

    std::error_code ec;
    fs::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << std::format("Logger: cannot create {}: {}\n", log_dir_.string(),
                                 ec.message());
        return false;
    }

    if (!open_file()) {
        return false;
    }

    initialized_ = true;
    write_line(std::format("{} [{}] [Logger] Logging to {} (level {})\n", timestamp(),
                           level_label(LogLevel::INFO), (log_dir_ / (app_name_ + ".log")).string(),
                           level_label(min_level_)));
    return true;
}

auto Logger::is_initialized() const -> bool {
    std::lock_guard lock(mutex_);
    return initialized_;
}

auto Logger::open_file() -> bool {
    const auto path = log_dir_ / (app_name_ + ".log");
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << std::format("Logger: cannot open {}\n", path.string());
        return false;
    }

    std::error_code ec;
    bytes_written_ = static_cast<size_t>(fs::file_size(path, ec));
    if (ec) {
        bytes_written_ = 0;
    }
    return true;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard lock(mutex_);
    if (level < min_level_) {
        return;
    }

    const auto line =
        std::format("{} [{}] [{}] {}\n", timestamp(), level_label(level), component, message);

    if (initialized_ && file_.is_open()) {
        if (bytes_written_ >= policy_.max_file_size_bytes) {
            rotate();
        }
        write_line(line);
    }

    if (console_output_) {
        std::cerr << line;
    }
}

void Logger::write_line(const std::string& line) {
    file_ << line;
    file_.flush();
    bytes_written_ += line.size();
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

auto Logger::get_log_file_path() const -> fs::path {
    std::lock_guard lock(mutex_);
    if (!initialized_) {
        return {};
    }
    return log_dir_ / (app_name_ + ".log");
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (initialized_ && file_.is_open()) {
        file_.flush();
        file_.close();
    }
    initialized_ = false;
}

auto Logger::parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warning" || lower == "warn") {
        return LogLevel::WARNING;
    }
    if (lower == "error") {
        return LogLevel::ERROR;
    }
    return std::nullopt;
}

auto Logger::timestamp() -> std::string {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", now);
}

auto Logger::level_label(LogLevel level) -> std::string_view {
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

void Logger::rotate() {
    file_.close();

    std::error_code ec;
    const auto rotated = [this](int index) {
        return log_dir_ / std::format("{}.{}.log", app_name_, index);
    };

    fs::remove(rotated(policy_.max_files), ec);
    for (int i = policy_.max_files - 1; i >= 1; --i) {
        if (fs::exists(rotated(i), ec)) {
            fs::rename(rotated(i), rotated(i + 1), ec);
        }
    }
    fs::rename(log_dir_ / (app_name_ + ".log"), rotated(1), ec);

    if (open_file()) {
        write_line(std::format("{} [{}] [Logger] Log file rotated\n", timestamp(),
                               level_label(LogLevel::INFO)));
    }
}

}  // namespace util
