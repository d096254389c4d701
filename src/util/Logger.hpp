/**
 * @file Logger.hpp
 * @brief Thread-safe component logger with size-based file rotation
 *
 * Lines are written as `<ISO 8601 UTC> [LEVEL] [Component] message`.
 * Before initialize() is called, messages only reach stderr when console
 * output is enabled, so library code can log unconditionally.
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

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Command lines, cache hits, parse details
    INFO,     ///< Device changes, stream completion
    WARNING,  ///< Recoverable failures (single metric, unreadable backup)
    ERROR     ///< Failures surfaced to the user
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 5 * 1024 * 1024;  ///< Rotate once the active file reaches this
    int max_files = 5;                              ///< Rotated files kept as name.N.log
};

/**
 * @class Logger
 * @brief Process-wide logger used through the LOG_* macros
 *
 * @code
 * util::Logger::instance().initialize(log_dir, "adb-debloater-cli");
 * LOG_INFO("DeviceRegistry", std::format("{} device(s) ready", devices.size()));
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
     * @brief Open {log_dir}/{app_name}.log for appending
     * @return false if the directory or file could not be created
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

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /// Mirror every accepted line to stderr
    void set_console_output(bool enable);

    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    void shutdown();

    /**
     * @brief Parse "debug", "info", "warning"/"warn" or "error"
     */
    [[nodiscard]] static auto parse_level(std::string_view name) -> std::optional<LogLevel>;

private:
    Logger() = default;
    ~Logger();

    [[nodiscard]] static auto timestamp() -> std::string;
    [[nodiscard]] static auto level_label(LogLevel level) -> std::string_view;

    void write_line(const std::string& line);
    void rotate();
    auto open_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t bytes_written_ = 0;
};

#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
