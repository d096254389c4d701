/**
 * @file Result.hpp
 * @brief Typed error taxonomy for bridge operations
 *
 * Every fallible operation returns std::expected<T, util::Error>. The kind
 * is assigned once, by the bridge executor, and propagated unchanged by the
 * components above it.
 */

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace util {

/**
 * @enum ErrorKind
 * @brief Classification of a failed bridge interaction
 */
enum class ErrorKind {
    BRIDGE_NOT_FOUND,     ///< No usable adb executable
    NO_DEVICE_CONNECTED,  ///< No ready device attached
    DEVICE_OFFLINE,       ///< Device attached but offline
    DEVICE_UNAUTHORIZED,  ///< USB debugging authorization pending
    SERVER_NOT_RUNNING,   ///< adb daemon unreachable
    PERMISSION_DENIED,    ///< Device or host refused the operation
    TIMEOUT,              ///< Command exceeded its deadline
    COMMAND_FAILED,       ///< Any other non-zero exit
    PARSE_ERROR,          ///< Output did not match the expected format
    IO_ERROR              ///< Local filesystem failure
};

/**
 * @struct Error
 * @brief Represents an error with a kind, detail message and optional code
 */
struct Error {
    ErrorKind kind = ErrorKind::COMMAND_FAILED;
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int err_code = 0)
        : message(std::move(msg)), code(err_code) {}
    Error(ErrorKind err_kind, std::string msg, int err_code = 0)
        : kind(err_kind), message(std::move(msg)), code(err_code) {}

    [[nodiscard]] auto what() const -> const std::string& {
        return message;
    }

    /**
     * @brief Human readable description suitable for end users
     */
    [[nodiscard]] auto user_message() const -> std::string {
        switch (kind) {
            case ErrorKind::BRIDGE_NOT_FOUND:
                return "ADB (Android Debug Bridge) not found. Please install Android SDK "
                       "Platform Tools.";
            case ErrorKind::NO_DEVICE_CONNECTED:
                return "No Android device connected. Please connect a device via USB or TCP.";
            case ErrorKind::DEVICE_OFFLINE:
                return "Device is offline. Please reconnect the device.";
            case ErrorKind::DEVICE_UNAUTHORIZED:
                return "Device is unauthorized. Please check the device screen for USB "
                       "debugging authorization prompt.";
            case ErrorKind::SERVER_NOT_RUNNING:
                return "ADB server is not running. Try restarting the ADB server.";
            case ErrorKind::PERMISSION_DENIED:
                return "Permission denied. Some operations require root access.";
            case ErrorKind::TIMEOUT:
                return "ADB command timed out. The device may be unresponsive.";
            case ErrorKind::COMMAND_FAILED:
                return "ADB command failed: " + message;
            case ErrorKind::PARSE_ERROR:
                return "Failed to parse ADB output: " + message;
            case ErrorKind::IO_ERROR:
                return "File operation failed: " + message;
        }
        return message;
    }
};

[[nodiscard]] constexpr auto error_kind_name(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::BRIDGE_NOT_FOUND: return "bridge_not_found";
        case ErrorKind::NO_DEVICE_CONNECTED: return "no_device_connected";
        case ErrorKind::DEVICE_OFFLINE: return "device_offline";
        case ErrorKind::DEVICE_UNAUTHORIZED: return "device_unauthorized";
        case ErrorKind::SERVER_NOT_RUNNING: return "server_not_running";
        case ErrorKind::PERMISSION_DENIED: return "permission_denied";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::COMMAND_FAILED: return "command_failed";
        case ErrorKind::PARSE_ERROR: return "parse_error";
        case ErrorKind::IO_ERROR: return "io_error";
    }
    return "unknown";
}

/// Shorthand used throughout the service layer
template<typename T>
using Result = std::expected<T, Error>;

} // namespace util
