/**
 * @file DeviceInfo.hpp
 * @brief Attached device and bridge executable descriptions
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * @enum ConnectionState
 * @brief Normalized adb device state
 */
enum class ConnectionState {
    READY,         ///< "device": authorized and usable
    OFFLINE,       ///< "offline"
    UNAUTHORIZED,  ///< "unauthorized"
    ABSENT         ///< Anything else (recovery, sideload, no permissions, ...)
};

[[nodiscard]] inline auto parse_connection_state(const std::string& state) -> ConnectionState {
    if (state == "device") {
        return ConnectionState::READY;
    }
    if (state == "offline") {
        return ConnectionState::OFFLINE;
    }
    if (state == "unauthorized") {
        return ConnectionState::UNAUTHORIZED;
    }
    return ConnectionState::ABSENT;
}

/**
 * @struct DeviceInfo
 * @brief One line of `adb devices -l`
 */
struct DeviceInfo {
    std::string serial;                                ///< Unique connection id, cache owner key
    std::string state;                                 ///< Raw state column
    ConnectionState connection = ConnectionState::ABSENT;
    std::optional<std::string> model;                  ///< model:Pixel_7
    std::optional<std::string> product;                ///< product:panther
    std::optional<std::string> device;                 ///< device:panther
    std::optional<std::string> transport_id;           ///< transport_id:1

    [[nodiscard]] auto is_ready() const -> bool { return connection == ConnectionState::READY; }
};

/**
 * @struct DeviceDetails
 * @brief Summary shown for the default device
 */
struct DeviceDetails {
    std::string name;             ///< Serial
    std::string model;            ///< ro.product.model
    std::string android_version;  ///< ro.build.version.release
    std::optional<int> battery_percent;
    std::string storage_available;  ///< Human readable, e.g. "12G"
};

/**
 * @struct BridgeExecutable
 * @brief Resolved adb binary
 */
struct BridgeExecutable {
    std::string path;               ///< Absolute path, or "adb" when found via PATH
    bool from_search_path = false;
};
