/**
 * @file IDeviceRegistry.hpp
 * @brief Interface for discovering attached devices
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "util/Result.hpp"

#include <vector>

/**
 * @class IDeviceRegistry
 * @brief Enumerates ready devices behind a short-lived cache
 */
class IDeviceRegistry {
public:
    virtual ~IDeviceRegistry() = default;

    /**
     * @brief List devices in state "device"
     * @param force_refresh Bypass the cache even if it is still fresh
     * @return Ready devices in adb's order
     */
    [[nodiscard]] virtual auto list_devices(bool force_refresh)
        -> std::expected<std::vector<DeviceInfo>, util::Error> = 0;

    /**
     * @brief First ready device, or NO_DEVICE_CONNECTED
     */
    [[nodiscard]] virtual auto default_device() -> std::expected<DeviceInfo, util::Error> = 0;

    virtual void invalidate_cache() = 0;
};
