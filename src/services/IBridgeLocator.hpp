/**
 * @file IBridgeLocator.hpp
 * @brief Interface for finding the adb executable
 */

#pragma once

#include "models/DeviceInfo.hpp"
#include "util/Result.hpp"

/**
 * @class IBridgeLocator
 * @brief Resolves and memoizes the adb executable
 */
class IBridgeLocator {
public:
    virtual ~IBridgeLocator() = default;

    /**
     * @brief Resolve adb, probing only on the first call after construction or invalidate()
     * @return Resolved executable, or BRIDGE_NOT_FOUND
     */
    [[nodiscard]] virtual auto resolve() -> std::expected<BridgeExecutable, util::Error> = 0;

    /**
     * @brief Forget the memoized result so the next resolve() probes again
     */
    virtual void invalidate() = 0;
};
