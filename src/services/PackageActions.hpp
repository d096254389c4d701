/**
 * @file PackageActions.hpp
 * @brief Removal and restoration of packages for the current user
 */

#pragma once

#include "services/IBridgeExecutor.hpp"
#include "services/IDeviceRegistry.hpp"
#include "services/PackageStreamService.hpp"
#include "util/Result.hpp"

#include <memory>
#include <string>
#include <string_view>

/**
 * @class PackageActions
 * @brief Uninstalls packages for user 0 and brings them back with install-existing
 *
 * Both operations are reversible on a stock device: `pm uninstall -k --user 0`
 * keeps the APK and data on the system partition.
 */
class PackageActions {
public:
    /**
     * @param stream Package enumerator whose cache is dropped after a removal; may be null
     */
    PackageActions(std::shared_ptr<IBridgeExecutor> executor,
                   std::shared_ptr<IDeviceRegistry> registry,
                   std::shared_ptr<PackageStreamService> stream = nullptr);

    /**
     * @brief Remove a package for the current user on the default device
     * @return Confirmation message on success
     */
    auto uninstall(const std::string& package_name) -> util::Result<std::string>;

    /**
     * @brief Reinstall a package previously removed for the current user
     */
    auto reinstall(const std::string& package_name) -> util::Result<std::string>;

    /**
     * @brief Non-empty and made only of letters, digits, '.' and '_'
     */
    [[nodiscard]] static auto is_valid_package_name(std::string_view name) -> bool;

private:
    auto target_serial() -> util::Result<std::string>;

    std::shared_ptr<IBridgeExecutor> executor_;
    std::shared_ptr<IDeviceRegistry> registry_;
    std::shared_ptr<PackageStreamService> stream_;
};
