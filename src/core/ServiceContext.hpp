/**
 * @file ServiceContext.hpp
 * @brief Composition root wiring the bridge, device and package services together
 */

#pragma once

#include "core/IEventSink.hpp"
#include "services/BackupService.hpp"
#include "services/BridgeExecutor.hpp"
#include "services/BridgeLocator.hpp"
#include "services/DeviceRegistry.hpp"
#include "services/HealthMonitor.hpp"
#include "services/PackageActions.hpp"
#include "services/PackageStreamService.hpp"
#include "services/ProcessRunner.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

/**
 * @struct ServiceConfig
 * @brief Runtime settings shared by every service
 */
struct ServiceConfig {
    std::optional<std::string> bridge_override;                     ///< Explicit adb executable
    std::chrono::milliseconds command_timeout = BridgeExecutor::DEFAULT_TIMEOUT;
    std::optional<std::filesystem::path> backup_directory;          ///< Defaults to the documents dir
};

/**
 * @class ServiceContext
 * @brief Owns one instance of each service for the lifetime of the process
 *
 * All services share a single locator so the adb path is probed once, and
 * all events go to the sink given at construction.
 */
class ServiceContext {
public:
    ServiceContext(const ServiceConfig& config, std::shared_ptr<IEventSink> sink);

    ServiceContext(const ServiceContext&) = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    [[nodiscard]] auto locator() const -> const std::shared_ptr<BridgeLocator>& { return locator_; }
    [[nodiscard]] auto executor() const -> const std::shared_ptr<BridgeExecutor>& { return executor_; }
    [[nodiscard]] auto devices() const -> const std::shared_ptr<DeviceRegistry>& { return devices_; }
    [[nodiscard]] auto packages() const -> const std::shared_ptr<PackageStreamService>& { return packages_; }
    [[nodiscard]] auto actions() const -> const std::shared_ptr<PackageActions>& { return actions_; }
    [[nodiscard]] auto health() const -> const std::shared_ptr<HealthMonitor>& { return health_; }
    [[nodiscard]] auto backups() const -> const std::shared_ptr<BackupService>& { return backups_; }

private:
    std::shared_ptr<ProcessRunner> runner_;
    std::shared_ptr<BridgeLocator> locator_;
    std::shared_ptr<BridgeExecutor> executor_;
    std::shared_ptr<DeviceRegistry> devices_;
    std::shared_ptr<PackageStreamService> packages_;
    std::shared_ptr<PackageActions> actions_;
    std::shared_ptr<HealthMonitor> health_;
    std::shared_ptr<BackupService> backups_;
};
