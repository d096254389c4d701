#include "core/ServiceContext.hpp"

#include "util/Logger.hpp"

#include <format>

ServiceContext::ServiceContext(const ServiceConfig& config, std::shared_ptr<IEventSink> sink) {
    if (!sink) {
        sink = std::make_shared<NullEventSink>();
    }

    runner_ = std::make_shared<ProcessRunner>();
    locator_ = std::make_shared<BridgeLocator>(runner_, config.bridge_override);
    executor_ = std::make_shared<BridgeExecutor>(locator_, runner_, config.command_timeout);
    devices_ = std::make_shared<DeviceRegistry>(executor_);
    packages_ = std::make_shared<PackageStreamService>(executor_, devices_, sink);
    actions_ = std::make_shared<PackageActions>(executor_, devices_, packages_);
    health_ = std::make_shared<HealthMonitor>(executor_, sink);
    backups_ = std::make_shared<BackupService>(
        executor_, devices_, actions_,
        config.backup_directory.value_or(BackupService::default_directory()));

    LOG_DEBUG("ServiceContext",
              std::format("Services ready (timeout {} ms, backups in {})", config.command_timeout.count(),
                          backups_->directory().string()));
}
