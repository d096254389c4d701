#include "services/PackageActions.hpp"

#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

PackageActions::PackageActions(std::shared_ptr<IBridgeExecutor> executor,
                               std::shared_ptr<IDeviceRegistry> registry,
                               std::shared_ptr<PackageStreamService> stream)
    : executor_(std::move(executor)), registry_(std::move(registry)), stream_(std::move(stream)) {}

auto PackageActions::is_valid_package_name(std::string_view name) -> bool {
    return !name.empty() && std::ranges::all_of(name, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_';
    });
}

auto PackageActions::target_serial() -> util::Result<std::string> {
    auto device = registry_->default_device();
    if (!device) {
        return std::unexpected(device.error());
    }
    return device->serial;
}

auto PackageActions::uninstall(const std::string& package_name) -> util::Result<std::string> {
    if (!is_valid_package_name(package_name)) {
        return std::unexpected(util::Error(util::ErrorKind::COMMAND_FAILED, "Invalid package name"));
    }
    auto serial = target_serial();
    if (!serial) {
        return std::unexpected(serial.error());
    }

    LOG_INFO("PackageActions", std::format("Uninstalling {} on {}", package_name, *serial));
    auto output = executor_->run(
        {"-s", *serial, "shell", "pm", "uninstall", "-k", "--user", "0", package_name});
    if (!output) {
        LOG_ERROR("PackageActions",
                  std::format("Uninstall of {} failed: {}", package_name, output.error().message));
        return std::unexpected(output.error());
    }

    const auto trimmed = std::string(util::trim(*output));
    if (!util::contains_lower(trimmed, "success")) {
        LOG_WARNING("PackageActions",
                    std::format("Package manager refused {}: {}", package_name, trimmed));
        return std::unexpected(
            util::Error(util::ErrorKind::COMMAND_FAILED, std::format("Failed to uninstall: {}", trimmed)));
    }

    // Installed set changed, the cached listing no longer matches the device
    if (stream_) {
        stream_->clear_cache();
    }
    return std::format("Successfully uninstalled {}", package_name);
}

auto PackageActions::reinstall(const std::string& package_name) -> util::Result<std::string> {
    if (!is_valid_package_name(package_name)) {
        return std::unexpected(util::Error(util::ErrorKind::COMMAND_FAILED, "Invalid package name"));
    }
    auto serial = target_serial();
    if (!serial) {
        return std::unexpected(serial.error());
    }

    LOG_INFO("PackageActions", std::format("Reinstalling {} on {}", package_name, *serial));
    auto output = executor_->run(
        {"-s", *serial, "shell", "cmd", "package", "install-existing", package_name});
    if (!output) {
        return std::unexpected(output.error());
    }

    const auto trimmed = std::string(util::trim(*output));
    if (!util::contains_lower(trimmed, "installed") && !util::contains_lower(trimmed, "success")) {
        LOG_WARNING("PackageActions",
                    std::format("install-existing did not confirm {}: {}", package_name, trimmed));
        return std::unexpected(util::Error(util::ErrorKind::COMMAND_FAILED,
                                           std::format("Failed to reinstall: {}", trimmed)));
    }

    if (stream_) {
        stream_->clear_cache();
    }
    return std::format("Successfully reinstalled {}", package_name);
}
