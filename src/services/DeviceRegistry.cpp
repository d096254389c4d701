#include "services/DeviceRegistry.hpp"

#include "services/HealthParsers.hpp"
#include "util/Logger.hpp"
#include "util/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

DeviceRegistry::DeviceRegistry(std::shared_ptr<IBridgeExecutor> executor, util::Clock clock)
    : executor_(std::move(executor)), clock_(std::move(clock)) {}

auto DeviceRegistry::parse_device_list(std::string_view output) -> std::vector<DeviceInfo> {
    std::vector<DeviceInfo> devices;

    for (auto line : util::split_lines(output)) {
        line = util::trim(line);
        if (line.empty() || line.starts_with("List of devices") || line.starts_with("*")) {
            continue;
        }

        const auto tokens = util::split_whitespace(line);
        if (tokens.size() < 2) {
            continue;
        }

        DeviceInfo device;
        device.serial = std::string(tokens[0]);
        device.state = std::string(tokens[1]);
        device.connection = parse_connection_state(device.state);

        for (size_t i = 2; i < tokens.size(); ++i) {
            const auto colon = tokens[i].find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            const auto key = tokens[i].substr(0, colon);
            auto value = std::string(tokens[i].substr(colon + 1));
            if (key == "model") {
                device.model = std::move(value);
            } else if (key == "product") {
                device.product = std::move(value);
            } else if (key == "device") {
                device.device = std::move(value);
            } else if (key == "transport_id") {
                device.transport_id = std::move(value);
            }
        }

        devices.push_back(std::move(device));
    }

    return devices;
}

auto DeviceRegistry::list_devices(bool force_refresh)
    -> std::expected<std::vector<DeviceInfo>, util::Error> {
    if (!force_refresh) {
        std::lock_guard lock{cache_mutex_};
        if (cache_.is_fresh(clock_())) {
            return cache_.value();
        }
    }

    auto output = executor_->run({"devices", "-l"});
    if (!output) {
        return std::unexpected(output.error());
    }

    auto devices = parse_device_list(*output);
    const auto total = devices.size();
    std::erase_if(devices, [](const DeviceInfo& device) { return !device.is_ready(); });
    LOG_DEBUG("DeviceRegistry", std::format("{} device(s) listed, {} ready", total, devices.size()));

    std::lock_guard lock{cache_mutex_};
    cache_.store(devices, clock_());
    return devices;
}

auto DeviceRegistry::default_device() -> std::expected<DeviceInfo, util::Error> {
    auto devices = list_devices(false);
    if (!devices) {
        return std::unexpected(devices.error());
    }
    if (devices->empty()) {
        return std::unexpected(
            util::Error{util::ErrorKind::NO_DEVICE_CONNECTED, "No ready device attached"});
    }
    return devices->front();
}

void DeviceRegistry::invalidate_cache() {
    std::lock_guard lock{cache_mutex_};
    cache_.reset();
}

auto DeviceRegistry::start_server() -> std::expected<void, util::Error> {
    auto result = executor_->run({"start-server"});
    invalidate_cache();
    if (!result) {
        return std::unexpected(result.error());
    }
    LOG_INFO("DeviceRegistry", "adb server started");
    return {};
}

auto DeviceRegistry::kill_server() -> std::expected<void, util::Error> {
    auto result = executor_->run({"kill-server"});
    invalidate_cache();
    if (!result) {
        return std::unexpected(result.error());
    }
    LOG_INFO("DeviceRegistry", "adb server stopped");
    return {};
}

auto DeviceRegistry::restart_server() -> std::expected<void, util::Error> {
    if (auto killed = kill_server(); !killed) {
        // Nothing to stop is fine
        if (killed.error().kind != util::ErrorKind::SERVER_NOT_RUNNING) {
            return killed;
        }
    }
    return start_server();
}

auto DeviceRegistry::is_valid_address(std::string_view address) -> bool {
    const auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }
    const auto port = address.substr(colon + 1);
    return std::ranges::all_of(port, [](unsigned char c) { return std::isdigit(c) != 0; }) &&
           port.size() <= 5;
}

auto DeviceRegistry::connect(const std::string& address) -> std::expected<std::string, util::Error> {
    if (!is_valid_address(address)) {
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED,
                                           std::format("Invalid address '{}', expected host:port", address)});
    }

    auto output = executor_->run({"connect", address});
    if (!output) {
        return std::unexpected(output.error());
    }

    // adb connect exits 0 even when the connection fails
    const auto status = std::string(util::trim(*output));
    const auto lower = util::to_lower(status);
    if (!lower.contains("connected to") && !lower.contains("already connected")) {
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED, status});
    }

    invalidate_cache();
    LOG_INFO("DeviceRegistry", std::format("Connected to {}", address));
    return status;
}

auto DeviceRegistry::disconnect(const std::string& address)
    -> std::expected<std::string, util::Error> {
    if (!is_valid_address(address)) {
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED,
                                           std::format("Invalid address '{}', expected host:port", address)});
    }

    auto output = executor_->run({"disconnect", address});
    if (!output) {
        return std::unexpected(output.error());
    }

    const auto status = std::string(util::trim(*output));
    if (!util::to_lower(status).contains("disconnected")) {
        return std::unexpected(util::Error{util::ErrorKind::COMMAND_FAILED, status});
    }

    invalidate_cache();
    LOG_INFO("DeviceRegistry", std::format("Disconnected from {}", address));
    return status;
}

auto DeviceRegistry::bridge_version() -> std::expected<std::string, util::Error> {
    auto output = executor_->run({"version"});
    if (!output) {
        return std::unexpected(output.error());
    }
    const auto lines = util::split_lines(*output);
    if (lines.empty()) {
        return std::unexpected(util::Error{util::ErrorKind::PARSE_ERROR, "Empty version output"});
    }
    return std::string(util::trim(lines.front()));
}

auto DeviceRegistry::get_state(const std::string& serial) -> std::expected<std::string, util::Error> {
    auto output = executor_->run({"-s", serial, "get-state"});
    if (!output) {
        return std::unexpected(output.error());
    }
    return std::string(util::trim(*output));
}

auto DeviceRegistry::is_device_online(const std::string& serial) -> bool {
    auto state = get_state(serial);
    return state && *state == "device";
}

auto DeviceRegistry::parse_properties(std::string_view output) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> properties;

    for (auto line : util::split_lines(output)) {
        line = util::trim(line);
        // [ro.product.model]: [Pixel 7]
        if (!line.starts_with('[')) {
            continue;
        }
        const auto key_end = line.find("]: [");
        if (key_end == std::string_view::npos || !line.ends_with(']')) {
            continue;
        }
        auto key = line.substr(1, key_end - 1);
        auto value = line.substr(key_end + 4, line.size() - key_end - 5);
        properties.emplace(std::string(key), std::string(value));
    }

    return properties;
}

auto DeviceRegistry::get_properties(const std::string& serial)
    -> std::expected<std::map<std::string, std::string>, util::Error> {
    auto output = executor_->shell(serial, "getprop");
    if (!output) {
        return std::unexpected(output.error());
    }
    return parse_properties(*output);
}

auto DeviceRegistry::device_details() -> std::expected<DeviceDetails, util::Error> {
    auto device = default_device();
    if (!device) {
        return std::unexpected(device.error());
    }

    const auto& serial = device->serial;
    DeviceDetails details;
    details.name = serial;

    auto model = executor_->shell(serial, "getprop ro.product.model");
    if (!model) {
        return std::unexpected(model.error());
    }
    details.model = std::string(util::trim(*model));

    if (auto version = executor_->shell(serial, "getprop ro.build.version.release")) {
        details.android_version = std::string(util::trim(*version));
    }

    if (auto battery = executor_->shell(serial, "dumpsys battery")) {
        details.battery_percent = health_parsers::parse_battery_level(*battery);
    }

    if (auto storage = executor_->shell(serial, "df -h /data")) {
        details.storage_available =
            health_parsers::parse_available_storage(*storage).value_or("Unknown");
    } else {
        details.storage_available = "Unknown";
    }

    return details;
}
