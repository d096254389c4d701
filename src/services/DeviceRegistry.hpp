#pragma once

#include "models/CachedResult.hpp"
#include "services/IBridgeExecutor.hpp"
#include "services/IDeviceRegistry.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

class DeviceRegistry : public IDeviceRegistry {
public:
    explicit DeviceRegistry(std::shared_ptr<IBridgeExecutor> executor,
                            util::Clock clock = util::steady_clock());
    ~DeviceRegistry() override = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    [[nodiscard]] auto list_devices(bool force_refresh)
        -> std::expected<std::vector<DeviceInfo>, util::Error> override;
    [[nodiscard]] auto default_device() -> std::expected<DeviceInfo, util::Error> override;
    void invalidate_cache() override;

    // --- Server and connection management ---

    auto start_server() -> std::expected<void, util::Error>;
    auto kill_server() -> std::expected<void, util::Error>;
    auto restart_server() -> std::expected<void, util::Error>;

    /**
     * @brief `adb connect host:port`
     * @return adb's status line on success
     */
    auto connect(const std::string& address) -> std::expected<std::string, util::Error>;
    auto disconnect(const std::string& address) -> std::expected<std::string, util::Error>;

    /**
     * @brief First line of `adb version`
     */
    [[nodiscard]] auto bridge_version() -> std::expected<std::string, util::Error>;

    // --- Per-device queries ---

    [[nodiscard]] auto get_state(const std::string& serial) -> std::expected<std::string, util::Error>;
    [[nodiscard]] auto is_device_online(const std::string& serial) -> bool;

    /**
     * @brief All system properties from `getprop`
     */
    [[nodiscard]] auto get_properties(const std::string& serial)
        -> std::expected<std::map<std::string, std::string>, util::Error>;

    /**
     * @brief Model, Android version, battery level and free storage of the default device
     */
    [[nodiscard]] auto device_details() -> std::expected<DeviceDetails, util::Error>;

    // --- Parsers (exposed for tests) ---

    /**
     * @brief Parse `adb devices -l` output, keeping every state
     */
    [[nodiscard]] static auto parse_device_list(std::string_view output) -> std::vector<DeviceInfo>;

    /**
     * @brief Parse `[key]: [value]` lines from getprop
     */
    [[nodiscard]] static auto parse_properties(std::string_view output)
        -> std::map<std::string, std::string>;

    /**
     * @brief Check whether the address looks like host:port with a numeric port
     */
    [[nodiscard]] static auto is_valid_address(std::string_view address) -> bool;

    static constexpr auto CACHE_TTL = std::chrono::seconds{5};

private:
    std::shared_ptr<IBridgeExecutor> executor_;
    util::Clock clock_;

    mutable std::mutex cache_mutex_;
    CachedResult<std::vector<DeviceInfo>> cache_{CACHE_TTL};
};
