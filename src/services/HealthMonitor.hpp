/**
 * @file HealthMonitor.hpp
 * @brief Per-metric cached collection of device health with optional polling
 */

#pragma once

#include "core/IEventSink.hpp"
#include "models/CachedResult.hpp"
#include "models/HealthTypes.hpp"
#include "services/IBridgeExecutor.hpp"
#include "util/Clock.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

/**
 * @class HealthMonitor
 * @brief Collects seven health metrics, each behind its own TTL
 *
 * Every collection pass emits a system_health_update after each metric so
 * the presentation can fill in progressively. The seven cache slots belong
 * to one device; seeing a different serial empties all of them.
 */
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<IBridgeExecutor> executor, std::shared_ptr<IEventSink> sink,
                  util::Clock clock = util::steady_clock());
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;
    HealthMonitor(HealthMonitor&&) = delete;
    HealthMonitor& operator=(HealthMonitor&&) = delete;

    /**
     * @brief Run one collection pass, refetching only stale metrics
     * @return The snapshot carried by the final (is_complete) update
     */
    auto collect() -> HealthSnapshot;

    /**
     * @brief Collect repeatedly on a background thread until stop_monitor()
     * @param interval Delay between passes, raised to MIN_INTERVAL if shorter
     *
     * A monitor that is already running is stopped first.
     */
    void start_monitor(std::chrono::milliseconds interval);
    void stop_monitor();
    [[nodiscard]] auto is_monitoring() const -> bool { return monitoring_.load(); }

    void clear_cache();

    static constexpr auto MIN_INTERVAL = std::chrono::milliseconds{1000};

    static constexpr auto STORAGE_TTL = std::chrono::seconds{3};
    static constexpr auto MEMORY_TTL = std::chrono::seconds{2};
    static constexpr auto CPU_TTL = std::chrono::seconds{3};
    static constexpr auto THERMAL_TTL = std::chrono::seconds{5};
    static constexpr auto SERVICES_TTL = std::chrono::seconds{10};
    static constexpr auto APP_COUNTS_TTL = std::chrono::seconds{60};
    static constexpr auto BATTERY_TTL = std::chrono::seconds{30};

private:
    template<typename T, typename Fetch>
    auto refresh(CachedResult<T>& slot, std::string_view name, const std::string& serial,
                 Fetch&& fetch, HealthSnapshot& snapshot, std::vector<std::string>& updated)
        -> std::optional<T>;

    void reset_slots();
    auto read_device_id() -> std::string;
    auto device_ready() -> bool;

    // --- Fetchers, run without holding cache_mutex_ ---
    auto fetch_storage(const std::string& serial) -> util::Result<StorageInfo>;
    auto fetch_memory(const std::string& serial) -> util::Result<MemoryInfo>;
    auto fetch_cpu(const std::string& serial) -> util::Result<CpuInfo>;
    auto fetch_services(const std::string& serial) -> util::Result<uint32_t>;
    auto fetch_app_counts(const std::string& serial) -> util::Result<AppCounts>;
    auto fetch_thermal(const std::string& serial) -> util::Result<ThermalInfo>;
    auto fetch_battery(const std::string& serial) -> util::Result<std::vector<BatteryDrainer>>;

    std::shared_ptr<IBridgeExecutor> executor_;
    std::shared_ptr<IEventSink> sink_;
    util::Clock clock_;

    mutable std::mutex cache_mutex_;
    std::string owner_;  ///< Device the slots below were filled for
    CachedResult<StorageInfo> storage_{STORAGE_TTL};
    CachedResult<MemoryInfo> memory_{MEMORY_TTL};
    CachedResult<CpuInfo> cpu_{CPU_TTL};
    CachedResult<uint32_t> services_{SERVICES_TTL};
    CachedResult<AppCounts> app_counts_{APP_COUNTS_TTL};
    CachedResult<ThermalInfo> thermal_{THERMAL_TTL};
    CachedResult<std::vector<BatteryDrainer>> battery_{BATTERY_TTL};

    std::mutex control_mutex_;  ///< Serializes start_monitor/stop_monitor
    std::mutex monitor_mutex_;
    std::condition_variable monitor_cv_;
    bool stop_requested_ = false;
    std::atomic<bool> monitoring_{false};
    std::thread monitor_thread_;
};
