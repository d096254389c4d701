/**
 * @file HealthTypes.hpp
 * @brief Device health metrics and the snapshot that aggregates them
 */

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct StorageInfo {
    uint64_t total_mb = 0;
    uint64_t used_mb = 0;
    uint64_t free_mb = 0;
    double usage_percent = 0.0;
};

struct MemoryInfo {
    uint64_t total_mb = 0;
    uint64_t available_mb = 0;
    uint64_t used_mb = 0;  ///< total - available
    double usage_percent = 0.0;
    uint64_t buffers_mb = 0;
    uint64_t cached_mb = 0;
};

struct CpuInfo {
    double usage_percent = 0.0;
    double user_percent = 0.0;
    double system_percent = 0.0;
    double idle_percent = 0.0;
};

struct ThermalInfo {
    std::string status = "unknown";  ///< normal, light, moderate, severe, critical, unknown
    bool throttling = false;
    std::optional<double> temperature_c;
};

struct AppCounts {
    uint32_t system_apps = 0;
    uint32_t user_apps = 0;
    uint32_t total_apps = 0;
};

struct BatteryDrainer {
    std::string package_name;
    std::string app_name;
    double usage_percent = 0.0;  ///< Share of the top-5 total
};

/// Metric names in collection order
namespace metric {
inline constexpr std::string_view STORAGE = "storage";
inline constexpr std::string_view MEMORY = "memory";
inline constexpr std::string_view CPU = "cpu";
inline constexpr std::string_view SERVICES = "services";
inline constexpr std::string_view APP_COUNTS = "app_counts";
inline constexpr std::string_view THERMAL = "thermal";
inline constexpr std::string_view BATTERY = "battery";

inline constexpr std::array ALL{STORAGE, MEMORY, CPU, SERVICES, APP_COUNTS, THERMAL, BATTERY};
}  // namespace metric

/**
 * @struct HealthSnapshot
 * @brief Independently sourced metrics; absent fields have never been fetched
 *
 * The snapshot has no single age. `freshness` maps each present metric to
 * the age of its cache slot in milliseconds at the time it was copied.
 */
struct HealthSnapshot {
    std::optional<StorageInfo> storage;
    std::optional<MemoryInfo> memory;
    std::optional<CpuInfo> cpu;
    std::optional<ThermalInfo> thermal;
    std::optional<uint32_t> services_count;
    std::optional<AppCounts> app_counts;
    std::vector<BatteryDrainer> battery_drainers;
    std::map<std::string, int64_t> freshness;
    int64_t timestamp = 0;  ///< Collection start, ms since epoch
    std::string device_id;
};

/**
 * @struct HealthUpdate
 * @brief Incremental snapshot emitted after each metric resolves
 */
struct HealthUpdate {
    HealthSnapshot health;
    std::vector<std::string> metrics_updated;
    bool is_complete = false;
};
