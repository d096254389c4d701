/**
 * @file HealthParsers.hpp
 * @brief Parsers for the text output of on-device diagnostic commands
 *
 * All parsers are pure functions over the raw command output so they can be
 * tested without a device.
 */

#pragma once

#include "models/HealthTypes.hpp"
#include "util/Result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace health_parsers {

/// Share of used over total as a percentage, 0 when total is 0
[[nodiscard]] inline auto percentage(double used, double total) -> double {
    return total > 0.0 ? used / total * 100.0 : 0.0;
}

/**
 * @brief Parse `df /data` with 1K-block columns
 *
 * Uses the last non-empty line: `<fs> <total> <used> <free> <use%> <mount>`.
 */
[[nodiscard]] auto parse_storage(std::string_view df_output) -> util::Result<StorageInfo>;

/**
 * @brief Parse `df -h /data` where sizes carry K/M/G/T suffixes
 */
[[nodiscard]] auto parse_storage_human(std::string_view df_output) -> util::Result<StorageInfo>;

/**
 * @brief Convert "1.5G", "512M", "100K" or "2T" to megabytes
 */
[[nodiscard]] auto parse_size_to_mb(std::string_view size) -> std::optional<double>;

/**
 * @brief Available column of `df -h /data`, as printed
 */
[[nodiscard]] auto parse_available_storage(std::string_view df_output) -> std::optional<std::string>;

/**
 * @brief Parse /proc/meminfo (MemTotal, MemAvailable, Buffers, Cached in kB)
 */
[[nodiscard]] auto parse_meminfo(std::string_view meminfo) -> util::Result<MemoryInfo>;

/**
 * @brief Parse the CPU summary line of `top -n 1 -b`
 *
 * Expects the toybox layout (`800%cpu 12%user 0%nice 5%sys 780%idle`);
 * figures are rescaled when the capacity exceeds 100%.
 */
[[nodiscard]] auto parse_top_cpu(std::string_view top_output) -> util::Result<CpuInfo>;

/**
 * @brief Fallback CPU usage from the aggregate line of /proc/stat
 */
[[nodiscard]] auto parse_proc_stat(std::string_view stat_output) -> util::Result<CpuInfo>;

/**
 * @brief Count registered services in `service list` output
 */
[[nodiscard]] auto parse_service_count(std::string_view output) -> uint32_t;

/**
 * @brief Count `package:` lines from `pm list packages`
 */
[[nodiscard]] auto count_packages(std::string_view output) -> uint32_t;

/**
 * @brief Derive throttling status and temperature from `dumpsys thermalservice`
 */
[[nodiscard]] auto parse_thermal(std::string_view dumpsys_output) -> ThermalInfo;

/**
 * @brief Top five consumers from the "Estimated power use" section of batterystats
 *
 * Percentages are shares of the top-five total, not of the whole device.
 */
[[nodiscard]] auto parse_battery_drainers(std::string_view batterystats)
    -> std::vector<BatteryDrainer>;

/**
 * @brief `level:` field of `dumpsys battery`
 */
[[nodiscard]] auto parse_battery_level(std::string_view dumpsys_battery) -> std::optional<int>;

}  // namespace health_parsers
