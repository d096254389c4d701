/**
 * @file JsonSerialization.hpp
 * @brief nlohmann::json conversions for models that leave the process
 *
 * Package stream payloads use camelCase keys; health payloads use
 * snake_case keys. Both are consumed by existing front ends.
 */

#pragma once

#include "models/BackupTypes.hpp"
#include "models/DeviceInfo.hpp"
#include "models/Events.hpp"
#include "models/HealthTypes.hpp"
#include "models/PackageTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

void to_json(nlohmann::json& j, const PackageRecord& record);
void to_json(nlohmann::json& j, const PackageChunk& chunk);
void to_json(nlohmann::json& j, const StreamProgress& progress);
void to_json(nlohmann::json& j, const StreamComplete& complete);
void to_json(nlohmann::json& j, const PackageCacheStatus& status);

void to_json(nlohmann::json& j, const StorageInfo& info);
void to_json(nlohmann::json& j, const MemoryInfo& info);
void to_json(nlohmann::json& j, const CpuInfo& info);
void to_json(nlohmann::json& j, const ThermalInfo& info);
void to_json(nlohmann::json& j, const AppCounts& counts);
void to_json(nlohmann::json& j, const BatteryDrainer& drainer);
void to_json(nlohmann::json& j, const HealthSnapshot& snapshot);
void to_json(nlohmann::json& j, const HealthUpdate& update);

void to_json(nlohmann::json& j, const DeviceInfo& device);
void to_json(nlohmann::json& j, const DeviceDetails& details);

void to_json(nlohmann::json& j, const BackupData& data);
/// @throws nlohmann::json::exception on missing or mistyped keys
void from_json(const nlohmann::json& j, BackupData& data);
void to_json(nlohmann::json& j, const BackupInfo& info);
void to_json(nlohmann::json& j, const RestoreResult& result);

/**
 * @brief Wrap an event as {"event": <name>, "payload": {...}}
 */
[[nodiscard]] auto event_to_json(const AppEvent& event) -> nlohmann::json;

/**
 * @brief Serialize for output, replacing invalid UTF-8 with U+FFFD
 *
 * adb stderr and user-supplied names are not guaranteed to be UTF-8; the
 * default strict dump would throw on them.
 * @param indent -1 for a single line
 */
[[nodiscard]] auto to_json_text(const nlohmann::json& j, int indent = -1) -> std::string;
