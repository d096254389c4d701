/**
 * @file JsonSerialization.cpp
 * @brief nlohmann::json conversions
 */

#include "models/JsonSerialization.hpp"

#include <string>
#include <type_traits>

using nlohmann::json;

namespace {

template<typename T>
auto optional_json(const std::optional<T>& value) -> json {
    if (value) {
        return json(*value);
    }
    return json(nullptr);
}

}  // namespace

// ============================================================================
// Package stream
// ============================================================================

void to_json(json& j, const PackageRecord& record) {
    j = json{
        {"packageName", record.package_name},
        { "appName", record.app_name},
        {"safetyLevel", std::string(safety_level_name(record.safety_level))},
    };
}

void to_json(json& j, const PackageChunk& chunk) {
    j = json{
        {  "packages", chunk.packages},
        {"chunkIndex", chunk.chunk_index},
        {"totalSoFar", chunk.total_so_far},
        {   "isFinal", chunk.is_final},
        { "fromCache", chunk.from_cache},
    };
}

void to_json(json& j, const StreamProgress& progress) {
    j = json{
        {        "status", progress.status},
        {"packagesLoaded", progress.packages_loaded},
        {    "isComplete", progress.is_complete},
        {         "error", optional_json(progress.error)},
    };
}

void to_json(json& j, const StreamComplete& complete) {
    j = json{
        {"totalPackages", complete.total_packages},
        {   "durationMs", complete.duration_ms},
        {    "fromCache", complete.from_cache},
    };
}

void to_json(json& j, const PackageCacheStatus& status) {
    j = json{
        {    "hasCache", status.has_cache},
        {"packageCount", status.package_count},
        {"deviceSerial", optional_json(status.device_serial)},
        {  "ageSeconds", optional_json(status.age_seconds)},
        {   "isExpired", status.is_expired},
    };
}

// ============================================================================
// Health
// ============================================================================

void to_json(json& j, const StorageInfo& info) {
    j = json{
        {     "total_mb", info.total_mb},
        {      "used_mb", info.used_mb},
        {      "free_mb", info.free_mb},
        {"usage_percent", info.usage_percent},
    };
}

void to_json(json& j, const MemoryInfo& info) {
    j = json{
        {     "total_mb", info.total_mb},
        {      "used_mb", info.used_mb},
        { "available_mb", info.available_mb},
        {"usage_percent", info.usage_percent},
        {   "buffers_mb", info.buffers_mb},
        {    "cached_mb", info.cached_mb},
    };
}

void to_json(json& j, const CpuInfo& info) {
    j = json{
        { "usage_percent", info.usage_percent},
        {  "user_percent", info.user_percent},
        {"system_percent", info.system_percent},
        {  "idle_percent", info.idle_percent},
    };
}

void to_json(json& j, const ThermalInfo& info) {
    j = json{
        {       "status", info.status},
        {"temperature_c", optional_json(info.temperature_c)},
        {   "throttling", info.throttling},
    };
}

void to_json(json& j, const AppCounts& counts) {
    j = json{
        {"system_apps", counts.system_apps},
        {  "user_apps", counts.user_apps},
        { "total_apps", counts.total_apps},
    };
}

void to_json(json& j, const BatteryDrainer& drainer) {
    j = json{
        { "package_name", drainer.package_name},
        {     "app_name", drainer.app_name},
        {"usage_percent", drainer.usage_percent},
    };
}

void to_json(json& j, const HealthSnapshot& snapshot) {
    j = json{
        {         "storage", optional_json(snapshot.storage)},
        {          "memory", optional_json(snapshot.memory)},
        {             "cpu", optional_json(snapshot.cpu)},
        {         "thermal", optional_json(snapshot.thermal)},
        {  "services_count", optional_json(snapshot.services_count)},
        {      "app_counts", optional_json(snapshot.app_counts)},
        {"battery_drainers", snapshot.battery_drainers},
        {       "freshness", snapshot.freshness},
        {       "timestamp", snapshot.timestamp},
        {       "device_id", snapshot.device_id},
    };
}

void to_json(json& j, const HealthUpdate& update) {
    j = json{
        {         "health", update.health},
        {"metrics_updated", update.metrics_updated},
        {    "is_complete", update.is_complete},
    };
}

// ============================================================================
// Devices
// ============================================================================

void to_json(json& j, const DeviceInfo& device) {
    j = json{
        {      "serial", device.serial},
        {       "state", device.state},
        {       "model", optional_json(device.model)},
        {     "product", optional_json(device.product)},
        {      "device", optional_json(device.device)},
        {"transport_id", optional_json(device.transport_id)},
    };
}

void to_json(json& j, const DeviceDetails& details) {
    j = json{
        {             "name", details.name},
        {            "model", details.model},
        {   "androidVersion", details.android_version},
        {"batteryPercentage", optional_json(details.battery_percent)},
        { "storageAvailable", details.storage_available},
    };
}

// ============================================================================
// Backups
// ============================================================================

void to_json(json& j, const BackupData& data) {
    j = json{
        {   "version", data.version},
        { "timestamp", data.timestamp},
        {"deviceName", data.device_name},
        {  "packages", data.packages},
    };
}

void from_json(const json& j, BackupData& data) {
    j.at("version").get_to(data.version);
    j.at("timestamp").get_to(data.timestamp);
    // Files written by older releases used the snake_case key
    if (j.contains("device_name") && !j.contains("deviceName")) {
        j.at("device_name").get_to(data.device_name);
    } else {
        j.at("deviceName").get_to(data.device_name);
    }
    j.at("packages").get_to(data.packages);
}

void to_json(json& j, const BackupInfo& info) {
    j = json{
        {    "filename", info.filename},
        {        "path", info.path},
        {   "timestamp", info.timestamp},
        {  "deviceName", info.device_name},
        {"packageCount", info.package_count},
    };
}

void to_json(json& j, const RestoreResult& result) {
    json failed = json::array();
    for (const auto& failure : result.failed) {
        failed.push_back(json{{"package", failure.package}, {"error", failure.error}});
    }
    j = json{
        {"restored", result.restored},
        {  "failed", failed},
    };
}

auto event_to_json(const AppEvent& event) -> json {
    json payload = std::visit([](const auto& value) { return json(value); }, event);
    return json{
        {  "event", std::string(event_name(event))},
        {"payload", std::move(payload)},
    };
}

auto to_json_text(const json& j, int indent) -> std::string {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}
