/**
 * @file JsonSerializationTest.cpp
 * @brief Unit tests for the JSON shapes of events and models
 */

#include "models/JsonSerialization.hpp"

#include <gtest/gtest.h>

using nlohmann::json;

// ========== Package stream payloads (camelCase) ==========

TEST(JsonSerializationTest, PackageRecord_UsesCamelCaseAndLevelName) {
    json j = PackageRecord{.package_name = "com.whatsapp", .app_name = "WhatsApp",
                           .safety_level = SafetyLevel::CAUTION};

    EXPECT_EQ(j, (json{{"packageName", "com.whatsapp"}, {"appName", "WhatsApp"}, {"safetyLevel", "Caution"}}));
}

TEST(JsonSerializationTest, PackageChunk_ContainsPositionFlags) {
    json j = PackageChunk{.packages = {PackageRecord{.package_name = "a.b", .app_name = "B"}},
                          .chunk_index = 2,
                          .total_so_far = 61,
                          .is_final = true,
                          .from_cache = true};

    EXPECT_EQ(j["chunkIndex"], 2);
    EXPECT_EQ(j["totalSoFar"], 61);
    EXPECT_TRUE(j["isFinal"].get<bool>());
    EXPECT_TRUE(j["fromCache"].get<bool>());
    ASSERT_EQ(j["packages"].size(), 1u);
    EXPECT_EQ(j["packages"][0]["safetyLevel"], "Safe");
}

TEST(JsonSerializationTest, StreamProgress_NoError_SerializesNull) {
    json j = StreamProgress{.status = "Loading packages... (30)", .packages_loaded = 30};

    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["packagesLoaded"], 30);
    EXPECT_FALSE(j["isComplete"].get<bool>());
}

TEST(JsonSerializationTest, CacheStatus_Empty_HasNullOptionals) {
    json j = PackageCacheStatus{};

    EXPECT_FALSE(j["hasCache"].get<bool>());
    EXPECT_TRUE(j["deviceSerial"].is_null());
    EXPECT_TRUE(j["ageSeconds"].is_null());
    EXPECT_TRUE(j["isExpired"].get<bool>());
}

// ========== Health payloads (snake_case) ==========

TEST(JsonSerializationTest, HealthUpdate_UsesSnakeCase) {
    HealthUpdate update;
    update.health.storage = StorageInfo{.total_mb = 1024, .used_mb = 512, .free_mb = 512, .usage_percent = 50.0};
    update.health.freshness["storage"] = 0;
    update.health.device_id = "emulator-5554";
    update.metrics_updated = {"storage"};

    json j = update;

    EXPECT_EQ(j["metrics_updated"], json::array({"storage"}));
    EXPECT_FALSE(j["is_complete"].get<bool>());
    EXPECT_EQ(j["health"]["storage"]["total_mb"], 1024);
    EXPECT_DOUBLE_EQ(j["health"]["storage"]["usage_percent"].get<double>(), 50.0);
    EXPECT_TRUE(j["health"]["memory"].is_null());
    EXPECT_TRUE(j["health"]["battery_drainers"].is_array());
    EXPECT_EQ(j["health"]["device_id"], "emulator-5554");
}

TEST(JsonSerializationTest, ThermalInfo_MissingTemperature_IsNull) {
    json j = ThermalInfo{.status = "moderate", .throttling = true, .temperature_c = std::nullopt};

    EXPECT_EQ(j["status"], "moderate");
    EXPECT_TRUE(j["throttling"].get<bool>());
    EXPECT_TRUE(j["temperature_c"].is_null());
}

// ========== Events ==========

TEST(JsonSerializationTest, EventToJson_WrapsNameAndPayload) {
    auto j = event_to_json(StreamComplete{.total_packages = 65, .duration_ms = 120, .from_cache = false});

    EXPECT_EQ(j["event"], "package_stream_complete");
    EXPECT_EQ(j["payload"]["totalPackages"], 65);
    EXPECT_EQ(j["payload"]["durationMs"], 120);
}

TEST(JsonSerializationTest, EventName_MatchesEveryAlternative) {
    EXPECT_EQ(event_name(PackageChunk{}), "package_chunk");
    EXPECT_EQ(event_name(StreamProgress{}), "package_stream_progress");
    EXPECT_EQ(event_name(StreamComplete{}), "package_stream_complete");
    EXPECT_EQ(event_name(HealthUpdate{}), "system_health_update");
}

// ========== Devices ==========

TEST(JsonSerializationTest, DeviceDetails_UsesFrontEndKeys) {
    json j = DeviceDetails{.name = "emulator-5554", .model = "Pixel 7", .android_version = "14",
                           .battery_percent = 80, .storage_available = "62G"};

    EXPECT_EQ(j["androidVersion"], "14");
    EXPECT_EQ(j["batteryPercentage"], 80);
    EXPECT_EQ(j["storageAvailable"], "62G");
}

// ========== Backups ==========

TEST(JsonSerializationTest, BackupData_ReadsWhatItWrites) {
    BackupData data{.version = "1.0", .timestamp = "2024-03-05T09:00:00Z", .device_name = "Pixel 7",
                    .packages = {"com.whatsapp", "com.facebook.katana"}};

    auto parsed = json(data).get<BackupData>();

    EXPECT_EQ(parsed.timestamp, data.timestamp);
    EXPECT_EQ(parsed.device_name, "Pixel 7");
    EXPECT_EQ(parsed.packages, data.packages);
}

TEST(JsonSerializationTest, BackupData_LegacySnakeCaseDeviceName_IsRead) {
    auto j = json::parse(R"({"version":"1.0","timestamp":"t","device_name":"Old","packages":["a.b"]})");

    EXPECT_EQ(j.get<BackupData>().device_name, "Old");
}

TEST(JsonSerializationTest, BackupData_MissingPackages_Throws) {
    auto j = json::parse(R"({"version":"1.0","timestamp":"t","deviceName":"x"})");

    EXPECT_THROW(j.get<BackupData>(), json::exception);
}

TEST(JsonSerializationTest, RestoreResult_ListsFailuresWithErrors) {
    RestoreResult result{.restored = {"a.b"}, .failed = {RestoreFailure{.package = "c.d", .error = "boom"}}};

    json j = result;

    EXPECT_EQ(j["restored"], json::array({"a.b"}));
    EXPECT_EQ(j["failed"][0]["package"], "c.d");
    EXPECT_EQ(j["failed"][0]["error"], "boom");
}
