/**
 * @file BackupServiceTest.cpp
 * @brief Unit tests for backup files and restore
 */

#include "services/BackupService.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

namespace {

std::vector<std::string> ReinstallArgs(const std::string& serial, const std::string& package) {
    return {"-s", serial, "shell", "cmd", "package", "install-existing", package};
}

nlohmann::json ReadJson(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return nlohmann::json::parse(buffer.str());
}

void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream(path) << content;
}

}  // namespace

class BackupServiceTest : public BridgeTestFixture {
protected:
    TempDirectory temp;
    std::filesystem::path backup_dir;
    std::shared_ptr<PackageActions> actions;
    std::unique_ptr<BackupService> backups;

    void SetUp() override {
        BridgeTestFixture::SetUp();
        backup_dir = temp.path() / "AndroidDebloater" / "backups";
        actions = std::make_shared<PackageActions>(executor, registry);
        backups = std::make_unique<BackupService>(executor, registry, actions, backup_dir);
    }

    void TearDown() override {
        backups.reset();
        actions.reset();
        BridgeTestFixture::TearDown();
    }

    void WriteBackup(const std::string& filename, const std::string& timestamp,
                     const std::vector<std::string>& packages) {
        std::filesystem::create_directories(backup_dir);
        nlohmann::json doc{{"version", "1.0"},
                           {"timestamp", timestamp},
                           {"deviceName", "Pixel 7"},
                           {"packages", packages}};
        WriteFile(backup_dir / filename, doc.dump());
    }
};

// ========== create Tests ==========

TEST_F(BackupServiceTest, Create_WritesDocumentWithDeviceModel) {
    OnShell("getprop ro.product.model", "Pixel 7\n");

    auto path = backups->create({"com.facebook.katana", "com.whatsapp"});

    ASSERT_TRUE(path.has_value()) << path.error().message;
    EXPECT_EQ(path->parent_path(), backup_dir);
    EXPECT_TRUE(path->filename().string().starts_with("backup_"));
    EXPECT_EQ(path->extension(), ".json");

    auto doc = ReadJson(*path);
    EXPECT_EQ(doc["version"], "1.0");
    EXPECT_EQ(doc["deviceName"], "Pixel 7");
    EXPECT_EQ(doc["packages"], nlohmann::json({"com.facebook.katana", "com.whatsapp"}));
    const auto timestamp = doc["timestamp"].get<std::string>();
    EXPECT_EQ(timestamp.size(), 20u);
    EXPECT_EQ(timestamp.back(), 'Z');
}

TEST_F(BackupServiceTest, Create_ModelUnavailable_UsesUnknownDevice) {
    OnShellFail("getprop ro.product.model", util::Error(util::ErrorKind::DEVICE_OFFLINE, "device offline"));

    auto path = backups->create({"com.whatsapp"});

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(ReadJson(*path)["deviceName"], "Unknown Device");
}

TEST_F(BackupServiceTest, Create_NonUtf8Model_WritesReplacementCharacter) {
    OnShell("getprop ro.product.model", "Pixel \xff\n");

    auto path = backups->create({"com.whatsapp"});

    ASSERT_TRUE(path.has_value()) << path.error().message;
    EXPECT_EQ(ReadJson(*path)["deviceName"], "Pixel \xEF\xBF\xBD");
}

TEST_F(BackupServiceTest, Create_TwiceInSameSecond_KeepsBothFiles) {
    OnShell("getprop ro.product.model", "Pixel 7");

    auto first = backups->create({"a.b"});
    auto second = backups->create({"c.d"});

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
    EXPECT_TRUE(std::filesystem::exists(*first));
    EXPECT_TRUE(std::filesystem::exists(*second));
}

TEST_F(BackupServiceTest, Create_DirectoryBlockedByFile_ReturnsIoError) {
    WriteFile(temp.path() / "blocked", "x");
    BackupService blocked(executor, registry, actions, temp.path() / "blocked" / "backups");

    auto path = blocked.create({"a.b"});

    ASSERT_FALSE(path.has_value());
    EXPECT_EQ(path.error().kind, util::ErrorKind::IO_ERROR);
}

// ========== list Tests ==========

TEST_F(BackupServiceTest, List_MissingDirectory_IsEmpty) {
    auto listed = backups->list();

    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
}

TEST_F(BackupServiceTest, List_SortsNewestFirstAndSkipsBadFiles) {
    WriteBackup("backup_2024-01-01_100000.json", "2024-01-01T10:00:00Z", {"a.b"});
    WriteBackup("backup_2024-03-05_090000.json", "2024-03-05T09:00:00Z", {"a.b", "c.d", "e.f"});
    WriteFile(backup_dir / "broken.json", "{not json");
    WriteFile(backup_dir / "notes.txt", "ignored");

    auto listed = backups->list();

    ASSERT_TRUE(listed.has_value());
    ASSERT_EQ(listed->size(), 2u);
    EXPECT_EQ((*listed)[0].filename, "backup_2024-03-05_090000.json");
    EXPECT_EQ((*listed)[0].package_count, 3u);
    EXPECT_EQ((*listed)[0].device_name, "Pixel 7");
    EXPECT_EQ((*listed)[1].timestamp, "2024-01-01T10:00:00Z");
}

TEST_F(BackupServiceTest, List_LegacyDeviceNameKey_IsAccepted) {
    std::filesystem::create_directories(backup_dir);
    WriteFile(backup_dir / "old.json",
              R"({"version":"1.0","timestamp":"2023-06-01T00:00:00Z","device_name":"Galaxy S10","packages":[]})");

    auto listed = backups->list();

    ASSERT_TRUE(listed.has_value());
    ASSERT_EQ(listed->size(), 1u);
    EXPECT_EQ((*listed)[0].device_name, "Galaxy S10");
}

// ========== restore Tests ==========

TEST_F(BackupServiceTest, Restore_ReinstallsEveryPackageAndReportsFailures) {
    WriteBackup("b.json", "2024-01-01T10:00:00Z", {"com.facebook.katana", "com.example.gone"});
    ON_CALL(*executor, run(ReinstallArgs(SERIAL, "com.facebook.katana")))
        .WillByDefault(Return(std::string("Package com.facebook.katana installed for user: 0")));
    ON_CALL(*executor, run(ReinstallArgs(SERIAL, "com.example.gone")))
        .WillByDefault(Return(std::string("Package com.example.gone doesn't exist")));

    auto result = backups->restore("b.json");

    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->restored, ElementsAre("com.facebook.katana"));
    ASSERT_EQ(result->failed.size(), 1u);
    EXPECT_EQ(result->failed[0].package, "com.example.gone");
    EXPECT_THAT(result->failed[0].error, ::testing::HasSubstr("doesn't exist"));
    EXPECT_FALSE(result->all_restored());
}

TEST_F(BackupServiceTest, Restore_EmptyBackup_SucceedsWithNothingToDo) {
    WriteBackup("empty.json", "2024-01-01T10:00:00Z", {});
    EXPECT_CALL(*executor, run(_)).Times(0);

    auto result = backups->restore("empty.json");

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->all_restored());
    EXPECT_TRUE(result->restored.empty());
}

TEST_F(BackupServiceTest, Restore_MissingFile_ReturnsIoError) {
    auto result = backups->restore("nope.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::IO_ERROR);
}

TEST_F(BackupServiceTest, Restore_MalformedFile_ReturnsParseError) {
    std::filesystem::create_directories(backup_dir);
    WriteFile(backup_dir / "bad.json", R"({"version":"1.0"})");

    auto result = backups->restore("bad.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::PARSE_ERROR);
}

TEST_F(BackupServiceTest, Restore_PathTraversal_IsRefused) {
    auto result = backups->restore("../secrets.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::COMMAND_FAILED);
}

// ========== remove Tests ==========

TEST_F(BackupServiceTest, Remove_ExistingFile_DeletesIt) {
    WriteBackup("b.json", "2024-01-01T10:00:00Z", {"a.b"});

    ASSERT_TRUE(backups->remove("b.json").has_value());
    EXPECT_FALSE(std::filesystem::exists(backup_dir / "b.json"));
}

TEST_F(BackupServiceTest, Remove_MissingFile_ReturnsIoError) {
    auto result = backups->remove("missing.json");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::IO_ERROR);
}

TEST_F(BackupServiceTest, IsValidBackupName_RejectsSeparatorsAndOtherExtensions) {
    EXPECT_TRUE(BackupService::is_valid_backup_name("backup_2024-01-01_100000.json"));
    EXPECT_FALSE(BackupService::is_valid_backup_name(".json"));
    EXPECT_FALSE(BackupService::is_valid_backup_name("backup.txt"));
    EXPECT_FALSE(BackupService::is_valid_backup_name("dir/backup.json"));
    EXPECT_FALSE(BackupService::is_valid_backup_name("dir\\backup.json"));
    EXPECT_FALSE(BackupService::is_valid_backup_name("..json"));
}

TEST_F(BackupServiceTest, DefaultDirectory_EndsWithAppFolder) {
    auto dir = BackupService::default_directory();

    EXPECT_EQ(dir.filename(), "backups");
    EXPECT_EQ(dir.parent_path().filename(), "AndroidDebloater");
}
