/**
 * @file BridgeLocatorTest.cpp
 * @brief Unit tests for adb discovery order and memoization
 */

#include "services/BridgeLocator.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockProcessRunner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

using ::testing::_;
using ::testing::Return;

namespace {

const std::vector<std::string> VERSION_ARGV = {"adb", "version"};

std::filesystem::path MakeExecutable(const std::filesystem::path& path) {
    std::ofstream(path) << "#!/bin/sh\n";
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

}  // namespace

class BridgeLocatorTest : public ::testing::Test {
protected:
    std::shared_ptr<testing::NiceMock<MockProcessRunner>> runner;
    TempDirectory temp;

    void SetUp() override {
        runner = std::make_shared<testing::NiceMock<MockProcessRunner>>();
        // Default: nothing named adb on PATH
        ON_CALL(*runner, run(_, _))
            .WillByDefault(Return(std::unexpected(util::Error(util::ErrorKind::COMMAND_FAILED, "spawn failed"))));
    }
};

// ========== Discovery order ==========

TEST_F(BridgeLocatorTest, Resolve_ExecutableOverride_WinsWithoutProbing) {
    auto adb = MakeExecutable(temp.path() / "adb");
    EXPECT_CALL(*runner, run(_, _)).Times(0);
    BridgeLocator locator(runner, adb.string(), std::vector<std::string>{});

    auto found = locator.resolve();

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->path, adb.string());
    EXPECT_FALSE(found->from_search_path);
}

TEST_F(BridgeLocatorTest, Resolve_MissingOverride_FallsBackToSearchPath) {
    EXPECT_CALL(*runner, run(VERSION_ARGV, _)).WillOnce(Return(MockProcessRunner::Ok("Android Debug Bridge version 1.0.41\n")));
    BridgeLocator locator(runner, (temp.path() / "nope").string(), std::vector<std::string>{});

    auto found = locator.resolve();

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->path, "adb");
    EXPECT_TRUE(found->from_search_path);
}

TEST_F(BridgeLocatorTest, Resolve_SearchPathFails_UsesFirstExecutableCandidate) {
    auto second = MakeExecutable(temp.path() / "adb-second");
    auto third = MakeExecutable(temp.path() / "adb-third");
    BridgeLocator locator(runner, std::nullopt,
                          std::vector<std::string>{(temp.path() / "missing").string(), second.string(),
                                                   third.string()});

    auto found = locator.resolve();

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->path, second.string());
}

TEST_F(BridgeLocatorTest, Resolve_VersionExitsNonZero_IsNotAccepted) {
    ON_CALL(*runner, run(VERSION_ARGV, _)).WillByDefault(Return(MockProcessRunner::Failed(127, "adb: not found")));
    BridgeLocator locator(runner, std::nullopt, std::vector<std::string>{});

    auto found = locator.resolve();

    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().kind, util::ErrorKind::BRIDGE_NOT_FOUND);
}

TEST_F(BridgeLocatorTest, Resolve_DirectoryCandidate_IsSkipped) {
    std::filesystem::create_directory(temp.path() / "adb-dir");
    BridgeLocator locator(runner, std::nullopt, std::vector<std::string>{(temp.path() / "adb-dir").string()});

    EXPECT_FALSE(locator.resolve().has_value());
}

// ========== Memoization ==========

TEST_F(BridgeLocatorTest, Resolve_CalledTwice_ProbesOnce) {
    EXPECT_CALL(*runner, run(VERSION_ARGV, _)).Times(1).WillOnce(Return(MockProcessRunner::Ok("ok")));
    BridgeLocator locator(runner, std::nullopt, std::vector<std::string>{});

    EXPECT_TRUE(locator.resolve().has_value());
    EXPECT_TRUE(locator.resolve().has_value());
}

TEST_F(BridgeLocatorTest, Resolve_NotFound_IsNotMemoized) {
    EXPECT_CALL(*runner, run(VERSION_ARGV, _))
        .WillOnce(Return(MockProcessRunner::Failed(1, "")))
        .WillOnce(Return(MockProcessRunner::Ok("ok")));
    BridgeLocator locator(runner, std::nullopt, std::vector<std::string>{});

    EXPECT_FALSE(locator.resolve().has_value());
    EXPECT_TRUE(locator.resolve().has_value());
}

TEST_F(BridgeLocatorTest, Invalidate_ForcesNewProbe) {
    EXPECT_CALL(*runner, run(VERSION_ARGV, _)).Times(2).WillRepeatedly(Return(MockProcessRunner::Ok("ok")));
    BridgeLocator locator(runner, std::nullopt, std::vector<std::string>{});

    EXPECT_TRUE(locator.resolve().has_value());
    locator.invalidate();
    EXPECT_TRUE(locator.resolve().has_value());
}

// ========== default_candidates Tests ==========

TEST_F(BridgeLocatorTest, DefaultCandidates_Linux_IncludesSdkUnderHome) {
    auto paths = BridgeLocator::default_candidates(HostPlatform::LINUX, [](const std::string& name) {
        return name == "HOME" ? std::optional<std::string>{"/home/dev"} : std::nullopt;
    });

    EXPECT_THAT(paths, ::testing::ElementsAre("/usr/bin/adb", "/usr/local/bin/adb",
                                              "/home/dev/Android/Sdk/platform-tools/adb"));
}

TEST_F(BridgeLocatorTest, DefaultCandidates_MacOs_IncludesHomebrewAndSdk) {
    auto paths = BridgeLocator::default_candidates(HostPlatform::MACOS, [](const std::string& name) {
        return name == "HOME" ? std::optional<std::string>{"/Users/dev"} : std::nullopt;
    });

    EXPECT_THAT(paths, ::testing::Contains("/opt/homebrew/bin/adb"));
    EXPECT_EQ(paths.back(), "/Users/dev/Library/Android/sdk/platform-tools/adb");
}

TEST_F(BridgeLocatorTest, DefaultCandidates_Windows_UsesLocalAppData) {
    auto paths = BridgeLocator::default_candidates(HostPlatform::WINDOWS, [](const std::string& name) {
        return name == "LOCALAPPDATA" ? std::optional<std::string>{"C:\\Users\\dev\\AppData\\Local"}
                                      : std::nullopt;
    });

    EXPECT_THAT(paths, ::testing::Contains("C:\\Users\\dev\\AppData\\Local\\Android\\Sdk\\platform-tools\\adb.exe"));
}

TEST_F(BridgeLocatorTest, DefaultCandidates_NoEnvironment_OnlyFixedPaths) {
    auto paths = BridgeLocator::default_candidates(HostPlatform::LINUX,
                                                   [](const std::string&) { return std::optional<std::string>{}; });

    EXPECT_EQ(paths.size(), 2u);
}
