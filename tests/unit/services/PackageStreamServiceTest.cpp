/**
 * @file PackageStreamServiceTest.cpp
 * @brief Unit tests for chunked package enumeration and its cache
 */

#include "services/PackageStreamService.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <format>

using ::testing::_;
using ::testing::Return;

namespace {

const std::vector<std::string> LIST_ARGS = {"-s", "emulator-5554", "shell", "pm", "list", "packages", "-a"};

std::vector<std::string> PackageLines(size_t count) {
    std::vector<std::string> lines;
    for (size_t i = 0; i < count; ++i) {
        lines.push_back(std::format("package:com.example.app{:03}", i));
    }
    return lines;
}

}  // namespace

class PackageStreamServiceTest : public BridgeTestFixture {
protected:
    std::unique_ptr<PackageStreamService> service;

    void SetUp() override {
        BridgeTestFixture::SetUp();
        service = std::make_unique<PackageStreamService>(executor, registry, sink, clock.as_clock());
    }

    void TearDown() override {
        service.reset();
        BridgeTestFixture::TearDown();
    }

    void RunToCompletion(bool force_refresh = false) {
        auto started = service->start_stream(force_refresh);
        ASSERT_TRUE(started.has_value());
        service->wait_for_idle();
    }
};

// ========== Live pass ==========

TEST_F(PackageStreamServiceTest, StartStream_ThreePackages_EmitsSingleFinalChunkInDiscoveryOrder) {
    ON_CALL(*executor, stream(LIST_ARGS, _))
        .WillByDefault(StreamLines({"package:com.b", "package:com.a", "package:com.c"}));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_TRUE(chunks[0].is_final);
    EXPECT_FALSE(chunks[0].from_cache);
    EXPECT_EQ(chunks[0].chunk_index, 0u);
    EXPECT_EQ(chunks[0].total_so_far, 3u);
    ASSERT_EQ(chunks[0].packages.size(), 3u);
    EXPECT_EQ(chunks[0].packages[0].package_name, "com.b");
    EXPECT_EQ(chunks[0].packages[1].package_name, "com.a");
    EXPECT_EQ(chunks[0].packages[2].package_name, "com.c");

    auto complete = sink->events_of<StreamComplete>();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].total_packages, 3u);
    EXPECT_FALSE(complete[0].from_cache);
}

TEST_F(PackageStreamServiceTest, StartStream_Completed_CachesPackagesSortedByName) {
    ON_CALL(*executor, stream(LIST_ARGS, _))
        .WillByDefault(StreamLines({"package:com.b", "package:com.a", "package:com.c"}));

    RunToCompletion();

    auto cached = service->cached_packages();
    ASSERT_EQ(cached.size(), 3u);
    EXPECT_EQ(cached[0].package_name, "com.a");
    EXPECT_EQ(cached[1].package_name, "com.b");
    EXPECT_EQ(cached[2].package_name, "com.c");

    auto status = service->cache_status();
    EXPECT_TRUE(status.has_cache);
    EXPECT_EQ(status.package_count, 3u);
    EXPECT_EQ(status.device_serial, std::optional<std::string>{SERIAL});
    EXPECT_FALSE(status.is_expired);
}

TEST_F(PackageStreamServiceTest, StartStream_SixtyFivePackages_EmitsThirtyThirtyFive) {
    ON_CALL(*executor, stream(LIST_ARGS, _)).WillByDefault(StreamLines(PackageLines(65)));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].packages.size(), 30u);
    EXPECT_EQ(chunks[1].packages.size(), 30u);
    EXPECT_EQ(chunks[2].packages.size(), 5u);
    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].chunk_index, i);
        EXPECT_EQ(chunks[i].is_final, i == 2);
    }
    EXPECT_EQ(chunks[2].total_so_far, 65u);
}

TEST_F(PackageStreamServiceTest, StartStream_ExactMultipleOfChunkSize_EmitsEmptyFinalChunk) {
    ON_CALL(*executor, stream(LIST_ARGS, _)).WillByDefault(StreamLines(PackageLines(60)));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_FALSE(chunks[1].is_final);
    EXPECT_TRUE(chunks[2].is_final);
    EXPECT_TRUE(chunks[2].packages.empty());
    EXPECT_EQ(chunks[2].total_so_far, 60u);
}

TEST_F(PackageStreamServiceTest, StartStream_NoPackages_EmitsEmptyFinalChunkAndZeroTotal) {
    ON_CALL(*executor, stream(LIST_ARGS, _)).WillByDefault(StreamLines({}));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_TRUE(chunks[0].is_final);
    EXPECT_TRUE(chunks[0].packages.empty());

    auto complete = sink->events_of<StreamComplete>();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].total_packages, 0u);
}

TEST_F(PackageStreamServiceTest, StartStream_NoiseLines_AreIgnored) {
    ON_CALL(*executor, stream(LIST_ARGS, _))
        .WillByDefault(StreamLines({"", "WARNING: linker noise", "package:", "  package:com.a  \r", "package:com.b"}));

    RunToCompletion();

    auto cached = service->cached_packages();
    ASSERT_EQ(cached.size(), 2u);
    EXPECT_EQ(cached[0].package_name, "com.a");
}

TEST_F(PackageStreamServiceTest, StartStream_ClassifiesWithPackageDatabase) {
    ON_CALL(*executor, stream(LIST_ARGS, _))
        .WillByDefault(StreamLines({"package:com.facebook.katana", "package:com.android.systemui"}));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].packages[0].app_name, "Facebook");
    EXPECT_EQ(chunks[0].packages[0].safety_level, SafetyLevel::CAUTION);
    EXPECT_EQ(chunks[0].packages[1].safety_level, SafetyLevel::DANGEROUS);
}

TEST_F(PackageStreamServiceTest, StartStream_EventOrder_ProgressChunksCompleteProgress) {
    ON_CALL(*executor, stream(LIST_ARGS, _)).WillByDefault(StreamLines(PackageLines(31)));

    RunToCompletion();

    auto events = sink->events();
    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(std::get<StreamProgress>(events[0]).status, "Starting package scan...");
    EXPECT_TRUE(std::holds_alternative<PackageChunk>(events[1]));
    EXPECT_EQ(std::get<StreamProgress>(events[2]).packages_loaded, 30u);
    EXPECT_TRUE(std::get<PackageChunk>(events[3]).is_final);
    EXPECT_TRUE(std::holds_alternative<StreamComplete>(events[4]));
    auto last = std::get<StreamProgress>(events[5]);
    EXPECT_TRUE(last.is_complete);
    EXPECT_EQ(last.status, "Loaded 31 packages");
    EXPECT_FALSE(last.error.has_value());
}

// ========== Failures ==========

TEST_F(PackageStreamServiceTest, StartStream_NoDevice_ReturnsErrorWithoutEvents) {
    ON_CALL(*registry, default_device())
        .WillByDefault(Return(std::unexpected(util::Error(util::ErrorKind::NO_DEVICE_CONNECTED, "none"))));
    EXPECT_CALL(*executor, stream(_, _)).Times(0);

    auto started = service->start_stream(false);

    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().kind, util::ErrorKind::NO_DEVICE_CONNECTED);
    EXPECT_EQ(sink->size(), 0u);
}

TEST_F(PackageStreamServiceTest, StartStream_FailsMidway_KeepsDeliveredChunksAndSkipsCache) {
    ON_CALL(*executor, stream(LIST_ARGS, _))
        .WillByDefault(StreamLinesThenFail(
            PackageLines(35), util::Error(util::ErrorKind::DEVICE_OFFLINE, "error: device offline")));

    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_FALSE(chunks[0].is_final);
    EXPECT_TRUE(sink->events_of<StreamComplete>().empty());

    auto progress = sink->events_of<StreamProgress>();
    ASSERT_FALSE(progress.empty());
    EXPECT_TRUE(progress.back().is_complete);
    ASSERT_TRUE(progress.back().error.has_value());
    EXPECT_THAT(*progress.back().error, ::testing::HasSubstr("offline"));

    EXPECT_FALSE(service->cache_status().has_cache);
}

// ========== Cache ==========

TEST_F(PackageStreamServiceTest, StartStream_FreshCache_ReplaysWithoutSpawning) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _))
        .Times(1)
        .WillOnce(StreamLines({"package:com.b", "package:com.a", "package:com.c"}));

    RunToCompletion();
    sink->clear();
    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_TRUE(chunks[0].from_cache);
    EXPECT_TRUE(chunks[0].is_final);
    EXPECT_EQ(chunks[0].packages[0].package_name, "com.a");

    auto complete = sink->events_of<StreamComplete>();
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_TRUE(complete[0].from_cache);
    EXPECT_EQ(complete[0].duration_ms, 0u);
    EXPECT_EQ(sink->events_of<StreamProgress>().back().status, "Loaded 3 packages (cached)");
}

TEST_F(PackageStreamServiceTest, StartStream_CacheReplay_UsesSameChunkBoundaries) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(1).WillOnce(StreamLines(PackageLines(65)));

    RunToCompletion();
    sink->clear();
    RunToCompletion();

    auto chunks = sink->events_of<PackageChunk>();
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].packages.size(), 5u);
    EXPECT_TRUE(chunks[2].is_final);
}

TEST_F(PackageStreamServiceTest, StartStream_CacheReplayOfExactMultiple_MatchesLiveChunkShape) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(1).WillOnce(StreamLines(PackageLines(60)));

    RunToCompletion();
    auto live = sink->events_of<PackageChunk>();
    sink->clear();
    RunToCompletion();
    auto replayed = sink->events_of<PackageChunk>();

    ASSERT_EQ(live.size(), 3u);
    ASSERT_EQ(replayed.size(), live.size());
    for (size_t i = 0; i < replayed.size(); ++i) {
        EXPECT_EQ(replayed[i].chunk_index, live[i].chunk_index);
        EXPECT_EQ(replayed[i].packages.size(), live[i].packages.size());
        EXPECT_EQ(replayed[i].total_so_far, live[i].total_so_far);
        EXPECT_EQ(replayed[i].is_final, live[i].is_final);
        EXPECT_TRUE(replayed[i].from_cache);
    }
    EXPECT_TRUE(replayed[2].packages.empty());
}

TEST_F(PackageStreamServiceTest, StartStream_ForceRefresh_BypassesFreshCache) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(2).WillRepeatedly(StreamLines({"package:com.a"}));

    RunToCompletion();
    RunToCompletion(true);

    EXPECT_EQ(sink->events_of<StreamComplete>().back().from_cache, false);
}

TEST_F(PackageStreamServiceTest, StartStream_CacheOlderThanTtl_RunsLivePass) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(2).WillRepeatedly(StreamLines({"package:com.a"}));

    RunToCompletion();
    clock.advance(PackageStreamService::CACHE_TTL + std::chrono::seconds{1});
    EXPECT_TRUE(service->cache_status().is_expired);
    RunToCompletion();
}

TEST_F(PackageStreamServiceTest, StartStream_DifferentDevice_DoesNotServeOtherDevicesCache) {
    const std::vector<std::string> other_args = {"-s", "R58M123", "shell", "pm", "list", "packages", "-a"};
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(1).WillOnce(StreamLines({"package:com.a"}));
    EXPECT_CALL(*executor, stream(other_args, _)).Times(1).WillOnce(StreamLines({"package:com.z"}));

    RunToCompletion();
    ON_CALL(*registry, default_device()).WillByDefault(Return(MockDeviceRegistry::CreateTestDevice("R58M123")));
    RunToCompletion();

    auto status = service->cache_status();
    EXPECT_EQ(status.device_serial, std::optional<std::string>{"R58M123"});
    EXPECT_EQ(service->cached_packages().front().package_name, "com.z");
}

TEST_F(PackageStreamServiceTest, ClearCache_AfterPass_ForcesLivePass) {
    EXPECT_CALL(*executor, stream(LIST_ARGS, _)).Times(2).WillRepeatedly(StreamLines({"package:com.a"}));

    RunToCompletion();
    service->clear_cache();
    EXPECT_FALSE(service->cache_status().has_cache);
    RunToCompletion();
}

TEST_F(PackageStreamServiceTest, CacheStatus_ReportsAgeInSeconds) {
    ON_CALL(*executor, stream(LIST_ARGS, _)).WillByDefault(StreamLines({"package:com.a"}));

    RunToCompletion();
    clock.advance(std::chrono::seconds{42});

    auto status = service->cache_status();
    EXPECT_EQ(status.age_seconds, std::optional<uint64_t>{42});
    EXPECT_FALSE(status.is_expired);
}

TEST_F(PackageStreamServiceTest, CacheStatus_NoPass_ReportsNoCache) {
    auto status = service->cache_status();
    EXPECT_FALSE(status.has_cache);
    EXPECT_EQ(status.package_count, 0u);
    EXPECT_TRUE(status.is_expired);
    EXPECT_FALSE(status.device_serial.has_value());
}
