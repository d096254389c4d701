/**
 * @file MockDeviceRegistry.hpp
 * @brief Google Mock implementation of IDeviceRegistry
 */

#pragma once

#include "services/IDeviceRegistry.hpp"

#include <gmock/gmock.h>

class MockDeviceRegistry : public IDeviceRegistry {
public:
    MOCK_METHOD((std::expected<std::vector<DeviceInfo>, util::Error>), list_devices,
                (bool force_refresh), (override));
    MOCK_METHOD((std::expected<DeviceInfo, util::Error>), default_device, (), (override));
    MOCK_METHOD(void, invalidate_cache, (), (override));

    // Helper: Create test device data
    static DeviceInfo CreateTestDevice(const std::string& serial = "emulator-5554") {
        return DeviceInfo{.serial = serial,
                          .state = "device",
                          .connection = ConnectionState::READY,
                          .model = "Pixel_7",
                          .product = "panther",
                          .device = "panther",
                          .transport_id = "1"};
    }

    // Helper: Create a nice mock whose default device is the given serial
    static std::shared_ptr<testing::NiceMock<MockDeviceRegistry>> WithDevice(
        const std::string& serial = "emulator-5554") {
        auto mock = std::make_shared<testing::NiceMock<MockDeviceRegistry>>();
        ON_CALL(*mock, default_device()).WillByDefault(testing::Return(CreateTestDevice(serial)));
        ON_CALL(*mock, list_devices(testing::_))
            .WillByDefault(testing::Return(std::vector<DeviceInfo>{CreateTestDevice(serial)}));
        return mock;
    }
};
