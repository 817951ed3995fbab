/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_device_inventory.cpp
 * @brief Device listing and development service queries
 **/

#include <gtest/gtest.h>

#include "wdev/device_inventory.hpp"
#include "bridge/adb_output_parser.hpp"
#include "fake_bridge_client.hpp"

using namespace wdev;

TEST(DeviceInventoryTest, ListsDevicesWithProperties)
{
    FakeBridgeClient bridge;
    bridge.listing_lines = {{"R58M123ABC", "device"}, {"192.168.1.12:5555", "device"}, {"emulator-5554", "offline"}};
    bridge.properties["R58M123ABC"] = {
        {WDEV_PROPERTY_MODEL, "SM-G991B"},
        {WDEV_PROPERTY_PLATFORM_VERSION, "13"},
        {WDEV_PROPERTY_MANUFACTURER, "samsung"},
    };

    DeviceInventory inventory(bridge);
    auto devices = inventory.list();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(3u, devices->size());

    const auto &usb = devices->at(0);
    EXPECT_EQ(DeviceStatus::DEVICE, usb.status);
    EXPECT_EQ("SM-G991B", usb.model);
    EXPECT_EQ("13", usb.platform_version);
    EXPECT_EQ("samsung", usb.manufacturer);
    EXPECT_FALSE(usb.wireless);

    // Property query fails, the device is still listed
    const auto &wireless = devices->at(1);
    EXPECT_TRUE(wireless.wireless);
    EXPECT_EQ("", wireless.model);

    const auto &offline = devices->at(2);
    EXPECT_EQ(DeviceStatus::OFFLINE, offline.status);
}

TEST(DeviceInventoryTest, ListingFailurePropagates)
{
    FakeBridgeClient bridge;
    bridge.list_status = WDEV_TIMEOUT;
    DeviceInventory inventory(bridge);
    EXPECT_EQ(WDEV_TIMEOUT, inventory.list().status());
}

TEST(DeviceInventoryTest, FindDevice)
{
    FakeBridgeClient bridge;
    bridge.listing_lines = {{"R58M123ABC", "device"}};
    DeviceInventory inventory(bridge);

    auto device = inventory.find("R58M123ABC");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ("R58M123ABC", device->id);
    EXPECT_EQ(WDEV_DEVICE_NOT_FOUND, inventory.find("R58M999").status());
}

TEST(DeviceInventoryTest, DevelopmentServices)
{
    FakeBridgeClient bridge;
    bridge.shell_outputs[{"R58M123ABC", "ps -A 2>/dev/null || ps"}] =
        "u0_a123 12345 678 0 0 0 0 S host.exp.exponent\n"
        "system 901 678 0 0 0 0 S system_server";
    bridge.shell_outputs[{"R58M123ABC", "pm list packages"}] =
        "package:com.android.settings\npackage:host.exp.exponent";
    DeviceInventory inventory(bridge);

    auto processes = inventory.get_development_processes("R58M123ABC");
    ASSERT_TRUE(processes.has_value());
    ASSERT_EQ(1u, processes->size());

    auto packages = inventory.get_development_packages("R58M123ABC");
    ASSERT_TRUE(packages.has_value());
    const std::vector<std::string> expected = {"host.exp.exponent"};
    EXPECT_EQ(expected, packages.value());

    EXPECT_EQ(WDEV_BRIDGE_COMMAND_FAILED, inventory.get_development_packages("other").status());
}
