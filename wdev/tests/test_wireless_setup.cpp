/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_wireless_setup.cpp
 * @brief Switching USB devices to network debugging
 **/

#include <gtest/gtest.h>

#include "wdev/wireless_setup.hpp"
#include "bridge/adb_output_parser.hpp"
#include "fake_bridge_client.hpp"

using namespace wdev;

static const std::string USB_DEVICE_ID = "R58M123ABC";

class WirelessSetupTest : public ::testing::Test {
protected:
    WirelessSetupTest() :
        inventory(bridge),
        setup(bridge, inventory)
    {
        bridge.listing_lines = {{USB_DEVICE_ID, "device"}};
    }

    void set_platform_version(const std::string &version)
    {
        bridge.properties[USB_DEVICE_ID] = {
            {WDEV_PROPERTY_MODEL, "SM-G991B"},
            {WDEV_PROPERTY_PLATFORM_VERSION, version},
        };
    }

    FakeBridgeClient bridge;
    DeviceInventory inventory;
    WirelessSetup setup;
};

TEST_F(WirelessSetupTest, ReadsRouteTableOnNewPlatforms)
{
    set_platform_version("13");
    bridge.shell_outputs[{USB_DEVICE_ID, "ip route"}] =
        "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42";

    auto endpoint = setup.enable(USB_DEVICE_ID);
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ("192.168.1.42", endpoint->address);
    EXPECT_EQ(WDEV_DEFAULT_TCP_PORT, endpoint->port);
    EXPECT_EQ("192.168.1.42:5555", endpoint->endpoint());
    EXPECT_EQ("SM-G991B", endpoint->model);
    EXPECT_FALSE(endpoint->already_wireless);

    ASSERT_EQ(1u, bridge.tcp_mode_calls.size());
    EXPECT_EQ(USB_DEVICE_ID, bridge.tcp_mode_calls[0].first);
    EXPECT_EQ(WDEV_DEFAULT_TCP_PORT, bridge.tcp_mode_calls[0].second);
    EXPECT_FALSE(bridge.was_shell_command_run("ip addr show wlan0"));
}

TEST_F(WirelessSetupTest, EmptyRouteAddressFailsWithoutSideEffects)
{
    set_platform_version("11");
    bridge.shell_outputs[{USB_DEVICE_ID, "ip route"}] = "";

    auto endpoint = setup.enable(USB_DEVICE_ID);
    EXPECT_EQ(WDEV_WIFI_ADDRESS_NOT_FOUND, endpoint.status());
    EXPECT_TRUE(bridge.was_shell_command_run("ip route"));
    EXPECT_TRUE(bridge.tcp_mode_calls.empty());
}

TEST_F(WirelessSetupTest, ReadsInterfaceOnLegacyPlatforms)
{
    set_platform_version("9");
    bridge.shell_outputs[{USB_DEVICE_ID, "ip addr show wlan0"}] =
        "    inet 10.0.0.23/24 brd 10.0.0.255 scope global wlan0";

    auto endpoint = setup.enable(USB_DEVICE_ID, 5556);
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ("10.0.0.23:5556", endpoint->endpoint());
    EXPECT_FALSE(bridge.was_shell_command_run("ip route"));
    ASSERT_EQ(1u, bridge.tcp_mode_calls.size());
    EXPECT_EQ(5556, bridge.tcp_mode_calls[0].second);
}

TEST_F(WirelessSetupTest, UnknownPlatformVersionUsesLegacyPath)
{
    set_platform_version("");
    bridge.shell_outputs[{USB_DEVICE_ID, "ip addr show wlan0"}] = "inet 10.0.0.23/24 scope global wlan0";

    EXPECT_EQ("10.0.0.23", setup.get_wifi_address(USB_DEVICE_ID, "UpsideDownCake"));
}

TEST_F(WirelessSetupTest, AlreadyWirelessDeviceIsLeftAlone)
{
    bridge.listing_lines = {{"192.168.1.42:5555", "device"}};

    auto endpoint = setup.enable("192.168.1.42:5555");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_TRUE(endpoint->already_wireless);
    EXPECT_EQ("192.168.1.42", endpoint->address);
    EXPECT_TRUE(bridge.tcp_mode_calls.empty());
    EXPECT_TRUE(bridge.shell_calls.empty());
}

TEST_F(WirelessSetupTest, UnknownDevice)
{
    EXPECT_EQ(WDEV_DEVICE_NOT_FOUND, setup.enable("missing").status());
    EXPECT_TRUE(bridge.tcp_mode_calls.empty());
}

TEST_F(WirelessSetupTest, TcpModeFailurePropagates)
{
    set_platform_version("13");
    bridge.shell_outputs[{USB_DEVICE_ID, "ip route"}] =
        "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42";
    bridge.enable_tcp_status = WDEV_BRIDGE_COMMAND_FAILED;

    EXPECT_EQ(WDEV_BRIDGE_COMMAND_FAILED, setup.enable(USB_DEVICE_ID).status());
}

TEST(WirelessSetupKnownDeviceTest, UnknownModelPlaceholder)
{
    WirelessEndpoint endpoint{};
    endpoint.device_id = USB_DEVICE_ID;
    endpoint.address = "192.168.1.42";
    endpoint.port = 5555;

    const auto device = WirelessSetup::to_known_device(endpoint, "2024-05-01T10:00:00.000Z");
    EXPECT_EQ(USB_DEVICE_ID, device.id);
    EXPECT_EQ("192.168.1.42:5555", device.endpoint);
    EXPECT_EQ(WDEV_UNKNOWN_MODEL, device.model);
    EXPECT_EQ("2024-05-01T10:00:00.000Z", device.last_connected);
}
