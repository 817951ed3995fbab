/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_commands.cpp
 * @brief connect, disconnect and enable-wireless commands over a scripted bridge
 **/

#include <gtest/gtest.h>

#include "connect_command.hpp"
#include "disconnect_command.hpp"
#include "enable_wireless_command.hpp"
#include "prompt.hpp"
#include "bridge/adb_output_parser.hpp"
#include "fake_bridge_client.hpp"
#include "temp_directory.hpp"

#include <sstream>

class CommandTest : public ::testing::Test {
protected:
    CommandTest() :
        store(dir.file("config.json")),
        preferences(Preferences::load(store)),
        prompt(input, output),
        context{bridge, preferences, prompt}
    {}

    template<typename CommandType>
    wdev_status run(const std::string &command_line)
    {
        CLI::App app{"wireless-dev"};
        CommandType command(app, context);
        app.parse(command_line);
        return command.execute();
    }

    TempDirectory dir;
    KnownDevicesStore store;
    FakeBridgeClient bridge;
    Preferences preferences;
    std::istringstream input;
    std::ostringstream output;
    Prompt prompt;
    CliContext context;
};

TEST_F(CommandTest, ConnectRecordsNewDevice)
{
    bridge.accepting_addresses = {"192.168.1.40"};
    bridge.properties["192.168.1.40:5555"] = {{WDEV_PROPERTY_MODEL, "Pixel 7"}};

    EXPECT_EQ(WDEV_SUCCESS, run<ConnectCommand>("connect --ip 192.168.1.40"));

    const std::vector<std::string> expected_calls = {"192.168.1.40:5555"};
    EXPECT_EQ(expected_calls, bridge.connect_calls);

    const auto saved = store.load();
    ASSERT_EQ(1u, saved.size());
    EXPECT_EQ("192.168.1.40:5555", saved[0].id);
    EXPECT_EQ("192.168.1.40:5555", saved[0].endpoint);
    EXPECT_EQ("Pixel 7", saved[0].model);
    EXPECT_FALSE(saved[0].last_connected.empty());
}

TEST_F(CommandTest, ConnectRefused)
{
    EXPECT_EQ(WDEV_CONNECT_FAILURE, run<ConnectCommand>("connect -i 192.168.1.41:5556"));
    EXPECT_TRUE(preferences.known_devices().empty());
    EXPECT_TRUE(store.load().empty());
}

TEST_F(CommandTest, ConnectPromptsForAddressWithoutKnownDevices)
{
    bridge.accepting_addresses = {"192.168.1.40"};
    input.str("my phone\n192.168.1.40:5556\n");

    EXPECT_EQ(WDEV_SUCCESS, run<ConnectCommand>("connect"));

    const std::vector<std::string> expected_calls = {"192.168.1.40:5556"};
    EXPECT_EQ(expected_calls, bridge.connect_calls);
    EXPECT_NE(std::string::npos, output.str().find("Please enter a valid IP address and optional port"));
    ASSERT_EQ(1u, preferences.known_devices().size());
    EXPECT_EQ(WDEV_UNKNOWN_MODEL, preferences.known_devices()[0].model);
}

TEST_F(CommandTest, ConnectSelectsKnownDevice)
{
    KnownDevice known;
    known.id = "R58M123ABC";
    known.endpoint = "192.168.1.42:5555";
    known.model = "SM-G991B";
    known.last_connected = "2024-05-01T10:00:00.000Z";
    preferences.record(known);
    bridge.accepting_addresses = {"192.168.1.42"};
    input.str("1\n");

    EXPECT_EQ(WDEV_SUCCESS, run<ConnectCommand>("connect"));

    const std::vector<std::string> expected_calls = {"192.168.1.42:5555"};
    EXPECT_EQ(expected_calls, bridge.connect_calls);
    ASSERT_EQ(1u, preferences.known_devices().size());
    EXPECT_NE(known.last_connected, preferences.known_devices()[0].last_connected);
}

TEST_F(CommandTest, ConnectAbortedByEndOfInput)
{
    EXPECT_EQ(WDEV_ABORTED_BY_USER, run<ConnectCommand>("connect"));
    EXPECT_TRUE(bridge.connect_calls.empty());
}

TEST_F(CommandTest, ConnectRejectsInvalidAddressOption)
{
    EXPECT_THROW(run<ConnectCommand>("connect -i phone"), CLI::ValidationError);
}

TEST_F(CommandTest, BridgeNotInstalled)
{
    bridge.installed = false;
    EXPECT_EQ(WDEV_BRIDGE_NOT_INSTALLED, run<ConnectCommand>("connect -i 192.168.1.40"));
    EXPECT_TRUE(bridge.connect_calls.empty());
}

TEST_F(CommandTest, EnableWirelessRecordsDevice)
{
    bridge.listing_lines = {{"R58M123ABC", "device"}};
    bridge.properties["R58M123ABC"] = {{WDEV_PROPERTY_MODEL, "SM-G991B"}, {WDEV_PROPERTY_PLATFORM_VERSION, "13"}};
    bridge.shell_outputs[{"R58M123ABC", "ip route"}] =
        "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42";

    EXPECT_EQ(WDEV_SUCCESS, run<EnableWirelessCommand>("enable-wireless -d R58M123ABC"));

    const auto saved = store.load();
    ASSERT_EQ(1u, saved.size());
    EXPECT_EQ("R58M123ABC", saved[0].id);
    EXPECT_EQ("192.168.1.42:5555", saved[0].endpoint);
    EXPECT_EQ("SM-G991B", saved[0].model);
}

TEST_F(CommandTest, EnableWirelessWithoutWifiAddressRecordsNothing)
{
    bridge.listing_lines = {{"R58M123ABC", "device"}};
    bridge.properties["R58M123ABC"] = {{WDEV_PROPERTY_MODEL, "SM-G991B"}, {WDEV_PROPERTY_PLATFORM_VERSION, "11"}};
    bridge.shell_outputs[{"R58M123ABC", "ip route"}] = "";

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    EXPECT_EQ(WDEV_WIFI_ADDRESS_NOT_FOUND, run<EnableWirelessCommand>("enable-wireless -d R58M123ABC"));
    const auto printed = testing::internal::GetCapturedStdout() + testing::internal::GetCapturedStderr();

    // Reported to the user once, not also through the logger
    const std::string hint = "Make sure Wi-Fi is enabled.";
    const auto first = printed.find(hint);
    ASSERT_NE(std::string::npos, first);
    EXPECT_EQ(std::string::npos, printed.find(hint, first + hint.size()));

    EXPECT_TRUE(bridge.was_shell_command_run("ip route"));
    EXPECT_TRUE(bridge.tcp_mode_calls.empty());
    EXPECT_TRUE(preferences.known_devices().empty());
    EXPECT_TRUE(store.load().empty());
}

TEST_F(CommandTest, EnableWirelessPromptsAmongUsbDevices)
{
    bridge.listing_lines = {{"192.168.1.50:5555", "device"}, {"R58M123ABC", "device"}, {"R58M999", "unauthorized"}};
    bridge.properties["R58M123ABC"] = {{WDEV_PROPERTY_PLATFORM_VERSION, "9"}};
    bridge.shell_outputs[{"R58M123ABC", "ip addr show wlan0"}] = "inet 10.0.0.23/24 scope global wlan0";
    input.str("1\n");

    EXPECT_EQ(WDEV_SUCCESS, run<EnableWirelessCommand>("enable-wireless"));

    // Only the authorized USB device is offered
    EXPECT_NE(std::string::npos, output.str().find("1) Unknown (R58M123ABC)"));
    EXPECT_EQ(std::string::npos, output.str().find("2)"));
    ASSERT_EQ(1u, preferences.known_devices().size());
    EXPECT_EQ(WDEV_UNKNOWN_MODEL, preferences.known_devices()[0].model);
}

TEST_F(CommandTest, EnableWirelessWithoutUsbDevices)
{
    bridge.listing_lines = {{"192.168.1.50:5555", "device"}};
    EXPECT_EQ(WDEV_NO_DEVICES, run<EnableWirelessCommand>("enable-wireless"));
}

TEST_F(CommandTest, DisconnectGivenDevice)
{
    bridge.accepting_addresses = {"192.168.1.40"};
    ASSERT_EQ(WDEV_SUCCESS, run<ConnectCommand>("connect -i 192.168.1.40"));

    EXPECT_EQ(WDEV_SUCCESS, run<DisconnectCommand>("disconnect -i 192.168.1.40:5555"));
    const std::vector<std::string> expected_calls = {"192.168.1.40:5555"};
    EXPECT_EQ(expected_calls, bridge.disconnect_calls);
}

TEST_F(CommandTest, DisconnectUnknownDeviceFails)
{
    EXPECT_EQ(WDEV_DISCONNECT_FAILURE, run<DisconnectCommand>("disconnect -i 192.168.1.41:5555"));
}

TEST_F(CommandTest, DisconnectPromptsAmongWirelessDevices)
{
    bridge.listing_lines = {{"R58M123ABC", "device"}, {"192.168.1.50:5555", "device"}};
    input.str("1\n");

    // The fake only disconnects endpoints it connected, the choice is what matters here
    EXPECT_EQ(WDEV_DISCONNECT_FAILURE, run<DisconnectCommand>("disconnect"));
    EXPECT_NE(std::string::npos, output.str().find("1) Unknown (192.168.1.50:5555)"));
    const std::vector<std::string> expected_calls = {"192.168.1.50:5555"};
    EXPECT_EQ(expected_calls, bridge.disconnect_calls);
}

TEST_F(CommandTest, DisconnectWithoutWirelessDevices)
{
    bridge.listing_lines = {{"R58M123ABC", "device"}};
    EXPECT_EQ(WDEV_NO_DEVICES, run<DisconnectCommand>("disconnect"));
    EXPECT_TRUE(bridge.disconnect_calls.empty());
}
