/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_adb_output_parser.cpp
 * @brief Parsing of captured adb outputs
 **/

#include <gtest/gtest.h>

#include "bridge/adb_output_parser.hpp"

using namespace wdev;

TEST(AdbOutputParserTest, ParsesDeviceList)
{
    const std::string output =
        "List of devices attached\n"
        "R58M123ABC\tdevice\n"
        "192.168.1.12:5555\tdevice\n"
        "emulator-5554\toffline\n"
        "0123456789ABCDEF\tunauthorized\n"
        "\n";

    auto devices = AdbOutputParser::parse_device_list(output);
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(4u, devices->size());
    EXPECT_EQ("R58M123ABC", devices->at(0).id);
    EXPECT_EQ("device", devices->at(0).state);
    EXPECT_EQ("192.168.1.12:5555", devices->at(1).id);
    EXPECT_EQ("offline", devices->at(2).state);
    EXPECT_EQ("unauthorized", devices->at(3).state);
}

TEST(AdbOutputParserTest, SkipsDaemonNotices)
{
    const std::string output =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\r\n"
        "R58M123ABC\tdevice\r\n";

    auto devices = AdbOutputParser::parse_device_list(output);
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(1u, devices->size());
    EXPECT_EQ("R58M123ABC", devices->at(0).id);
}

TEST(AdbOutputParserTest, KeepsSpacesOfMdnsIds)
{
    const std::string output =
        "List of devices attached\n"
        "adb-R58M123ABC-xyz (2)._adb-tls-connect._tcp\tdevice\n";

    auto devices = AdbOutputParser::parse_device_list(output);
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(1u, devices->size());
    EXPECT_EQ("adb-R58M123ABC-xyz (2)._adb-tls-connect._tcp", devices->at(0).id);
    EXPECT_TRUE(AdbOutputParser::is_wireless_id(devices->at(0).id));
}

TEST(AdbOutputParserTest, EmptyDeviceList)
{
    auto devices = AdbOutputParser::parse_device_list("List of devices attached\n\n");
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());
}

TEST(AdbOutputParserTest, MissingHeaderIsInvalid)
{
    auto devices = AdbOutputParser::parse_device_list("adb: command not found");
    EXPECT_EQ(WDEV_INVALID_BRIDGE_RESPONSE, devices.status());
}

TEST(AdbOutputParserTest, DeviceStatus)
{
    EXPECT_EQ(DeviceStatus::DEVICE, AdbOutputParser::to_device_status("device"));
    EXPECT_EQ(DeviceStatus::OFFLINE, AdbOutputParser::to_device_status("offline"));
    EXPECT_EQ(DeviceStatus::UNAUTHORIZED, AdbOutputParser::to_device_status("unauthorized"));
    EXPECT_EQ(DeviceStatus::UNKNOWN, AdbOutputParser::to_device_status("recovery"));
}

TEST(AdbOutputParserTest, WirelessIds)
{
    EXPECT_TRUE(AdbOutputParser::is_wireless_id("192.168.1.12:5555"));
    EXPECT_TRUE(AdbOutputParser::is_wireless_id("10.0.0.7:37215"));
    EXPECT_FALSE(AdbOutputParser::is_wireless_id("R58M123ABC"));
    EXPECT_FALSE(AdbOutputParser::is_wireless_id("emulator-5554"));
}

TEST(AdbOutputParserTest, ConnectReplies)
{
    EXPECT_TRUE(AdbOutputParser::is_connect_success("connected to 192.168.1.12:5555"));
    EXPECT_TRUE(AdbOutputParser::is_connect_success("already connected to 192.168.1.12:5555"));
    EXPECT_FALSE(AdbOutputParser::is_connect_success(
        "failed to connect to '192.168.1.13:5555': Connection refused"));
    EXPECT_FALSE(AdbOutputParser::is_connect_success("cannot connect to 192.168.1.13:5555: No route to host"));
    EXPECT_FALSE(AdbOutputParser::is_connect_success(""));
}

TEST(AdbOutputParserTest, DisconnectReplies)
{
    EXPECT_TRUE(AdbOutputParser::is_disconnect_success("disconnected 192.168.1.12:5555"));
    EXPECT_FALSE(AdbOutputParser::is_disconnect_success("error: no such device '192.168.1.12:5555'"));
}

TEST(AdbOutputParserTest, ParsesProperties)
{
    const std::string output =
        "[ro.build.version.release]: [13]\n"
        "[ro.product.manufacturer]: [samsung]\n"
        "[ro.product.model]: [SM-G991B]\n"
        "[persist.sys.empty]: []\n"
        "garbage line\n";

    const auto properties = AdbOutputParser::parse_properties(output);
    EXPECT_EQ(4u, properties.size());
    EXPECT_EQ("13", properties.at(WDEV_PROPERTY_PLATFORM_VERSION));
    EXPECT_EQ("samsung", properties.at(WDEV_PROPERTY_MANUFACTURER));
    EXPECT_EQ("SM-G991B", properties.at(WDEV_PROPERTY_MODEL));
    EXPECT_EQ("", properties.at("persist.sys.empty"));
}

TEST(AdbOutputParserTest, RouteSourceAddress)
{
    const std::string output =
        "10.0.2.0/24 dev eth0 proto kernel scope link src 10.0.2.15\n"
        "192.168.1.0/24 dev wlan0 proto kernel scope link src 192.168.1.42\n";

    EXPECT_EQ("192.168.1.42", AdbOutputParser::parse_route_source_address(output));
    EXPECT_EQ("10.0.2.15", AdbOutputParser::parse_route_source_address(output, "eth0"));
    EXPECT_EQ("", AdbOutputParser::parse_route_source_address(""));
    EXPECT_EQ("", AdbOutputParser::parse_route_source_address("default via 10.0.2.2 dev eth0"));
}

TEST(AdbOutputParserTest, InetAddress)
{
    const std::string output =
        "30: wlan0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc mq state UP group default qlen 3000\n"
        "    link/ether 02:00:00:44:55:66 brd ff:ff:ff:ff:ff:ff\n"
        "    inet 192.168.1.42/24 brd 192.168.1.255 scope global wlan0\n"
        "       valid_lft forever preferred_lft forever\n"
        "    inet6 fe80::ff:fe44:5566/64 scope link\n";

    EXPECT_EQ("192.168.1.42", AdbOutputParser::parse_inet_address(output));
    EXPECT_EQ("", AdbOutputParser::parse_inet_address("Device \"wlan0\" does not exist."));
}

TEST(AdbOutputParserTest, MajorVersion)
{
    EXPECT_EQ(11, AdbOutputParser::parse_major_version("11").value());
    EXPECT_EQ(8, AdbOutputParser::parse_major_version("8.1.0").value());
    EXPECT_EQ(14, AdbOutputParser::parse_major_version(" 14\n").value());
    EXPECT_EQ(WDEV_INVALID_BRIDGE_RESPONSE, AdbOutputParser::parse_major_version("").status());
    EXPECT_EQ(WDEV_INVALID_BRIDGE_RESPONSE, AdbOutputParser::parse_major_version("Tiramisu").status());
}

TEST(AdbOutputParserTest, DevelopmentProcesses)
{
    const std::string output =
        "USER           PID  PPID     VSZ    RSS WCHAN            ADDR S NAME\n"
        "root             1     0 1234567   4000 0                   0 S init\n"
        "u0_a123      12345   678 9876543 123456 0                   0 S host.exp.exponent\n"
        "u0_a124      12346   678 9876543 123456 0                   0 S com.example.reactapp\n"
        "system         901   678 9876543 123456 0                   0 S system_server\n";

    const auto processes = AdbOutputParser::filter_development_processes(output);
    ASSERT_EQ(2u, processes.size());
    EXPECT_NE(std::string::npos, processes[0].find("host.exp.exponent"));
    EXPECT_NE(std::string::npos, processes[1].find("com.example.reactapp"));
}

TEST(AdbOutputParserTest, DevelopmentPackages)
{
    const std::string output =
        "package:com.android.settings\n"
        "package:host.exp.exponent\n"
        "package:com.example.app.debug\n"
        "package:com.facebook.react.devsupport\n"
        "package:com.google.android.gms\n";

    const auto packages = AdbOutputParser::filter_development_packages(output);
    const std::vector<std::string> expected = {"host.exp.exponent", "com.example.app.debug",
        "com.facebook.react.devsupport"};
    EXPECT_EQ(expected, packages);
}
