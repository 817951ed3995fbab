/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file adb_output_parser.hpp
 * @brief Parsing of the plain-text replies of adb
 **/

#ifndef _WDEV_ADB_OUTPUT_PARSER_HPP_
#define _WDEV_ADB_OUTPUT_PARSER_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"

#include <map>
#include <string>
#include <vector>

namespace wdev
{

#define WDEV_PROPERTY_MODEL ("ro.product.model")
#define WDEV_PROPERTY_PLATFORM_VERSION ("ro.build.version.release")
#define WDEV_PROPERTY_MANUFACTURER ("ro.product.manufacturer")
#define WDEV_WIFI_INTERFACE_NAME ("wlan0")

class AdbOutputParser final
{
public:
    AdbOutputParser() = delete;

    /**
     * Parses "adb devices" output into "<id> <state>" pairs. Daemon startup notices and lines of any other
     * shape are skipped. Returns WDEV_INVALID_BRIDGE_RESPONSE if the "List of devices attached" header is missing.
     */
    static Expected<std::vector<RawDeviceLine>> parse_device_list(const std::string &output);

    static DeviceStatus to_device_status(const std::string &state);

    // "192.168.1.12:5555" or "adb-XXXX._adb-tls-connect._tcp"
    static bool is_wireless_id(const std::string &device_id);

    static bool is_connect_success(const std::string &reply);
    static bool is_disconnect_success(const std::string &reply);

    /**
     * Parses a full "getprop" dump ("[key]: [value]" per line). Lines of other shapes are skipped.
     */
    static std::map<std::string, std::string> parse_properties(const std::string &output);

    // Returns the "src" address of the first route through the interface, or "" if there is none
    static std::string parse_route_source_address(const std::string &output,
        const std::string &interface_name = WDEV_WIFI_INTERFACE_NAME);

    // Returns the first "inet" address of "ip addr show" output without its prefix length, or ""
    static std::string parse_inet_address(const std::string &output);

    // "11" -> 11, "8.1.0" -> 8
    static Expected<int32_t> parse_major_version(const std::string &platform_version);

    static std::vector<std::string> filter_development_processes(const std::string &ps_output);
    // Also strips the "package:" prefix
    static std::vector<std::string> filter_development_packages(const std::string &pm_output);
};

} /* namespace wdev */

#endif /* _WDEV_ADB_OUTPUT_PARSER_HPP_ */
