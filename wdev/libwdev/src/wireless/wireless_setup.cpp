/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wireless_setup.cpp
 * @brief Switching USB attached devices to network debugging
 **/

#include "wdev/wireless_setup.hpp"
#include "bridge/adb_output_parser.hpp"

#include "common/utils.hpp"
#include "common/network_utils.hpp"
#include "common/logger_macros.hpp"

namespace wdev
{

static const char *ROUTE_TABLE_COMMAND = "ip route";
static const char *WIFI_INTERFACE_COMMAND = "ip addr show wlan0";

std::string WirelessEndpoint::endpoint() const
{
    return NetworkUtils::make_endpoint(address, port);
}

WirelessSetup::WirelessSetup(BridgeClient &bridge, DeviceInventory &inventory) :
    m_bridge(bridge),
    m_inventory(inventory)
{}

Expected<WirelessEndpoint> WirelessSetup::enable(const std::string &device_id, uint16_t port)
{
    CHECK(0 != port, WDEV_INVALID_ARGUMENT, "Invalid port 0");
    TRY(const auto device, m_inventory.find(device_id));

    WirelessEndpoint result{};
    result.device_id = device.id;
    result.port = port;
    result.model = device.model;

    if (device.wireless) {
        LOGGER__INFO("Device {} is already connected wirelessly", device.id);
        result.already_wireless = true;
        auto endpoint = NetworkUtils::split_endpoint(device.id, port);
        if (endpoint) {
            result.address = endpoint->first;
            result.port = endpoint->second;
        }
        return result;
    }

    auto platform_version = device.platform_version;
    if (platform_version.empty()) {
        TRY(platform_version, m_bridge.get_property(device.id, WDEV_PROPERTY_PLATFORM_VERSION));
    }

    result.address = get_wifi_address(device.id, platform_version);
    if (result.address.empty()) {
        LOGGER__INFO("No Wi-Fi address found for {} (platform version \"{}\")", device.id, platform_version);
        return make_unexpected(WDEV_WIFI_ADDRESS_NOT_FOUND);
    }

    CHECK_SUCCESS(m_bridge.enable_tcp_mode(device.id, port), "Failed switching {} to TCP mode", device.id);
    LOGGER__INFO("Wireless debugging enabled on {} at {}", device.id, result.endpoint());

    result.already_wireless = false;
    return result;
}

std::string WirelessSetup::get_wifi_address(const std::string &device_id, const std::string &platform_version)
{
    auto major_version = AdbOutputParser::parse_major_version(platform_version);
    if (!major_version) {
        LOGGER__WARNING("Unknown platform version \"{}\" of {}, assuming a version older than {}",
            platform_version, device_id, WDEV_ROUTE_LOOKUP_MIN_PLATFORM_VERSION);
    }

    if (major_version && (major_version.value() >= WDEV_ROUTE_LOOKUP_MIN_PLATFORM_VERSION)) {
        LOGGER__DEBUG("Reading the Wi-Fi address of {} from the route table", device_id);
        auto routes = m_bridge.run_shell(device_id, ROUTE_TABLE_COMMAND);
        if (!routes) {
            LOGGER__INFO("Failed reading the route table of {}, status {}", device_id, routes.status());
            return "";
        }
        return AdbOutputParser::parse_route_source_address(routes.value());
    }

    LOGGER__DEBUG("Reading the Wi-Fi address of {} from the wlan0 interface", device_id);
    auto wlan_info = m_bridge.run_shell(device_id, WIFI_INTERFACE_COMMAND);
    if (!wlan_info) {
        LOGGER__INFO("Failed reading the wlan0 interface of {}, status {}", device_id, wlan_info.status());
        return "";
    }
    return AdbOutputParser::parse_inet_address(wlan_info.value());
}

KnownDevice WirelessSetup::to_known_device(const WirelessEndpoint &endpoint, const std::string &timestamp)
{
    KnownDevice known_device{};
    known_device.id = endpoint.device_id;
    known_device.endpoint = endpoint.endpoint();
    known_device.model = endpoint.model.empty() ? WDEV_UNKNOWN_MODEL : endpoint.model;
    known_device.last_connected = timestamp;
    return known_device;
}

} /* namespace wdev */
