/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wireless_setup.hpp
 * @brief Switching USB attached devices to network debugging
 **/

#ifndef _WDEV_WIRELESS_SETUP_HPP_
#define _WDEV_WIRELESS_SETUP_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"
#include "wdev/bridge_client.hpp"
#include "wdev/device_inventory.hpp"

#include <string>

/** wdev namespace */
namespace wdev
{

/** Platform major version from which the Wi-Fi address is read from the route table */
#define WDEV_ROUTE_LOOKUP_MIN_PLATFORM_VERSION (11)

struct WirelessEndpoint {
    std::string device_id;
    /** Wi-Fi address of the device. Empty for an already wireless device whose id is not "address:port" */
    std::string address;
    uint16_t port;
    std::string model;
    /** The device was attached over the network already, nothing was changed */
    bool already_wireless;

    std::string endpoint() const;
};

class WirelessSetup final
{
public:
    WirelessSetup(BridgeClient &bridge, DeviceInventory &inventory);

    /**
     * Makes the device's bridge daemon listen on the given port of its Wi-Fi address.
     *
     * @return The device's endpoint. WDEV_DEVICE_NOT_FOUND if the device is not listed,
     *         WDEV_WIFI_ADDRESS_NOT_FOUND if its Wi-Fi address could not be read.
     * @note Recording the device in the preferences is left to the caller.
     */
    Expected<WirelessEndpoint> enable(const std::string &device_id, uint16_t port = WDEV_DEFAULT_TCP_PORT);

    /**
     * Reads the device's Wi-Fi address: from the wlan0 route on platform 11 and above, from the wlan0
     * interface otherwise. Returns an empty string if there is none.
     */
    std::string get_wifi_address(const std::string &device_id, const std::string &platform_version);

    static KnownDevice to_known_device(const WirelessEndpoint &endpoint, const std::string &timestamp);

private:
    BridgeClient &m_bridge;
    DeviceInventory &m_inventory;
};

} /* namespace wdev */

#endif /* _WDEV_WIRELESS_SETUP_HPP_ */
