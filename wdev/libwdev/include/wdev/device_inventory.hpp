/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_inventory.hpp
 * @brief Listing of the devices currently attached to the bridge
 **/

#ifndef _WDEV_DEVICE_INVENTORY_HPP_
#define _WDEV_DEVICE_INVENTORY_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"
#include "wdev/bridge_client.hpp"

#include <string>
#include <vector>

/** wdev namespace */
namespace wdev
{

class DeviceInventory final
{
public:
    explicit DeviceInventory(BridgeClient &bridge);

    /**
     * Returns every listed device. Devices in "device" state get their model, platform version and manufacturer
     * from a single property query; if that query fails the fields stay empty.
     */
    Expected<std::vector<Device>> list();

    /**
     * @return The listed device with the given id, or WDEV_DEVICE_NOT_FOUND.
     */
    Expected<Device> find(const std::string &device_id);

    // Process list lines mentioning app_process, react, expo or metro
    Expected<std::vector<std::string>> get_development_processes(const std::string &device_id);
    // Installed package names mentioning react, expo or debug
    Expected<std::vector<std::string>> get_development_packages(const std::string &device_id);

    static Device to_device(const RawDeviceLine &line);

private:
    BridgeClient &m_bridge;
};

} /* namespace wdev */

#endif /* _WDEV_DEVICE_INVENTORY_HPP_ */
