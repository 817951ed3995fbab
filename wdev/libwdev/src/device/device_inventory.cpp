/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device_inventory.cpp
 * @brief Listing of the devices currently attached to the bridge
 **/

#include "wdev/device_inventory.hpp"
#include "bridge/adb_output_parser.hpp"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

namespace wdev
{

// toybox ps (Android 8+) needs -A to list every process, the older toolbox ps rejects it
static const char *PROCESS_LIST_COMMAND = "ps -A 2>/dev/null || ps";
static const char *PACKAGE_LIST_COMMAND = "pm list packages";

static std::string get_or_empty(const std::map<std::string, std::string> &properties, const std::string &key)
{
    const auto it = properties.find(key);
    return (properties.end() == it) ? "" : it->second;
}

DeviceInventory::DeviceInventory(BridgeClient &bridge) :
    m_bridge(bridge)
{}

Device DeviceInventory::to_device(const RawDeviceLine &line)
{
    Device device{};
    device.id = line.id;
    device.status = AdbOutputParser::to_device_status(line.state);
    device.wireless = AdbOutputParser::is_wireless_id(line.id);
    return device;
}

Expected<std::vector<Device>> DeviceInventory::list()
{
    TRY(const auto lines, m_bridge.list_devices());

    std::vector<Device> devices;
    devices.reserve(lines.size());
    for (const auto &line : lines) {
        auto device = to_device(line);
        if (DeviceStatus::DEVICE == device.status) {
            auto properties = m_bridge.get_properties(device.id);
            if (properties) {
                device.model = get_or_empty(properties.value(), WDEV_PROPERTY_MODEL);
                device.platform_version = get_or_empty(properties.value(), WDEV_PROPERTY_PLATFORM_VERSION);
                device.manufacturer = get_or_empty(properties.value(), WDEV_PROPERTY_MANUFACTURER);
            } else {
                LOGGER__INFO("Failed reading properties of {}, status {}", device.id, properties.status());
            }
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

Expected<Device> DeviceInventory::find(const std::string &device_id)
{
    TRY(auto devices, list());
    for (auto &device : devices) {
        if (device_id == device.id) {
            return std::move(device);
        }
    }

    LOGGER__INFO("Device {} is not in the device listing", device_id);
    return make_unexpected(WDEV_DEVICE_NOT_FOUND);
}

Expected<std::vector<std::string>> DeviceInventory::get_development_processes(const std::string &device_id)
{
    TRY(const auto output, m_bridge.run_shell(device_id, PROCESS_LIST_COMMAND));
    return AdbOutputParser::filter_development_processes(output);
}

Expected<std::vector<std::string>> DeviceInventory::get_development_packages(const std::string &device_id)
{
    TRY(const auto output, m_bridge.run_shell(device_id, PACKAGE_LIST_COMMAND));
    return AdbOutputParser::filter_development_packages(output);
}

} /* namespace wdev */
