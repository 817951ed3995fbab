/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file device.hpp
 * @brief Records describing listed devices, discovered hosts and known devices
 **/

#ifndef _WDEV_DEVICE_HPP_
#define _WDEV_DEVICE_HPP_

#include "wdev/wdev.h"

#include <string>

/** wdev namespace */
namespace wdev
{

/** Connection state reported by the bridge for a listed device */
enum class DeviceStatus {
    DEVICE,
    OFFLINE,
    UNAUTHORIZED,
    UNKNOWN
};

/** One entry of the bridge's device listing, before any property query */
struct RawDeviceLine {
    std::string id;
    std::string state;
};

/** A device from the current listing */
struct Device {
    std::string id;
    DeviceStatus status;
    std::string model;
    std::string platform_version;
    std::string manufacturer;
    /** True when the device is attached over the network rather than USB */
    bool wireless;
};

enum class HostStatus {
    CONNECTED,
    DISCOVERABLE
};

/** A host found by the discovery sweep */
struct DiscoveredHost {
    std::string address;
    HostStatus status;

    bool operator==(const DiscoveredHost &other) const
    {
        return (address == other.address) && (status == other.status);
    }
};

/** A persisted record of a device previously used over the network */
struct KnownDevice {
    std::string id;
    /** "address:port" */
    std::string endpoint;
    std::string model;
    /** ISO-8601 UTC, e.g. "2025-01-31T08:15:00.123Z" */
    std::string last_connected;

    bool operator==(const KnownDevice &other) const
    {
        return (id == other.id) && (endpoint == other.endpoint) && (model == other.model) &&
            (last_connected == other.last_connected);
    }
};

inline const char *device_status_to_string(DeviceStatus status)
{
    switch (status) {
    case DeviceStatus::DEVICE:
        return "device";
    case DeviceStatus::OFFLINE:
        return "offline";
    case DeviceStatus::UNAUTHORIZED:
        return "unauthorized";
    default:
        return "unknown";
    }
}

} /* namespace wdev */

#endif /* _WDEV_DEVICE_HPP_ */
