/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file preferences.hpp
 * @brief Persisted record of the devices used over the network
 **/

#ifndef _WDEV_PREFERENCES_HPP_
#define _WDEV_PREFERENCES_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"

#include <string>
#include <vector>

/** wdev namespace */
namespace wdev
{

/**
 * The JSON file holding the known devices:
 * {"knownDevices": [{"id": ..., "ip": "address:port", "model": ..., "lastConnected": ...}]}
 */
class KnownDevicesStore final
{
public:
    explicit KnownDevicesStore(const std::string &file_path);

    // <config dir>/config.json
    static KnownDevicesStore create_default();

    /**
     * Reads the known devices. A missing file gives an empty list, a malformed one gives an empty list and a warning.
     */
    std::vector<KnownDevice> load() const;

    /**
     * Overwrites the file with the given devices, creating its directory if needed.
     */
    wdev_status save(const std::vector<KnownDevice> &devices) const;

    const std::string &file_path() const;

    // Missing keys read as empty strings. WDEV_INVALID_CONFIG for invalid JSON or values of the wrong type.
    static Expected<std::vector<KnownDevice>> parse(const std::string &content);
    static std::string serialize(const std::vector<KnownDevice> &devices);

private:
    std::string m_file_path;
};

/**
 * The known devices loaded once at startup. Commands mutate it and save it explicitly.
 */
class Preferences final
{
public:
    static Preferences load(const KnownDevicesStore &store);

    const std::vector<KnownDevice> &known_devices() const;

    /**
     * Appends the device, or refreshes the model and timestamp of the record with the same id and endpoint.
     */
    void record(const KnownDevice &device);

    /**
     * Sets the timestamp of the record with the given endpoint.
     * @return false if no record has that endpoint.
     */
    bool touch(const std::string &endpoint, const std::string &timestamp);

    wdev_status save() const;

private:
    Preferences(const KnownDevicesStore &store, std::vector<KnownDevice> &&known_devices);

    KnownDevicesStore m_store;
    std::vector<KnownDevice> m_known_devices;
};

} /* namespace wdev */

#endif /* _WDEV_PREFERENCES_HPP_ */
