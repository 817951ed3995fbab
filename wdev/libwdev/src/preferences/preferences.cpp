/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file preferences.cpp
 * @brief Known devices loaded for the current command
 **/

#include "wdev/preferences.hpp"

#include "common/utils.hpp"
#include "common/logger_macros.hpp"

namespace wdev
{

Preferences Preferences::load(const KnownDevicesStore &store)
{
    return Preferences(store, store.load());
}

Preferences::Preferences(const KnownDevicesStore &store, std::vector<KnownDevice> &&known_devices) :
    m_store(store),
    m_known_devices(std::move(known_devices))
{}

const std::vector<KnownDevice> &Preferences::known_devices() const
{
    return m_known_devices;
}

void Preferences::record(const KnownDevice &device)
{
    for (auto &known_device : m_known_devices) {
        if ((known_device.id == device.id) && (known_device.endpoint == device.endpoint)) {
            known_device.model = device.model;
            known_device.last_connected = device.last_connected;
            return;
        }
    }
    m_known_devices.push_back(device);
}

bool Preferences::touch(const std::string &endpoint, const std::string &timestamp)
{
    for (auto &known_device : m_known_devices) {
        if (known_device.endpoint == endpoint) {
            known_device.last_connected = timestamp;
            return true;
        }
    }
    return false;
}

wdev_status Preferences::save() const
{
    return m_store.save(m_known_devices);
}

} /* namespace wdev */
