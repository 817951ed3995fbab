/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file known_devices_store.cpp
 * @brief JSON file of the known devices
 **/

#include "wdev/preferences.hpp"
#include "utils/wdev_paths.hpp"

#include "common/utils.hpp"
#include "common/filesystem.hpp"
#include "common/logger_macros.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace wdev
{

#define JSON_PRINT_INDENTATION (2)

static const char *KNOWN_DEVICES_KEY = "knownDevices";
static const char *ID_KEY = "id";
static const char *ENDPOINT_KEY = "ip";
static const char *MODEL_KEY = "model";
static const char *LAST_CONNECTED_KEY = "lastConnected";

KnownDevicesStore::KnownDevicesStore(const std::string &file_path) :
    m_file_path(file_path)
{}

KnownDevicesStore KnownDevicesStore::create_default()
{
    return KnownDevicesStore(WdevPaths::get_config_file_path());
}

const std::string &KnownDevicesStore::file_path() const
{
    return m_file_path;
}

Expected<std::vector<KnownDevice>> KnownDevicesStore::parse(const std::string &content)
{
    try {
        const auto config_json = json::parse(content);
        CHECK(config_json.is_object(), WDEV_INVALID_CONFIG, "Config root must be an object");

        std::vector<KnownDevice> devices;
        const auto known_devices = config_json.find(KNOWN_DEVICES_KEY);
        if ((config_json.end() == known_devices) || known_devices->is_null()) {
            return devices;
        }
        CHECK(known_devices->is_array(), WDEV_INVALID_CONFIG, "\"{}\" must be an array", KNOWN_DEVICES_KEY);

        for (const auto &entry : *known_devices) {
            CHECK(entry.is_object(), WDEV_INVALID_CONFIG, "Every \"{}\" entry must be an object", KNOWN_DEVICES_KEY);
            KnownDevice device{};
            device.id = entry.value(ID_KEY, std::string());
            device.endpoint = entry.value(ENDPOINT_KEY, std::string());
            device.model = entry.value(MODEL_KEY, std::string());
            device.last_connected = entry.value(LAST_CONNECTED_KEY, std::string());
            devices.push_back(std::move(device));
        }
        return devices;
    }
    catch (json::exception &e) {
        LOGGER__WARNING("Failed parsing config: {}", e.what());
        return make_unexpected(WDEV_INVALID_CONFIG);
    }
}

std::string KnownDevicesStore::serialize(const std::vector<KnownDevice> &devices)
{
    auto known_devices = json::array();
    for (const auto &device : devices) {
        json entry;
        entry[ID_KEY] = device.id;
        entry[ENDPOINT_KEY] = device.endpoint;
        entry[MODEL_KEY] = device.model;
        entry[LAST_CONNECTED_KEY] = device.last_connected;
        known_devices.push_back(std::move(entry));
    }

    json config_json;
    config_json[KNOWN_DEVICES_KEY] = std::move(known_devices);
    return config_json.dump(JSON_PRINT_INDENTATION) + "\n";
}

std::vector<KnownDevice> KnownDevicesStore::load() const
{
    if (!Filesystem::does_file_exists(m_file_path)) {
        LOGGER__DEBUG("Config file {} does not exist yet", m_file_path);
        return {};
    }

    std::ifstream ifs(m_file_path);
    if (!ifs.good()) {
        LOGGER__WARNING("Failed opening config file {} with errno: {}, ignoring it", m_file_path, errno);
        return {};
    }
    std::stringstream content;
    content << ifs.rdbuf();

    auto devices = parse(content.str());
    if (!devices) {
        LOGGER__WARNING("Config file {} is malformed, starting with no known devices", m_file_path);
        return {};
    }
    return devices.release();
}

wdev_status KnownDevicesStore::save(const std::vector<KnownDevice> &devices) const
{
    const auto separator = m_file_path.rfind('/');
    if ((std::string::npos != separator) && (0 != separator)) {
        const auto dir_path = m_file_path.substr(0, separator);
        TRY(const auto is_dir, Filesystem::is_directory(dir_path));
        if (!is_dir) {
            CHECK_SUCCESS(Filesystem::create_directory(dir_path), "Failed creating config directory {}", dir_path);
        }
    }

    CHECK_SUCCESS(Filesystem::write_file_atomically(m_file_path, serialize(devices)),
        "Failed writing config file {}", m_file_path);
    LOGGER__DEBUG("Saved {} known devices to {}", devices.size(), m_file_path);
    return WDEV_SUCCESS;
}

} /* namespace wdev */
