/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file test_known_devices_store.cpp
 * @brief Known devices file format and tolerance
 **/

#include <gtest/gtest.h>

#include "wdev/preferences.hpp"
#include "temp_directory.hpp"

#include <fstream>
#include <sstream>

using namespace wdev;

static KnownDevice make_device(size_t index)
{
    KnownDevice device;
    device.id = "R58M" + std::to_string(index);
    device.endpoint = "192.168.1." + std::to_string(10 + index) + ":5555";
    device.model = "Pixel " + std::to_string(index);
    device.last_connected = "2024-05-01T10:00:0" + std::to_string(index % 10) + ".000Z";
    return device;
}

TEST(KnownDevicesStoreTest, SaveAndLoadRecords)
{
    TempDirectory dir;
    KnownDevicesStore store(dir.file("config.json"));

    std::vector<KnownDevice> devices;
    for (size_t i = 0; i < 5; i++) {
        devices.push_back(make_device(i));
    }
    ASSERT_EQ(WDEV_SUCCESS, store.save(devices));

    EXPECT_EQ(devices, store.load());
}

TEST(KnownDevicesStoreTest, SaveCreatesDirectory)
{
    TempDirectory dir;
    KnownDevicesStore store(dir.file("wireless-dev/config.json"));

    ASSERT_EQ(WDEV_SUCCESS, store.save({make_device(1)}));
    EXPECT_EQ(1u, store.load().size());
}

TEST(KnownDevicesStoreTest, MissingFileLoadsEmpty)
{
    TempDirectory dir;
    KnownDevicesStore store(dir.file("config.json"));
    EXPECT_TRUE(store.load().empty());
}

TEST(KnownDevicesStoreTest, MalformedFileLoadsEmpty)
{
    TempDirectory dir;
    dir.write("config.json", "{\"knownDevices\": [ {\"id\": ");
    KnownDevicesStore store(dir.file("config.json"));
    EXPECT_TRUE(store.load().empty());
}

TEST(KnownDevicesStoreTest, SerializedFormat)
{
    TempDirectory dir;
    KnownDevicesStore store(dir.file("config.json"));
    ASSERT_EQ(WDEV_SUCCESS, store.save({make_device(2)}));

    std::ifstream ifs(store.file_path());
    std::stringstream content;
    content << ifs.rdbuf();
    const auto text = content.str();
    EXPECT_NE(std::string::npos, text.find("\"knownDevices\""));
    EXPECT_NE(std::string::npos, text.find("\"ip\": \"192.168.1.12:5555\""));
    EXPECT_NE(std::string::npos, text.find("\"lastConnected\""));
}

TEST(KnownDevicesStoreTest, AbsentKeysDefaultToEmpty)
{
    auto devices = KnownDevicesStore::parse(R"({"knownDevices": [{"id": "R58M1"}]})");
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(1u, devices->size());
    EXPECT_EQ("R58M1", devices->at(0).id);
    EXPECT_EQ("", devices->at(0).endpoint);
    EXPECT_EQ("", devices->at(0).model);
    EXPECT_EQ("", devices->at(0).last_connected);
}

TEST(KnownDevicesStoreTest, MissingListIsEmpty)
{
    auto devices = KnownDevicesStore::parse("{}");
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());
}

TEST(KnownDevicesStoreTest, WrongTypesAreInvalid)
{
    EXPECT_EQ(WDEV_INVALID_CONFIG, KnownDevicesStore::parse("[]").status());
    EXPECT_EQ(WDEV_INVALID_CONFIG, KnownDevicesStore::parse(R"({"knownDevices": {}})").status());
    EXPECT_EQ(WDEV_INVALID_CONFIG, KnownDevicesStore::parse(R"({"knownDevices": [42]})").status());
    EXPECT_EQ(WDEV_INVALID_CONFIG, KnownDevicesStore::parse(R"({"knownDevices": [{"id": 7}]})").status());
    EXPECT_EQ(WDEV_INVALID_CONFIG, KnownDevicesStore::parse("not json").status());
}
