/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file adb_client.hpp
 * @brief BridgeClient running the adb executable
 **/

#ifndef _WDEV_ADB_CLIENT_HPP_
#define _WDEV_ADB_CLIENT_HPP_

#include "wdev/bridge_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace wdev
{

#define WDEV_DEFAULT_ADB_PATH ("adb")

class AdbClient final : public BridgeClient
{
public:
    static Expected<std::unique_ptr<AdbClient>> create(const std::string &adb_path,
        std::chrono::milliseconds command_timeout);

    AdbClient(const std::string &adb_path, std::chrono::milliseconds command_timeout);
    virtual ~AdbClient() = default;

    virtual wdev_status check_installed() override;
    virtual Expected<std::vector<RawDeviceLine>> list_devices() override;
    virtual Expected<BridgeReply> connect(const std::string &endpoint, std::chrono::milliseconds timeout) override;
    virtual Expected<BridgeReply> disconnect(const std::string &endpoint) override;
    virtual Expected<std::string> get_property(const std::string &device_id, const std::string &key) override;
    virtual Expected<std::map<std::string, std::string>> get_properties(const std::string &device_id) override;
    virtual Expected<std::string> run_shell(const std::string &device_id, const std::string &command) override;
    virtual wdev_status enable_tcp_mode(const std::string &device_id, uint16_t port) override;

    // Serial numbers, "address:port" and mDNS service names
    static bool is_valid_device_id(const std::string &device_id);

    // Every argument single-quoted, so the shell passes each as one literal word
    std::string build_command_line(const std::vector<std::string> &args) const;

private:
    // Runs adb and returns its exit code and output. WDEV_BRIDGE_NOT_INSTALLED if the shell could not find adb.
    Expected<std::pair<int32_t, std::string>> run_raw(const std::vector<std::string> &args,
        std::chrono::milliseconds timeout);
    // Like run_raw, failing with WDEV_BRIDGE_COMMAND_FAILED on a non-zero exit code
    Expected<std::string> run(const std::vector<std::string> &args);

    const std::string m_adb_path;
    const std::chrono::milliseconds m_command_timeout;
};

} /* namespace wdev */

#endif /* _WDEV_ADB_CLIENT_HPP_ */
