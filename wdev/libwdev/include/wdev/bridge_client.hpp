/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file bridge_client.hpp
 * @brief Interface to the external device bridge executable (adb)
 **/

#ifndef _WDEV_BRIDGE_CLIENT_HPP_
#define _WDEV_BRIDGE_CLIENT_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

/** wdev namespace */
namespace wdev
{

class BridgeClient;
using BridgeClientPtr = std::unique_ptr<BridgeClient>;

/** Outcome of a connect or disconnect the bridge answered */
struct BridgeReply {
    /** Whether the reply reports the requested state change */
    bool success;
    /** The bridge's reply text, trimmed */
    std::string message;
};

/**
 * Runs bridge commands and interprets their replies.
 * Implementations must be safe to call from several threads at once (the discovery sweep probes in parallel).
 */
class BridgeClient
{
public:
    /**
     * Creates a client for the real adb executable. The executable is taken from $WDEV_ADB_PATH, or "adb" from PATH.
     *
     * @param[in] command_timeout   Timeout of every command except connect, which takes its own.
     */
    static Expected<BridgeClientPtr> create_adb(
        std::chrono::milliseconds command_timeout = std::chrono::milliseconds(WDEV_DEFAULT_BRIDGE_TIMEOUT_MS));

    virtual ~BridgeClient() = default;
    BridgeClient(const BridgeClient &) = delete;
    BridgeClient &operator=(const BridgeClient &) = delete;
    BridgeClient(BridgeClient &&) = delete;
    BridgeClient &operator=(BridgeClient &&) = delete;

    /**
     * @return WDEV_SUCCESS if the bridge executable can be run, WDEV_BRIDGE_NOT_INSTALLED otherwise.
     */
    virtual wdev_status check_installed() = 0;

    virtual Expected<std::vector<RawDeviceLine>> list_devices() = 0;

    /**
     * Connects the bridge to a network endpoint.
     *
     * @param[in] endpoint  "address:port".
     * @param[in] timeout   Time to wait for the bridge before killing it.
     * @return The bridge's reply, whose success flag is false when the bridge refused (unreachable host, connection
     *         refused). WDEV_TIMEOUT if the bridge did not answer in time, other errors if it could not be run.
     */
    virtual Expected<BridgeReply> connect(const std::string &endpoint, std::chrono::milliseconds timeout) = 0;

    /**
     * @param[in] endpoint  "address:port", or any listed device id of a network device.
     * @return The bridge's reply, whose success flag is false when nothing was disconnected.
     */
    virtual Expected<BridgeReply> disconnect(const std::string &endpoint) = 0;

    /**
     * @return The value of a single system property, trimmed. Empty if the property is not set.
     */
    virtual Expected<std::string> get_property(const std::string &device_id, const std::string &key) = 0;

    /**
     * Reads all system properties of a device with a single command.
     */
    virtual Expected<std::map<std::string, std::string>> get_properties(const std::string &device_id) = 0;

    /**
     * Runs a command line in the device's shell and returns its output.
     */
    virtual Expected<std::string> run_shell(const std::string &device_id, const std::string &command) = 0;

    /**
     * Restarts the device's bridge daemon listening on the given TCP port.
     */
    virtual wdev_status enable_tcp_mode(const std::string &device_id, uint16_t port) = 0;

protected:
    BridgeClient() = default;
};

} /* namespace wdev */

#endif /* _WDEV_BRIDGE_CLIENT_HPP_ */
