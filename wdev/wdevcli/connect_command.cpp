/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file connect_command.cpp
 * @brief Connects to a device over the network
 **/

#include "connect_command.hpp"
#include "common.hpp"
#include "prompt.hpp"
#include "common/network_utils.hpp"
#include "bridge/adb_output_parser.hpp"

#include <iostream>

ConnectCommand::ConnectCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("connect", "Connect to a device over the network"), context)
{
    m_app->add_option("-i,--ip", m_endpoint, "Device IP address with an optional port (default port: 5555)")
        ->check(EndpointValidator());
}

wdev_status ConnectCommand::execute_with_bridge()
{
    TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, auto endpoint, choose_endpoint());

    if (std::string::npos == endpoint.find(':')) {
        endpoint = NetworkUtils::make_endpoint(endpoint, WDEV_DEFAULT_TCP_PORT);
    }
    auto address_and_port = NetworkUtils::split_endpoint(endpoint, WDEV_DEFAULT_TCP_PORT);
    if (!address_and_port) {
        CliCommon::print_error(fmt::format("Invalid device address {}", endpoint));
        return address_and_port.status();
    }

    std::cout << "Connecting to " << endpoint << "..." << std::endl;
    auto reply = m_context.bridge.connect(endpoint, std::chrono::milliseconds(WDEV_DEFAULT_BRIDGE_TIMEOUT_MS));
    if (!reply) {
        CliCommon::print_error(fmt::format("Failed to connect to {}. status={}", endpoint, reply.status()));
        return reply.status();
    }
    if (!reply->success) {
        std::cout << reply->message << std::endl;
        CliCommon::print_error(fmt::format("Failed to connect to {}", endpoint));
        return WDEV_CONNECT_FAILURE;
    }
    CliCommon::print_success(reply->message);

    const auto timestamp = CliCommon::now_timestamp();
    if (!m_context.preferences.touch(endpoint, timestamp)) {
        auto model = m_context.bridge.get_property(endpoint, WDEV_PROPERTY_MODEL);
        KnownDevice device;
        device.id = endpoint;
        device.endpoint = endpoint;
        device.model = (model && !model->empty()) ? model.value() : WDEV_UNKNOWN_MODEL;
        device.last_connected = timestamp;
        m_context.preferences.record(device);
    }
    auto status = m_context.preferences.save();
    if (WDEV_SUCCESS != status) {
        CliCommon::print_error(fmt::format("Failed to save known devices. status={}", status));
        return status;
    }

    CliCommon::print_success(fmt::format("Connected to {}", endpoint));
    return WDEV_SUCCESS;
}

Expected<std::string> ConnectCommand::choose_endpoint()
{
    if (!m_endpoint.empty()) {
        return std::string(m_endpoint);
    }

    const auto &known_devices = m_context.preferences.known_devices();
    if (known_devices.empty()) {
        return m_context.prompt.input("Enter device IP and port (e.g., 192.168.1.100:5555):",
            std::regex(WDEV_ENDPOINT_PATTERN), "Please enter a valid IP address and optional port");
    }

    std::vector<std::string> choices;
    for (const auto &device : known_devices) {
        choices.push_back(fmt::format("{} ({})", device.model, device.endpoint));
    }
    TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, const auto index,
        m_context.prompt.select("Select a device to connect to:", choices));
    return std::string(known_devices[index].endpoint);
}
