/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file disconnect_command.cpp
 * @brief Disconnects a wireless device
 **/

#include "disconnect_command.hpp"
#include "common.hpp"
#include "prompt.hpp"
#include "wdev/device_inventory.hpp"

#include <iostream>

DisconnectCommand::DisconnectCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("disconnect", "Disconnect a wireless device"), context)
{
    m_app->add_option("-i,--ip", m_device_id, "Device IP address with an optional port");
}

wdev_status DisconnectCommand::execute_with_bridge()
{
    // Failures were reported while choosing
    auto chosen = choose_device();
    if (!chosen) {
        return chosen.status();
    }
    const auto device_id = chosen.release();

    std::cout << "Disconnecting from " << device_id << "..." << std::endl;
    auto reply = m_context.bridge.disconnect(device_id);
    if (!reply) {
        CliCommon::print_error(fmt::format("Failed to disconnect from {}. status={}", device_id, reply.status()));
        return reply.status();
    }
    std::cout << reply->message << std::endl;
    if (!reply->success) {
        CliCommon::print_error(fmt::format("Failed to disconnect from {}", device_id));
        return WDEV_DISCONNECT_FAILURE;
    }

    CliCommon::print_success(fmt::format("Disconnected from {}", device_id));
    return WDEV_SUCCESS;
}

Expected<std::string> DisconnectCommand::choose_device()
{
    if (!m_device_id.empty()) {
        return std::string(m_device_id);
    }

    DeviceInventory inventory(m_context.bridge);
    auto devices = inventory.list();
    if (!devices) {
        CliCommon::print_error(fmt::format("Failed to list devices. status={}", devices.status()));
        return make_unexpected(devices.status());
    }

    std::vector<std::string> ids;
    std::vector<std::string> choices;
    for (const auto &device : devices.value()) {
        if (device.wireless) {
            ids.push_back(device.id);
            choices.push_back(fmt::format("{} ({})", device.model.empty() ? WDEV_UNKNOWN_MODEL : device.model, device.id));
        }
    }
    if (ids.empty()) {
        CliCommon::print_warning("No wireless devices connected.");
        return make_unexpected(WDEV_NO_DEVICES);
    }

    TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, const auto index,
        m_context.prompt.select("Select a device to disconnect:", choices));
    return std::string(ids[index]);
}
