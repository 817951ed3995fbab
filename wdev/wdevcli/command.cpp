/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.cpp
 * @brief Base classes for wireless-dev commands.
 **/


#include "command.hpp"
#include "common.hpp"
#include "wdev/device_inventory.hpp"

#include <iostream>

Command::Command(CLI::App *app) :
    m_app(app)
{
}

ContainerCommand::ContainerCommand(CLI::App *app, CliContext &context) :
    Command(app),
    m_context(context)
{
    m_app->require_subcommand(1);
}

wdev_status ContainerCommand::execute()
{
    for (auto &command : m_subcommands) {
        if (command->parsed()) {
            return command->execute();
        }
    }

    LOGGER__ERROR("No subcommand found");
    return WDEV_NOT_FOUND;
}

BridgeCommand::BridgeCommand(CLI::App *app, CliContext &context) :
    Command(app),
    m_context(context)
{
}

wdev_status BridgeCommand::execute()
{
    auto status = m_context.bridge.check_installed();
    if (WDEV_BRIDGE_NOT_INSTALLED == status) {
        CliCommon::print_error("ADB is not installed or not in PATH. Please install Android SDK and add ADB to your PATH.");
        return status;
    }
    CHECK_SUCCESS(status);

    return execute_with_bridge();
}

Expected<WirelessEndpoint> BridgeCommand::enable_wireless(const std::string &device_id, uint16_t port)
{
    std::cout << "Enabling wireless debugging on " << device_id << "..." << std::endl;

    DeviceInventory inventory(m_context.bridge);
    WirelessSetup setup(m_context.bridge, inventory);
    auto endpoint = setup.enable(device_id, port);
    if (!endpoint) {
        if (WDEV_DEVICE_NOT_FOUND == endpoint.status()) {
            CliCommon::print_error(fmt::format("Device {} not found.", device_id));
        } else if (WDEV_WIFI_ADDRESS_NOT_FOUND == endpoint.status()) {
            CliCommon::print_error("Failed to get device IP address. Make sure Wi-Fi is enabled.");
        }
        CliCommon::print_error(fmt::format("Failed to enable wireless debugging on {}. status={}", device_id,
            endpoint.status()));
        return make_unexpected(endpoint.status());
    }

    if (endpoint->already_wireless) {
        CliCommon::print_warning(fmt::format("Device {} is already connected wirelessly", device_id));
        return endpoint;
    }

    CliCommon::print_success(fmt::format("Wireless debugging enabled. Device IP: {}", endpoint->address));
    CliCommon::print_info(fmt::format("Wait a few seconds and then connect with: adb connect {}", endpoint->endpoint()));

    m_context.preferences.record(WirelessSetup::to_known_device(endpoint.value(), CliCommon::now_timestamp()));
    auto status = m_context.preferences.save();
    if (WDEV_SUCCESS != status) {
        CliCommon::print_error(fmt::format("Failed to save known devices. status={}", status));
        return make_unexpected(status);
    }

    return endpoint;
}
