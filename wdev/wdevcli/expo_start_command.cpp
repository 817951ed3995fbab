/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expo_start_command.cpp
 * @brief Starts the Expo development server for wireless debugging
 **/

#include "expo_start_command.hpp"
#include "common.hpp"
#include "common/process.hpp"
#include "wdev/device_inventory.hpp"

#include <iostream>

#define WDEV_EXPO_START_COMMAND ("npx expo start --host lan")
#define WDEV_PACKAGER_HOSTNAME_ENV_VAR ("REACT_NATIVE_PACKAGER_HOSTNAME")

// Exit code of a child stopped with Ctrl-C
static const int32_t INTERRUPTED_EXIT_CODE = 130;

ExpoStartCommand::ExpoStartCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("expo-start", "Start Expo development server with wireless debugging"),
        context)
{
    m_app->add_option("-d,--device", m_device_id, "Device ID to enable wireless debugging on");
}

wdev_status ExpoStartCommand::execute_with_bridge()
{
    if (!m_device_id.empty()) {
        auto status = prepare_device();
        if (WDEV_SUCCESS != status) {
            return status;
        }
    }

    const auto local_address = CliCommon::get_local_address();
    CliCommon::print_success(fmt::format("Starting Expo server on {}...", local_address));
    CliCommon::print_info("This will automatically use the wireless connection for your device.");

    const auto command_line = fmt::format("{}={} {}", WDEV_PACKAGER_HOSTNAME_ENV_VAR,
        Process::quote_argument(local_address), WDEV_EXPO_START_COMMAND);
    LOGGER__INFO("Running \"{}\"", command_line);
    auto exit_code = Process::create_and_wait(command_line);
    if (!exit_code) {
        CliCommon::print_error(fmt::format("Failed to start the Expo server. status={}", exit_code.status()));
        return exit_code.status();
    }

    if ((0 != exit_code.value()) && (INTERRUPTED_EXIT_CODE != exit_code.value())) {
        CliCommon::print_error(fmt::format("Expo server exited with code {}", exit_code.value()));
        return WDEV_EXTERNAL_COMMAND_FAILED;
    }
    return WDEV_SUCCESS;
}

wdev_status ExpoStartCommand::prepare_device()
{
    DeviceInventory inventory(m_context.bridge);
    auto device = inventory.find(m_device_id);
    if (!device) {
        if (WDEV_DEVICE_NOT_FOUND == device.status()) {
            CliCommon::print_error(fmt::format("Device {} not found.", m_device_id));
        } else {
            CliCommon::print_error(fmt::format("Failed to list devices. status={}", device.status()));
        }
        return device.status();
    }
    if (device->wireless) {
        return WDEV_SUCCESS;
    }

    CliCommon::print_info("Device is connected via USB. Enabling wireless debugging...");
    auto endpoint = enable_wireless(m_device_id);
    if (!endpoint) {
        return endpoint.status();
    }
    CliCommon::wait_for_settle();
    return WDEV_SUCCESS;
}
