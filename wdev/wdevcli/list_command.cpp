/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file list_command.cpp
 * @brief Lists the devices attached to the bridge
 **/

#include "list_command.hpp"
#include "common.hpp"
#include "wdev/device_inventory.hpp"

#include <iostream>

static const size_t ID_WIDTH = 30;
static const size_t STATUS_WIDTH = 15;
static const size_t MODEL_WIDTH = 25;
static const size_t PLATFORM_VERSION_WIDTH = 10;
static const size_t TYPE_WIDTH = 10;

ListCommand::ListCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("list", "List connected devices"), context)
{
}

wdev_status ListCommand::execute_with_bridge()
{
    DeviceInventory inventory(m_context.bridge);
    auto devices = inventory.list();
    if (!devices) {
        CliCommon::print_error(fmt::format("Failed to list devices. status={}", devices.status()));
        return devices.status();
    }

    if (devices->empty()) {
        CliCommon::print_warning("No devices connected. Use \"wireless-dev discover\" to find devices.");
        return WDEV_SUCCESS;
    }

    CliCommon::print_table_header({{"Device ID", ID_WIDTH}, {"Status", STATUS_WIDTH}, {"Model", MODEL_WIDTH},
        {"Android", PLATFORM_VERSION_WIDTH}, {"Type", TYPE_WIDTH}});
    for (const auto &device : devices.value()) {
        const auto status_color = (DeviceStatus::DEVICE == device.status) ? FORMAT_GREEN_PRINT : FORMAT_YELLOW_PRINT;
        std::cout << CliCommon::format_cell(device.id, ID_WIDTH)
                  << CliCommon::format_cell(device_status_to_string(device.status), STATUS_WIDTH, status_color)
                  << CliCommon::format_cell(device.model.empty() ? WDEV_UNKNOWN_MODEL : device.model, MODEL_WIDTH)
                  << CliCommon::format_cell(device.platform_version.empty() ? "N/A" : device.platform_version,
                        PLATFORM_VERSION_WIDTH)
                  << (device.wireless ? CliCommon::format_cell("Wireless", TYPE_WIDTH, FORMAT_BLUE_PRINT) :
                        CliCommon::format_cell("USB", TYPE_WIDTH, FORMAT_YELLOW_PRINT))
                  << std::endl;
    }

    return WDEV_SUCCESS;
}
