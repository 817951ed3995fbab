/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file enable_wireless_command.cpp
 * @brief Switches a USB device to network debugging
 **/

#include "enable_wireless_command.hpp"
#include "common.hpp"
#include "prompt.hpp"
#include "wdev/device_inventory.hpp"

EnableWirelessCommand::EnableWirelessCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("enable-wireless", "Enable wireless debugging on a USB connected device"),
        context)
{
    m_app->add_option("-d,--device", m_device_id, "Device ID");
}

wdev_status EnableWirelessCommand::execute_with_bridge()
{
    // Failures were reported while choosing
    auto chosen = choose_device();
    if (!chosen) {
        return chosen.status();
    }
    const auto device_id = chosen.release();

    auto endpoint = enable_wireless(device_id);
    if (!endpoint) {
        return endpoint.status();
    }

    CliCommon::print_success(fmt::format("Wireless debugging enabled on {}", device_id));
    return WDEV_SUCCESS;
}

Expected<std::string> EnableWirelessCommand::choose_device()
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
        if (!device.wireless && (DeviceStatus::DEVICE == device.status)) {
            ids.push_back(device.id);
            choices.push_back(fmt::format("{} ({})", device.model.empty() ? WDEV_UNKNOWN_MODEL : device.model, device.id));
        }
    }
    if (ids.empty()) {
        CliCommon::print_warning("No USB devices connected. Connect a device via USB first.");
        return make_unexpected(WDEV_NO_DEVICES);
    }

    TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, const auto index,
        m_context.prompt.select("Select a USB device to enable wireless debugging:", choices));
    return std::string(ids[index]);
}
