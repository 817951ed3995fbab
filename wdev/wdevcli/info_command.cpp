/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file info_command.cpp
 * @brief Prints the properties and development services of a device
 **/

#include "info_command.hpp"
#include "common.hpp"
#include "prompt.hpp"
#include "wdev/device_inventory.hpp"

#include <iostream>

static const size_t FIELD_WIDTH = 15;

InfoCommand::InfoCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("info", "Show device information and running development services"),
        context)
{
    m_app->add_option("-d,--device", m_device_id, "Device ID");
}

wdev_status InfoCommand::execute_with_bridge()
{
    // Failures were reported while choosing
    auto device = choose_device();
    if (!device) {
        return device.status();
    }

    print_device(device.value());
    return WDEV_SUCCESS;
}

Expected<Device> InfoCommand::choose_device()
{
    DeviceInventory inventory(m_context.bridge);
    auto devices = inventory.list();
    if (!devices) {
        CliCommon::print_error(fmt::format("Failed to list devices. status={}", devices.status()));
        return make_unexpected(devices.status());
    }
    if (devices->empty()) {
        CliCommon::print_warning("No devices connected.");
        return make_unexpected(WDEV_NO_DEVICES);
    }

    if (!m_device_id.empty()) {
        for (const auto &device : devices.value()) {
            if (device.id == m_device_id) {
                return Device(device);
            }
        }
        CliCommon::print_error(fmt::format("Device {} not found.", m_device_id));
        return make_unexpected(WDEV_DEVICE_NOT_FOUND);
    }

    if (1 == devices->size()) {
        return Device(devices->front());
    }

    std::vector<std::string> choices;
    for (const auto &device : devices.value()) {
        choices.push_back(fmt::format("{} ({})", device.model.empty() ? WDEV_UNKNOWN_MODEL : device.model, device.id));
    }
    TRY_WITH_ACCEPTABLE_STATUS(WDEV_ABORTED_BY_USER, const auto index,
        m_context.prompt.select("Select a device to show info:", choices));
    return Device(devices.value()[index]);
}

void InfoCommand::print_device(const Device &device)
{
    auto print_field = [](const std::string &name, const std::string &value) {
        std::cout << "  " << CliCommon::format_cell(name + ":", FIELD_WIDTH) << (value.empty() ? "N/A" : value)
                  << std::endl;
    };

    std::cout << std::endl << CliCommon::colored("Device Information", FORMAT_BLUE_PRINT) << std::endl;
    print_field("ID", device.id);
    print_field("Status", device_status_to_string(device.status));
    print_field("Model", device.model.empty() ? WDEV_UNKNOWN_MODEL : device.model);
    print_field("Android", device.platform_version);
    print_field("Manufacturer", device.manufacturer);
    print_field("Connection", device.wireless ? "Wireless" : "USB");

    DeviceInventory inventory(m_context.bridge);

    std::cout << std::endl << CliCommon::colored("Running Development Services", FORMAT_BLUE_PRINT) << std::endl;
    auto processes = inventory.get_development_processes(device.id);
    if (!processes || processes->empty()) {
        CliCommon::print_warning("  No React Native/Expo services detected.");
    } else {
        for (const auto &process : processes.value()) {
            std::cout << "  " << process << std::endl;
        }
    }

    std::cout << std::endl << CliCommon::colored("Installed Development Packages", FORMAT_BLUE_PRINT) << std::endl;
    auto packages = inventory.get_development_packages(device.id);
    if (!packages || packages->empty()) {
        CliCommon::print_warning("  No development packages detected.");
    } else {
        for (const auto &package : packages.value()) {
            std::cout << "  " << package << std::endl;
        }
    }
}
