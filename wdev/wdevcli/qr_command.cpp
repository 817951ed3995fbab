/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file qr_command.cpp
 * @brief Prints a QR code for connecting to this host or to a device
 **/

#include "qr_command.hpp"
#include "common.hpp"
#include "qr_renderer.hpp"
#include "common/network_utils.hpp"

#include <iostream>

QrCommand::QrCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("qr", "Generate a QR code for wireless connection"), context),
    m_port(WDEV_DEFAULT_TCP_PORT)
{
    m_app->add_option("-d,--device", m_device_id, "Enable wireless debugging on this device and use its address");
    m_app->add_option("-p,--port", m_port, "TCP port of the connection")
        ->check(CLI::Range(1, UINT16_MAX))
        ->default_val(WDEV_DEFAULT_TCP_PORT);
}

wdev_status QrCommand::execute_with_bridge()
{
    // Failures were reported while resolving
    auto address = get_address();
    if (!address) {
        return address.status();
    }

    const auto uri = QrRenderer::build_connection_uri(address.value(), m_port);
    auto qr_code = QrRenderer::render(uri);
    if (!qr_code) {
        CliCommon::print_error(fmt::format("Failed to generate a QR code for {}. status={}", uri, qr_code.status()));
        return qr_code.status();
    }
    CliCommon::print_info("Scan this QR code on your device to connect wirelessly:");
    std::cout << qr_code.value() << std::endl;

    CliCommon::print_info(fmt::format("Or connect manually with: adb connect {}",
        NetworkUtils::make_endpoint(address.value(), m_port)));
    std::cout << std::endl;
    CliCommon::print_warning("Note: On your device, you need a QR scanner app that can handle \"adbwireless://\" protocol.");
    CliCommon::print_warning("For some devices, you may need to connect manually with the command shown above.");
    return WDEV_SUCCESS;
}

Expected<std::string> QrCommand::get_address()
{
    if (m_device_id.empty()) {
        return CliCommon::get_local_address();
    }

    auto endpoint = enable_wireless(m_device_id, m_port);
    if (!endpoint) {
        return make_unexpected(endpoint.status());
    }
    if (!endpoint->already_wireless) {
        CliCommon::wait_for_settle();
    }
    if (endpoint->address.empty()) {
        CliCommon::print_error(fmt::format("Failed to get the address of device {}.", m_device_id));
        return make_unexpected(WDEV_WIFI_ADDRESS_NOT_FOUND);
    }
    return std::string(endpoint->address);
}
