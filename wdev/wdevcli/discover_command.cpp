/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file discover_command.cpp
 * @brief Finds devices on the local network
 **/

#include "discover_command.hpp"
#include "common.hpp"
#include "common/network_utils.hpp"
#include "wdev/discovery.hpp"

#include <algorithm>
#include <iostream>

static const size_t ADDRESS_WIDTH = 20;
static const size_t STATUS_WIDTH = 15;

DiscoverCommand::DiscoverCommand(CLI::App &parent_app, CliContext &context) :
    BridgeCommand(parent_app.add_subcommand("discover", "Discover devices on the local network"), context),
    m_timeout_ms(WDEV_DEFAULT_PROBE_TIMEOUT_MS),
    m_disconnect_probed(false)
{
    m_app->add_option("--interface", m_interface_name,
        "Network interface whose subnet is scanned (default: first active IPv4 interface)");
    m_app->add_option("--timeout-ms", m_timeout_ms, "Timeout of each connection probe in milliseconds")
        ->check(CLI::PositiveNumber)
        ->default_val(WDEV_DEFAULT_PROBE_TIMEOUT_MS);
    m_app->add_flag("--disconnect-probed", m_disconnect_probed,
        "Disconnect the hosts that were connected only for probing");
}

wdev_status DiscoverCommand::execute_with_bridge()
{
    TRY(const auto local_address, get_local_address());

    SweepParams params;
    params.local_address = local_address;
    params.probe_timeout = std::chrono::milliseconds(m_timeout_ms);
    params.disconnect_probed = m_disconnect_probed;

    std::cout << "Discovering devices on network " << local_address << "..." << std::endl;
    DiscoverySweep sweep(m_context.bridge);
    auto hosts = sweep.run(params);
    if (!hosts) {
        CliCommon::print_error(fmt::format("Device discovery failed. status={}", hosts.status()));
        return hosts.status();
    }
    CliCommon::print_success("Device discovery completed");

    if (hosts->empty()) {
        CliCommon::print_warning("No devices discoverable on the network. "
            "Make sure they have wireless debugging enabled.");
        return WDEV_SUCCESS;
    }

    // All hosts share the /24 prefix, so a shorter address has a smaller last octet
    std::sort(hosts->begin(), hosts->end(), [](const DiscoveredHost &a, const DiscoveredHost &b) {
        return (a.address.size() != b.address.size()) ? (a.address.size() < b.address.size()) : (a.address < b.address);
    });

    CliCommon::print_table_header({{"IP Address", ADDRESS_WIDTH}, {"Status", STATUS_WIDTH}});
    for (const auto &host : hosts.value()) {
        std::cout << CliCommon::format_cell(host.address, ADDRESS_WIDTH)
                  << ((HostStatus::CONNECTED == host.status) ?
                        CliCommon::format_cell("Connected", STATUS_WIDTH, FORMAT_GREEN_PRINT) :
                        CliCommon::format_cell("Discoverable", STATUS_WIDTH, FORMAT_BLUE_PRINT))
                  << std::endl;
    }

    return WDEV_SUCCESS;
}

Expected<std::string> DiscoverCommand::get_local_address()
{
    if (m_interface_name.empty()) {
        return CliCommon::get_local_address();
    }

    auto address = NetworkUtils::get_ip_from_interface(m_interface_name);
    if (!address) {
        CliCommon::print_error(fmt::format("Failed to get the address of interface {}. status={}", m_interface_name,
            address.status()));
        return make_unexpected(address.status());
    }
    return address;
}
