/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdevcli.cpp
 * @brief wireless-dev CLI.
 *
 * Command line interface for wireless debugging of Android devices during React Native/Expo development.
 **/

#include "wdevcli.hpp"
#include "command.hpp"
#include "prompt.hpp"
#include "list_command.hpp"
#include "discover_command.hpp"
#include "connect_command.hpp"
#include "disconnect_command.hpp"
#include "enable_wireless_command.hpp"
#include "info_command.hpp"
#include "qr_command.hpp"
#include "expo_start_command.hpp"
#include "utils/wdev_logger.hpp"

#include "CLI/CLI.hpp"

#include <iostream>


static bool do_versions_match()
{
    wdev_version_t libwdev_version = {};
    auto status = wdev_get_library_version(&libwdev_version);
    if (WDEV_SUCCESS != status) {
        std::cerr << "Failed to get libwdev version" << std::endl;
        return false;
    }

    bool versions_match = ((WDEV_MAJOR_VERSION == libwdev_version.major) &&
        (WDEV_MINOR_VERSION == libwdev_version.minor) &&
        (WDEV_REVISION_VERSION == libwdev_version.revision));
    if (!versions_match) {
        std::cerr << "libwdev version (" <<
            libwdev_version.major << "." << libwdev_version.minor << "." << libwdev_version.revision <<
            ") does not match wireless-dev version (" <<
            WDEV_MAJOR_VERSION << "." << WDEV_MINOR_VERSION << "." << WDEV_REVISION_VERSION << ")" << std::endl;
        return false;
    }
    return true;
}

class WdevCLI : public ContainerCommand {
public:
    WdevCLI(CLI::App *app, CliContext &context) : ContainerCommand(app, context)
    {
        m_app->set_version_flag("-v,--version", fmt::format("wireless-dev version {}.{}.{}", WDEV_MAJOR_VERSION,
            WDEV_MINOR_VERSION, WDEV_REVISION_VERSION));

        add_subcommand<ListCommand>();
        add_subcommand<DiscoverCommand>();
        add_subcommand<ConnectCommand>();
        add_subcommand<DisconnectCommand>();
        add_subcommand<EnableWirelessCommand>();
        add_subcommand<InfoCommand>();
        add_subcommand<QrCommand>();
        add_subcommand<ExpoStartCommand>();
    }

    int parse_and_execute(int argc, char **argv)
    {
        CLI11_PARSE(*m_app, argc, argv);
        return static_cast<int>(execute());
    }

};

int main(int argc, char** argv) {
    if (!do_versions_match()) {
        return -1;
    }
    if (nullptr == WdevLogger::get_instance()) {
        std::cerr << "Failed to create the logger" << std::endl;
        return static_cast<int>(WDEV_OUT_OF_HOST_MEMORY);
    }

    auto bridge = BridgeClient::create_adb();
    if (!bridge) {
        std::cerr << "Failed to create the adb client. status=" << bridge.status() << std::endl;
        return static_cast<int>(bridge.status());
    }
    auto preferences = Preferences::load(KnownDevicesStore::create_default());
    Prompt prompt(std::cin, std::cout);
    CliContext context{*bridge.value(), preferences, prompt};

    CLI::App app{"CLI tool for wireless React Native/Expo development with Android devices", "wireless-dev"};
    WdevCLI cli(&app, context);
    return cli.parse_and_execute(argc, argv);
}
