/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file enable_wireless_command.hpp
 * @brief Switches a USB device to network debugging
 **/

#ifndef _WDEV_ENABLE_WIRELESS_COMMAND_HPP_
#define _WDEV_ENABLE_WIRELESS_COMMAND_HPP_

#include "command.hpp"

class EnableWirelessCommand : public BridgeCommand {
public:
    EnableWirelessCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<std::string> choose_device();

    std::string m_device_id;
};

#endif /* _WDEV_ENABLE_WIRELESS_COMMAND_HPP_ */
