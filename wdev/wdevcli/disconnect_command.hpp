/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file disconnect_command.hpp
 * @brief Disconnects a wireless device
 **/

#ifndef _WDEV_DISCONNECT_COMMAND_HPP_
#define _WDEV_DISCONNECT_COMMAND_HPP_

#include "command.hpp"

class DisconnectCommand : public BridgeCommand {
public:
    DisconnectCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<std::string> choose_device();

    std::string m_device_id;
};

#endif /* _WDEV_DISCONNECT_COMMAND_HPP_ */
