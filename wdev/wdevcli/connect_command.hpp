/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file connect_command.hpp
 * @brief Connects to a device over the network
 **/

#ifndef _WDEV_CONNECT_COMMAND_HPP_
#define _WDEV_CONNECT_COMMAND_HPP_

#include "command.hpp"

class ConnectCommand : public BridgeCommand {
public:
    ConnectCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<std::string> choose_endpoint();

    std::string m_endpoint;
};

#endif /* _WDEV_CONNECT_COMMAND_HPP_ */
