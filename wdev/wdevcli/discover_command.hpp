/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file discover_command.hpp
 * @brief Finds devices on the local network
 **/

#ifndef _WDEV_DISCOVER_COMMAND_HPP_
#define _WDEV_DISCOVER_COMMAND_HPP_

#include "command.hpp"

class DiscoverCommand : public BridgeCommand {
public:
    DiscoverCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<std::string> get_local_address();

    std::string m_interface_name;
    uint32_t m_timeout_ms;
    bool m_disconnect_probed;
};

#endif /* _WDEV_DISCOVER_COMMAND_HPP_ */
