/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file list_command.hpp
 * @brief Lists the devices attached to the bridge
 **/

#ifndef _WDEV_LIST_COMMAND_HPP_
#define _WDEV_LIST_COMMAND_HPP_

#include "command.hpp"

class ListCommand : public BridgeCommand {
public:
    ListCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

};

#endif /* _WDEV_LIST_COMMAND_HPP_ */
