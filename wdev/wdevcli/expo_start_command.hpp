/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file expo_start_command.hpp
 * @brief Starts the Expo development server for wireless debugging
 **/

#ifndef _WDEV_EXPO_START_COMMAND_HPP_
#define _WDEV_EXPO_START_COMMAND_HPP_

#include "command.hpp"

class ExpoStartCommand : public BridgeCommand {
public:
    ExpoStartCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    wdev_status prepare_device();

    std::string m_device_id;
};

#endif /* _WDEV_EXPO_START_COMMAND_HPP_ */
