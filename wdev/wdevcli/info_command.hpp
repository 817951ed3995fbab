/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file info_command.hpp
 * @brief Prints the properties and development services of a device
 **/

#ifndef _WDEV_INFO_COMMAND_HPP_
#define _WDEV_INFO_COMMAND_HPP_

#include "command.hpp"

class InfoCommand : public BridgeCommand {
public:
    InfoCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<Device> choose_device();
    void print_device(const Device &device);

    std::string m_device_id;
};

#endif /* _WDEV_INFO_COMMAND_HPP_ */
