/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file qr_command.hpp
 * @brief Prints a QR code for connecting to this host or to a device
 **/

#ifndef _WDEV_QR_COMMAND_HPP_
#define _WDEV_QR_COMMAND_HPP_

#include "command.hpp"

class QrCommand : public BridgeCommand {
public:
    QrCommand(CLI::App &parent_app, CliContext &context);

protected:
    virtual wdev_status execute_with_bridge() override;

private:
    Expected<std::string> get_address();

    std::string m_device_id;
    uint16_t m_port;
};

#endif /* _WDEV_QR_COMMAND_HPP_ */
