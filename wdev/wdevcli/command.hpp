/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file command.hpp
 * @brief Base classes of the CLI commands
 **/

#ifndef _WDEV_COMMAND_HPP_
#define _WDEV_COMMAND_HPP_

#include "wdevcli.hpp"
#include "wdev/wireless_setup.hpp"
#include "CLI/CLI.hpp"

#include <memory>
#include <vector>


class Command {
public:
    explicit Command(CLI::App *app);
    virtual ~Command() = default;

    virtual wdev_status execute() = 0;

    bool parsed() const
    {
        return m_app->parsed();
    }

protected:
    CLI::App *m_app;
};

// Command that only contains list of subcommand
class ContainerCommand : public Command {
public:
    ContainerCommand(CLI::App *app, CliContext &context);
    virtual wdev_status execute() override final;

protected:

    template<typename CommandType>
    CommandType &add_subcommand()
    {
        auto command = std::make_shared<CommandType>(*m_app, m_context);
        m_subcommands.push_back(command);
        return *command;
    }

    CliContext &m_context;

private:
    std::vector<std::shared_ptr<Command>> m_subcommands;
};

// Command that needs the bridge executable. Aborts with WDEV_BRIDGE_NOT_INSTALLED when it cannot be run.
class BridgeCommand : public Command {
public:
    BridgeCommand(CLI::App *app, CliContext &context);
    virtual wdev_status execute() override final;

protected:
    virtual wdev_status execute_with_bridge() = 0;

    // Switches the device to network debugging, prints the outcome and records the device in the preferences
    Expected<WirelessEndpoint> enable_wireless(const std::string &device_id, uint16_t port = WDEV_DEFAULT_TCP_PORT);

    CliContext &m_context;
};

#endif /* _WDEV_COMMAND_HPP_ */
