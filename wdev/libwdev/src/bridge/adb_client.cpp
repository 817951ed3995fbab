/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file adb_client.cpp
 * @brief BridgeClient running the adb executable
 **/

#include "bridge/adb_client.hpp"
#include "bridge/adb_output_parser.hpp"

#include "common/utils.hpp"
#include "common/env_vars.hpp"
#include "common/process.hpp"
#include "common/network_utils.hpp"
#include "common/string_utils.hpp"
#include "common/logger_macros.hpp"

#include <cctype>
#include <cstring>

namespace wdev
{

static const int32_t SHELL_COMMAND_NOT_FOUND = 127;
static const int32_t SHELL_COMMAND_NOT_EXECUTABLE = 126;
static const size_t MAX_DEVICE_ID_LENGTH = 128;
static const char *DEVICE_ID_EXTRA_CHARS = ":._- ()";

Expected<BridgeClientPtr> BridgeClient::create_adb(std::chrono::milliseconds command_timeout)
{
    auto adb_path = get_env_variable(WDEV_ADB_PATH_ENV_VAR);
    const std::string path = adb_path ? adb_path.release() : WDEV_DEFAULT_ADB_PATH;
    LOGGER__DEBUG("Using adb executable \"{}\"", path);

    TRY(auto client, AdbClient::create(path, command_timeout));
    return BridgeClientPtr(std::move(client));
}

Expected<std::unique_ptr<AdbClient>> AdbClient::create(const std::string &adb_path,
    std::chrono::milliseconds command_timeout)
{
    CHECK(!adb_path.empty(), WDEV_INVALID_ARGUMENT, "adb path must not be empty");
    CHECK(command_timeout.count() > 0, WDEV_INVALID_ARGUMENT, "Invalid command timeout {}ms", command_timeout.count());

    auto client = make_unique_nothrow<AdbClient>(adb_path, command_timeout);
    CHECK(nullptr != client, WDEV_OUT_OF_HOST_MEMORY);
    return client;
}

AdbClient::AdbClient(const std::string &adb_path, std::chrono::milliseconds command_timeout) :
    m_adb_path(adb_path),
    m_command_timeout(command_timeout)
{}

bool AdbClient::is_valid_device_id(const std::string &device_id)
{
    if (device_id.empty() || (device_id.length() > MAX_DEVICE_ID_LENGTH)) {
        return false;
    }

    for (const auto c : device_id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && (nullptr == std::strchr(DEVICE_ID_EXTRA_CHARS, c))) {
            return false;
        }
    }
    return true;
}

std::string AdbClient::build_command_line(const std::vector<std::string> &args) const
{
    auto command_line = Process::quote_argument(m_adb_path);
    for (const auto &arg : args) {
        command_line += " ";
        command_line += Process::quote_argument(arg);
    }
    return command_line;
}

Expected<std::pair<int32_t, std::string>> AdbClient::run_raw(const std::vector<std::string> &args,
    std::chrono::milliseconds timeout)
{
    const auto command_line = build_command_line(args);
    LOGGER__TRACE("Running \"{}\"", command_line);

    TRY_WITH_ACCEPTABLE_STATUS(WDEV_TIMEOUT, auto result,
        Process::create_and_wait_for_output(command_line, Process::DEFAULT_MAX_OUTPUT_SIZE, timeout));
    if ((SHELL_COMMAND_NOT_FOUND == result.first) || (SHELL_COMMAND_NOT_EXECUTABLE == result.first)) {
        LOGGER__DEBUG("\"{}\" could not be run: {}", m_adb_path, result.second);
        return make_unexpected(WDEV_BRIDGE_NOT_INSTALLED);
    }
    return result;
}

Expected<std::string> AdbClient::run(const std::vector<std::string> &args)
{
    TRY(auto result, run_raw(args, m_command_timeout));
    CHECK(0 == result.first, WDEV_BRIDGE_COMMAND_FAILED, "\"{}\" exited with code {}: {}",
        build_command_line(args), result.first, StringUtils::trim(result.second));
    return std::move(result.second);
}

wdev_status AdbClient::check_installed()
{
    auto result = run_raw({"version"}, m_command_timeout);
    if (!result) {
        LOGGER__DEBUG("\"{} version\" failed with status {}", m_adb_path, result.status());
        return WDEV_BRIDGE_NOT_INSTALLED;
    }
    if (0 != result->first) {
        LOGGER__DEBUG("\"{} version\" exited with code {}", m_adb_path, result->first);
        return WDEV_BRIDGE_NOT_INSTALLED;
    }
    return WDEV_SUCCESS;
}

Expected<std::vector<RawDeviceLine>> AdbClient::list_devices()
{
    TRY(const auto output, run({"devices"}));
    return AdbOutputParser::parse_device_list(output);
}

Expected<BridgeReply> AdbClient::connect(const std::string &endpoint, std::chrono::milliseconds timeout)
{
    CHECK_EXPECTED(NetworkUtils::split_endpoint(endpoint, WDEV_DEFAULT_TCP_PORT),
        "Invalid endpoint \"{}\"", endpoint);

    // Probes time out routinely, so failures are only worth a debug print here
    auto result = run_raw({"connect", endpoint}, timeout);
    if (!result) {
        LOGGER__DEBUG("adb connect {} failed with status {}", endpoint, result.status());
        return make_unexpected(result.status());
    }

    BridgeReply reply{AdbOutputParser::is_connect_success(result->second), StringUtils::trim(result->second)};
    LOGGER__DEBUG("adb connect {} (exit code {}): {}", endpoint, result->first, reply.message);
    return reply;
}

Expected<BridgeReply> AdbClient::disconnect(const std::string &endpoint)
{
    CHECK(is_valid_device_id(endpoint), WDEV_INVALID_ARGUMENT, "Invalid device id \"{}\"", endpoint);

    TRY(const auto result, run_raw({"disconnect", endpoint}, m_command_timeout));
    BridgeReply reply{AdbOutputParser::is_disconnect_success(result.second), StringUtils::trim(result.second)};
    LOGGER__DEBUG("adb disconnect {} (exit code {}): {}", endpoint, result.first, reply.message);
    return reply;
}

Expected<std::string> AdbClient::get_property(const std::string &device_id, const std::string &key)
{
    CHECK(!key.empty() && (std::string::npos == key.find_first_not_of(
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789._-")),
        WDEV_INVALID_ARGUMENT, "Invalid property name \"{}\"", key);

    TRY(const auto output, run_shell(device_id, "getprop " + key));
    return StringUtils::trim(output);
}

Expected<std::map<std::string, std::string>> AdbClient::get_properties(const std::string &device_id)
{
    TRY(const auto output, run_shell(device_id, "getprop"));
    return AdbOutputParser::parse_properties(output);
}

Expected<std::string> AdbClient::run_shell(const std::string &device_id, const std::string &command)
{
    CHECK(is_valid_device_id(device_id), WDEV_INVALID_ARGUMENT, "Invalid device id \"{}\"", device_id);
    return run({"-s", device_id, "shell", command});
}

wdev_status AdbClient::enable_tcp_mode(const std::string &device_id, uint16_t port)
{
    CHECK(is_valid_device_id(device_id), WDEV_INVALID_ARGUMENT, "Invalid device id \"{}\"", device_id);
    CHECK(0 != port, WDEV_INVALID_ARGUMENT, "Invalid port 0");

    TRY(const auto output, run({"-s", device_id, "tcpip", std::to_string(port)}));
    LOGGER__INFO("adb tcpip {} on {}: {}", port, device_id, StringUtils::trim(output));
    return WDEV_SUCCESS;
}

} /* namespace wdev */
