/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file adb_output_parser.cpp
 * @brief Parsing of the plain-text replies of adb
 **/

#include "bridge/adb_output_parser.hpp"
#include "common/utils.hpp"
#include "common/string_utils.hpp"
#include "common/logger_macros.hpp"

#include <regex>

namespace wdev
{

static const char *DEVICE_LIST_HEADER = "List of devices attached";
static const char *DAEMON_NOTICE_PREFIX = "*";
static const char *MDNS_TLS_CONNECT_SERVICE = "._adb-tls-connect._tcp";
static const char *PACKAGE_PREFIX = "package:";

Expected<std::vector<RawDeviceLine>> AdbOutputParser::parse_device_list(const std::string &output)
{
    std::vector<RawDeviceLine> devices;
    bool found_header = false;

    for (const auto &line : StringUtils::split_lines(output)) {
        const auto trimmed = StringUtils::trim(line);
        if (StringUtils::starts_with(trimmed, DEVICE_LIST_HEADER)) {
            found_header = true;
            continue;
        }
        if (!found_header || StringUtils::starts_with(trimmed, DAEMON_NOTICE_PREFIX)) {
            continue;
        }

        // adb separates the id from the state with a tab, mDNS ids may contain spaces ("adb-XXXX (2)._adb-tls-connect._tcp")
        const auto tab = trimmed.find('\t');
        if (std::string::npos != tab) {
            const auto rest = StringUtils::split_whitespace(trimmed.substr(tab + 1));
            if (!rest.empty()) {
                devices.push_back(RawDeviceLine{StringUtils::trim(trimmed.substr(0, tab)), rest[0]});
                continue;
            }
        }

        const auto tokens = StringUtils::split_whitespace(trimmed);
        if (tokens.size() < 2) {
            LOGGER__DEBUG("Skipping device list line \"{}\"", line);
            continue;
        }
        devices.push_back(RawDeviceLine{tokens[0], tokens[1]});
    }

    CHECK(found_header, WDEV_INVALID_BRIDGE_RESPONSE, "Unexpected device listing: \"{}\"", output);
    return devices;
}

DeviceStatus AdbOutputParser::to_device_status(const std::string &state)
{
    if ("device" == state) {
        return DeviceStatus::DEVICE;
    } else if ("offline" == state) {
        return DeviceStatus::OFFLINE;
    } else if ("unauthorized" == state) {
        return DeviceStatus::UNAUTHORIZED;
    }
    return DeviceStatus::UNKNOWN;
}

bool AdbOutputParser::is_wireless_id(const std::string &device_id)
{
    static const std::regex ENDPOINT_PATTERN(R"(\d{1,3}(\.\d{1,3}){3}:\d+)");
    return std::regex_search(device_id, ENDPOINT_PATTERN) ||
        (std::string::npos != device_id.find(MDNS_TLS_CONNECT_SERVICE));
}

bool AdbOutputParser::is_connect_success(const std::string &reply)
{
    for (const auto &line : StringUtils::split_lines(reply)) {
        const auto trimmed = StringUtils::trim(line);
        if (StringUtils::starts_with(trimmed, "connected to") || StringUtils::starts_with(trimmed, "already connected to")) {
            return true;
        }
    }
    return false;
}

bool AdbOutputParser::is_disconnect_success(const std::string &reply)
{
    for (const auto &line : StringUtils::split_lines(reply)) {
        if (StringUtils::starts_with(StringUtils::trim(line), "disconnected")) {
            return true;
        }
    }
    return false;
}

std::map<std::string, std::string> AdbOutputParser::parse_properties(const std::string &output)
{
    static const std::regex PROPERTY_PATTERN(R"(^\[([^\]]+)\]: \[(.*)\]$)");

    std::map<std::string, std::string> properties;
    for (const auto &line : StringUtils::split_lines(output)) {
        std::smatch match;
        const auto trimmed = StringUtils::trim(line);
        if (std::regex_match(trimmed, match, PROPERTY_PATTERN)) {
            properties[match[1].str()] = match[2].str();
        }
    }
    return properties;
}

std::string AdbOutputParser::parse_route_source_address(const std::string &output, const std::string &interface_name)
{
    for (const auto &line : StringUtils::split_lines(output)) {
        const auto tokens = StringUtils::split_whitespace(line);
        bool through_interface = false;
        for (size_t i = 0; (i + 1) < tokens.size(); i++) {
            if (("dev" == tokens[i]) && (interface_name == tokens[i + 1])) {
                through_interface = true;
                break;
            }
        }
        if (!through_interface) {
            continue;
        }

        for (size_t i = 0; (i + 1) < tokens.size(); i++) {
            if ("src" == tokens[i]) {
                return tokens[i + 1];
            }
        }
    }
    return "";
}

std::string AdbOutputParser::parse_inet_address(const std::string &output)
{
    for (const auto &line : StringUtils::split_lines(output)) {
        const auto tokens = StringUtils::split_whitespace(line);
        if ((2 <= tokens.size()) && ("inet" == tokens[0])) {
            return tokens[1].substr(0, tokens[1].find('/'));
        }
    }
    return "";
}

Expected<int32_t> AdbOutputParser::parse_major_version(const std::string &platform_version)
{
    const auto trimmed = StringUtils::trim(platform_version);
    const auto digits_end = trimmed.find_first_not_of("0123456789");
    const auto digits = trimmed.substr(0, digits_end);
    if (digits.empty()) {
        // Not logged, callers decide whether an unknown version matters
        return make_unexpected(WDEV_INVALID_BRIDGE_RESPONSE);
    }
    return StringUtils::to_int32(digits, 10);
}

std::vector<std::string> AdbOutputParser::filter_development_processes(const std::string &ps_output)
{
    static const std::regex DEVELOPMENT_PROCESS_PATTERN("app_process|react|expo|metro");

    std::vector<std::string> processes;
    for (const auto &line : StringUtils::split_lines(ps_output)) {
        if (std::regex_search(line, DEVELOPMENT_PROCESS_PATTERN)) {
            processes.push_back(line);
        }
    }
    return processes;
}

std::vector<std::string> AdbOutputParser::filter_development_packages(const std::string &pm_output)
{
    static const std::regex DEVELOPMENT_PACKAGE_PATTERN("react|expo|debug");

    std::vector<std::string> packages;
    for (const auto &line : StringUtils::split_lines(pm_output)) {
        if (!std::regex_search(line, DEVELOPMENT_PACKAGE_PATTERN)) {
            continue;
        }
        auto package = StringUtils::trim(line);
        if (StringUtils::starts_with(package, PACKAGE_PREFIX)) {
            package = StringUtils::trim(package.substr(std::string(PACKAGE_PREFIX).size()));
        }
        packages.push_back(package);
    }
    return packages;
}

} /* namespace wdev */
