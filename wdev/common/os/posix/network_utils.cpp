/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_utils.cpp
 * @brief Network interface queries for Linux
 **/

#include "common/network_utils.hpp"
#include "common/file_descriptor.hpp"
#include "common/string_utils.hpp"
#include "common/utils.hpp"
#include "common/logger_macros.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>

namespace wdev
{

static const uint32_t MAX_PORT = 65535;

Expected<std::string> NetworkUtils::get_ip_from_interface(const std::string &interface_name)
{
    struct ifreq ifr = {};

    CHECK(interface_name.size() < MAX_INTERFACE_SIZE, WDEV_INVALID_ARGUMENT,
        "Interface name \"{}\" is too long", interface_name);

    /* Create socket */
    FileDescriptor socket_fd(socket(AF_INET, SOCK_DGRAM, 0));
    CHECK(0 <= socket_fd, WDEV_ETH_FAILURE, "Failed to create socket. errno: {:#x}", errno);

    /* Convert interface name to ip address */
    ifr.ifr_addr.sa_family = AF_INET;
    (void)strncpy(ifr.ifr_name, interface_name.c_str(), IFNAMSIZ-1);
    auto posix_rc = ioctl(socket_fd, SIOCGIFADDR, &ifr);
    CHECK(posix_rc >= 0, WDEV_ETH_INTERFACE_NOT_FOUND,
        "Interface {} was not found. ioctl with SIOCGIFADDR has failed. errno: {:#x}", interface_name, errno);

    char address[INET_ADDRSTRLEN] = {};
    const auto *sin = reinterpret_cast<struct sockaddr_in*>(&ifr.ifr_addr);
    CHECK(nullptr != inet_ntop(AF_INET, &sin->sin_addr, address, sizeof(address)), WDEV_ETH_FAILURE,
        "inet_ntop failed. errno: {:#x}", errno);

    std::string res = address;
    LOGGER__DEBUG("Interface {} | IP: {}", interface_name, res);
    return res;
}

Expected<std::string> NetworkUtils::get_local_ipv4_address()
{
    struct ifaddrs *interfaces = nullptr;
    CHECK(0 == getifaddrs(&interfaces), WDEV_ETH_FAILURE, "getifaddrs failed. errno: {:#x}", errno);

    std::string res;
    for (auto *iface = interfaces; nullptr != iface; iface = iface->ifa_next) {
        if ((nullptr == iface->ifa_addr) || (AF_INET != iface->ifa_addr->sa_family)) {
            continue;
        }
        if ((0 == (iface->ifa_flags & IFF_UP)) || (0 != (iface->ifa_flags & IFF_LOOPBACK))) {
            continue;
        }

        char address[INET_ADDRSTRLEN] = {};
        const auto *sin = reinterpret_cast<struct sockaddr_in*>(iface->ifa_addr);
        if (nullptr == inet_ntop(AF_INET, &sin->sin_addr, address, sizeof(address))) {
            continue;
        }
        LOGGER__DEBUG("Interface {} | IP: {}", iface->ifa_name, address);
        res = address;
        break;
    }
    freeifaddrs(interfaces);

    if (res.empty()) {
        LOGGER__DEBUG("No external IPv4 interface was found");
        return make_unexpected(WDEV_ETH_INTERFACE_NOT_FOUND);
    }
    return res;
}

bool NetworkUtils::is_valid_ipv4(const std::string &address)
{
    struct in_addr parsed = {};
    return (1 == inet_pton(AF_INET, address.c_str(), &parsed));
}

Expected<std::string> NetworkUtils::get_subnet_prefix(const std::string &address)
{
    CHECK(is_valid_ipv4(address), WDEV_INVALID_ARGUMENT, "\"{}\" is not an IPv4 address", address);
    return address.substr(0, address.rfind('.') + 1);
}

Expected<std::pair<std::string, uint16_t>> NetworkUtils::split_endpoint(const std::string &endpoint,
    uint16_t default_port)
{
    const auto colon = endpoint.find(':');
    if (std::string::npos == colon) {
        CHECK(is_valid_ipv4(endpoint), WDEV_INVALID_ARGUMENT, "\"{}\" is not an IPv4 address", endpoint);
        return std::make_pair(endpoint, default_port);
    }

    const auto address = endpoint.substr(0, colon);
    const auto port_str = endpoint.substr(colon + 1);
    CHECK(is_valid_ipv4(address), WDEV_INVALID_ARGUMENT, "\"{}\" is not an IPv4 address", address);
    CHECK(!port_str.empty() && (std::string::npos == port_str.find_first_not_of("0123456789")),
        WDEV_INVALID_ARGUMENT, "Invalid port \"{}\"", port_str);
    TRY(const auto port, StringUtils::to_uint32(port_str, 10), "Invalid port \"{}\"", port_str);
    CHECK((0 < port) && (port <= MAX_PORT), WDEV_INVALID_ARGUMENT, "Port {} is out of range", port);

    return std::make_pair(address, static_cast<uint16_t>(port));
}

} /* namespace wdev */
