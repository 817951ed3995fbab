/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file network_utils.hpp
 * @brief Local network interface queries and IPv4 address helpers
 **/

#ifndef _WDEV_NETWORK_UTILS_HPP_
#define _WDEV_NETWORK_UTILS_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"

#include <string>
#include <utility>

#include <net/if.h>

namespace wdev
{

class NetworkUtils final
{
public:
    NetworkUtils() = delete;

    static const uint32_t MAX_INTERFACE_SIZE = IFNAMSIZ;

    static Expected<std::string> get_ip_from_interface(const std::string &interface_name);

    /**
     * Returns the address of the first interface that is up, not loopback and has an IPv4 address.
     * Returns WDEV_ETH_INTERFACE_NOT_FOUND when no such interface exists.
     */
    static Expected<std::string> get_local_ipv4_address();

    static bool is_valid_ipv4(const std::string &address);

    /**
     * Returns the dotted /24 prefix of an IPv4 address, including the trailing dot ("192.168.1.5" -> "192.168.1.").
     */
    static Expected<std::string> get_subnet_prefix(const std::string &address);

    /**
     * Splits "address[:port]" into its parts, using default_port when the port is omitted.
     */
    static Expected<std::pair<std::string, uint16_t>> split_endpoint(const std::string &endpoint, uint16_t default_port);

    static std::string make_endpoint(const std::string &address, uint16_t port)
    {
        return address + ":" + std::to_string(port);
    }
};

} /* namespace wdev */

#endif /* _WDEV_NETWORK_UTILS_HPP_ */
