/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file discovery.hpp
 * @brief Sweep of the local /24 subnet for hosts accepting bridge connections
 **/

#ifndef _WDEV_DISCOVERY_HPP_
#define _WDEV_DISCOVERY_HPP_

#include "wdev/wdev.h"
#include "wdev/expected.hpp"
#include "wdev/device.hpp"
#include "wdev/bridge_client.hpp"

#include <chrono>
#include <string>
#include <vector>

/** wdev namespace */
namespace wdev
{

struct SweepParams {
    SweepParams();

    /** Address of this host, the sweep covers its /24 subnet */
    std::string local_address;
    uint16_t port;
    std::chrono::milliseconds probe_timeout;
    size_t max_concurrent_probes;
    /** Disconnect the hosts this sweep connected once it is done */
    bool disconnect_probed;
};

class DiscoverySweep final
{
public:
    explicit DiscoverySweep(BridgeClient &bridge);

    /**
     * Classifies every other host of the local subnet:
     * - hosts whose address appears in a listed device id are CONNECTED and are not probed;
     * - the rest are probed with a bridge connect, hosts that accept are DISCOVERABLE;
     * - hosts that refuse or time out are left out.
     *
     * The device listing is fetched once before probing, and once more after probing if any probe succeeded.
     * Probes run on a pool of worker threads, the call returns after all of them settled.
     *
     * @return The recorded hosts, without duplicates and in no particular order. Fails with the listing's status
     *         if the first listing fails.
     */
    Expected<std::vector<DiscoveredHost>> run(const SweepParams &params);

    /**
     * Returns the addresses 1-254 of the local /24 subnet except local_address. Empty for a loopback address.
     */
    static Expected<std::vector<std::string>> candidate_addresses(const std::string &local_address);

    static bool is_listed(const std::vector<RawDeviceLine> &listing, const std::string &address);

private:
    void disconnect_probed_hosts(const std::vector<DiscoveredHost> &hosts, const SweepParams &params,
        const std::vector<RawDeviceLine> &initial_listing, const Expected<std::vector<RawDeviceLine>> &recheck);

    BridgeClient &m_bridge;
};

} /* namespace wdev */

#endif /* _WDEV_DISCOVERY_HPP_ */
