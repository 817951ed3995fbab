/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file discovery_sweep.cpp
 * @brief Sweep of the local /24 subnet for hosts accepting bridge connections
 **/

#include "wdev/discovery.hpp"

#include "common/utils.hpp"
#include "common/thread_pool.hpp"
#include "common/network_utils.hpp"
#include "common/string_utils.hpp"
#include "common/logger_macros.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace wdev
{

static const char *LOOPBACK_PREFIX = "127.";
static const char *PROBE_THREAD_NAME = "wdev-probe";

SweepParams::SweepParams() :
    local_address(WDEV_LOOPBACK_ADDRESS),
    port(WDEV_DEFAULT_TCP_PORT),
    probe_timeout(WDEV_DEFAULT_PROBE_TIMEOUT_MS),
    max_concurrent_probes(WDEV_DEFAULT_MAX_CONCURRENT_PROBES),
    disconnect_probed(false)
{}

DiscoverySweep::DiscoverySweep(BridgeClient &bridge) :
    m_bridge(bridge)
{}

Expected<std::vector<std::string>> DiscoverySweep::candidate_addresses(const std::string &local_address)
{
    TRY(const auto prefix, NetworkUtils::get_subnet_prefix(local_address));

    std::vector<std::string> candidates;
    if (StringUtils::starts_with(local_address, LOOPBACK_PREFIX)) {
        LOGGER__WARNING("Local address {} is a loopback address, there is no subnet to discover", local_address);
        return candidates;
    }

    for (uint32_t host = WDEV_SUBNET_FIRST_HOST; host <= WDEV_SUBNET_LAST_HOST; host++) {
        auto address = prefix + std::to_string(host);
        if (address != local_address) {
            candidates.push_back(std::move(address));
        }
    }
    return candidates;
}

bool DiscoverySweep::is_listed(const std::vector<RawDeviceLine> &listing, const std::string &address)
{
    // Plain substring match, so "192.168.1.1" is also found in "192.168.1.12:5555"
    return std::any_of(listing.begin(), listing.end(), [&address](const RawDeviceLine &line) {
        return std::string::npos != line.id.find(address);
    });
}

Expected<std::vector<DiscoveredHost>> DiscoverySweep::run(const SweepParams &params)
{
    CHECK(0 < params.max_concurrent_probes, WDEV_INVALID_ARGUMENT, "max_concurrent_probes must be positive");
    TRY(const auto candidates, candidate_addresses(params.local_address));
    TRY(const auto listing, m_bridge.list_devices(), "Failed listing devices before discovery");

    std::vector<DiscoveredHost> hosts;
    std::vector<std::string> to_probe;
    for (const auto &address : candidates) {
        if (is_listed(listing, address)) {
            hosts.push_back(DiscoveredHost{address, HostStatus::CONNECTED});
        } else {
            to_probe.push_back(address);
        }
    }
    LOGGER__INFO("Discovery from {}: {} hosts already connected, probing {} hosts", params.local_address,
        hosts.size(), to_probe.size());

    std::vector<DiscoveredHost> probed;
    if (!to_probe.empty()) {
        std::mutex probed_mutex;
        // The pool's destructor waits for every probe
        WdevThreadPool pool(std::min(params.max_concurrent_probes, to_probe.size()), PROBE_THREAD_NAME);
        for (const auto &address : to_probe) {
            pool.add_job([this, &params, &probed, &probed_mutex, address]() -> wdev_status {
                const auto endpoint = NetworkUtils::make_endpoint(address, params.port);
                auto reply = m_bridge.connect(endpoint, params.probe_timeout);
                if (!reply) {
                    return reply.status();
                }
                if (!reply->success) {
                    return WDEV_CONNECT_FAILURE;
                }

                std::unique_lock<std::mutex> lock(probed_mutex);
                probed.push_back(DiscoveredHost{address, HostStatus::DISCOVERABLE});
                return WDEV_SUCCESS;
            });
        }
    }

    if (!probed.empty()) {
        auto recheck = m_bridge.list_devices();
        if (!recheck) {
            LOGGER__WARNING("Failed listing devices after discovery, status {}", recheck.status());
        } else {
            for (const auto &host : probed) {
                if (!is_listed(recheck.value(), host.address)) {
                    LOGGER__INFO("Probed host {} accepted the connection but is not listed", host.address);
                }
            }
        }

        if (params.disconnect_probed) {
            disconnect_probed_hosts(probed, params, listing, recheck);
        }
    }

    // Candidates are distinct and each lands in exactly one of the two lists, the set only guards that
    std::set<std::string> seen;
    std::vector<DiscoveredHost> result;
    for (auto &host : hosts) {
        if (seen.insert(host.address).second) {
            result.push_back(std::move(host));
        }
    }
    for (auto &host : probed) {
        if (seen.insert(host.address).second) {
            result.push_back(std::move(host));
        }
    }
    return result;
}

void DiscoverySweep::disconnect_probed_hosts(const std::vector<DiscoveredHost> &hosts, const SweepParams &params,
    const std::vector<RawDeviceLine> &initial_listing, const Expected<std::vector<RawDeviceLine>> &recheck)
{
    std::set<std::string> listed_before;
    for (const auto &line : initial_listing) {
        listed_before.insert(line.id);
    }

    for (const auto &host : hosts) {
        // Exact "address:port" ids only, never a device that was connected before the sweep
        std::vector<std::string> ids;
        if (recheck) {
            for (const auto &line : recheck.value()) {
                if (StringUtils::starts_with(line.id, host.address + ":") && !contains(listed_before, line.id)) {
                    ids.push_back(line.id);
                }
            }
        }
        if (ids.empty()) {
            ids.push_back(NetworkUtils::make_endpoint(host.address, params.port));
        }

        for (const auto &id : ids) {
            auto reply = m_bridge.disconnect(id);
            if (!reply) {
                LOGGER__WARNING("Failed disconnecting probed host {}, status {}", id, reply.status());
            } else if (!reply->success) {
                LOGGER__WARNING("Failed disconnecting probed host {}: {}", id, reply->message);
            } else {
                LOGGER__DEBUG("Disconnected probed host {}", id);
            }
        }
    }
}

} /* namespace wdev */
