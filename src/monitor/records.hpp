//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   records.hpp
 *
 * @brief  The normalized tunnel health model published on each
 *         refresh cycle
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace TunnelMonitor {

/**
 *  Classified health of a tunnel.  A tunnel with an unknown or missing
 *  declared status has no TunnelHealth value at all (std::nullopt).
 */
enum class TunnelHealth : uint8_t
{
    INACTIVE,
    DEGRADED,
    HEALTHY,
    DOWN
};


/**
 *  All connections of one tunnel sharing the same client identifier,
 *  folded together within a single refresh cycle.
 */
struct Connector
{
    std::string client_id;
    std::string version;                     ///< Empty when not reported
    unsigned int sessions = 0;
    std::vector<std::string> edges;          ///< Sorted, no duplicates
    std::vector<std::string> origin_ips;     ///< Sorted, no duplicates
    bool pending_reconnect = false;
    std::string opened_at_latest;            ///< Empty when not reported

    std::string latest_version;              ///< Empty when unknown
    std::optional<bool> is_latest;
    std::optional<bool> update_available;
    std::optional<std::string> version_diff; ///< Set only if update_available
};


/**
 *  Result of reconciling the raw connection list of one tunnel
 */
struct ReconcileResult
{
    std::vector<Connector> connectors;
    unsigned int connector_count = 0;
    unsigned int session_count = 0;
};


/**
 *  One tunnel with its classified health and reconciled connectors
 */
struct Tunnel
{
    std::string id;
    std::string unique_id;
    std::string name;
    std::optional<std::string> declared_status;
    std::optional<TunnelHealth> health;
    std::string created_at;
    std::vector<Connector> connectors;
    unsigned int connector_count = 0;
    unsigned int session_count = 0;
    std::string latest_version;
};


/**
 *  A complete, immutable result of one successful refresh cycle
 *  of one account
 */
struct Snapshot
{
    using Ptr = std::shared_ptr<const Snapshot>;

    std::string account_id;
    std::string friendly_name;
    std::chrono::system_clock::time_point published_at;
    std::string latest_version;
    std::vector<Tunnel> tunnels;
};


/**
 *  A monitored account, as read from the accounts file
 */
struct AccountCredentials
{
    std::string account_id;
    std::string api_token;
    std::string friendly_name;
};

} // namespace TunnelMonitor
