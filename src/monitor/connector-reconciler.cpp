//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   connector-reconciler.cpp
 *
 * @brief  Implementation of the connection to connector folding
 */

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "common/timestamp.hpp"
#include "monitor/connector-reconciler.hpp"
#include "monitor/constants.hpp"
#include "monitor/field-aliases.hpp"


namespace TunnelMonitor {

namespace {

/**
 *  Connector being built while folding the connections
 */
struct ConnectorAccumulator
{
    ConnectorAccumulator(const std::string &client_id)
    {
        connector.client_id = client_id;
    }

    void AddOpenedAt(const std::string &opened_at)
    {
        auto parsed = ParseISO8601(opened_at);
        bool newer = false;
        if (connector.opened_at_latest.empty())
        {
            newer = true;
        }
        else if (parsed && opened_at_tp)
        {
            newer = *parsed > *opened_at_tp;
        }
        else if (parsed || opened_at_tp)
        {
            // A timestamp which can be parsed always wins over one
            // which cannot
            newer = parsed.has_value();
        }
        else
        {
            newer = opened_at > connector.opened_at_latest;
        }

        if (newer)
        {
            connector.opened_at_latest = opened_at;
            opened_at_tp = parsed;
        }
    }

    Connector connector;
    std::set<std::string> edges;
    std::set<std::string> origin_ips;
    std::optional<std::chrono::system_clock::time_point> opened_at_tp;
};

} // anonymous namespace


ReconcileResult ReconcileConnectors(const Json::Value &connections,
                                    const std::string &latest_version)
{
    ReconcileResult result;
    if (!connections.isArray())
    {
        return result;
    }

    std::vector<ConnectorAccumulator> groups;
    std::map<std::string, size_t> index;

    for (const auto &conn : connections)
    {
        const std::string client_id = FieldAliases::ResolveString(conn, ConnectionField::CLIENT_ID)
                                          .value_or(Constants::UNKNOWN_CLIENT_ID);

        auto idx = index.find(client_id);
        if (index.end() == idx)
        {
            idx = index.emplace(client_id, groups.size()).first;
            groups.emplace_back(client_id);
        }
        ConnectorAccumulator &acc = groups[idx->second];

        ++acc.connector.sessions;
        ++result.session_count;

        auto version = FieldAliases::ResolveString(conn, ConnectionField::VERSION);
        if (version && acc.connector.version.empty())
        {
            acc.connector.version = *version;
        }

        auto edge = FieldAliases::ResolveString(conn, ConnectionField::EDGE);
        if (edge)
        {
            acc.edges.insert(*edge);
        }

        auto origin_ip = FieldAliases::ResolveString(conn, ConnectionField::ORIGIN_IP);
        if (origin_ip)
        {
            acc.origin_ips.insert(*origin_ip);
        }

        auto opened_at = FieldAliases::ResolveString(conn, ConnectionField::OPENED_AT);
        if (opened_at)
        {
            acc.AddOpenedAt(*opened_at);
        }

        if (FieldAliases::ResolveFlag(conn, ConnectionField::PENDING_RECONNECT))
        {
            acc.connector.pending_reconnect = true;
        }
    }

    for (auto &acc : groups)
    {
        acc.connector.edges.assign(acc.edges.begin(), acc.edges.end());
        acc.connector.origin_ips.assign(acc.origin_ips.begin(), acc.origin_ips.end());
        ApplyVersionComparison(acc.connector, latest_version);
        result.connectors.push_back(std::move(acc.connector));
    }
    result.connector_count = static_cast<unsigned int>(result.connectors.size());
    return result;
}


void ApplyVersionComparison(Connector &connector,
                            const std::string &latest_version)
{
    connector.latest_version = latest_version;
    if (connector.version.empty() || latest_version.empty())
    {
        connector.is_latest.reset();
        connector.update_available.reset();
        connector.version_diff.reset();
        return;
    }

    const bool latest = (connector.version == latest_version);
    connector.is_latest = latest;
    connector.update_available = !latest;
    if (latest)
    {
        connector.version_diff.reset();
    }
    else
    {
        connector.version_diff = connector.version + " -> " + latest_version;
    }
}

} // namespace TunnelMonitor
