//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   field-aliases.cpp
 *
 * @brief  Connection field alias table and lookup functions
 */

#include <map>

#include "monitor/field-aliases.hpp"


namespace TunnelMonitor {
namespace FieldAliases {

static const std::map<ConnectionField, std::vector<std::string>> alias_table = {
    {ConnectionField::CLIENT_ID, {"client_id", "clientId"}},
    {ConnectionField::VERSION, {"client_version", "clientVersion", "version"}},
    {ConnectionField::OPENED_AT, {"opened_at", "openedAt", "started_at"}},
    {ConnectionField::EDGE, {"colo_name", "edge", "colo", "origin"}},
    {ConnectionField::ORIGIN_IP, {"client_address", "origin_ip", "ip"}},
    {ConnectionField::PENDING_RECONNECT, {"is_pending_reconnect", "pending_reconnect"}}};


const std::vector<std::string> &Get(const ConnectionField field)
{
    return alias_table.at(field);
}


std::optional<std::string> ResolveString(const Json::Value &conn,
                                         const ConnectionField field)
{
    if (!conn.isObject())
    {
        return std::nullopt;
    }

    for (const auto &alias : Get(field))
    {
        const Json::Value &v = conn[alias];
        if (v.isString())
        {
            if (!v.asString().empty())
            {
                return v.asString();
            }
        }
        else if (v.isNumeric() || v.isBool())
        {
            return v.asString();
        }
    }
    return std::nullopt;
}


static bool is_true(const Json::Value &v)
{
    if (v.isBool())
    {
        return v.asBool();
    }
    if (v.isIntegral())
    {
        return 0 != v.asLargestInt();
    }
    if (v.isDouble())
    {
        return 0.0 != v.asDouble();
    }
    if (v.isString())
    {
        const std::string s = v.asString();
        return !s.empty() && "false" != s && "0" != s;
    }
    return false;
}


bool ResolveFlag(const Json::Value &conn, const ConnectionField field)
{
    if (!conn.isObject())
    {
        return false;
    }

    for (const auto &alias : Get(field))
    {
        if (is_true(conn[alias]))
        {
            return true;
        }
    }
    return false;
}

} // namespace FieldAliases
} // namespace TunnelMonitor
