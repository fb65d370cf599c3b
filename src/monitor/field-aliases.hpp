//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   field-aliases.hpp
 *
 * @brief  Lookup of connection record fields which are reported under
 *         different names depending on the API variant
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>


namespace TunnelMonitor {

enum class ConnectionField : uint8_t
{
    CLIENT_ID,
    VERSION,
    OPENED_AT,
    EDGE,
    ORIGIN_IP,
    PENDING_RECONNECT
};


namespace FieldAliases {

/**
 *  Retrieve the JSON member names of a logical connection field, in
 *  the order they are tried
 */
const std::vector<std::string> &Get(const ConnectionField field);

/**
 *  Resolve a logical string field of a raw connection record.  The
 *  first alias carrying a non-empty scalar value is used; numbers and
 *  booleans are converted to their string representation.
 *
 * @param conn   Json::Value with the raw connection record
 * @param field  ConnectionField to resolve
 *
 * @return std::optional<std::string> with the value, or std::nullopt
 *         if none of the aliases carry a usable value
 */
std::optional<std::string> ResolveString(const Json::Value &conn,
                                         const ConnectionField field);

/**
 *  Resolve a logical flag of a raw connection record.  The flag is
 *  set if any of its aliases carries a true value: true, a non-zero
 *  number or a non-empty string other than "false" and "0".
 */
bool ResolveFlag(const Json::Value &conn, const ConnectionField field);

} // namespace FieldAliases
} // namespace TunnelMonitor
