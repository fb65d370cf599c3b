//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   connector-reconciler.hpp
 *
 * @brief  Folds the raw connection records of a tunnel into connectors
 */

#pragma once

#include <string>
#include <json/json.h>

#include "monitor/records.hpp"


namespace TunnelMonitor {

/**
 *  Groups the raw connections of a single tunnel by their client
 *  identifier.  Connections without a client identifier end up in the
 *  "unknown" connector; no connection is ever dropped.  Connectors are
 *  returned in the order their client identifier was first seen.
 *
 * @param connections     Json::Value array of raw connection records.
 *                        Anything else is treated as an empty list.
 * @param latest_version  std::string with the newest known release,
 *                        may be empty
 *
 * @return ReconcileResult with the connectors and their counters
 */
ReconcileResult ReconcileConnectors(const Json::Value &connections,
                                    const std::string &latest_version);

/**
 *  Set the latest_version related fields of a connector.  If either
 *  version is unknown, is_latest, update_available and version_diff
 *  are all left unset.
 */
void ApplyVersionComparison(Connector &connector,
                            const std::string &latest_version);

} // namespace TunnelMonitor
