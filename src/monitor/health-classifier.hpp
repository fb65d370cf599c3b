//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   health-classifier.hpp
 *
 * @brief  Maps the declared tunnel status to a TunnelHealth value
 */

#pragma once

#include <optional>
#include <string>

#include "monitor/records.hpp"


namespace TunnelMonitor {

/**
 *  Classify the health of a tunnel from the status reported by the
 *  provider.  Only the exact status names "inactive", "degraded",
 *  "healthy" and "down" are recognised.
 *
 * @param declared_status  std::optional<std::string> with the status
 *
 * @return std::optional<TunnelHealth>, std::nullopt if the status is
 *         missing or not recognised
 */
std::optional<TunnelHealth> ClassifyTunnelHealth(const std::optional<std::string> &declared_status);

/**
 *  The lower case name of a TunnelHealth value, as used in the
 *  exported snapshot
 */
const std::string TunnelHealth_str(const TunnelHealth health);

} // namespace TunnelMonitor
