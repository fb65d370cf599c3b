//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   constants.hpp
 *
 * @brief  Default endpoints, timeouts and intervals
 */

#pragma once

#include <chrono>


namespace TunnelMonitor {
namespace Constants {

constexpr char API_HOST[] = "api.cloudflare.com";
constexpr char API_BASE_PATH[] = "/client/v4";
constexpr char RELEASE_HOST[] = "api.github.com";
constexpr char RELEASE_PATH[] = "/repos/cloudflare/cloudflared/releases/latest";
constexpr char HTTPS_PORT[] = "443";

constexpr unsigned int REQUEST_TIMEOUT = 15;      ///< seconds
constexpr unsigned int VERIFY_TIMEOUT = 10;       ///< seconds
constexpr unsigned int REFRESH_INTERVAL = 60;     ///< seconds
constexpr unsigned int VERSION_TTL = 3600;        ///< seconds
constexpr unsigned int MAX_PARALLEL_FETCHES = 4;
constexpr size_t BODY_EXCERPT_LENGTH = 200;

/// Grouping key for connections without a client identifier
constexpr char UNKNOWN_CLIENT_ID[] = "unknown";

/// Prefix of the stable per-tunnel identity exported to consumers
constexpr char UNIQUE_ID_PREFIX[] = "cloudflare_tunnel_monitor_";

} // namespace Constants
} // namespace TunnelMonitor
