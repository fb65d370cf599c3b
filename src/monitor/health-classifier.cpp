//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   health-classifier.cpp
 *
 * @brief  Implementation of the tunnel health classification
 */

#include <array>

#include "monitor/health-classifier.hpp"


namespace TunnelMonitor {

static const std::array<TunnelHealth, 4> all_health_states = {
    TunnelHealth::INACTIVE,
    TunnelHealth::DEGRADED,
    TunnelHealth::HEALTHY,
    TunnelHealth::DOWN};


std::optional<TunnelHealth> ClassifyTunnelHealth(const std::optional<std::string> &declared_status)
{
    if (!declared_status)
    {
        return std::nullopt;
    }
    for (const auto &h : all_health_states)
    {
        if (TunnelHealth_str(h) == *declared_status)
        {
            return h;
        }
    }
    return std::nullopt;
}


const std::string TunnelHealth_str(const TunnelHealth health)
{
    switch (health)
    {
    case TunnelHealth::INACTIVE:
        return "inactive";
    case TunnelHealth::DEGRADED:
        return "degraded";
    case TunnelHealth::HEALTHY:
        return "healthy";
    case TunnelHealth::DOWN:
        return "down";
    }
    return "[unknown]";
}

} // namespace TunnelMonitor
