//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   health-classifier.cpp
 *
 * @brief  Unit tests for the tunnel health classification
 */

#include <gtest/gtest.h>

#include "monitor/health-classifier.hpp"

using namespace TunnelMonitor;


namespace unittest {

TEST(HealthClassifier, known_states)
{
    EXPECT_EQ(ClassifyTunnelHealth(std::string("healthy")), TunnelHealth::HEALTHY);
    EXPECT_EQ(ClassifyTunnelHealth(std::string("degraded")), TunnelHealth::DEGRADED);
    EXPECT_EQ(ClassifyTunnelHealth(std::string("inactive")), TunnelHealth::INACTIVE);
    EXPECT_EQ(ClassifyTunnelHealth(std::string("down")), TunnelHealth::DOWN);
}


TEST(HealthClassifier, unknown_states)
{
    EXPECT_FALSE(ClassifyTunnelHealth(std::nullopt).has_value());
    EXPECT_FALSE(ClassifyTunnelHealth(std::string("")).has_value());
    EXPECT_FALSE(ClassifyTunnelHealth(std::string("deleted")).has_value());
    EXPECT_FALSE(ClassifyTunnelHealth(std::string("HEALTHY")).has_value())
        << "Status names are not case folded";
}


TEST(HealthClassifier, names)
{
    for (const auto &n : {"inactive", "degraded", "healthy", "down"})
    {
        auto h = ClassifyTunnelHealth(std::string(n));
        ASSERT_TRUE(h.has_value()) << n;
        EXPECT_EQ(TunnelHealth_str(*h), n);
    }
}

} // namespace unittest
