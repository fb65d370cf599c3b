//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   connector-reconciler.cpp
 *
 * @brief  Unit tests for the connection to connector folding
 */

#include <algorithm>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include <json/json.h>

#include "monitor/connector-reconciler.hpp"

using namespace TunnelMonitor;


namespace unittest {

static Json::Value parse(const std::string &s)
{
    std::istringstream buf(s);
    Json::Value v;
    buf >> v;
    return v;
}


static const Connector *find_connector(const ReconcileResult &r,
                                       const std::string &client_id)
{
    for (const auto &c : r.connectors)
    {
        if (client_id == c.client_id)
        {
            return &c;
        }
    }
    return nullptr;
}


/**
 *  Checks the invariants which must hold for any input
 */
static void check_invariants(const Json::Value &input, const ReconcileResult &r)
{
    EXPECT_EQ(r.session_count, input.size())
        << "session_count does not match the number of connections";
    EXPECT_EQ(r.connector_count, r.connectors.size());

    unsigned int sum = 0;
    for (const auto &c : r.connectors)
    {
        EXPECT_GE(c.sessions, 1u);
        sum += c.sessions;

        EXPECT_TRUE(std::is_sorted(c.edges.begin(), c.edges.end()));
        EXPECT_TRUE(std::adjacent_find(c.edges.begin(), c.edges.end()) == c.edges.end())
            << "Duplicated edge in " << c.client_id;
        EXPECT_TRUE(std::is_sorted(c.origin_ips.begin(), c.origin_ips.end()));
        EXPECT_TRUE(std::adjacent_find(c.origin_ips.begin(), c.origin_ips.end()) == c.origin_ips.end())
            << "Duplicated origin IP in " << c.client_id;

        const bool drift = !c.version.empty() && !c.latest_version.empty()
                           && c.version != c.latest_version;
        EXPECT_EQ(c.version_diff.has_value(), drift);
        EXPECT_EQ(c.update_available.value_or(false), drift);
    }
    EXPECT_EQ(sum, r.session_count) << "Sum of sessions differs from session_count";
}


TEST(ConnectorReconciler, empty_input)
{
    ReconcileResult r = ReconcileConnectors(Json::Value(Json::arrayValue), "2024.2.0");
    EXPECT_TRUE(r.connectors.empty());
    EXPECT_EQ(r.connector_count, 0u);
    EXPECT_EQ(r.session_count, 0u);

    r = ReconcileConnectors(Json::Value(), "2024.2.0");
    EXPECT_TRUE(r.connectors.empty()) << "null input must be treated as empty";
}


TEST(ConnectorReconciler, grouping_scenario)
{
    Json::Value in = parse(R"([
        {"client_id": "A", "version": "2024.1.0", "colo": "AMS"},
        {"client_id": "A", "colo": "FRA"},
        {"client_id": "B", "version": "2024.1.0"}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "2024.2.0");
    check_invariants(in, r);

    ASSERT_EQ(r.connector_count, 2u);
    ASSERT_EQ(r.connectors[0].client_id, "A") << "First seen order not kept";
    ASSERT_EQ(r.connectors[1].client_id, "B");

    const Connector &a = r.connectors[0];
    EXPECT_EQ(a.sessions, 2u);
    EXPECT_EQ(a.edges, (std::vector<std::string>{"AMS", "FRA"}));
    EXPECT_EQ(a.version, "2024.1.0");
    EXPECT_EQ(a.latest_version, "2024.2.0");
    ASSERT_TRUE(a.update_available.has_value());
    EXPECT_TRUE(*a.update_available);
    ASSERT_TRUE(a.is_latest.has_value());
    EXPECT_FALSE(*a.is_latest);
    EXPECT_EQ(a.version_diff.value_or(""), "2024.1.0 -> 2024.2.0");

    const Connector &b = r.connectors[1];
    EXPECT_EQ(b.sessions, 1u);
    EXPECT_TRUE(b.update_available.value_or(false));
}


TEST(ConnectorReconciler, unknown_client_id)
{
    Json::Value in = parse(R"([
        {"colo_name": "LHR"},
        {},
        {"client_id": ""},
        {"client_id": null, "clientId": null}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    check_invariants(in, r);

    ASSERT_EQ(r.connector_count, 1u);
    EXPECT_EQ(r.connectors[0].client_id, "unknown");
    EXPECT_EQ(r.connectors[0].sessions, 4u);
    EXPECT_EQ(r.connectors[0].edges, (std::vector<std::string>{"LHR"}));
}


TEST(ConnectorReconciler, non_object_records_still_counted)
{
    Json::Value in = parse(R"([ "garbage", 42, null, {"client_id": "A"} ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    check_invariants(in, r);

    ASSERT_NE(find_connector(r, "unknown"), nullptr);
    EXPECT_EQ(find_connector(r, "unknown")->sessions, 3u);
    ASSERT_NE(find_connector(r, "A"), nullptr);
}


TEST(ConnectorReconciler, aliases)
{
    Json::Value in = parse(R"([
        {"clientId": "C", "clientVersion": "2024.3.0", "edge": "SIN",
         "origin_ip": "10.0.0.2", "openedAt": "2024-05-01T10:00:00Z",
         "pending_reconnect": true},
        {"clientId": "C", "client_version": "2024.4.0", "origin": "NRT",
         "ip": "10.0.0.1", "started_at": "2024-05-01T11:00:00Z"}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "2024.3.0");
    check_invariants(in, r);

    ASSERT_EQ(r.connector_count, 1u);
    const Connector &c = r.connectors[0];
    EXPECT_EQ(c.client_id, "C");
    EXPECT_EQ(c.version, "2024.3.0") << "The first reported version must win";
    EXPECT_EQ(c.edges, (std::vector<std::string>{"NRT", "SIN"}));
    EXPECT_EQ(c.origin_ips, (std::vector<std::string>{"10.0.0.1", "10.0.0.2"}));
    EXPECT_TRUE(c.pending_reconnect);
    EXPECT_EQ(c.opened_at_latest, "2024-05-01T11:00:00Z");
    EXPECT_TRUE(c.is_latest.value_or(false));
    EXPECT_FALSE(c.update_available.value_or(true));
    EXPECT_FALSE(c.version_diff.has_value());
}


TEST(ConnectorReconciler, duplicates_collapse)
{
    Json::Value in = parse(R"([
        {"client_id": "A", "colo_name": "AMS", "client_address": "1.2.3.4"},
        {"client_id": "A", "colo_name": "AMS", "client_address": "1.2.3.4"},
        {"client_id": "A", "colo_name": "AMS", "client_address": "1.2.3.4"}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    check_invariants(in, r);
    ASSERT_EQ(r.connector_count, 1u);
    EXPECT_EQ(r.connectors[0].sessions, 3u);
    EXPECT_EQ(r.connectors[0].edges.size(), 1u);
    EXPECT_EQ(r.connectors[0].origin_ips.size(), 1u);
}


TEST(ConnectorReconciler, pending_reconnect_is_sticky)
{
    Json::Value in = parse(R"([
        {"client_id": "A", "is_pending_reconnect": false},
        {"client_id": "A", "is_pending_reconnect": true},
        {"client_id": "A", "is_pending_reconnect": false},
        {"client_id": "B", "is_pending_reconnect": false}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    EXPECT_TRUE(find_connector(r, "A")->pending_reconnect);
    EXPECT_FALSE(find_connector(r, "B")->pending_reconnect);
}


TEST(ConnectorReconciler, unknown_versions)
{
    Json::Value in = parse(R"([
        {"client_id": "A", "version": "2024.1.0"},
        {"client_id": "B"}
    ])");

    ReconcileResult r = ReconcileConnectors(in, "");
    check_invariants(in, r);
    for (const auto &c : r.connectors)
    {
        EXPECT_FALSE(c.is_latest.has_value()) << c.client_id;
        EXPECT_FALSE(c.update_available.has_value()) << c.client_id;
        EXPECT_FALSE(c.version_diff.has_value()) << c.client_id;
    }

    r = ReconcileConnectors(in, "2024.1.0");
    check_invariants(in, r);
    const Connector *b = find_connector(r, "B");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->is_latest.has_value())
        << "A connector without version must have an unknown is_latest";
    EXPECT_FALSE(b->update_available.has_value());
    EXPECT_TRUE(find_connector(r, "A")->is_latest.value_or(false));
}


TEST(ConnectorReconciler, opened_at_parsed_comparison)
{
    // The offset timestamp is the latest instant, even though it is
    // not the greatest string
    Json::Value in = parse(R"([
        {"client_id": "A", "opened_at": "2024-05-01T10:30:00Z"},
        {"client_id": "A", "opened_at": "2024-05-01T09:00:00-02:00"},
        {"client_id": "A", "opened_at": "2024-05-01T10:45:00.123456Z"}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    EXPECT_EQ(r.connectors[0].opened_at_latest, "2024-05-01T09:00:00-02:00");
}


TEST(ConnectorReconciler, opened_at_unparseable)
{
    Json::Value in = parse(R"([
        {"client_id": "A", "opened_at": "zzz-not-a-time"},
        {"client_id": "A", "opened_at": "2024-05-01T10:30:00Z"},
        {"client_id": "B", "opened_at": "abc"},
        {"client_id": "B", "opened_at": "abd"}
    ])");
    ReconcileResult r = ReconcileConnectors(in, "");
    EXPECT_EQ(find_connector(r, "A")->opened_at_latest, "2024-05-01T10:30:00Z")
        << "A parseable timestamp must win over an unparseable one";
    EXPECT_EQ(find_connector(r, "B")->opened_at_latest, "abd");
}


TEST(ConnectorReconciler, version_comparison)
{
    Connector c;
    c.version = "2024.1.0";
    ApplyVersionComparison(c, "2024.1.0");
    EXPECT_TRUE(c.is_latest.value_or(false));
    EXPECT_FALSE(c.update_available.value_or(true));
    EXPECT_FALSE(c.version_diff.has_value());

    ApplyVersionComparison(c, "2024.2.0");
    EXPECT_FALSE(c.is_latest.value_or(true));
    EXPECT_TRUE(c.update_available.value_or(false));
    EXPECT_EQ(c.version_diff.value_or(""), "2024.1.0 -> 2024.2.0");

    ApplyVersionComparison(c, "");
    EXPECT_FALSE(c.is_latest.has_value());
    EXPECT_FALSE(c.update_available.has_value());
    EXPECT_FALSE(c.version_diff.has_value());
    EXPECT_EQ(c.latest_version, "");
}


TEST(ConnectorReconciler, generated_inputs)
{
    // Deterministic mix of records with random looking field sets
    static const char *ids[] = {"A", "B", "", "C"};
    static const char *colos[] = {"AMS", "FRA", "AMS", "LHR", ""};
    static const char *versions[] = {"2024.1.0", "", "2024.2.0"};

    for (unsigned int len = 0; len < 40; len += 7)
    {
        Json::Value in(Json::arrayValue);
        for (unsigned int i = 0; i < len; ++i)
        {
            Json::Value conn(Json::objectValue);
            if (*ids[i % 4])
            {
                conn["client_id"] = ids[i % 4];
            }
            if (*colos[i % 5])
            {
                conn["colo_name"] = colos[i % 5];
            }
            if (*versions[i % 3])
            {
                conn["client_version"] = versions[i % 3];
            }
            conn["client_address"] = "192.0.2." + std::to_string(i % 6);
            in.append(conn);
        }
        ReconcileResult r = ReconcileConnectors(in, "2024.2.0");
        check_invariants(in, r);
    }
}

} // namespace unittest
