//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   account-monitor.cpp
 *
 * @brief  Unit tests for AccountMonitor and RefreshOrchestrator
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "monitor/account-monitor.hpp"
#include "monitor/refresh-orchestrator.hpp"
#include "fake-transport.hpp"

using namespace std::chrono_literals;


namespace unittest {

static const std::string TWO_TUNNELS = R"({"success": true, "result": [
    {"id": "t1", "name": "web", "status": "healthy",
     "created_at": "2024-01-01T00:00:00Z"},
    {"id": "t2", "name": "", "status": "down"}
]})";


class AccountMonitorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        transport = std::make_shared<FakeTransport>();
        log = LogSender::Create(LogGroup::REFRESH, nullptr);
        api = APIClient::Create(transport, log);
        cache = LatestVersionCache::Create([]()
                                           {
                                               return std::string("2024.2.0");
                                           },
                                           3600s);
        creds.account_id = ACCOUNT_ID;
        creds.api_token = "token";
        creds.friendly_name = "Home";
    }

    AccountMonitor::Ptr create_monitor(unsigned int parallel = 4)
    {
        MonitorSettings s;
        s.refresh_interval = 3600s;
        s.max_parallel_fetches = parallel;
        return AccountMonitor::Create(creds, api, cache, log, s);
    }

  public:
    FakeTransport::Ptr transport;
    LogSender::Ptr log;
    APIClient::Ptr api;
    LatestVersionCache::Ptr cache;
    AccountCredentials creds;
};


TEST_F(AccountMonitorTest, publish_snapshot)
{
    transport->Reply(TUNNELS_URI, 200, TWO_TUNNELS);
    transport->Reply(connections_uri("t1"), 200, R"({"result": [
        {"client_id": "A", "client_version": "2024.1.0", "colo_name": "AMS"},
        {"client_id": "A", "colo_name": "FRA"},
        {"client_id": "B", "client_version": "2024.1.0"}
    ]})");
    transport->Reply(connections_uri("t2"), 200, R"({"result": []})");

    auto mon = create_monitor();
    EXPECT_EQ(mon->GetSnapshot(), nullptr);
    ASSERT_TRUE(mon->RunCycle());
    EXPECT_EQ(mon->GetState(), CycleState::IDLE);
    EXPECT_FALSE(mon->GetLastError().has_value());

    Snapshot::Ptr snap = mon->GetSnapshot();
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->account_id, ACCOUNT_ID);
    EXPECT_EQ(snap->friendly_name, "Home");
    EXPECT_EQ(snap->latest_version, "2024.2.0");
    ASSERT_EQ(snap->tunnels.size(), 2u);

    const Tunnel &t1 = snap->tunnels[0];
    EXPECT_EQ(t1.id, "t1");
    EXPECT_EQ(t1.name, "web");
    EXPECT_EQ(t1.unique_id, "cloudflare_tunnel_monitor_acct-1_t1");
    EXPECT_EQ(t1.health, TunnelHealth::HEALTHY);
    EXPECT_EQ(t1.created_at, "2024-01-01T00:00:00Z");
    EXPECT_EQ(t1.connector_count, 2u);
    EXPECT_EQ(t1.session_count, 3u);
    EXPECT_EQ(t1.latest_version, "2024.2.0");
    ASSERT_EQ(t1.connectors.size(), 2u);
    EXPECT_EQ(t1.connectors[0].version_diff.value_or(""), "2024.1.0 -> 2024.2.0");

    const Tunnel &t2 = snap->tunnels[1];
    EXPECT_EQ(t2.name, "t2") << "An empty name must fall back to the id";
    EXPECT_EQ(t2.health, TunnelHealth::DOWN);
    EXPECT_EQ(t2.connector_count, 0u);
    EXPECT_EQ(t2.created_at, "");
}


TEST_F(AccountMonitorTest, unauthorized_keeps_previous_snapshot)
{
    transport->Reply(TUNNELS_URI, 200, R"({"result": [{"id": "t1", "status": "healthy"}]})");
    auto mon = create_monitor();
    ASSERT_TRUE(mon->RunCycle());
    Snapshot::Ptr first = mon->GetSnapshot();
    ASSERT_NE(first, nullptr);

    transport->Reply(TUNNELS_URI, 401, R"({"success": false})", "Unauthorized");
    const size_t conn_requests = transport->CountRequests(connections_uri("t1"));
    EXPECT_FALSE(mon->RunCycle());

    EXPECT_EQ(mon->GetSnapshot(), first) << "The previous snapshot was replaced";
    EXPECT_EQ(transport->CountRequests(connections_uri("t1")), conn_requests)
        << "Connections were fetched after a failed tunnel list request";

    auto err = mon->GetLastError();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RemoteAPIException::Kind::UNAUTHORIZED);
    EXPECT_EQ(mon->GetState(), CycleState::IDLE);
}


TEST_F(AccountMonitorTest, error_cleared_after_success)
{
    transport->Fail(TUNNELS_URI, true);
    auto mon = create_monitor();
    EXPECT_FALSE(mon->RunCycle());
    ASSERT_TRUE(mon->GetLastError().has_value());
    EXPECT_EQ(mon->GetLastError()->kind, RemoteAPIException::Kind::UNREACHABLE);
    EXPECT_EQ(mon->GetSnapshot(), nullptr);

    transport->Reply(TUNNELS_URI, 200, R"({"result": []})");
    EXPECT_TRUE(mon->RunCycle());
    EXPECT_FALSE(mon->GetLastError().has_value());
    ASSERT_NE(mon->GetSnapshot(), nullptr);
    EXPECT_TRUE(mon->GetSnapshot()->tunnels.empty());
}


TEST_F(AccountMonitorTest, failing_tunnel_is_isolated)
{
    transport->Reply(TUNNELS_URI, 200, TWO_TUNNELS);
    transport->Reply(connections_uri("t1"), 500, "internal", "Internal Server Error");
    transport->Reply(connections_uri("t2"), 200,
                     R"({"result": [{"client_id": "X"}]})");

    auto mon = create_monitor();
    ASSERT_TRUE(mon->RunCycle());
    Snapshot::Ptr snap = mon->GetSnapshot();
    ASSERT_EQ(snap->tunnels.size(), 2u);
    EXPECT_EQ(snap->tunnels[0].connector_count, 0u);
    EXPECT_EQ(snap->tunnels[0].session_count, 0u);
    EXPECT_EQ(snap->tunnels[1].connector_count, 1u);
    EXPECT_FALSE(mon->GetLastError().has_value());
}


TEST_F(AccountMonitorTest, library_error_is_isolated)
{
    transport->Reply(TUNNELS_URI, 200, TWO_TUNNELS);
    transport->LibraryError(connections_uri("t1"), "ssl_context: error");
    transport->Reply(connections_uri("t2"), 200,
                     R"({"result": [{"client_id": "X"}]})");

    auto mon = create_monitor();
    ASSERT_TRUE(mon->RunCycle());
    EXPECT_EQ(mon->GetState(), CycleState::IDLE);

    Snapshot::Ptr snap = mon->GetSnapshot();
    ASSERT_NE(snap, nullptr);
    ASSERT_EQ(snap->tunnels.size(), 2u);
    EXPECT_EQ(snap->tunnels[0].connector_count, 0u);
    EXPECT_EQ(snap->tunnels[1].connector_count, 1u);
    EXPECT_FALSE(mon->GetLastError().has_value());
}


TEST_F(AccountMonitorTest, library_error_on_tunnel_list)
{
    transport->LibraryError(TUNNELS_URI, "ssl_context: error");

    auto mon = create_monitor();
    EXPECT_FALSE(mon->RunCycle());
    EXPECT_EQ(mon->GetState(), CycleState::IDLE);
    EXPECT_EQ(mon->GetSnapshot(), nullptr);

    auto err = mon->GetLastError();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, RemoteAPIException::Kind::UNREACHABLE);
}


TEST_F(AccountMonitorTest, skip_tunnels_without_id)
{
    transport->Reply(TUNNELS_URI, 200, R"({"result": [
        {"name": "no id"},
        {"id": "", "name": "empty id"},
        "not an object",
        {"id": "t3", "status": "unheard-of"}
    ]})");

    auto mon = create_monitor();
    ASSERT_TRUE(mon->RunCycle());
    Snapshot::Ptr snap = mon->GetSnapshot();
    ASSERT_EQ(snap->tunnels.size(), 1u);
    EXPECT_EQ(snap->tunnels[0].id, "t3");
    EXPECT_EQ(snap->tunnels[0].declared_status.value_or(""), "unheard-of");
    EXPECT_FALSE(snap->tunnels[0].health.has_value());
}


TEST_F(AccountMonitorTest, bounded_batches)
{
    Json::Value list(Json::objectValue);
    list["result"] = Json::Value(Json::arrayValue);
    for (int i = 0; i < 9; ++i)
    {
        Json::Value t(Json::objectValue);
        t["id"] = "t" + std::to_string(i);
        list["result"].append(t);
        transport->Reply(connections_uri("t" + std::to_string(i)), 200,
                         R"({"result": [{"client_id": "c"}]})");
    }
    std::ostringstream buf;
    buf << list;
    transport->Reply(TUNNELS_URI, 200, buf.str());

    auto mon = create_monitor(2);
    ASSERT_TRUE(mon->RunCycle());
    Snapshot::Ptr snap = mon->GetSnapshot();
    ASSERT_EQ(snap->tunnels.size(), 9u);
    for (int i = 0; i < 9; ++i)
    {
        EXPECT_EQ(snap->tunnels[i].id, "t" + std::to_string(i)) << "Order lost";
        EXPECT_EQ(snap->tunnels[i].connector_count, 1u);
    }
}


TEST_F(AccountMonitorTest, publish_callback)
{
    transport->Reply(TUNNELS_URI, 401, "", "Unauthorized");
    auto mon = create_monitor();

    std::vector<AccountStatus> published;
    mon->SetPublishCallback([&published](const AccountStatus &st)
                            {
                                published.push_back(st);
                            });
    mon->RunCycle();
    transport->Reply(TUNNELS_URI, 200, R"({"result": []})");
    mon->RunCycle();

    ASSERT_EQ(published.size(), 2u);
    EXPECT_EQ(published[0].account_id, ACCOUNT_ID);
    EXPECT_EQ(published[0].snapshot, nullptr);
    EXPECT_TRUE(published[0].last_error.has_value());
    EXPECT_NE(published[1].snapshot, nullptr);
    EXPECT_FALSE(published[1].last_error.has_value());
}


TEST_F(AccountMonitorTest, start_stop)
{
    transport->Reply(TUNNELS_URI, 200, R"({"result": []})");
    auto mon = create_monitor();

    std::mutex mtx;
    std::condition_variable cv;
    bool done = false;
    mon->SetPublishCallback([&](const AccountStatus &)
                            {
                                std::lock_guard<std::mutex> lg(mtx);
                                done = true;
                                cv.notify_all();
                            });

    mon->Start();
    EXPECT_TRUE(mon->IsRunning());
    {
        std::unique_lock<std::mutex> lk(mtx);
        ASSERT_TRUE(cv.wait_for(lk, 10s, [&done]()
                                { return done; }))
            << "The first cycle did not run right away";
    }

    // The refresh interval is an hour; Stop() must not wait for it
    const auto t0 = std::chrono::steady_clock::now();
    mon->Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_FALSE(mon->IsRunning());
    EXPECT_EQ(transport->CountRequests(TUNNELS_URI), 1u);
}



class RefreshOrchestratorTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        transport = std::make_shared<FakeTransport>();
        auto log = LogSender::Create(LogGroup::REFRESH, nullptr);
        OrchestratorSettings s;
        s.monitor.refresh_interval = 3600s;
        orch = RefreshOrchestrator::Create(APIClient::Create(transport, log),
                                           log,
                                           s);
    }

    AccountCredentials account(const std::string &id)
    {
        AccountCredentials c;
        c.account_id = id;
        c.api_token = "token-" + id;
        c.friendly_name = "Account " + id;
        return c;
    }

  public:
    FakeTransport::Ptr transport;
    RefreshOrchestrator::Ptr orch;
};


TEST_F(RefreshOrchestratorTest, add_remove)
{
    EXPECT_TRUE(orch->AddAccount(account("a")));
    EXPECT_TRUE(orch->AddAccount(account("b")));
    EXPECT_FALSE(orch->AddAccount(account("a"))) << "Duplicated account accepted";
    EXPECT_EQ(orch->GetAccountIds(), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(orch->RemoveAccount("a"));
    EXPECT_FALSE(orch->RemoveAccount("a"));
    EXPECT_EQ(orch->GetAccountIds(), (std::vector<std::string>{"b"}));
    EXPECT_EQ(orch->GetSnapshot("a"), nullptr);
}


TEST_F(RefreshOrchestratorTest, remove_callback)
{
    std::vector<std::string> removed;
    orch->SetRemoveCallback([&removed](const std::string &account_id)
                            {
                                removed.push_back(account_id);
                            });
    ASSERT_TRUE(orch->AddAccount(account("a")));
    ASSERT_TRUE(orch->AddAccount(account("b")));

    EXPECT_TRUE(orch->RemoveAccount("b"));
    EXPECT_FALSE(orch->RemoveAccount("unknown"));
    EXPECT_EQ(removed, (std::vector<std::string>{"b"}));
}


TEST_F(RefreshOrchestratorTest, shared_version_lookup)
{
    transport->Reply(RELEASE_URI, 200, R"({"tag_name": "v2024.9.1"})");
    transport->Reply("/client/v4/accounts/a/cfd_tunnel?is_deleted=false", 200,
                     R"({"result": [{"id": "t1"}]})");
    transport->Reply("/client/v4/accounts/b/cfd_tunnel?is_deleted=false", 401, "");
    ASSERT_TRUE(orch->AddAccount(account("a")));
    ASSERT_TRUE(orch->AddAccount(account("b")));

    EXPECT_FALSE(orch->RefreshAll()) << "Account b must fail";
    EXPECT_EQ(transport->CountRequests(RELEASE_URI), 1u)
        << "The release lookup is not shared between accounts";

    Snapshot::Ptr a = orch->GetSnapshot("a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->latest_version, "2024.9.1");
    EXPECT_EQ(orch->GetSnapshot("b"), nullptr);

    for (const auto &st : orch->GetAccountStatus())
    {
        if ("b" == st.account_id)
        {
            ASSERT_TRUE(st.last_error.has_value());
            EXPECT_EQ(st.last_error->kind, RemoteAPIException::Kind::UNAUTHORIZED);
        }
        else
        {
            EXPECT_FALSE(st.last_error.has_value());
        }
    }
}

} // namespace unittest
