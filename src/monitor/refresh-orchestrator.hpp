//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   refresh-orchestrator.hpp
 *
 * @brief  Owner of all the monitored accounts and the shared latest
 *         version cache
 */

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "log/log-sender.hpp"
#include "monitor/account-monitor.hpp"
#include "monitor/api-client.hpp"
#include "monitor/constants.hpp"
#include "monitor/version-cache.hpp"


namespace TunnelMonitor {

struct OrchestratorSettings
{
    MonitorSettings monitor;
    std::chrono::seconds version_ttl{Constants::VERSION_TTL};
};


/**
 *  Composition root of the monitoring core.  It creates the single
 *  LatestVersionCache every account shares and one AccountMonitor per
 *  monitored account.
 */
class RefreshOrchestrator
{
  public:
    using Ptr = std::shared_ptr<RefreshOrchestrator>;
    using RemoveCallback = std::function<void(const std::string &account_id)>;

    [[nodiscard]] static RefreshOrchestrator::Ptr Create(APIClient::Ptr api,
                                                         LogSender::Ptr log,
                                                         const OrchestratorSettings &settings = {})
    {
        return Ptr(new RefreshOrchestrator(api, log, settings));
    }

    ~RefreshOrchestrator() noexcept;

    /**
     *  Add an account to monitor.  If the periodic refresh is already
     *  running, the account starts refreshing right away.
     *
     * @param creds  AccountCredentials of the new account
     *
     * @return false if the account is already monitored
     */
    bool AddAccount(const AccountCredentials &creds);

    /**
     *  Stop and remove a monitored account
     *
     * @return false if the account was not monitored
     */
    bool RemoveAccount(const std::string &account_id);

    /**
     *  Set the function called after each completed cycle of any
     *  account.  It is called from the refresh threads.
     */
    void SetPublishCallback(AccountMonitor::PublishCallback cb);

    /**
     *  Set the function called by RemoveAccount(), once the account
     *  has stopped refreshing
     */
    void SetRemoveCallback(RemoveCallback cb);

    void Start();
    void Stop();

    /**
     *  Run one refresh cycle for every account, concurrently, and wait
     *  for all of them to complete
     *
     * @return true if every account published a new Snapshot
     */
    bool RefreshAll();

    /**
     *  Retrieve the last published Snapshot of an account
     *
     * @return Snapshot::Ptr, nullptr if the account is unknown or has
     *         not published anything yet
     */
    Snapshot::Ptr GetSnapshot(const std::string &account_id) const;

    std::vector<AccountStatus> GetAccountStatus() const;
    std::vector<std::string> GetAccountIds() const;

    LatestVersionCache::Ptr GetVersionCache() const noexcept
    {
        return version_cache;
    }


  private:
    APIClient::Ptr api;
    LogSender::Ptr log;
    const OrchestratorSettings settings;
    LatestVersionCache::Ptr version_cache;

    mutable std::mutex monitors_mtx;
    std::map<std::string, AccountMonitor::Ptr> monitors;
    AccountMonitor::PublishCallback publish_cb;
    RemoveCallback remove_cb;
    bool running = false;

    RefreshOrchestrator(APIClient::Ptr api,
                        LogSender::Ptr log,
                        const OrchestratorSettings &settings);
};

} // namespace TunnelMonitor
