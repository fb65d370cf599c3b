//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   refresh-orchestrator.cpp
 *
 * @brief  Implementation of RefreshOrchestrator
 */

#include <future>

#include "log/logtag.hpp"
#include "monitor/refresh-orchestrator.hpp"


namespace TunnelMonitor {

RefreshOrchestrator::RefreshOrchestrator(APIClient::Ptr api_,
                                         LogSender::Ptr log_,
                                         const OrchestratorSettings &settings_)
    : api(api_), log(log_), settings(settings_)
{
    APIClient::Ptr client = api;
    version_cache = LatestVersionCache::Create([client]()
                                               {
                                                   return client->FetchLatestRelease();
                                               },
                                               settings.version_ttl,
                                               log->Derive(LogGroup::VERSIONCACHE, nullptr));
}


RefreshOrchestrator::~RefreshOrchestrator() noexcept
{
    Stop();
}


bool RefreshOrchestrator::AddAccount(const AccountCredentials &creds)
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    if (monitors.find(creds.account_id) != monitors.end())
    {
        log->LogWarn("Account " + creds.account_id + " is already monitored");
        return false;
    }

    auto mon = AccountMonitor::Create(creds,
                                      api,
                                      version_cache,
                                      log->Derive(LogGroup::REFRESH,
                                                  LogTag::Create(creds.friendly_name)),
                                      settings.monitor);
    if (publish_cb)
    {
        mon->SetPublishCallback(publish_cb);
    }
    monitors[creds.account_id] = mon;
    log->LogInfo("Monitoring account " + creds.friendly_name
                 + " (" + creds.account_id + ")");
    if (running)
    {
        mon->Start();
    }
    return true;
}


bool RefreshOrchestrator::RemoveAccount(const std::string &account_id)
{
    AccountMonitor::Ptr mon;
    RemoveCallback cb;
    {
        std::lock_guard<std::mutex> lg(monitors_mtx);
        auto it = monitors.find(account_id);
        if (monitors.end() == it)
        {
            return false;
        }
        mon = it->second;
        monitors.erase(it);
        cb = remove_cb;
    }
    mon->Stop();
    if (cb)
    {
        cb(account_id);
    }
    log->LogInfo("Stopped monitoring account " + account_id);
    return true;
}


void RefreshOrchestrator::SetRemoveCallback(RemoveCallback cb)
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    remove_cb = std::move(cb);
}


void RefreshOrchestrator::SetPublishCallback(AccountMonitor::PublishCallback cb)
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    publish_cb = cb;
    for (auto &m : monitors)
    {
        m.second->SetPublishCallback(cb);
    }
}


void RefreshOrchestrator::Start()
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    if (running)
    {
        return;
    }
    running = true;
    for (auto &m : monitors)
    {
        m.second->Start();
    }
    log->LogVerb1("Started refreshing " + std::to_string(monitors.size())
                  + " account(s)");
}


void RefreshOrchestrator::Stop()
{
    std::vector<AccountMonitor::Ptr> mons;
    {
        std::lock_guard<std::mutex> lg(monitors_mtx);
        if (!running)
        {
            return;
        }
        running = false;
        for (auto &m : monitors)
        {
            mons.push_back(m.second);
        }
    }

    // Stop() on each monitor blocks until its thread has exited,
    // so the lock must not be held here
    for (auto &m : mons)
    {
        m->Stop();
    }
    log->LogVerb1("All account refresh tasks stopped");
}


bool RefreshOrchestrator::RefreshAll()
{
    std::vector<AccountMonitor::Ptr> mons;
    {
        std::lock_guard<std::mutex> lg(monitors_mtx);
        for (auto &m : monitors)
        {
            mons.push_back(m.second);
        }
    }

    std::vector<std::future<bool>> cycles;
    for (auto &m : mons)
    {
        cycles.push_back(std::async(std::launch::async,
                                    [m]()
                                    {
                                        return m->RunCycle();
                                    }));
    }

    bool all_published = true;
    for (auto &c : cycles)
    {
        if (!c.get())
        {
            all_published = false;
        }
    }
    return all_published;
}


Snapshot::Ptr RefreshOrchestrator::GetSnapshot(const std::string &account_id) const
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    auto it = monitors.find(account_id);
    if (monitors.end() == it)
    {
        return nullptr;
    }
    return it->second->GetSnapshot();
}


std::vector<AccountStatus> RefreshOrchestrator::GetAccountStatus() const
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    std::vector<AccountStatus> ret;
    for (const auto &m : monitors)
    {
        ret.push_back(m.second->GetStatus());
    }
    return ret;
}


std::vector<std::string> RefreshOrchestrator::GetAccountIds() const
{
    std::lock_guard<std::mutex> lg(monitors_mtx);
    std::vector<std::string> ret;
    for (const auto &m : monitors)
    {
        ret.push_back(m.first);
    }
    return ret;
}

} // namespace TunnelMonitor
