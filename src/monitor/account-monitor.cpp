//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   account-monitor.cpp
 *
 * @brief  Implementation of AccountMonitor
 */

#include <algorithm>
#include <future>

#include "monitor/account-monitor.hpp"
#include "monitor/connector-reconciler.hpp"
#include "monitor/health-classifier.hpp"


namespace TunnelMonitor {

const std::string CycleState_str(const CycleState s)
{
    switch (s)
    {
    case CycleState::IDLE:
        return "idle";
    case CycleState::FETCHING:
        return "fetching";
    case CycleState::RECONCILING:
        return "reconciling";
    case CycleState::PUBLISHED:
        return "published";
    case CycleState::FAILED:
        return "failed";
    }
    return "[unknown]";
}


/**
 *  Retrieve a member of a raw tunnel record if it is a string
 */
static std::optional<std::string> string_member(const Json::Value &rec,
                                                const char *name)
{
    const Json::Value &v = rec[name];
    if (v.isString())
    {
        return v.asString();
    }
    return std::nullopt;
}


namespace {

/**
 *  A usable entry from the tunnel list
 */
struct TunnelEntry
{
    std::string id;
    std::string name;
    std::optional<std::string> status;
    std::string created_at;
};

} // anonymous namespace


AccountMonitor::AccountMonitor(const AccountCredentials &creds_,
                               APIClient::Ptr api_,
                               LatestVersionCache::Ptr version_cache_,
                               LogSender::Ptr log_,
                               const MonitorSettings &settings_)
    : creds(creds_), api(api_), version_cache(version_cache_),
      log(log_), settings(settings_)
{
}


AccountMonitor::~AccountMonitor() noexcept
{
    Stop();
}


void AccountMonitor::SetPublishCallback(PublishCallback cb)
{
    std::lock_guard<std::mutex> lg(state_mtx);
    publish_cb = std::move(cb);
}


bool AccountMonitor::RunCycle()
{
    set_state(CycleState::FETCHING);

    // The tunnel list and the latest version are retrieved concurrently
    LatestVersionCache::Ptr cache = version_cache;
    std::future<std::string> latest_version_f = std::async(std::launch::async,
                                                           [cache]()
                                                           {
                                                               return cache->Get();
                                                           });
    Json::Value tunnel_list;
    try
    {
        tunnel_list = api->FetchTunnels(creds);
    }
    catch (const RemoteAPIException &excp)
    {
        latest_version_f.wait();
        record_failure(excp);
        return false;
    }
    const std::string latest_version = latest_version_f.get();

    std::vector<TunnelEntry> entries;
    for (const auto &rec : tunnel_list)
    {
        if (!rec.isObject())
        {
            continue;
        }
        auto id = string_member(rec, "id");
        if (!id || id->empty())
        {
            log->Debug("Skipping tunnel record without id");
            continue;
        }

        TunnelEntry e;
        e.id = *id;
        auto name = string_member(rec, "name");
        e.name = (name && !name->empty() ? *name : e.id);
        e.status = string_member(rec, "status");
        e.created_at = string_member(rec, "created_at").value_or("");
        entries.push_back(e);
    }

    std::vector<std::string> ids;
    for (const auto &e : entries)
    {
        ids.push_back(e.id);
    }
    std::vector<Json::Value> connections = fetch_all_connections(ids);
    if (stop_requested)
    {
        log->Debug("Refresh cycle cancelled");
        set_state(CycleState::IDLE);
        return false;
    }

    set_state(CycleState::RECONCILING);
    auto snap = std::make_shared<Snapshot>();
    snap->account_id = creds.account_id;
    snap->friendly_name = creds.friendly_name;
    snap->latest_version = latest_version;
    for (size_t i = 0; i < entries.size(); ++i)
    {
        const TunnelEntry &e = entries[i];

        Tunnel t;
        t.id = e.id;
        t.unique_id = Constants::UNIQUE_ID_PREFIX + creds.account_id + "_" + e.id;
        t.name = e.name;
        t.declared_status = e.status;
        t.health = ClassifyTunnelHealth(e.status);
        t.created_at = e.created_at;
        t.latest_version = latest_version;

        ReconcileResult r = ReconcileConnectors(connections[i], latest_version);
        t.connectors = std::move(r.connectors);
        t.connector_count = r.connector_count;
        t.session_count = r.session_count;
        snap->tunnels.push_back(std::move(t));
    }
    snap->published_at = std::chrono::system_clock::now();

    {
        std::lock_guard<std::mutex> lg(state_mtx);
        snapshot = snap;
        last_error.reset();
    }
    set_state(CycleState::PUBLISHED);
    log->LogVerb1("Published " + std::to_string(snap->tunnels.size())
                  + " tunnel(s)");
    notify_publish();
    set_state(CycleState::IDLE);
    return true;
}


void AccountMonitor::Start()
{
    if (refresh_thread)
    {
        return;
    }
    stop_requested = false;
    refresh_thread.reset(new std::thread([this]()
                                         {
                                             refresh_loop();
                                         }));
    log->LogVerb2("Refresh thread started, interval "
                  + std::to_string(settings.refresh_interval.count()) + "s");
}


void AccountMonitor::Stop()
{
    if (!refresh_thread)
    {
        return;
    }
    {
        std::lock_guard<std::mutex> lg(exit_cv_mutex);
        stop_requested = true;
    }
    exit_cv.notify_all();
    if (refresh_thread->joinable())
    {
        refresh_thread->join();
    }
    refresh_thread.reset();
    log->LogVerb2("Refresh thread stopped");
}


bool AccountMonitor::IsRunning() const noexcept
{
    return refresh_thread != nullptr;
}


CycleState AccountMonitor::GetState() const
{
    std::lock_guard<std::mutex> lg(state_mtx);
    return state;
}


Snapshot::Ptr AccountMonitor::GetSnapshot() const
{
    std::lock_guard<std::mutex> lg(state_mtx);
    return snapshot;
}


std::optional<CycleError> AccountMonitor::GetLastError() const
{
    std::lock_guard<std::mutex> lg(state_mtx);
    return last_error;
}


AccountStatus AccountMonitor::GetStatus() const
{
    std::lock_guard<std::mutex> lg(state_mtx);
    AccountStatus st;
    st.account_id = creds.account_id;
    st.friendly_name = creds.friendly_name;
    st.snapshot = snapshot;
    st.last_error = last_error;
    return st;
}


void AccountMonitor::set_state(const CycleState newstate)
{
    {
        std::lock_guard<std::mutex> lg(state_mtx);
        state = newstate;
    }
    log->Debug("Cycle state: " + CycleState_str(newstate));
}


void AccountMonitor::record_failure(const RemoteAPIException &excp)
{
    {
        std::lock_guard<std::mutex> lg(state_mtx);
        last_error = CycleError{excp.what(), excp.GetKind()};
    }
    set_state(CycleState::FAILED);

    if (RemoteAPIException::Kind::UNAUTHORIZED == excp.GetKind())
    {
        log->LogCritical("Tunnel list refresh failed, the account needs "
                         "to be reconfigured: "
                         + std::string(excp.what()));
    }
    else
    {
        log->LogError("Tunnel list refresh failed: " + std::string(excp.what()));
    }
    notify_publish();
    set_state(CycleState::IDLE);
}


void AccountMonitor::notify_publish()
{
    PublishCallback cb;
    {
        std::lock_guard<std::mutex> lg(state_mtx);
        cb = publish_cb;
    }
    if (cb)
    {
        cb(GetStatus());
    }
}


Json::Value AccountMonitor::fetch_connections(const std::string &tunnel_id) const
{
    try
    {
        return api->FetchConnections(creds, tunnel_id);
    }
    catch (const RemoteAPIException &excp)
    {
        log->LogWarn("Could not fetch connections for tunnel "
                     + tunnel_id + ": " + excp.what());
    }
    return Json::Value(Json::arrayValue);
}


std::vector<Json::Value> AccountMonitor::fetch_all_connections(const std::vector<std::string> &tunnel_ids)
{
    std::vector<Json::Value> result(tunnel_ids.size(),
                                    Json::Value(Json::arrayValue));
    const size_t batch_size = std::max(1u, settings.max_parallel_fetches);

    for (size_t start = 0; start < tunnel_ids.size(); start += batch_size)
    {
        if (stop_requested)
        {
            break;
        }

        const size_t end = std::min(start + batch_size, tunnel_ids.size());
        std::vector<std::future<Json::Value>> batch;
        for (size_t i = start; i < end; ++i)
        {
            const std::string id = tunnel_ids[i];
            batch.push_back(std::async(std::launch::async,
                                       [this, id]()
                                       {
                                           return fetch_connections(id);
                                       }));
        }
        for (size_t i = start; i < end; ++i)
        {
            result[i] = batch[i - start].get();
        }
    }
    return result;
}


void AccountMonitor::refresh_loop()
{
    while (!stop_requested)
    {
        try
        {
            RunCycle();
        }
        catch (const std::exception &excp)
        {
            log->LogError("Unexpected error during refresh: "
                          + std::string(excp.what()));
            set_state(CycleState::IDLE);
        }

        // Wait for the next cycle, or until Stop() is called
        std::unique_lock<std::mutex> exit_lock(exit_cv_mutex);
        exit_cv.wait_for(exit_lock,
                         settings.refresh_interval,
                         [this]()
                         {
                             return stop_requested.load();
                         });
    }
}

} // namespace TunnelMonitor
