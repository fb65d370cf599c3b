//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   version-cache.cpp
 *
 * @brief  Implementation of LatestVersionCache
 */

#include "monitor/version-cache.hpp"


namespace TunnelMonitor {

LatestVersionCache::LatestVersionCache(FetchFunc fetch_,
                                       const std::chrono::seconds ttl_,
                                       LogSender::Ptr log_)
    : fetch(std::move(fetch_)), ttl(ttl_), log(log_)
{
}


std::string LatestVersionCache::Get(const Clock::time_point now)
{
    std::unique_lock<std::mutex> lk(mtx);

    if (fetched_at && (now - *fetched_at) < ttl)
    {
        return version;
    }
    if (lookup_running)
    {
        lookup_done.wait(lk,
                         [this]()
                         {
                             return !lookup_running;
                         });
        return version;
    }

    lookup_running = true;
    lk.unlock();
    const std::string fetched = run_lookup();
    lk.lock();
    lookup_running = false;
    lookup_done.notify_all();

    if (fetched.empty())
    {
        if (log)
        {
            log->LogVerb1(fetched_at
                              ? "Latest version unavailable, keeping " + version
                              : std::string("Latest version unavailable"));
        }
    }
    else
    {
        if (log && fetched != version)
        {
            log->LogInfo("Latest cloudflared release: " + fetched);
        }
        version = fetched;
        fetched_at = now;
    }
    return version;
}


std::string LatestVersionCache::run_lookup()
{
    try
    {
        return fetch();
    }
    catch (const std::exception &excp)
    {
        if (log)
        {
            log->LogError("Latest version lookup failed: "
                          + std::string(excp.what()));
        }
    }
    return "";
}


std::string LatestVersionCache::Peek() const
{
    std::lock_guard<std::mutex> lg(mtx);
    return version;
}


bool LatestVersionCache::IsCached() const
{
    std::lock_guard<std::mutex> lg(mtx);
    return fetched_at.has_value();
}

} // namespace TunnelMonitor
