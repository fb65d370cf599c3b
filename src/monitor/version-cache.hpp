//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   version-cache.hpp
 *
 * @brief  Time limited cache of the newest cloudflared release
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "log/log-sender.hpp"


namespace TunnelMonitor {

/**
 *  Keeps the newest known release version, shared by all monitored
 *  accounts.  A value is reused without a new lookup while it is
 *  younger than the TTL.  When a lookup fails, the last known value is
 *  returned even if it has expired.
 *
 *  Only one lookup runs at a time.  Callers arriving while a lookup is
 *  in progress wait for it and reuse its outcome, also when it failed.
 *  The lookup itself runs without the cache lock held.
 */
class LatestVersionCache
{
  public:
    using Ptr = std::shared_ptr<LatestVersionCache>;
    using Clock = std::chrono::steady_clock;

    /**
     *  Function retrieving the newest release version.  It returns an
     *  empty string on failure.
     */
    using FetchFunc = std::function<std::string()>;

    [[nodiscard]] static LatestVersionCache::Ptr Create(FetchFunc fetch,
                                                        const std::chrono::seconds ttl,
                                                        LogSender::Ptr log = nullptr)
    {
        return Ptr(new LatestVersionCache(std::move(fetch), ttl, log));
    }

    /**
     *  Retrieve the latest version, looking it up if the cached value
     *  is missing or has expired
     *
     * @param now  Clock::time_point to evaluate the TTL against
     *
     * @return std::string with the version, empty if never retrieved
     */
    std::string Get(const Clock::time_point now);

    std::string Get()
    {
        return Get(Clock::now());
    }

    /**
     *  Return the cached version without any lookup
     */
    std::string Peek() const;

    bool IsCached() const;

    std::chrono::seconds GetTTL() const noexcept
    {
        return ttl;
    }


  private:
    mutable std::mutex mtx;
    std::condition_variable lookup_done;
    bool lookup_running = false;
    FetchFunc fetch;
    const std::chrono::seconds ttl;
    LogSender::Ptr log;
    std::string version;
    std::optional<Clock::time_point> fetched_at;

    LatestVersionCache(FetchFunc fetch,
                       const std::chrono::seconds ttl,
                       LogSender::Ptr log);

    std::string run_lookup();
};

} // namespace TunnelMonitor
