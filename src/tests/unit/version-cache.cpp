//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   version-cache.cpp
 *
 * @brief  Unit tests for TunnelMonitor::LatestVersionCache
 */

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "monitor/version-cache.hpp"

using namespace TunnelMonitor;
using namespace std::chrono_literals;


namespace unittest {

/**
 *  Fetch function returning a scripted value and counting the calls
 */
struct ScriptedFetch
{
    std::atomic<unsigned int> calls{0};
    std::string next_value;

    LatestVersionCache::FetchFunc func()
    {
        return [this]()
        {
            ++calls;
            return next_value;
        };
    }
};


TEST(LatestVersionCache, empty_state)
{
    ScriptedFetch f;
    auto cache = LatestVersionCache::Create(f.func(), 3600s);
    const auto t0 = LatestVersionCache::Clock::now();

    EXPECT_EQ(cache->Get(t0), "");
    EXPECT_FALSE(cache->IsCached());
    EXPECT_EQ(f.calls, 1u);

    // Still Empty, so each call retries
    EXPECT_EQ(cache->Get(t0 + 1s), "");
    EXPECT_EQ(f.calls, 2u);
}


TEST(LatestVersionCache, reuse_within_ttl)
{
    ScriptedFetch f;
    f.next_value = "2024.10.0";
    auto cache = LatestVersionCache::Create(f.func(), 3600s);
    const auto t0 = LatestVersionCache::Clock::now();

    EXPECT_EQ(cache->Get(t0), "2024.10.0");
    EXPECT_EQ(f.calls, 1u);
    EXPECT_TRUE(cache->IsCached());

    f.next_value = "2024.11.0";
    EXPECT_EQ(cache->Get(t0 + 3599s), "2024.10.0");
    EXPECT_EQ(f.calls, 1u) << "A network call was done within the TTL";
}


TEST(LatestVersionCache, refresh_after_ttl)
{
    ScriptedFetch f;
    f.next_value = "2024.10.0";
    auto cache = LatestVersionCache::Create(f.func(), 3600s);
    const auto t0 = LatestVersionCache::Clock::now();

    cache->Get(t0);
    f.next_value = "2024.11.0";
    EXPECT_EQ(cache->Get(t0 + 3600s), "2024.11.0");
    EXPECT_EQ(f.calls, 2u);
    EXPECT_EQ(cache->Peek(), "2024.11.0");
}


TEST(LatestVersionCache, stale_on_failure)
{
    ScriptedFetch f;
    f.next_value = "2024.10.0";
    auto cache = LatestVersionCache::Create(f.func(), 60s);
    const auto t0 = LatestVersionCache::Clock::now();

    cache->Get(t0);
    f.next_value = "";
    EXPECT_EQ(cache->Get(t0 + 2h), "2024.10.0")
        << "The stale value must be kept when the lookup fails";
    EXPECT_EQ(f.calls, 2u);

    // The failed lookup does not renew the entry
    EXPECT_EQ(cache->Get(t0 + 2h + 1s), "2024.10.0");
    EXPECT_EQ(f.calls, 3u);
}


TEST(LatestVersionCache, throwing_fetch)
{
    bool fail = false;
    auto cache = LatestVersionCache::Create([&fail]() -> std::string
                                            {
                                                if (fail)
                                                {
                                                    throw std::runtime_error("boom");
                                                }
                                                return "1.0";
                                            },
                                            1s);
    const auto t0 = LatestVersionCache::Clock::now();
    EXPECT_EQ(cache->Get(t0), "1.0");
    fail = true;
    EXPECT_EQ(cache->Get(t0 + 10s), "1.0");
}


TEST(LatestVersionCache, single_flight)
{
    std::atomic<unsigned int> calls{0};
    auto cache = LatestVersionCache::Create([&calls]()
                                            {
                                                ++calls;
                                                std::this_thread::sleep_for(100ms);
                                                return std::string("2024.10.0");
                                            },
                                            3600s);

    std::vector<std::thread> threads;
    std::vector<std::string> results(8);
    for (size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([cache, &results, i]()
                             {
                                 results[i] = cache->Get();
                             });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    EXPECT_EQ(calls, 1u) << "Concurrent callers started their own lookups";
    for (const auto &r : results)
    {
        EXPECT_EQ(r, "2024.10.0");
    }
}


TEST(LatestVersionCache, single_flight_failed_lookup)
{
    std::atomic<unsigned int> calls{0};
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    auto cache = LatestVersionCache::Create([&calls, &started, released]()
                                            {
                                                if (1 == ++calls)
                                                {
                                                    started.set_value();
                                                    released.wait();
                                                }
                                                return std::string();
                                            },
                                            3600s);

    std::vector<std::thread> threads;
    std::vector<std::string> results(5, "unset");
    threads.emplace_back([cache, &results]()
                         {
                             results[0] = cache->Get();
                         });
    started.get_future().wait();

    // These arrive while the first lookup is still running
    for (size_t i = 1; i < results.size(); ++i)
    {
        threads.emplace_back([cache, &results, i]()
                             {
                                 results[i] = cache->Get();
                             });
    }
    std::this_thread::sleep_for(200ms);
    release.set_value();
    for (auto &t : threads)
    {
        t.join();
    }

    EXPECT_EQ(calls, 1u) << "Callers waiting on a failed lookup retried it";
    for (const auto &r : results)
    {
        EXPECT_EQ(r, "");
    }
    EXPECT_FALSE(cache->IsCached());

    // A caller arriving after the failed lookup tries again
    EXPECT_EQ(cache->Get(), "");
    EXPECT_EQ(calls, 2u);
}


TEST(LatestVersionCache, stale_value_during_failed_lookup)
{
    std::atomic<unsigned int> calls{0};
    auto cache = LatestVersionCache::Create([&calls]()
                                            {
                                                if (1 == ++calls)
                                                {
                                                    return std::string("2024.9.0");
                                                }
                                                std::this_thread::sleep_for(100ms);
                                                return std::string();
                                            },
                                            1s);
    const auto t0 = LatestVersionCache::Clock::now();
    ASSERT_EQ(cache->Get(t0), "2024.9.0");

    std::vector<std::thread> threads;
    std::vector<std::string> results(4);
    for (size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([cache, &results, i, t0]()
                             {
                                 results[i] = cache->Get(t0 + 10s);
                             });
    }
    for (auto &t : threads)
    {
        t.join();
    }

    for (const auto &r : results)
    {
        EXPECT_EQ(r, "2024.9.0");
    }
    EXPECT_EQ(calls, 2u) << "Concurrent callers started their own lookups";
    EXPECT_TRUE(cache->IsCached());
}

} // namespace unittest
