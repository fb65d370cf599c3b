//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   account-monitor.hpp
 *
 * @brief  Periodic refresh of the tunnels of a single account
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <json/json.h>

#include "log/log-sender.hpp"
#include "monitor/api-client.hpp"
#include "monitor/constants.hpp"
#include "monitor/exceptions.hpp"
#include "monitor/records.hpp"
#include "monitor/version-cache.hpp"


namespace TunnelMonitor {

/**
 *  Progress of the refresh cycle of an account
 */
enum class CycleState : uint8_t
{
    IDLE,
    FETCHING,
    RECONCILING,
    PUBLISHED,
    FAILED
};

const std::string CycleState_str(const CycleState s);


/**
 *  Failure of a complete refresh cycle
 */
struct CycleError
{
    std::string message;
    RemoteAPIException::Kind kind;
};


/**
 *  What consumers get to see of an account after each cycle
 */
struct AccountStatus
{
    std::string account_id;
    std::string friendly_name;
    Snapshot::Ptr snapshot = nullptr;   ///< Last published, may be nullptr
    std::optional<CycleError> last_error;
};


struct MonitorSettings
{
    std::chrono::seconds refresh_interval{Constants::REFRESH_INTERVAL};
    unsigned int max_parallel_fetches = Constants::MAX_PARALLEL_FETCHES;
};


/**
 *  Runs the refresh cycles of one monitored account.  A cycle fetches
 *  the tunnel list and the latest release version concurrently, then
 *  the connections of every tunnel, and finally publishes a new
 *  Snapshot.  If the tunnel list cannot be retrieved, the previous
 *  Snapshot is kept and the error is recorded instead.
 *
 *  The periodic thread started by Start() waits the refresh interval
 *  after each completed cycle.
 */
class AccountMonitor
{
  public:
    using Ptr = std::shared_ptr<AccountMonitor>;

    /**
     *  Called after every completed cycle, successful or not
     */
    using PublishCallback = std::function<void(const AccountStatus &)>;

    [[nodiscard]] static AccountMonitor::Ptr Create(const AccountCredentials &creds,
                                                    APIClient::Ptr api,
                                                    LatestVersionCache::Ptr version_cache,
                                                    LogSender::Ptr log,
                                                    const MonitorSettings &settings = {})
    {
        return Ptr(new AccountMonitor(creds, api, version_cache, log, settings));
    }

    ~AccountMonitor() noexcept;

    void SetPublishCallback(PublishCallback cb);

    /**
     *  Run a single refresh cycle in the calling thread
     *
     * @return true if a new Snapshot was published
     */
    bool RunCycle();

    /**
     *  Start the periodic refresh thread.  The first cycle runs
     *  immediately.
     */
    void Start();

    /**
     *  Stop the periodic refresh thread and wait for it to exit.  A
     *  running cycle is abandoned before its next network request;
     *  a request already in progress completes or times out first.
     */
    void Stop();

    bool IsRunning() const noexcept;

    CycleState GetState() const;
    Snapshot::Ptr GetSnapshot() const;
    std::optional<CycleError> GetLastError() const;
    AccountStatus GetStatus() const;

    const AccountCredentials &GetCredentials() const noexcept
    {
        return creds;
    }


  private:
    const AccountCredentials creds;
    APIClient::Ptr api;
    LatestVersionCache::Ptr version_cache;
    LogSender::Ptr log;
    const MonitorSettings settings;

    mutable std::mutex state_mtx;
    CycleState state = CycleState::IDLE;
    Snapshot::Ptr snapshot = nullptr;
    std::optional<CycleError> last_error;
    PublishCallback publish_cb;

    std::unique_ptr<std::thread> refresh_thread;
    std::mutex exit_cv_mutex;
    std::condition_variable exit_cv;
    std::atomic<bool> stop_requested{false};

    AccountMonitor(const AccountCredentials &creds,
                   APIClient::Ptr api,
                   LatestVersionCache::Ptr version_cache,
                   LogSender::Ptr log,
                   const MonitorSettings &settings);

    void set_state(const CycleState newstate);
    void record_failure(const RemoteAPIException &excp);
    void notify_publish();
    Json::Value fetch_connections(const std::string &tunnel_id) const;
    std::vector<Json::Value> fetch_all_connections(const std::vector<std::string> &tunnel_ids);
    void refresh_loop();
};

} // namespace TunnelMonitor
