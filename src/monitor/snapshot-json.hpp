//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   snapshot-json.hpp
 *
 * @brief  JSON export of the published snapshots
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <json/json.h>

#include "log/log-sender.hpp"
#include "monitor/account-monitor.hpp"
#include "monitor/records.hpp"


namespace TunnelMonitor {
namespace SnapshotJSON {

Json::Value Export(const Connector &connector);
Json::Value Export(const Tunnel &tunnel);

/**
 *  Export everything known about a single account.  If nothing has been
 *  published yet, published_at and latest_version are null and the
 *  tunnel list is empty.
 */
Json::Value Export(const AccountStatus &status);

/**
 *  Export all accounts as {"accounts": {"<account_id>": {...}}}
 */
Json::Value Export(const std::vector<AccountStatus> &accounts);

} // namespace SnapshotJSON


/**
 *  Keeps the latest AccountStatus of every account and rewrites the
 *  state file each time one of them is updated.  The file is replaced
 *  atomically, readers never see a partially written file.
 */
class StateFileWriter
{
  public:
    using Ptr = std::shared_ptr<StateFileWriter>;

    [[nodiscard]] static StateFileWriter::Ptr Create(const std::string &filename,
                                                     LogSender::Ptr log)
    {
        return Ptr(new StateFileWriter(filename, log));
    }

    /**
     *  Record a new account status and write the state file
     *
     * @return false if the file could not be written
     */
    bool Update(const AccountStatus &status);

    /**
     *  Drop an account from the state file
     *
     * @return false if the file could not be written
     */
    bool Remove(const std::string &account_id);

    const std::string &GetFilename() const noexcept
    {
        return filename;
    }


  private:
    const std::string filename;
    LogSender::Ptr log;
    std::mutex mtx;
    std::map<std::string, AccountStatus> accounts;

    StateFileWriter(const std::string &filename, LogSender::Ptr log);
    bool write_all();
    bool write_file(const Json::Value &data);
};

} // namespace TunnelMonitor
