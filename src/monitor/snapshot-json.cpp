//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   snapshot-json.cpp
 *
 * @brief  Implementation of the snapshot JSON export and StateFileWriter
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <unistd.h>

#include "common/timestamp.hpp"
#include "monitor/health-classifier.hpp"
#include "monitor/snapshot-json.hpp"


namespace TunnelMonitor {
namespace SnapshotJSON {

static Json::Value string_or_null(const std::string &s)
{
    return (s.empty() ? Json::Value(Json::nullValue) : Json::Value(s));
}


template <typename T>
static Json::Value optional_or_null(const std::optional<T> &v)
{
    return (v ? Json::Value(*v) : Json::Value(Json::nullValue));
}


static Json::Value string_list(const std::vector<std::string> &list)
{
    Json::Value ret(Json::arrayValue);
    for (const auto &e : list)
    {
        ret.append(e);
    }
    return ret;
}


Json::Value Export(const Connector &connector)
{
    Json::Value ret(Json::objectValue);
    ret["client_id"] = connector.client_id;
    ret["version"] = string_or_null(connector.version);
    ret["sessions"] = connector.sessions;
    ret["edges"] = string_list(connector.edges);
    ret["origin_ips"] = string_list(connector.origin_ips);
    ret["pending_reconnect"] = connector.pending_reconnect;
    ret["opened_at_latest"] = string_or_null(connector.opened_at_latest);
    ret["latest_version"] = string_or_null(connector.latest_version);
    ret["is_latest"] = optional_or_null(connector.is_latest);
    ret["update_available"] = optional_or_null(connector.update_available);
    ret["version_diff"] = optional_or_null(connector.version_diff);
    return ret;
}


Json::Value Export(const Tunnel &tunnel)
{
    Json::Value ret(Json::objectValue);
    ret["id"] = tunnel.id;
    ret["unique_id"] = tunnel.unique_id;
    ret["name"] = tunnel.name;
    ret["status"] = optional_or_null(tunnel.declared_status);
    ret["health"] = (tunnel.health
                         ? Json::Value(TunnelHealth_str(*tunnel.health))
                         : Json::Value(Json::nullValue));
    ret["created_at"] = string_or_null(tunnel.created_at);
    ret["connector_count"] = tunnel.connector_count;
    ret["session_count"] = tunnel.session_count;
    ret["latest_cloudflared_version"] = string_or_null(tunnel.latest_version);

    Json::Value connectors(Json::arrayValue);
    for (const auto &c : tunnel.connectors)
    {
        connectors.append(Export(c));
    }
    ret["connectors"] = connectors;
    return ret;
}


Json::Value Export(const AccountStatus &status)
{
    Json::Value ret(Json::objectValue);
    ret["friendly_name"] = status.friendly_name;
    ret["published_at"] = Json::nullValue;
    ret["latest_version"] = Json::nullValue;
    ret["tunnels"] = Json::Value(Json::arrayValue);

    if (status.snapshot)
    {
        ret["published_at"] = FormatISO8601UTC(status.snapshot->published_at);
        ret["latest_version"] = string_or_null(status.snapshot->latest_version);
        for (const auto &t : status.snapshot->tunnels)
        {
            ret["tunnels"].append(Export(t));
        }
    }

    if (status.last_error)
    {
        ret["last_error"] = status.last_error->message;
        ret["last_error_kind"] = RemoteAPIException::KindStr(status.last_error->kind);
    }
    else
    {
        ret["last_error"] = Json::nullValue;
        ret["last_error_kind"] = Json::nullValue;
    }
    return ret;
}


Json::Value Export(const std::vector<AccountStatus> &accounts)
{
    Json::Value ret(Json::objectValue);
    ret["accounts"] = Json::Value(Json::objectValue);
    for (const auto &a : accounts)
    {
        ret["accounts"][a.account_id] = Export(a);
    }
    return ret;
}

} // namespace SnapshotJSON



StateFileWriter::StateFileWriter(const std::string &filename_, LogSender::Ptr log_)
    : filename(filename_), log(log_)
{
}


bool StateFileWriter::Update(const AccountStatus &status)
{
    std::lock_guard<std::mutex> lg(mtx);
    accounts[status.account_id] = status;
    return write_all();
}


bool StateFileWriter::Remove(const std::string &account_id)
{
    std::lock_guard<std::mutex> lg(mtx);
    if (0 == accounts.erase(account_id))
    {
        return true;
    }
    return write_all();
}


bool StateFileWriter::write_all()
{
    std::vector<AccountStatus> all;
    for (const auto &a : accounts)
    {
        all.push_back(a.second);
    }
    return write_file(SnapshotJSON::Export(all));
}


bool StateFileWriter::write_file(const Json::Value &data)
{
    // Written next to the destination, so rename() stays on the
    // same file system
    const std::string tmpname = filename + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmpname, std::ios::trunc);
        out << data << std::endl;
        out.close();
        if (out.fail())
        {
            log->LogError("Could not write state file " + tmpname);
            std::remove(tmpname.c_str());
            return false;
        }
    }

    if (0 != std::rename(tmpname.c_str(), filename.c_str()))
    {
        log->LogError("Could not replace state file " + filename + ": "
                      + std::string(strerror(errno)));
        std::remove(tmpname.c_str());
        return false;
    }
    log->Debug("State file " + filename + " updated");
    return true;
}

} // namespace TunnelMonitor
