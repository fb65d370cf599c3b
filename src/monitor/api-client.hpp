//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   api-client.hpp
 *
 * @brief  Client for the Cloudflare tunnel API and the cloudflared
 *         release feed
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <json/json.h>

#include "log/log-sender.hpp"
#include "monitor/constants.hpp"
#include "monitor/exceptions.hpp"
#include "monitor/http-transport.hpp"
#include "monitor/records.hpp"


namespace TunnelMonitor {

/**
 *  Result of a credential verification
 */
enum class TokenStatus : uint8_t
{
    VALID,
    INVALID,
    CONNECTIVITY_ERROR
};

const std::string TokenStatus_str(const TokenStatus s);


/**
 *  Remote endpoints and timeouts used by the APIClient
 */
struct APIClientSettings
{
    std::string api_host = Constants::API_HOST;
    std::string release_host = Constants::RELEASE_HOST;
    std::string release_path = Constants::RELEASE_PATH;
    std::chrono::seconds timeout{Constants::REQUEST_TIMEOUT};
    std::chrono::seconds verify_timeout{Constants::VERIFY_TIMEOUT};
};


/**
 *  Issues the GET requests against the remote services and turns
 *  the replies into either the JSON records requested or one of the
 *  RemoteAPIException subclasses.  No transport level error escapes
 *  from this class.
 */
class APIClient
{
  public:
    using Ptr = std::shared_ptr<APIClient>;

    [[nodiscard]] static APIClient::Ptr Create(HTTP::Transport::Ptr transport,
                                               LogSender::Ptr log,
                                               const APIClientSettings &settings = {})
    {
        return Ptr(new APIClient(transport, log, settings));
    }

    /**
     *  Retrieve all the non-deleted tunnels of an account
     *
     * @param creds  AccountCredentials of the account to query
     *
     * @return Json::Value array with the raw tunnel records
     *
     * @throws Unauthorized, RemoteError, Unreachable, MalformedPayload
     */
    Json::Value FetchTunnels(const AccountCredentials &creds) const;

    /**
     *  Retrieve the active connections of a single tunnel
     *
     * @param creds      AccountCredentials of the account owning the tunnel
     * @param tunnel_id  std::string with the tunnel identifier
     *
     * @return Json::Value array with the raw connection records
     *
     * @throws Unauthorized, RemoteError, Unreachable, MalformedPayload
     */
    Json::Value FetchConnections(const AccountCredentials &creds,
                                 const std::string &tunnel_id) const;

    /**
     *  Look up the version of the newest cloudflared release.  This
     *  never throws; any failure results in an empty string.
     */
    std::string FetchLatestRelease() const;

    /**
     *  Check if an API token is accepted by the tunnel provider
     */
    TokenStatus VerifyToken(const std::string &api_token) const;

    const APIClientSettings &GetSettings() const noexcept
    {
        return settings;
    }


  private:
    HTTP::Transport::Ptr transport;
    LogSender::Ptr log;
    const APIClientSettings settings;

    APIClient(HTTP::Transport::Ptr transport,
              LogSender::Ptr log,
              const APIClientSettings &settings);

    HTTP::Request api_request(const std::string &api_token,
                              const std::string &path) const;
    Json::Value fetch_result_list(const HTTP::Request &req) const;
};

} // namespace TunnelMonitor
