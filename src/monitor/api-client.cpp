//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   api-client.cpp
 *
 * @brief  Implementation of the remote API client
 */

#include <sstream>

#include "common/string-utils.hpp"
#include "monitor/api-client.hpp"


namespace TunnelMonitor {

const std::string TokenStatus_str(const TokenStatus s)
{
    switch (s)
    {
    case TokenStatus::VALID:
        return "valid";
    case TokenStatus::INVALID:
        return "invalid";
    case TokenStatus::CONNECTIVITY_ERROR:
        return "connectivity error";
    }
    return "[unknown]";
}


/**
 *  Parses a reply body as JSON
 *
 * @throws MalformedPayload if the body is not valid JSON
 */
static Json::Value parse_body(const std::string &body)
{
    std::istringstream buf(body);
    Json::Value root;
    try
    {
        buf >> root;
    }
    catch (const Json::Exception &excp)
    {
        throw MalformedPayload("Reply is not valid JSON: "
                               + filter_ctrl_chars(excp.what(), true));
    }
    return root;
}


APIClient::APIClient(HTTP::Transport::Ptr transport_,
                     LogSender::Ptr log_,
                     const APIClientSettings &settings_)
    : transport(transport_), log(log_), settings(settings_)
{
}


Json::Value APIClient::FetchTunnels(const AccountCredentials &creds) const
{
    return fetch_result_list(api_request(creds.api_token,
                                         "/accounts/"
                                             + url_encode_segment(creds.account_id)
                                             + "/cfd_tunnel?is_deleted=false"));
}


Json::Value APIClient::FetchConnections(const AccountCredentials &creds,
                                        const std::string &tunnel_id) const
{
    return fetch_result_list(api_request(creds.api_token,
                                         "/accounts/"
                                             + url_encode_segment(creds.account_id)
                                             + "/cfd_tunnel/"
                                             + url_encode_segment(tunnel_id)
                                             + "/connections"));
}


std::string APIClient::FetchLatestRelease() const
{
    HTTP::Request req;
    req.host = settings.release_host;
    req.uri = settings.release_path;
    req.timeout = settings.timeout;
    req.headers["Accept"] = "application/json";

    try
    {
        HTTP::Response resp = transport->Get(req);
        if (200 != resp.status_code)
        {
            log->LogVerb1("Latest release request failed: "
                          + std::to_string(resp.status_code) + " "
                          + resp.status_text);
            return "";
        }

        Json::Value rel = parse_body(resp.body);
        if (!rel.isObject())
        {
            log->LogVerb1("Latest release reply is not a JSON object");
            return "";
        }

        std::string version;
        for (const auto &field : {"tag_name", "name"})
        {
            const Json::Value &v = rel[field];
            if (v.isString() && !v.asString().empty())
            {
                version = v.asString();
                break;
            }
        }
        if (!version.empty() && 'v' == version[0])
        {
            version.erase(0, 1);
        }
        if (version.empty())
        {
            log->LogVerb1("Latest release reply carries no version tag");
        }
        return version;
    }
    catch (const MalformedPayload &excp)
    {
        log->LogVerb1("Error parsing latest release: " + std::string(excp.what()));
    }
    catch (const std::exception &excp)
    {
        log->LogVerb1("Error fetching latest release: " + std::string(excp.what()));
    }
    return "";
}


TokenStatus APIClient::VerifyToken(const std::string &api_token) const
{
    HTTP::Request req = api_request(api_token, "/user/tokens/verify");
    req.timeout = settings.verify_timeout;

    try
    {
        HTTP::Response resp = transport->Get(req);
        switch (resp.status_code)
        {
        case 200:
            return TokenStatus::VALID;
        case 401:
            return TokenStatus::INVALID;
        default:
            log->LogVerb1("Token verification returned HTTP "
                          + std::to_string(resp.status_code) + " "
                          + resp.status_text);
            return TokenStatus::CONNECTIVITY_ERROR;
        }
    }
    catch (const std::exception &excp)
    {
        log->LogVerb1("Token verification failed: " + std::string(excp.what()));
        return TokenStatus::CONNECTIVITY_ERROR;
    }
}


HTTP::Request APIClient::api_request(const std::string &api_token,
                                     const std::string &path) const
{
    HTTP::Request req;
    req.host = settings.api_host;
    req.uri = std::string(Constants::API_BASE_PATH) + path;
    req.timeout = settings.timeout;
    req.headers["Authorization"] = "Bearer " + api_token;
    req.headers["Content-Type"] = "application/json";
    return req;
}


Json::Value APIClient::fetch_result_list(const HTTP::Request &req) const
{
    HTTP::Response resp;
    try
    {
        resp = transport->Get(req);
    }
    catch (const TransportException &excp)
    {
        if (excp.IsTimeout())
        {
            throw Unreachable("Timeout while communicating with "
                              + req.host);
        }
        throw Unreachable("Client error while communicating with "
                          + req.host + ": " + excp.what());
    }
    catch (const std::exception &excp)
    {
        // Transport implementations are expected to raise
        // TransportException only, anything else still means no reply
        throw Unreachable("Client error while communicating with "
                          + req.host + ": " + excp.what());
    }

    if (401 == resp.status_code)
    {
        throw Unauthorized("Unauthorized (401). Check the API token");
    }
    if (200 != resp.status_code)
    {
        throw RemoteError(resp.status_code,
                          resp.status_text,
                          excerpt(resp.body, Constants::BODY_EXCERPT_LENGTH));
    }

    Json::Value root = parse_body(resp.body);
    if (!root.isObject())
    {
        throw MalformedPayload("Unexpected payload from " + req.host
                               + ": not a JSON object");
    }
    if (!root.isMember("result") || root["result"].isNull())
    {
        return Json::Value(Json::arrayValue);
    }
    if (!root["result"].isArray())
    {
        throw MalformedPayload("Unexpected payload from " + req.host
                               + ": 'result' is not a list");
    }
    return root["result"];
}

} // namespace TunnelMonitor
