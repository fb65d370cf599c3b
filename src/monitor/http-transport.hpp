//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   http-transport.hpp
 *
 * @brief  Abstract HTTPS GET transport used by the API client
 */

#pragma once

#include <chrono>
#include <exception>
#include <map>
#include <memory>
#include <string>

#include "monitor/constants.hpp"


namespace TunnelMonitor {

/**
 *  Raised by a Transport when no HTTP reply could be retrieved at all
 */
class TransportException : public std::exception
{
  public:
    TransportException(const std::string &err, const bool timeout = false) noexcept
        : errormsg(err), timeout(timeout)
    {
    }
    virtual ~TransportException() = default;

    virtual const char *what() const noexcept
    {
        return errormsg.c_str();
    }

    bool IsTimeout() const noexcept
    {
        return timeout;
    }

  private:
    const std::string errormsg;
    const bool timeout;
};


namespace HTTP {

struct Request
{
    std::string host;
    std::string port = Constants::HTTPS_PORT;
    std::string uri;
    std::map<std::string, std::string> headers;
    std::chrono::seconds timeout{Constants::REQUEST_TIMEOUT};
};


struct Response
{
    int status_code = 0;
    std::string status_text;
    std::string body;
};


/**
 *  Performs a single HTTPS GET request.  Implementations must be safe
 *  to call from several threads at the same time.
 */
class Transport
{
  public:
    using Ptr = std::shared_ptr<Transport>;

    virtual ~Transport() = default;

    /**
     *  Run the request and wait for the complete reply
     *
     * @param req  Request to perform
     * @return Response with the HTTP status and the complete body
     *
     * @throws TransportException if no reply was received
     */
    virtual Response Get(const Request &req) = 0;

    virtual const std::string GetTransportInfo() const = 0;
};

} // namespace HTTP
} // namespace TunnelMonitor
