//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   core-http-transport.hpp
 *
 * @brief  HTTPS transport built on the OpenVPN 3 Core library
 *         WS::ClientSet HTTP client
 */

#pragma once

#include <string>

#include "log/log-sender.hpp"
#include "monitor/http-transport.hpp"


namespace TunnelMonitor {
namespace HTTP {

/**
 *  Transport implementation using the asio based HTTP client in the
 *  OpenVPN 3 Core library.  Each request runs its own synchronous
 *  ClientSet with its own SSL context, which allows several threads
 *  to use the same CoreTransport object.
 */
class CoreTransport : public Transport
{
  public:
    /**
     *  Prepare the transport
     *
     * @param log        LogSender::Ptr for debug logging
     * @param ca_bundle  std::string with the path to a PEM file with
     *                   the trusted CA certificates
     *
     * @throws ConfigFileException if the CA bundle cannot be read
     */
    CoreTransport(LogSender::Ptr log, const std::string &ca_bundle);
    virtual ~CoreTransport() = default;

    /**
     *  Run a GET request.  Errors raised by the Core library, such as
     *  SSL setup failures, are reported as TransportException too.
     */
    Response Get(const Request &req) override;
    const std::string GetTransportInfo() const override;

  private:
    LogSender::Ptr log;
    std::string ca_bundle_file;
    std::string ca_certs;

    Response run_request(const Request &req);
};

} // namespace HTTP
} // namespace TunnelMonitor
