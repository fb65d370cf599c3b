//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   core-http-transport.cpp
 *
 * @brief  Implementation of the OpenVPN 3 Core library based
 *         HTTPS transport
 */

#include <fstream>
#include <memory>
#include <sstream>

// The Core library log integration must be included before
// any of the Core library headers
#include "log/core-logger.hpp"

#include <openvpn/frame/frame_init.hpp>
#include <openvpn/random/randapi.hpp>
#include <openvpn/ssl/sslchoose.hpp>
#include <openvpn/ws/httpcliset.hpp>

#include "build-config.h"
#include "common/cmdargparser-exceptions.hpp"
#include "monitor/core-http-transport.hpp"

using namespace openvpn;


namespace TunnelMonitor {
namespace HTTP {

CoreTransport::CoreTransport(LogSender::Ptr log_, const std::string &ca_bundle)
    : log(log_), ca_bundle_file(ca_bundle)
{
    std::ifstream cafile(ca_bundle_file);
    if (cafile.fail())
    {
        throw ConfigFileException(ca_bundle_file, "Could not open CA bundle");
    }
    std::stringstream buf;
    buf << cafile.rdbuf();
    ca_certs = buf.str();
    if (ca_certs.empty())
    {
        throw ConfigFileException(ca_bundle_file, "CA bundle is empty");
    }
}


Response CoreTransport::Get(const Request &req)
{
    try
    {
        return run_request(req);
    }
    catch (const TransportException &)
    {
        throw;
    }
    catch (const std::exception &excp)
    {
        throw TransportException("HTTPS request to " + req.host
                                 + " failed: " + excp.what());
    }
}


Response CoreTransport::run_request(const Request &req)
{
    // The reference counting used by the Core library is not thread
    // safe, so nothing here is shared between requests.
    StrongRandomAPI::Ptr rng(new SSLLib::RandomAPI());
    Frame::Ptr frame = frame_init_simple(2048);

    SSLLib::SSLAPI::Config::Ptr sslcfg = new SSLLib::SSLAPI::Config();
    sslcfg->set_mode(Mode(Mode::CLIENT));
    sslcfg->load_ca(ca_certs, false);
    sslcfg->set_local_cert_enabled(false);
    sslcfg->set_flags(SSLConst::ENABLE_CLIENT_SNI);
    sslcfg->set_frame(frame);
    sslcfg->set_rng(rng);

    WS::Client::Config::Ptr httpcfg = new WS::Client::Config();
    httpcfg->ssl_factory = sslcfg->new_factory();
    httpcfg->frame = frame;
    httpcfg->user_agent = TUNMON_USER_AGENT;
    httpcfg->connect_timeout = static_cast<unsigned int>(req.timeout.count());
    httpcfg->general_timeout = static_cast<unsigned int>(req.timeout.count());

    WS::ClientSet::TransactionSet::Ptr ts = new WS::ClientSet::TransactionSet();
    ts->host.host = req.host;
    ts->host.port = req.port;
    ts->http_config = httpcfg;
    ts->max_retries = 1;
    ts->debug_level = 0;

    std::unique_ptr<WS::ClientSet::Transaction> trans(new WS::ClientSet::Transaction());
    trans->req.method = "GET";
    trans->req.uri = req.uri;
    for (const auto &hdr : req.headers)
    {
        trans->ci.extra_headers.push_back(hdr.first + ": " + hdr.second);
    }
    ts->transactions.push_back(std::move(trans));

    log->Debug("GET https://" + req.host + req.uri);

    WS::ClientSet::run_synchronous([ts](WS::ClientSet::Ptr cs)
                                   {
                                       cs->new_request(ts);
                                   },
                                   nullptr,
                                   rng.get());

    const WS::ClientSet::Transaction &t = *ts->transactions.at(0);
    if (WS::Client::Status::E_SUCCESS != t.status)
    {
        const bool timeout = (WS::Client::Status::E_CONNECT_TIMEOUT == t.status
                              || WS::Client::Status::E_GENERAL_TIMEOUT == t.status);
        throw TransportException(std::string(WS::Client::Status::error_str(t.status))
                                     + ": " + t.description,
                                 timeout);
    }

    Response resp;
    resp.status_code = t.reply.status_code;
    resp.status_text = t.reply.status_text;
    resp.body = t.content_in.to_string();

    log->Debug("GET https://" + req.host + req.uri + " => "
               + std::to_string(resp.status_code) + " "
               + resp.status_text + " ("
               + std::to_string(resp.body.size()) + " bytes)");
    return resp;
}


const std::string CoreTransport::GetTransportInfo() const
{
    return "OpenVPN 3 Core HTTPS client (CA bundle: " + ca_bundle_file + ")";
}

} // namespace HTTP
} // namespace TunnelMonitor
