//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   core-logger.hpp
 *
 * @brief  Routes the OpenVPN 3 Core library log macros into a LogSender.
 *
 *         This file MUST be included before any of the OpenVPN 3 Core
 *         library headers, otherwise the Core library will fall back to
 *         its own std::cout based logging.
 */

#pragma once

#include <sstream>
#include <string>

#include "log/log-sender.hpp"


/**
 *  cftunnel-monitor logging implementation for OpenVPN 3 Core library
 */
namespace CoreLog {

/**
 *  Connects the Core library log macros to a LogSender.  Until this
 *  has been called, all Core library log output is discarded.
 *
 * @param log_object  LogSender::Ptr object to use for logging
 */
void Connect(LogSender::Ptr log_object);

/**
 *  Disconnects the Core library logging from the LogSender
 */
void Disconnect();

/**
 *  Internal helper function, used by the OPENVPN_LOG(), OPENVPN_LOG_NTNL()
 *  and OPENVPN_LOG_STRING() macros.
 *
 * @param logmsg  std::string of the log message to log
 */
void ___core_log(const std::string &logmsg);

} // namespace CoreLog



#define OPENVPN_LOG(msg)                \
    {                                   \
        std::ostringstream ls;          \
        ls << msg;                      \
        CoreLog::___core_log(ls.str()); \
    }

#define OPENVPN_LOG_NTNL(msg)           \
    {                                   \
        std::ostringstream ls;          \
        ls << msg;                      \
        CoreLog::___core_log(ls.str()); \
    }

#define OPENVPN_LOG_STRING(str) CoreLog::___core_log(str)


namespace openvpn {
namespace Log {
struct Context
{
    struct Wrapper
    {
    };
    Context(const Wrapper &)
    {
    }
};
} // namespace Log
} // namespace openvpn
