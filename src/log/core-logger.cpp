//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   core-logger.cpp
 *
 * @brief  Implementation of the Core library log bridge
 */

#include <mutex>
#include <string>

#include "core-logger.hpp"


namespace CoreLog {

namespace {
std::mutex core_log_mtx;
LogSender::Ptr core_log_sender = nullptr;
} // namespace


void Connect(LogSender::Ptr log_object)
{
    std::lock_guard<std::mutex> guard(core_log_mtx);
    core_log_sender = log_object;
}


void Disconnect()
{
    std::lock_guard<std::mutex> guard(core_log_mtx);
    core_log_sender = nullptr;
}


void ___core_log(const std::string &logmsg)
{
    LogSender::Ptr log;
    {
        std::lock_guard<std::mutex> guard(core_log_mtx);
        log = core_log_sender;
    }
    if (!log)
    {
        return;
    }

    std::string l(logmsg);
    l.erase(l.find_last_not_of(" \n") + 1); // rtrim
    log->Debug("[Core] " + l);
}

} // namespace CoreLog
