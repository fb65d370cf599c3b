//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   log-sender.cpp
 *
 * @brief  Implementation of LogSender
 */

#include <string>

#include "log-sender.hpp"


LogSender::Ptr LogSender::Create(const LogGroup lgroup,
                                 LogWriter::Ptr lgwr,
                                 const uint32_t log_level,
                                 LogTag::Ptr tag)
{
    return LogSender::Ptr(new LogSender(lgroup, lgwr, log_level, tag));
}


LogSender::LogSender(const LogGroup lgroup,
                     LogWriter::Ptr lgwr,
                     const uint32_t log_level,
                     LogTag::Ptr tag)
    : Log::EventFilter(log_level),
      logwr(lgwr), log_group(lgroup), logtag(tag)
{
    // Run it through the range check
    SetLogLevel(log_level);
}


LogSender::Ptr LogSender::Derive(const LogGroup lgroup, LogTag::Ptr tag) const
{
    return LogSender::Create(lgroup, logwr, GetLogLevel(), tag);
}


LogGroup LogSender::GetLogGroup() const noexcept
{
    return log_group;
}


LogTag::Ptr LogSender::GetLogTag() const noexcept
{
    return logtag;
}


LogWriter::Ptr LogSender::GetLogWriter() const noexcept
{
    return logwr;
}


void LogSender::Log(const Events::Log &logev, const bool duplicate_check)
{
    // Don't log an empty messages or if log level filtering allows it
    // The filtering is done against the LogCategory of the message
    if (logev.empty() || !EventFilter::Allow(logev))
    {
        return;
    }

    {
        std::lock_guard<std::mutex> guard(last_mtx);
        if (duplicate_check
            && !last_logevent.empty() && (logev == last_logevent))
        {
            // This contains the same log message as the previous one
            return;
        }
        last_logevent = logev;
    }

    if (logwr)
    {
        Events::Log ev(logev);
        if (!ev.GetLogTag())
        {
            ev.AddLogTag(logtag);
        }
        logwr->Write(ev);
    }
}


void LogSender::Debug(const std::string &msg, const bool duplicate_check)
{
    Log(Events::Log(log_group, LogCategory::DEBUG, msg), duplicate_check);
}


void LogSender::LogVerb2(const std::string &msg, const bool duplicate_check)
{
    Log(Events::Log(log_group, LogCategory::VERB2, msg), duplicate_check);
}


void LogSender::LogVerb1(const std::string &msg, const bool duplicate_check)
{
    Log(Events::Log(log_group, LogCategory::VERB1, msg), duplicate_check);
}


void LogSender::LogInfo(const std::string &msg, const bool duplicate_check)
{
    Log(Events::Log(log_group, LogCategory::INFO, msg), duplicate_check);
}


void LogSender::LogWarn(const std::string &msg, const bool duplicate_check)
{
    Log(Events::Log(log_group, LogCategory::WARN, msg), duplicate_check);
}


void LogSender::LogError(const std::string &msg)
{
    Log(Events::Log(log_group, LogCategory::ERROR, msg));
}


void LogSender::LogCritical(const std::string &msg)
{
    Log(Events::Log(log_group, LogCategory::CRIT, msg));
}


void LogSender::LogFATAL(const std::string &msg)
{
    Log(Events::Log(log_group, LogCategory::FATAL, msg));
}


Events::Log LogSender::GetLastLogEvent() const
{
    std::lock_guard<std::mutex> guard(last_mtx);
    return last_logevent;
}
