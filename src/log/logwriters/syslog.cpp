//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   syslog.cpp
 *
 * @brief  Implementation of SyslogWriter
 */

#include <map>
#include <string>

#include "syslog.hpp"


SyslogWriter::SyslogWriter(const std::string &prgname,
                           const int log_facility)
    : LogWriter(), progname(prgname)
{
    // openlog() keeps the pointer; progname lives as long as this object
    openlog(progname.c_str(), LOG_NDELAY | LOG_PID, log_facility);
}


SyslogWriter::~SyslogWriter()
{
    closelog();
}


const std::string SyslogWriter::GetLogWriterInfo() const
{
    return "syslog";
}


int SyslogWriter::ConvertLogFacility(const std::string &facility)
{
    static const std::map<std::string, int> facilities = {
        {"LOG_AUTH", LOG_AUTH},
        {"LOG_AUTHPRIV", LOG_AUTHPRIV},
        {"LOG_CRON", LOG_CRON},
        {"LOG_DAEMON", LOG_DAEMON},
        {"LOG_LOCAL0", LOG_LOCAL0},
        {"LOG_LOCAL1", LOG_LOCAL1},
        {"LOG_LOCAL2", LOG_LOCAL2},
        {"LOG_LOCAL3", LOG_LOCAL3},
        {"LOG_LOCAL4", LOG_LOCAL4},
        {"LOG_LOCAL5", LOG_LOCAL5},
        {"LOG_LOCAL6", LOG_LOCAL6},
        {"LOG_LOCAL7", LOG_LOCAL7},
        {"LOG_SYSLOG", LOG_SYSLOG},
        {"LOG_USER", LOG_USER}};

    auto it = facilities.find(facility);
    if (facilities.end() == it)
    {
        throw SyslogException("Invalid syslog facility value: " + facility);
    }
    return it->second;
}


void SyslogWriter::WriteEvent(const Events::Log &logev)
{
    syslog(LogCategoryPriority(logev.category), "%s", FormatLine(logev).c_str());
}
