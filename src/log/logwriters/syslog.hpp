//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   syslog.hpp
 *
 * @brief  LogWriter sending events to syslog(3)
 */

#pragma once

#include <syslog.h>

#include <stdexcept>
#include <string>

#include "log/logwriter.hpp"


class SyslogException : public std::runtime_error
{
  public:
    SyslogException(const std::string &err)
        : std::runtime_error(err)
    {
    }
};


class SyslogWriter : public LogWriter
{
  public:
    /**
     * @param prgname       Program identifier used in the syslog entries
     * @param log_facility  syslog(3) facility, LOG_DAEMON by default
     */
    SyslogWriter(const std::string &prgname,
                 const int log_facility = LOG_DAEMON);
    virtual ~SyslogWriter();

    const std::string GetLogWriterInfo() const override;

    // syslog stamps the entries itself
    bool TimestampEnabled() const noexcept override
    {
        return true;
    }

    /**
     *  Look up a syslog(3) facility by its macro name, such as "LOG_LOCAL3"
     *
     * @throws SyslogException on an unknown facility name
     */
    static int ConvertLogFacility(const std::string &facility);

  protected:
    void WriteEvent(const Events::Log &logev) override;

  private:
    std::string progname;
};
