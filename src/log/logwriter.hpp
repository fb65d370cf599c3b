//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   logwriter.hpp
 *
 * @brief  Base class of the log destinations
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "events/log.hpp"
#include "logtag.hpp"


/**
 *  A log destination.  One LogWriter is shared by the service and every
 *  account refresh thread; Write() calls are serialized so lines from
 *  different accounts never interleave.
 */
class LogWriter
{
  public:
    using Ptr = std::shared_ptr<LogWriter>;

    LogWriter() = default;
    virtual ~LogWriter() = default;

    /**
     * @return std::string describing the log destination
     */
    virtual const std::string GetLogWriterInfo() const = 0;

    /**
     *  Prefix each log line with the local time.  Destinations adding
     *  their own timestamps ignore this flag.
     */
    void EnableTimestamp(const bool tstamp) noexcept
    {
        timestamp = tstamp;
    }

    virtual bool TimestampEnabled() const noexcept
    {
        return timestamp;
    }

    /**
     *  Prefix the lines of account bound events with "{account:label}"
     */
    void EnableMessagePrepend(const bool mp) noexcept
    {
        prepend_prefix = mp;
    }

    bool MessagePrependEnabled() const noexcept
    {
        return prepend_prefix;
    }

    void Write(const Events::Log &logev)
    {
        std::lock_guard<std::mutex> guard(write_mtx);
        WriteEvent(logev);
    }


  protected:
    bool timestamp = true;
    bool prepend_prefix = true;

    /**
     *  Send a single event to the destination.  Called with the write
     *  lock held.
     */
    virtual void WriteEvent(const Events::Log &logev) = 0;

    /**
     *  Render an event as one line of text:
     *  "[{account:label} ]Group CATEGORY: message"
     *
     * @param logev       Events::Log to render
     * @param msg_colour  Inserted between the prefix and the message
     */
    std::string FormatLine(const Events::Log &logev,
                           const std::string &msg_colour = "") const
    {
        std::string line;
        LogTag::Ptr tag = logev.GetLogTag();
        if (prepend_prefix && tag)
        {
            line = tag->str(true) + " ";
        }
        return line + LogPrefix(logev.group, logev.category)
               + msg_colour + logev.message;
    }


  private:
    std::mutex write_mtx;
};
