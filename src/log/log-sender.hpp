//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   log-sender.hpp
 *
 * @brief  Declaration of LogSender, the logging handle each component
 *         of the service uses
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "events/log.hpp"
#include "logfilter.hpp"
#include "logwriter.hpp"


/**
 *  A LogSender sends log events of a single LogGroup to a LogWriter,
 *  filtered by the configured log level.  It can optionally tag all its
 *  events with a LogTag, identifying the monitored account.
 *
 *  A LogSender without a LogWriter silently discards all events.
 */
class LogSender : public Log::EventFilter
{
  public:
    using Ptr = std::shared_ptr<LogSender>;

    /**
     *  Create a new LogSender
     *
     * @param lgroup     LogGroup all events from this sender belongs to
     * @param lgwr       LogWriter::Ptr where the events are written, may be
     *                   nullptr
     * @param log_level  uint32_t with the initial log level (0-6)
     * @param tag        LogTag::Ptr to attach to all events, may be nullptr
     */
    [[nodiscard]] static LogSender::Ptr Create(const LogGroup lgroup,
                                               LogWriter::Ptr lgwr,
                                               const uint32_t log_level = 3,
                                               LogTag::Ptr tag = nullptr);

    /**
     *  Create a new LogSender sharing the LogWriter and log level of this
     *  sender, but with a different log group and LogTag
     *
     * @param lgroup  LogGroup for the new sender
     * @param tag     LogTag::Ptr for the new sender, may be nullptr
     *
     * @return LogSender::Ptr to the new sender
     */
    LogSender::Ptr Derive(const LogGroup lgroup, LogTag::Ptr tag) const;

    virtual ~LogSender() = default;

    LogGroup GetLogGroup() const noexcept;
    LogTag::Ptr GetLogTag() const noexcept;
    LogWriter::Ptr GetLogWriter() const noexcept;

    virtual void Log(const Events::Log &logev, const bool duplicate_check = false);
    virtual void Debug(const std::string &msg, const bool duplicate_check = false);
    virtual void LogVerb2(const std::string &msg, const bool duplicate_check = false);
    virtual void LogVerb1(const std::string &msg, const bool duplicate_check = false);
    virtual void LogInfo(const std::string &msg, const bool duplicate_check = false);
    virtual void LogWarn(const std::string &msg, const bool duplicate_check = false);
    virtual void LogError(const std::string &msg);
    virtual void LogCritical(const std::string &msg);
    virtual void LogFATAL(const std::string &msg);

    /**
     *  Retrieve the last log event which passed the log level filter.
     *  Mostly useful for testing.
     */
    Events::Log GetLastLogEvent() const;


  protected:
    LogSender(const LogGroup lgroup,
              LogWriter::Ptr lgwr,
              const uint32_t log_level,
              LogTag::Ptr tag);

    LogWriter::Ptr logwr = nullptr;
    LogGroup log_group;
    LogTag::Ptr logtag = nullptr;


  private:
    mutable std::mutex last_mtx;
    Events::Log last_logevent;
};
