//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   events/log.hpp
 *
 * @brief  Log event passed from a LogSender to the LogWriter
 */

#pragma once

#include <ostream>
#include <string>

#include "log/log-helpers.hpp"
#include "log/logtag.hpp"


namespace Events {

/**
 *  A single log event.  The account tag is not part of the event
 *  identity; two events with the same group, category and message
 *  compare equal regardless of the account they were sent for.
 */
struct Log
{
    Log() = default;

    /**
     * @param grp        LogGroup of the component sending the event
     * @param ctg        LogCategory (severity) of the event
     * @param msg        Log message
     * @param filter_nl  Strip newlines as well as other control
     *                   characters from the message (default true).
     *                   Remote payload excerpts end up in log messages,
     *                   so control characters are never kept.
     */
    Log(const LogGroup grp,
        const LogCategory ctg,
        const std::string &msg,
        bool filter_nl = true);

    void AddLogTag(LogTag::Ptr tag) noexcept;

    /**
     * @return LogTag::Ptr of the account the event belongs to, nullptr
     *         for service wide events
     */
    LogTag::Ptr GetLogTag() const noexcept;

    const std::string GetLogGroupStr() const;
    const std::string GetLogCategoryStr() const;

    void reset();
    bool empty() const;

    /**
     *  Render the event as text
     *
     * @param prefix  Prepend the "Group CATEGORY: " prefix
     */
    const std::string str(bool prefix = true) const;

    bool operator==(const Log &compare) const;
    bool operator!=(const Log &compare) const;

    friend std::ostream &operator<<(std::ostream &os, const Log &ev)
    {
        return os << ev.str();
    }

    LogGroup group = LogGroup::UNDEFINED;
    LogCategory category = LogCategory::UNDEFINED;
    std::string message{};

  private:
    LogTag::Ptr logtag = nullptr;
};

} // namespace Events
