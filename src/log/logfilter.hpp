//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   logfilter.hpp
 *
 * @brief  Log level based filtering of log events
 */

#pragma once

#include <cstdint>

#include "events/log.hpp"


namespace Log {

/**
 *  Log level filtering shared by the LogSender handles.  Each log
 *  level adds one more LogCategory to what gets written:
 *
 *    0  FATAL and CRITICAL    4  + VERB1
 *    1  + ERROR               5  + VERB2
 *    2  + WARNING             6  + DEBUG
 *    3  + INFO
 */
class EventFilter
{
  public:
    static constexpr uint32_t MaxLogLevel = 6;

    virtual ~EventFilter() = default;

    /**
     * @throws LogException if loglev is above MaxLogLevel
     */
    void SetLogLevel(const uint32_t loglev);
    uint32_t GetLogLevel() const noexcept;

    /**
     * @return true if events of this category pass the current log level
     */
    bool Allow(const LogCategory catg) const noexcept;


  protected:
    EventFilter(const uint32_t log_level_val) noexcept;

    bool Allow(const Events::Log &logev) const noexcept
    {
        return Allow(logev.category);
    }


  private:
    uint32_t log_level;
};

} // namespace Log
