//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   logfilter.cpp
 *
 * @brief  Implementation of Log::EventFilter
 */

#include <array>
#include <string>

#include "logfilter.hpp"


namespace Log {

namespace {

// Lowest log level each LogCategory is written at, indexed by category
const std::array<uint32_t, 9> category_min_level = {
    {
        0, // UNDEFINED
        6, // DEBUG
        5, // VERB2
        4, // VERB1
        3, // INFO
        2, // WARN
        1, // ERROR
        0, // CRIT
        0, // FATAL
    }};

} // namespace


EventFilter::EventFilter(const uint32_t loglvl) noexcept
    : log_level(loglvl)
{
}


void EventFilter::SetLogLevel(const uint32_t loglev)
{
    if (MaxLogLevel < loglev)
    {
        throw LogException("Invalid log level: " + std::to_string(loglev));
    }
    log_level = loglev;
}


uint32_t EventFilter::GetLogLevel() const noexcept
{
    return log_level;
}


bool EventFilter::Allow(const LogCategory catg) const noexcept
{
    const auto idx = static_cast<std::size_t>(catg);
    return idx >= category_min_level.size()
           || category_min_level[idx] <= log_level;
}

} // namespace Log
