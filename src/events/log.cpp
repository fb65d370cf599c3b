//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   events/log.cpp
 *
 * @brief  Implementation of Events::Log
 */

#include <string>

#include "common/string-utils.hpp"
#include "log.hpp"


namespace Events {

Log::Log(const LogGroup grp,
         const LogCategory ctg,
         const std::string &msg,
         bool filter_nl)
    : group(grp), category(ctg),
      message(filter_ctrl_chars(msg, filter_nl))
{
}


void Log::AddLogTag(LogTag::Ptr tag) noexcept
{
    logtag = std::move(tag);
}


LogTag::Ptr Log::GetLogTag() const noexcept
{
    return logtag;
}


const std::string Log::GetLogGroupStr() const
{
    const auto idx = static_cast<uint8_t>(group);
    return (idx < LogGroupCount ? LogGroup_str[idx] : "[group:" + std::to_string(idx) + "]");
}


const std::string Log::GetLogCategoryStr() const
{
    const auto idx = static_cast<uint8_t>(category);
    return (idx < LogCategory_str.size()
                ? LogCategory_str[idx]
                : "[category:" + std::to_string(idx) + "]");
}


void Log::reset()
{
    *this = Log();
}


bool Log::empty() const
{
    return LogGroup::UNDEFINED == group
           && LogCategory::UNDEFINED == category
           && message.empty();
}


const std::string Log::str(bool prefix) const
{
    return (prefix ? LogPrefix(group, category) : std::string()) + message;
}


bool Log::operator==(const Log &compare) const
{
    return group == compare.group
           && category == compare.category
           && message == compare.message;
}


bool Log::operator!=(const Log &compare) const
{
    return !(*this == compare);
}

} // namespace Events
