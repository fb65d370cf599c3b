//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   log-helpers.hpp
 *
 * @brief  Log groups, log categories and helper functions shared by
 *         all the logging components
 */

#pragma once

#include <syslog.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>


class LogException : public std::runtime_error
{
  public:
    LogException(const std::string &err)
        : std::runtime_error(err)
    {
    }
};



/**
 * Log groups is used to classify the source of log events
 */
const uint8_t LogGroupCount = 6;
enum class LogGroup : std::uint8_t
{
    UNDEFINED,    /**< Default - should not be used in code, but is here to detect errors */
    SERVICE,      /**< Main service process (cftunnel-monitor) */
    APICLIENT,    /**< Remote API client and the HTTPS transport */
    VERSIONCACHE, /**< Latest-version cache of the connector release feed */
    REFRESH,      /**< Per-account refresh orchestration */
    CORELIB       /**< OpenVPN 3 Core library web client */
};

const std::array<const std::string, LogGroupCount> LogGroup_str = {
    {"[[UNDEFINED]]",
     "Service",
     "API Client",
     "Version Cache",
     "Refresh",
     "Core Library"}};


enum class LogCategory : uint8_t
{
    UNDEFINED, /**< Undefined/not set */
    DEBUG,     /**< Debug messages */
    VERB2,     /**< Even more details */
    VERB1,     /**< More details */
    INFO,      /**< Informational messages */
    WARN,      /**< Warnings - important issues which might need attention*/
    ERROR,     /**< Errors - These must be fixed for successful operation */
    CRIT,      /**< Critical - These requires users attention */
    FATAL      /**< Fatal errors - The current operation is going to stop */
};


const std::array<const std::string, 9> LogCategory_str = {
    {
        "[[UNDEFINED]]",   // LogCategory::UNDEFINED
        "DEBUG",           // LogCategory::DEBUG
        "VERB2",           // LogCategory::VERB2
        "VERB1",           // LogCategory::VERB1
        "INFO",            // LogCategory::INFO
        "WARNING",         // LogCategory::WARN
        "-- ERROR --",     // LogCategory::ERROR
        "!! CRITICAL !!",  // LogCategory::CRIT
        "**!! FATAL !!**", // LogCategory::FATAL
    }};



/**
 *  Generates the "Group CATEGORY: " prefix used in front of log lines.
 *  Undefined parts are left out; with both undefined the prefix is empty.
 */
inline const std::string LogPrefix(LogGroup group, LogCategory catg)
{
    const auto g = static_cast<uint8_t>(group);
    const auto c = static_cast<uint8_t>(catg);

    std::string ret;
    if (LogGroup::UNDEFINED != group)
    {
        ret = (g < LogGroupCount ? LogGroup_str[g]
                                 : "[group:" + std::to_string(g) + "]");
    }
    if (LogCategory::UNDEFINED != catg)
    {
        ret += (ret.empty() ? "" : " ");
        ret += (c < LogCategory_str.size() ? LogCategory_str[c]
                                           : "[category:" + std::to_string(c) + "]");
    }
    return (ret.empty() ? ret : ret + ": ");
}


/**
 *  The syslog(3) priority matching a LogCategory, also used for the
 *  PRIORITY field of journald records
 */
inline int LogCategoryPriority(LogCategory catg)
{
    switch (catg)
    {
    case LogCategory::DEBUG:
        return LOG_DEBUG;
    case LogCategory::WARN:
        return LOG_WARNING;
    case LogCategory::ERROR:
        return LOG_ERR;
    case LogCategory::CRIT:
        return LOG_CRIT;
    case LogCategory::FATAL:
        return LOG_ALERT;
    default:
        return LOG_INFO;
    }
}
