//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   timestamp.cpp
 *
 * @brief  Simple functions for retriveving and parsing time/date
 *         related information
 */

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "timestamp.hpp"


std::string GetTimestamp()
{
    time_t now = time(0);
    tm ltm{};
    localtime_r(&now, &ltm);

    std::stringstream ret;
    ret << 1900 + ltm.tm_year
        << "-" << std::setw(2) << std::setfill('0') << 1 + ltm.tm_mon
        << "-" << std::setw(2) << std::setfill('0') << ltm.tm_mday
        << " " << std::setw(2) << std::setfill('0') << ltm.tm_hour
        << ":" << std::setw(2) << std::setfill('0') << ltm.tm_min
        << ":" << std::setw(2) << std::setfill('0') << ltm.tm_sec
        << " ";
    return ret.str();
}


std::optional<std::chrono::system_clock::time_point> ParseISO8601(const std::string &tstamp)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (7 != std::sscanf(tstamp.c_str(),
                         "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                         &year, &month, &day, &sep,
                         &hour, &minute, &second, &consumed))
    {
        return std::nullopt;
    }
    if (('T' != sep && 't' != sep && ' ' != sep)
        || month < 1 || month > 12 || day < 1 || day > 31
        || hour > 23 || minute > 59 || second > 60
        || hour < 0 || minute < 0 || second < 0)
    {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fraction of seconds, kept with microsecond precision
    long micro = 0;
    if (pos < tstamp.size() && '.' == tstamp[pos])
    {
        ++pos;
        long scale = 100000;
        size_t digits = 0;
        while (pos < tstamp.size() && std::isdigit(static_cast<unsigned char>(tstamp[pos])))
        {
            micro += (tstamp[pos] - '0') * scale;
            scale /= 10;
            ++pos;
            ++digits;
        }
        if (0 == digits)
        {
            return std::nullopt;
        }
    }

    // Zone designator
    long offset_sec = 0;
    if (pos < tstamp.size())
    {
        char z = tstamp[pos];
        if ('Z' == z || 'z' == z)
        {
            ++pos;
        }
        else if ('+' == z || '-' == z)
        {
            int oh = 0, om = 0;
            std::string zone = tstamp.substr(pos + 1);
            int zc = 0;
            if (2 != std::sscanf(zone.c_str(), "%2d:%2d%n", &oh, &om, &zc)
                && 2 != std::sscanf(zone.c_str(), "%2d%2d%n", &oh, &om, &zc))
            {
                return std::nullopt;
            }
            if (oh > 23 || om > 59)
            {
                return std::nullopt;
            }
            offset_sec = (oh * 3600L + om * 60L) * ('+' == z ? 1 : -1);
            pos += 1 + static_cast<size_t>(zc);
        }
    }
    if (pos != tstamp.size())
    {
        return std::nullopt;
    }

    tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    time_t epoch = timegm(&t);

    return std::chrono::system_clock::from_time_t(epoch - offset_sec)
           + std::chrono::microseconds(micro);
}


std::string FormatISO8601UTC(const std::chrono::system_clock::time_point &tp)
{
    time_t epoch = std::chrono::system_clock::to_time_t(tp);
    tm utc{};
    gmtime_r(&epoch, &utc);

    char buf[32] = {};
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf);
}
