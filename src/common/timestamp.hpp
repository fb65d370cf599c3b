//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   timestamp.hpp
 *
 * @brief  Simple functions for retriveving and parsing time/date
 *         related information
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>


/**
 *  Get a timestamp of the current date and time.  The format is
 *  the ISO standard without time zone - YYYY-MM-DD HH:MM:SS
 *
 * @return  Returns a string with the date and time, with a trailing space
 */
std::string GetTimestamp();


/**
 *  Parses an ISO-8601 timestamp as returned by the tunnel provider API.
 *
 *  Accepted: YYYY-MM-DD[T ]HH:MM:SS, optionally followed by a fraction
 *  of seconds and a zone designator (Z, +HH:MM, -HH:MM or +HHMM).
 *  Timestamps without a zone designator are considered UTC.
 *
 * @param tstamp  std::string with the timestamp to parse
 *
 * @return  The parsed time point, or std::nullopt if the string could not
 *          be parsed
 */
std::optional<std::chrono::system_clock::time_point> ParseISO8601(const std::string &tstamp);


/**
 *  Formats a time point as an ISO-8601 UTC timestamp: YYYY-MM-DDTHH:MM:SSZ
 *
 * @param tp  std::chrono::system_clock::time_point to format
 * @return std::string with the formatted timestamp
 */
std::string FormatISO8601UTC(const std::chrono::system_clock::time_point &tp);
