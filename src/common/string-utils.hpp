//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   common/string-utils.hpp
 *
 * @brief  Collection of various minor helper functions for strings
 */

#pragma once

#include <string>


/**
 *  Filters out all characters below 0x20 (ASCII control characters).
 *  Newline characters are removed if filter_nl is set to be true.
 *
 *  @param input      std::string of the input string to filter
 *  @param filter_nl  bool flag to enable filtering of newline chars.
 *                    If true, newline chars will be removed.
 *  @return std::string of the santised input string
 */
std::string filter_ctrl_chars(const std::string &input, bool filter_nl);


/**
 *  Returns at most max_len characters from the start of input, with
 *  control characters and newlines removed.  Used to quote parts of
 *  remote error responses in log messages and exceptions.
 *
 * @param input    std::string to shorten
 * @param max_len  size_t with the maximum number of characters to keep
 * @return std::string with the excerpt
 */
std::string excerpt(const std::string &input, size_t max_len);


/**
 *  Percent-encodes a single URL path segment (RFC 3986 unreserved
 *  characters are kept as-is)
 *
 * @param segment  std::string with the raw path segment
 * @return std::string which is safe to put between two '/' in an URI
 */
std::string url_encode_segment(const std::string &segment);
