//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   common/string-utils.cpp
 *
 * @brief  Collection of various minor helper functions for strings
 */


#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

#include "string-utils.hpp"


std::string filter_ctrl_chars(const std::string &input, bool filter_nl)
{
    std::string output(input);

    // Remove trailing new lines
    output.erase(output.find_last_not_of("\n") + 1);

    // Remove all control characters (< 0x20) - except
    // of preserving only newlines (\n) if requested.
    output.erase(
        std::remove_if(output.begin(),
                       output.end(),
                       [filter_nl](char c)
                       {
                           return ((c >= 0 && c < 0x20 && c != '\n')
                                   || (filter_nl && c == '\n'));
                       }),
        output.end());
    return output;
}


std::string excerpt(const std::string &input, size_t max_len)
{
    return filter_ctrl_chars(input.substr(0, max_len), true);
}


std::string url_encode_segment(const std::string &segment)
{
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (const unsigned char c : segment)
    {
        if (std::isalnum(c) || '-' == c || '_' == c || '.' == c || '~' == c)
        {
            out << c;
        }
        else
        {
            out << '%' << std::setw(2) << std::setfill('0')
                << static_cast<unsigned int>(c);
        }
    }
    return out.str();
}
