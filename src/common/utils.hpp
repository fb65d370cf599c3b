//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   utils.hpp
 *
 * @brief  Misc utility functions
 */

#pragma once

#include <string>


std::string get_version(const std::string &component);
int stop_handler(void *loop);

static inline std::string simple_basename(const std::string &filename)
{
    return filename.substr(filename.rfind('/') + 1);
}


/**
 *  Checks if the currently available console/terminal is
 *  capable of doing colours.
 *
 * @return bool, true if it is expected the terminal output can handle
 *               colours; otherwise false
 */
bool is_colour_terminal();
