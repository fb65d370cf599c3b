//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   utils.cpp
 *
 * @brief  Misc utility functions
 */

#include "build-config.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <glib.h>

#include "utils.hpp"


/**
 *  Generates a version string of the program
 *
 * @param component  std::string with argv[0] of the running binary
 *
 * @return A pre-formatted std::string containing the version references
 */
std::string get_version(const std::string &component)
{
    std::stringstream ver;
    ver << PACKAGE_NAME << " " << PACKAGE_VERSION
        << " (" << simple_basename(component) << ")";
    return ver.str();
}


/**
 *  Stops the main GMainLoop.  Used by the SIGINT and SIGTERM
 *  signal processing, set up via g_unix_signal_add()
 *
 * @param loop  Pointer to the GMainLoop object to stop
 *
 * @return Returns G_SOURCE_CONTINUE, to not remove the signal
 *         processing.
 */
int stop_handler(void *loop)
{
    std::cout << "** Shutting down " << PACKAGE_NAME << " "
              << "(pid: " << std::to_string(getpid()) << ")" << std::endl;
    g_main_loop_quit(static_cast<GMainLoop *>(loop));
    return G_SOURCE_CONTINUE;
}


bool is_colour_terminal()
{
    if (0 == isatty(STDOUT_FILENO))
    {
        return false;
    }

    const char *term = getenv("TERM");
    if (nullptr == term)
    {
        return false;
    }
    return 0 != strcmp(term, "dumb");
}
