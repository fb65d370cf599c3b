//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   journald.cpp
 *
 * @brief  Implementation of JournaldWriter
 */

#include "build-config.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "log/logwriters/journald.hpp"


#ifdef HAVE_SYSTEMD

#include <sys/uio.h>

#define SD_JOURNAL_SUPPRESS_LOCATION
#include <systemd/sd-journal.h>


JournaldWriter::JournaldWriter(const std::string &logsndr)
    : LogWriter(), log_sender("TUNMON_LOG_SENDER=" + logsndr)
{
}


const std::string JournaldWriter::GetLogWriterInfo() const
{
    return "journald";
}


void JournaldWriter::WriteEvent(const Events::Log &event)
{
    // The strings must stay alive until sd_journal_sendv() returns,
    // the iovec records only point into them
    std::vector<std::string> fields;
    fields.push_back(log_sender);

    auto logtag = event.GetLogTag();
    if (logtag)
    {
        fields.push_back("TUNMON_LOG_TAG=" + logtag->str(false));
    }
    fields.push_back("TUNMON_LOG_GROUP=" + event.GetLogGroupStr());
    fields.push_back("TUNMON_LOG_CATEGORY=" + event.GetLogCategoryStr());
    fields.push_back("PRIORITY=" + std::to_string(LogCategoryPriority(event.category)));

    std::string msg{"MESSAGE="};
    if (prepend_prefix && logtag)
    {
        msg += logtag->str(true) + " ";
    }
    msg += event.message;
    fields.push_back(msg);

    std::vector<struct iovec> iov;
    for (auto &f : fields)
    {
        iov.push_back({const_cast<char *>(f.data()), f.size()});
    }

    int r = sd_journal_sendv(iov.data(), static_cast<int>(iov.size()));
    if (0 != r)
    {
        std::cerr << "ERROR: Failed to send log event to journald: "
                  << strerror(-r) << std::endl;
    }
}
#endif // HAVE_SYSTEMD
