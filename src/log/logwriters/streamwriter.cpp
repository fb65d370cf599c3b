//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   streamwriter.cpp
 *
 * @brief  Implementation of StreamLogWriter and ColourStreamWriter
 */

#include <string>

#include "common/timestamp.hpp"
#include "streamwriter.hpp"


StreamLogWriter::StreamLogWriter(std::ostream &dst)
    : LogWriter(), dest(dst)
{
}


StreamLogWriter::~StreamLogWriter()
{
    dest.flush();
}


const std::string StreamLogWriter::GetLogWriterInfo() const
{
    return "StreamWriter";
}


void StreamLogWriter::WriteEvent(const Events::Log &logev)
{
    write_line(FormatLine(logev), "", "");
}


void StreamLogWriter::write_line(const std::string &line,
                                 const std::string &colour_init,
                                 const std::string &colour_reset)
{
    if (timestamp)
    {
        dest << GetTimestamp();
    }
    dest << colour_init << line << colour_reset << std::endl;
}



ColourStreamWriter::ColourStreamWriter(std::ostream &dst, ColourEngine::Ptr ce)
    : StreamLogWriter(dst), colours(std::move(ce))
{
}


const std::string ColourStreamWriter::GetLogWriterInfo() const
{
    return "ColourStreamWriter";
}


void ColourStreamWriter::WriteEvent(const Events::Log &logev)
{
    if (!colours)
    {
        StreamLogWriter::WriteEvent(logev);
        return;
    }

    if (ColourEngine::ColourMode::BY_GROUP == colours->GetColourMode())
    {
        // The message gets the colour of the sending component; the
        // prefix keeps the severity colour for warnings and worse
        const std::string grpcol = colours->ColourByGroup(logev.group);
        const std::string prefixcol = (LogCategory::INFO < logev.category
                                           ? colours->ColourByCategory(logev.category)
                                           : grpcol);
        write_line(FormatLine(logev, grpcol), prefixcol, colours->Reset());
        return;
    }
    write_line(FormatLine(logev),
               colours->ColourByCategory(logev.category),
               colours->Reset());
}
