//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   streamwriter.hpp
 *
 * @brief  LogWriter implementations writing to a std::ostream
 */

#pragma once

#include <ostream>

#include "log/colourengine.hpp"
#include "log/logwriter.hpp"


/**
 *  Writes log lines to a std::ostream, typically stdout, stderr or
 *  an opened log file
 */
class StreamLogWriter : public LogWriter
{
  public:
    StreamLogWriter(std::ostream &dst);
    virtual ~StreamLogWriter();

    const std::string GetLogWriterInfo() const override;

  protected:
    std::ostream &dest;

    void WriteEvent(const Events::Log &logev) override;

    /**
     *  Write a formatted line, wrapped in the given terminal control
     *  sequences
     */
    void write_line(const std::string &line,
                    const std::string &colour_init,
                    const std::string &colour_reset);
};


/**
 *  StreamLogWriter colouring each line through a ColourEngine, either
 *  by the severity or by the component sending the event
 */
class ColourStreamWriter : public StreamLogWriter
{
  public:
    /**
     * @param dst  std::ostream to write to
     * @param ce   ColourEngine providing the colour codes.  The writer
     *             takes ownership of it.
     */
    ColourStreamWriter(std::ostream &dst, ColourEngine::Ptr ce);
    virtual ~ColourStreamWriter() = default;

    const std::string GetLogWriterInfo() const override;

  protected:
    void WriteEvent(const Events::Log &logev) override;

  private:
    ColourEngine::Ptr colours;
};
