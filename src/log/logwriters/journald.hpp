//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   journald.hpp
 *
 * @brief  Declaration of the JournaldWriter implementation of LogWriter
 */

#pragma once

#include "build-config.h"

#include <string>

#include "log/logwriter.hpp"


#ifdef HAVE_SYSTEMD
/**
 *  LogWriter implementation, writing to systemd journal
 */
class JournaldWriter : public LogWriter
{
  public:
    JournaldWriter(const std::string &log_sender);
    virtual ~JournaldWriter() = default;

    const std::string GetLogWriterInfo() const override;

    // journald stamps its records itself
    bool TimestampEnabled() const noexcept override
    {
        return true;
    }

  protected:
    /**
     *  Sends the event as a structured journal record, with the group,
     *  category and account tag in separate TUNMON_* fields
     */
    void WriteEvent(const Events::Log &logev) override;

  private:
    const std::string log_sender;
};
#endif // HAVE_SYSTEMD
