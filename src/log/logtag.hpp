//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   logtag.hpp
 *
 * @brief  Declaration of the LogTag class
 */

#pragma once

#include <iostream>
#include <memory>
#include <string>


/**
 *  A LogTag identifies which monitored account a log event belongs to.
 *  Several account tasks share the same LogWriter, so each of them
 *  attaches its own tag to the events it sends.
 */
struct LogTag
{
    using Ptr = std::shared_ptr<LogTag>;

    /**
     *  LogTag constructor
     *
     * @param label          std::string with the account label (friendly
     *                       name or account id)
     * @param default_encaps bool flag adding the {account:xxxx} encapsulation
     */
    [[nodiscard]] static LogTag::Ptr Create(const std::string &label,
                                            const bool default_encaps = true);

    LogTag(const LogTag &cp);
    ~LogTag() = default;

    /**
     *  Return a std::string containing the tag to be used with log lines
     *
     *  The structure is: {account:label} if the 'encaps' is set to true,
     *  otherwise just the label.
     *
     * @param encaps_override  Bool flag to override the default encapsulating
     *                         of the tag
     *
     * @return  Returns a std::string containing the tag
     */
    const std::string str(const bool encaps_override) const;

    /**
     *  Same as str(const bool), using the default_encaps setting
     *  given to Create()
     */
    const std::string str() const;

    friend std::ostream &operator<<(std::ostream &os, const LogTag &ltag)
    {
        return os << ltag.str();
    }

    std::string tag{};  /**<  The account label */
    bool encaps = true; /**<  Encapsulate the label in "{account:...}" */

  private:
    LogTag(const std::string &label, const bool default_encaps);
};
