//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   logtag.cpp
 *
 * @brief  Implementation of the LogTag class
 */

#include <string>

#include "logtag.hpp"


LogTag::Ptr LogTag::Create(const std::string &label, const bool default_encaps)
{
    return LogTag::Ptr(new LogTag(label, default_encaps));
}


LogTag::LogTag(const std::string &label, const bool default_encaps)
    : tag(label), encaps(default_encaps)
{
}


LogTag::LogTag(const LogTag &cp)
    : tag(cp.tag), encaps(cp.encaps)
{
}


const std::string LogTag::str(const bool encaps_override) const
{
    if (encaps_override)
    {
        return std::string("{account:") + tag + "}";
    }
    return tag;
}


const std::string LogTag::str() const
{
    return str(encaps);
}
