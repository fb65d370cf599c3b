//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   ansicolours.hpp
 *
 * @brief  ColourEngine ANSI Terminal colour code implementation
 */

#pragma once

#include <string>

#include "colourengine.hpp"


/**
 *  Class implementing the ColourEngine to be used to make
 *  output to terminals colourful
 */
class ANSIColours : public ColourEngine
{
  public:
    ANSIColours() = default;
    ~ANSIColours() override = default;

    const std::string Set(Colour foreground, Colour background) override
    {
        std::string seq = Reset() + "\033[";
        if (Colour::NONE == foreground)
        {
            seq += "0m";
        }
        else
        {
            seq += (is_bright(foreground) ? "1;3" : "3")
                   + std::to_string(ansi_code(foreground)) + "m";
        }
        if (Colour::NONE != background)
        {
            seq += "\033[4" + std::to_string(ansi_code(background)) + "m";
        }
        return seq;
    }


    const std::string Reset() override
    {
        return "\033[0m";
    }


    const std::string ColourByGroup(LogGroup grp) override
    {
        switch (grp)
        {
        case LogGroup::APICLIENT:
            return Set(Colour::BRIGHT_WHITE, Colour::BLUE);

        case LogGroup::VERSIONCACHE:
            return Set(Colour::BRIGHT_WHITE, Colour::CYAN);

        case LogGroup::REFRESH:
            return Set(Colour::BRIGHT_GREEN, Colour::NONE);

        case LogGroup::CORELIB:
            return Set(Colour::BRIGHT_YELLOW, Colour::NONE);

        case LogGroup::UNDEFINED:
        case LogGroup::SERVICE:
        default:
            return "";
        }
    }


    const std::string ColourByCategory(LogCategory ctg) override
    {
        switch (ctg)
        {
        case LogCategory::DEBUG:
            return Set(Colour::BRIGHT_BLUE, Colour::NONE);

        case LogCategory::VERB2:
            return Set(Colour::BRIGHT_CYAN, Colour::NONE);

        case LogCategory::VERB1:
            return "";

        case LogCategory::INFO:
            return Set(Colour::BRIGHT_WHITE, Colour::NONE);

        case LogCategory::WARN:
            return Set(Colour::BRIGHT_YELLOW, Colour::NONE);

        case LogCategory::ERROR:
            return Set(Colour::BRIGHT_RED, Colour::NONE);

        case LogCategory::CRIT:
            return Set(Colour::BRIGHT_WHITE, Colour::RED);

        case LogCategory::FATAL:
            return Set(Colour::BRIGHT_YELLOW, Colour::RED);

        default:
            return "";
        }
    }


  private:
    // Colour values come in pairs after NONE: the normal and bright
    // variant of each of the eight ANSI colours, in ANSI order
    static unsigned int ansi_code(const Colour c)
    {
        return (static_cast<unsigned int>(c) - 1) / 2;
    }

    static bool is_bright(const Colour c)
    {
        return Colour::NONE != c
               && 1 == (static_cast<unsigned int>(c) - 1) % 2;
    }
};
