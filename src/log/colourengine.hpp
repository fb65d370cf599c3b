//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   colourengine.hpp
 *
 * @brief  Colour Engine API, used by ColourStreamWriter to colour
 *         the log output
 */

#pragma once

#include <memory>
#include <string>

#include "log-helpers.hpp"


/**
 *  This is just the abstract API which needs to be implemented
 *  by various colour engine implementations
 */
class ColourEngine
{
  public:
    using Ptr = std::unique_ptr<ColourEngine>;

    /**
     *  Colouring approaches
     */
    enum class ColourMode : uint8_t
    {
        BY_GROUP,   //!< Colours chosen based on the LogGroup identifier
        BY_CATEGORY //!< Colours chosen based on the LogCategory identifier
    };

    /**
     *  Supported colours
     */
    enum class Colour : std::uint8_t
    {
        NONE,
        BLACK,
        BRIGHT_BLACK,
        RED,
        BRIGHT_RED,
        GREEN,
        BRIGHT_GREEN,
        YELLOW,
        BRIGHT_YELLOW,
        BLUE,
        BRIGHT_BLUE,
        MAGENTA,
        BRIGHT_MAGENTA,
        CYAN,
        BRIGHT_CYAN,
        WHITE,
        BRIGHT_WHITE
    };

    virtual ~ColourEngine() = default;

    /**
     *  Needs to be called to specify the colours to be used in the output
     *
     * @param fg  ColourEngine::Colour to use as foreground colour
     * @param bg  ColourEngine::Colour to use as backround colour
     *
     * @return  Returns a string containing to be used to colour the output
     */
    virtual const std::string Set(Colour fg, Colour bg) = 0;

    /**
     *  Removes any colour settings, returning back to default output mode
     *
     * @return  Returns the string needed to reset the colour to default
     */
    virtual const std::string Reset() = 0;

    /**
     *  Changes the colour mode.  The default is BY_CATEGORY.
     *
     * @param m  ColourMode to use
     */
    void SetColourMode(ColourMode m)
    {
        mode = m;
    }

    ColourMode GetColourMode() const
    {
        return mode;
    }

    virtual const std::string ColourByGroup(LogGroup grp) = 0;
    virtual const std::string ColourByCategory(LogCategory ctg) = 0;


  private:
    ColourMode mode = ColourMode::BY_CATEGORY;
};
