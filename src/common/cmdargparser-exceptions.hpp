//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   cmdargparser-exceptions.hpp
 *
 * @brief  Exceptions used by the command line argument parser and
 *         the configuration file parsers
 */

#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <vector>


/**
 *  Base class of all command line and configuration errors
 */
class CommandArgBaseException : public std::exception
{
  public:
    CommandArgBaseException(const std::string &msg) noexcept
        : message(msg)
    {
    }

    virtual ~CommandArgBaseException() = default;

    virtual const char *what() const noexcept
    {
        return message.c_str();
    }

    /**
     * @return True if calling what() will yield more information
     */
    virtual bool gotErrorMessage() const noexcept
    {
        return !message.empty();
    }


  protected:
    const std::string message;
};


/**
 *  Thrown when running a command failed.  The error message may be
 *  empty if the details have already been presented to the user.
 */
class CommandException : public CommandArgBaseException
{
  public:
    CommandException(const std::string &command) noexcept
        : CommandArgBaseException(""),
          command(command)
    {
    }

    CommandException(const std::string &command,
                     const std::string &msg) noexcept
        : CommandArgBaseException(msg),
          command(command)
    {
    }

    virtual const char *getCommand() const noexcept
    {
        return command.c_str();
    }


  private:
    const std::string command;
};


/**
 *  Thrown when a single option has an invalid value or is misused
 */
class OptionException : public CommandArgBaseException
{
  public:
    OptionException(const std::string &option) noexcept
        : CommandArgBaseException("--" + option)
    {
    }

    OptionException(const std::string &option, const std::string &msg) noexcept
        : CommandArgBaseException("--" + option + ": " + msg)
    {
    }

    virtual ~OptionException() = default;
};


class OptionNotFound : public CommandArgBaseException
{
  public:
    OptionNotFound(const std::string &key) noexcept
        : CommandArgBaseException("Option '" + key + "' was not found")
    {
    }
};


class OptionNotPresent : public CommandArgBaseException
{
  public:
    OptionNotPresent(const std::string &key) noexcept
        : CommandArgBaseException("Option '" + key + "' value is not present")
    {
    }
};


/**
 *  Thrown when options which cannot be combined are used together
 */
class ExclusiveOptionError : public CommandArgBaseException
{
  public:
    ExclusiveOptionError(const std::string &opt,
                         const std::vector<std::string> &group)
        : CommandArgBaseException(generate_error(opt, group))
    {
    }

    ExclusiveOptionError(const std::vector<std::string> &group)
        : CommandArgBaseException(generate_error("", group))
    {
    }


  private:
    static std::string generate_error(const std::string &opt,
                                      const std::vector<std::string> &group)
    {
        std::stringstream msg;
        if (!opt.empty())
        {
            msg << "Option '" << opt << "' cannot be combined with: ";
        }
        else
        {
            msg << "These options cannot be combined: ";
        }

        bool first = true;
        for (const auto &o : group)
        {
            if (opt == o)
            {
                continue;
            }
            msg << (first ? "" : ", ") << o;
            first = false;
        }
        return msg.str();
    }
};


/**
 *  Thrown by the configuration file and accounts file parsers
 */
class ConfigFileException : public CommandArgBaseException
{
  public:
    ConfigFileException(const std::string &msg)
        : CommandArgBaseException("Configuration error: " + msg),
          detail(msg)
    {
    }

    ConfigFileException(const std::string &cfgfile,
                        const std::string &msg)
        : CommandArgBaseException("Configuration file error in "
                                  + cfgfile + ": " + msg),
          detail(msg)
    {
    }

    /**
     * @return The error message without the file name prefix
     */
    const std::string &GetDetail() const noexcept
    {
        return detail;
    }

  private:
    const std::string detail;
};
