//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   cmdargparser.hpp
 *
 * @brief  Command line argument parser for C++.  Built around getopt_long()
 */

#pragma once

#include <getopt.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/cmdargparser-exceptions.hpp"
#include "common/configfileparser.hpp"


/**
 *  This class is sent to the callback function which is called
 *  when parsing the arguments and options.  A ParsedArgs object contains
 *  all the parsed options and their arguments through a simple API.
 *
 *  This class is not directly populated, but this happens via internal
 *  RegisterParsedArgs class which inherits this class.
 */
class ParsedArgs
{
  public:
    using Ptr = std::shared_ptr<ParsedArgs>;
    using ExclusiveGroups = std::vector<std::vector<std::string>>;

    ParsedArgs(const std::string &argv0)
        : argv0(argv0)
    {
    }

    virtual ~ParsedArgs() = default;

    /**
     *  Check if the command line parser completed parsing all options and
     *  arguments.  This is false when --help or --version was processed.
     */
    bool GetCompleted() const
    {
        return completed;
    }

    std::string GetArgv0() const
    {
        return argv0;
    }

    /**
     *   Import option settings from a configuration file.  Settings in the
     *   configuration file override the command line, including the other
     *   options in the same exclusive option group.
     *
     * @param config     Configuration::File::Ptr to the configuration
     *                   file parser
     */
    void ImportConfigFile(Configuration::File::Ptr config);

    /**
     *  Check if parsed options are exclusive according to the ExclusiveGroups
     *
     *  Example:  CheckExclusiveOptions({{"syslog", "journald", "log-file"}});
     *
     * @param args_exclusive  ExclusiveGroups containing groups of options
     *                        which cannot be combined.
     *
     * @throws ExclusiveOptionError if an option is not exclusive
     */
    void CheckExclusiveOptions(const ExclusiveGroups &args_exclusive) const;

    /**
     *  Checks if a specific option name has been parsed.
     *
     * @param k  std::string containing the option to look-up.
     * @return Returns true if the option was found
     */
    bool Present(const std::string &k) const;

    std::vector<std::string> GetOptionNames() const
    {
        return present;
    }

    /**
     *  Retrieve the number of values found for a specific option
     *
     * @param k  std::string containing the option name to look-up
     * @return Returns the number of values for that option name.
     */
    unsigned int GetValueLen(const std::string &k) const noexcept;

    /**
     *  Retrieve a specific option value, based on option name and
     *  value index
     *
     * @param k    std::string containing the option name to look-up
     * @param idx  unsigned int of the value element to retrieve
     * @return  Returns a std::string with the collected value
     * @throws  OptionNotFound if the option or index does not exist
     */
    std::string GetValue(const std::string &k, const unsigned int idx) const;

    /**
     *  Retrieve the last value of a specific option name.  This ensures
     *  the last option usage overrides the prior settings.
     *
     * @param k   std::string containing the option name to look-up
     * @return    Returns a std::string with the collected value
     * @throws  OptionNotFound if the option has no value
     */
    std::string GetLastValue(const std::string &k) const;

    /**
     *  Boolean variant of @GetLastValue()
     *
     * @throws OptionException if the value is not a boolean
     */
    bool GetLastBoolValue(const std::string &k) const;

    /**
     *  Retrieve the last value of a specific option as an unsigned integer
     *
     * @param k        std::string containing the option name to look-up
     * @param min_val  unsigned int with the smallest value accepted
     *
     * @throws OptionException if the value is not a number or too small
     */
    unsigned int GetLastUIntValue(const std::string &k, const unsigned int min_val) const;

    /**
     *  Arguments which were not picked up by any option
     */
    std::vector<std::string> GetAllExtraArgs() const
    {
        return extra_args;
    }


  protected:
    std::string argv0;
    std::map<std::string, std::vector<std::string>> key_value;
    std::vector<std::string> present;
    std::vector<std::string> extra_args;
    bool completed = false;


  private:
    void remove_arg(const std::string &opt);
};



/**
 *  Callback function API, called with the parsed arguments
 */
using commandPtr = int (*)(ParsedArgs::Ptr);


/**
 *   Internal class used to populate the ParsedArgs class.
 */
class RegisterParsedArgs : public ParsedArgs
{
  public:
    using Ptr = std::shared_ptr<RegisterParsedArgs>;

    RegisterParsedArgs(const std::string &arg0)
        : ParsedArgs(arg0)
    {
    }

    /**
     *  Registers an option with an optional value.  If value is NULL,
     *  it will be flagged as present only.
     */
    void register_option(const std::string &k, const char *v);

    void register_extra_args(const char *e);

    void set_completed();
};



/**
 *  This class handles a single and specific option.  It prepares the
 *  information needed by getopt_long() and the --help screen.
 */
class SingleCommandOption
{
  public:
    using Ptr = std::shared_ptr<SingleCommandOption>;

    /**
     * Registers an option which does not take any additional value.
     *
     * @param longopt    std::string containing the long option name
     * @param shrtopt    char containing the single option character to use.
     *                   Can be 0 if no short option is required
     * @param help_text  A simple help text which describes this option in the
     *                   --help screen.
     */
    SingleCommandOption(const std::string &longopt,
                        const char shrtopt,
                        const std::string &help_text);

    /**
     *  Registers an option which takes a value.
     *
     * @param longopt    std::string containing the long option name
     * @param shrtopt    char containing the single option character to use.
     *                   Can be 0 if no short option is required
     * @param metavar    A simple string describing the additional value; only
     *                   used by the --help screen
     * @param required   Indicates if the value is required (true) or
     *                   optional (false).
     * @param help_text  A simple help text which describes this option in the
     *                   --help screen.
     */
    SingleCommandOption(const std::string &longopt,
                        const char shrtopt,
                        const std::string &metavar,
                        const bool required,
                        const std::string &help_text);

    std::string getopt_optstring() const;
    bool check_short_option(const char o) const;
    bool check_long_option(const char *o) const;
    std::string get_option_name() const;
    const struct option *get_struct_option() const;

    /**
     *  Generates a line of information related to this option for
     *  the --help screen.
     *
     * @param width  Unsigned int defining the available width for the
     *               option/argument part of the output.
     */
    std::string gen_help_line(const unsigned int width = 34) const;


  private:
    const std::string longopt;
    const char shortopt;
    const std::string metavar;
    const std::string help_text;
    struct option getopt_option = {};
};



/**
 *  A SingleCommand object represents a program with a callback function
 *  which is called with the parsed command line.  It is built up with one
 *  or more SingleCommandOption describing the options it supports.
 */
class SingleCommand
{
  public:
    using Ptr = std::shared_ptr<SingleCommand>;

    /**
     * @param command      std::string of the command name
     * @param description  std::string with a short description of this command
     * @param cmdfunc      Callback function to run when the command line
     *                     has been parsed.
     */
    SingleCommand(const std::string &command,
                  const std::string &description,
                  const commandPtr cmdfunc);

    SingleCommandOption::Ptr AddOption(const std::string &longopt,
                                       const char shortopt,
                                       const std::string &help_text);

    SingleCommandOption::Ptr AddOption(const std::string &longopt,
                                       const char shortopt,
                                       const std::string &metavar,
                                       const bool required,
                                       const std::string &help_text);

    SingleCommandOption::Ptr AddOption(const std::string &longopt,
                                       const std::string &help_text)
    {
        return AddOption(longopt, 0, help_text);
    }

    SingleCommandOption::Ptr AddOption(const std::string &longopt,
                                       const std::string &metavar,
                                       const bool required,
                                       const std::string &help_text)
    {
        return AddOption(longopt, 0, metavar, required, help_text);
    }

    /**
     *  Adds a default --version option, which will be handled internally
     *  by this class
     */
    void AddVersionOption(const char shortopt = 0);

    std::string GetCommand() const
    {
        return command;
    }

    /**
     *  Parses the command line and calls the callback function.
     *
     * @param arg0   std::string containing the basic name of the current
     *               binary
     * @param argc   argc from main()
     * @param argv   argv from main()
     *
     * @return Returns the exit code of the callback function, or 0 if
     *         --help or --version was processed.
     * @throws CommandException on unknown options
     */
    int RunCommand(const std::string &arg0, int argc, char **argv);

    /**
     *  Parses the command line without calling the callback function
     */
    ParsedArgs::Ptr ParseCommandLine(const std::string &arg0, int argc, char **argv);


  private:
    const std::string command;
    const std::string description;
    const commandPtr command_func;
    std::vector<SingleCommandOption::Ptr> options;
    bool opt_version_added = false;

    std::string gen_help(const std::string &arg0) const;
};
