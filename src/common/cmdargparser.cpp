//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   cmdargparser.cpp
 *
 * @brief  Command line argument parser for C++.  Built around getopt_long()
 */

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>

#include "common/utils.hpp"
#include "common/cmdargparser.hpp"
#include "common/configfileparser.hpp"


void ParsedArgs::ImportConfigFile(Configuration::File::Ptr config)
{
    for (const auto &opt : config->GetOptions())
    {
        // Remove all the related exclusive options in the parsed args.
        // The imported configuration file overrides the command line
        // arguments
        for (const auto &rel : config->GetRelatedExclusiveOptions(opt))
        {
            remove_arg(rel);
        }

        remove_arg(opt);
        key_value[opt].push_back(config->GetValue(opt));
        present.push_back(opt);
    }
}


void ParsedArgs::CheckExclusiveOptions(const ExclusiveGroups &args_exclusive) const
{
    for (const auto &arg : present)
    {
        for (const auto &group : args_exclusive)
        {
            if (std::find(group.begin(), group.end(), arg) == group.end())
            {
                continue;
            }

            // This argument is in an exclusiveness group; check if any
            // of the other options in the group has been used as well
            for (const auto &x : group)
            {
                if (arg != x
                    && std::find(present.begin(), present.end(), x) != present.end())
                {
                    throw ExclusiveOptionError(arg, group);
                }
            }
        }
    }
}


bool ParsedArgs::Present(const std::string &k) const
{
    return std::find(present.begin(), present.end(), k) != present.end();
}


unsigned int ParsedArgs::GetValueLen(const std::string &k) const noexcept
{
    auto it = key_value.find(k);
    return (key_value.end() != it ? it->second.size() : 0);
}


std::string ParsedArgs::GetValue(const std::string &k, const unsigned int idx) const
{
    auto it = key_value.find(k);
    if (key_value.end() == it || idx >= it->second.size())
    {
        throw OptionNotFound(k);
    }
    return it->second[idx];
}


std::string ParsedArgs::GetLastValue(const std::string &k) const
{
    auto it = key_value.find(k);
    if (key_value.end() == it || it->second.empty())
    {
        throw OptionNotFound(k);
    }
    return it->second.back();
}


bool ParsedArgs::GetLastBoolValue(const std::string &k) const
{
    std::string value = GetLastValue(k);
    if (("false" != value) && ("true" != value)
        && ("no" != value) && ("yes" != value))
    {
        throw OptionException(k, "Boolean options must be either 'false' or 'true'");
    }
    return "true" == value || "yes" == value;
}


unsigned int ParsedArgs::GetLastUIntValue(const std::string &k,
                                          const unsigned int min_val) const
{
    std::string value = GetLastValue(k);
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    {
        throw OptionException(k, "Value must be a positive integer");
    }

    unsigned long v = 0;
    try
    {
        v = std::stoul(value);
    }
    catch (const std::out_of_range &)
    {
        throw OptionException(k, "Value is too large");
    }
    if (v < min_val || v > 0xFFFFFFFFUL)
    {
        throw OptionException(k, "Value must be at least " + std::to_string(min_val));
    }
    return static_cast<unsigned int>(v);
}


void ParsedArgs::remove_arg(const std::string &opt)
{
    auto e = key_value.find(opt);
    if (e != key_value.end())
    {
        e->second.clear();
    }

    auto p = std::find(present.begin(), present.end(), opt);
    if (p != present.end())
    {
        present.erase(p);
    }
}



void RegisterParsedArgs::register_option(const std::string &k, const char *v)
{
    if (nullptr != v)
    {
        key_value[k].push_back(std::string(v));
    }
    if (!Present(k))
    {
        present.push_back(k);
    }
}


void RegisterParsedArgs::register_extra_args(const char *e)
{
    extra_args.push_back(std::string(e));
}


void RegisterParsedArgs::set_completed()
{
    completed = true;
}



SingleCommandOption::SingleCommandOption(const std::string &longopt,
                                         const char shrtopt,
                                         const std::string &help_text)
    : longopt(longopt), shortopt(shrtopt), help_text(help_text)
{
    getopt_option.name = this->longopt.c_str();
    getopt_option.has_arg = no_argument;
    getopt_option.flag = nullptr;
    getopt_option.val = shortopt;
}


SingleCommandOption::SingleCommandOption(const std::string &longopt,
                                         const char shrtopt,
                                         const std::string &metavar,
                                         const bool required,
                                         const std::string &help_text)
    : longopt(longopt), shortopt(shrtopt),
      metavar(metavar), help_text(help_text)
{
    getopt_option.name = this->longopt.c_str();
    getopt_option.has_arg = (required ? required_argument : optional_argument);
    getopt_option.flag = nullptr;
    getopt_option.val = shortopt;
}


std::string SingleCommandOption::getopt_optstring() const
{
    if (0 == shortopt)
    {
        return "";
    }

    std::string ret(1, shortopt);
    switch (getopt_option.has_arg)
    {
    case optional_argument:
        ret += "::";
        break;
    case required_argument:
        ret += ":";
        break;
    default:
        break;
    }
    return ret;
}


bool SingleCommandOption::check_short_option(const char o) const
{
    return 0 != shortopt && o == shortopt;
}


bool SingleCommandOption::check_long_option(const char *o) const
{
    return (nullptr != o && longopt == o);
}


std::string SingleCommandOption::get_option_name() const
{
    return longopt;
}


const struct option *SingleCommandOption::get_struct_option() const
{
    return &getopt_option;
}


std::string SingleCommandOption::gen_help_line(const unsigned int width) const
{
    std::stringstream r;

    // Keep the long options aligned under each other
    if (0 == shortopt)
    {
        r << "     ";
    }
    else
    {
        r << "-" << shortopt << " | ";
    }
    r << "--" << longopt;

    if (!metavar.empty())
    {
        if (required_argument == getopt_option.has_arg)
        {
            r << " " << metavar;
        }
        else
        {
            r << "[=" << metavar << "]";
        }
    }

    size_t l = r.str().size();
    if ((width - 3) < l)
    {
        // Too long; put the description on its own line
        r << std::endl
          << std::setw(width) << " ";
    }
    else
    {
        r << std::setw(width - l) << "";
    }
    r << " - " << help_text;
    return r.str();
}



SingleCommand::SingleCommand(const std::string &command,
                             const std::string &description,
                             const commandPtr cmdfunc)
    : command(command), description(description), command_func(cmdfunc)
{
    options.push_back(std::make_shared<SingleCommandOption>("help",
                                                            'h',
                                                            "This help screen"));
}


SingleCommandOption::Ptr SingleCommand::AddOption(const std::string &longopt,
                                                  const char shortopt,
                                                  const std::string &help_text)
{
    auto opt = std::make_shared<SingleCommandOption>(longopt, shortopt, help_text);
    options.push_back(opt);
    return opt;
}


SingleCommandOption::Ptr SingleCommand::AddOption(const std::string &longopt,
                                                  const char shortopt,
                                                  const std::string &metavar,
                                                  const bool required,
                                                  const std::string &help_text)
{
    auto opt = std::make_shared<SingleCommandOption>(longopt,
                                                     shortopt,
                                                     metavar,
                                                     required,
                                                     help_text);
    options.push_back(opt);
    return opt;
}


void SingleCommand::AddVersionOption(const char shortopt)
{
    (void)AddOption("version", shortopt, "Show version information");
    opt_version_added = true;
}


int SingleCommand::RunCommand(const std::string &arg0, int argc, char **argv)
{
    ParsedArgs::Ptr cmd_args = ParseCommandLine(arg0, argc, argv);
    return cmd_args->GetCompleted() ? command_func(cmd_args) : 0;
}


ParsedArgs::Ptr SingleCommand::ParseCommandLine(const std::string &arg0,
                                                int argc,
                                                char **argv)
{
    // getopt_long() expects the last record in the struct option array
    // to be an empty/zeroed struct option element
    std::vector<struct option> long_opts;
    std::string shortopts;
    for (const auto &opt : options)
    {
        long_opts.push_back(*opt->get_struct_option());
        shortopts += opt->getopt_optstring();
    }
    long_opts.push_back({nullptr, 0, nullptr, 0});

    auto cmd_args = std::make_shared<RegisterParsedArgs>(arg0);

    optind = 1; // Skip argv[0] which contains the program name
    opterr = 1;
    while (true)
    {
        int optidx = -1;
        int c = getopt_long(argc, argv, shortopts.c_str(), long_opts.data(), &optidx);
        if (-1 == c)
        {
            break;
        }

        if ('?' == c || ':' == c)
        {
            // getopt_long() has already reported the issue on stderr
            throw CommandException(command);
        }

        SingleCommandOption::Ptr match = nullptr;
        for (const auto &o : options)
        {
            if ((0 == c && optidx >= 0 && o->check_long_option(long_opts[optidx].name))
                || (0 != c && o->check_short_option(static_cast<char>(c))))
            {
                match = o;
                break;
            }
        }
        if (!match)
        {
            throw CommandException(command, "Unexpected option parsing result");
        }

        if ("help" == match->get_option_name())
        {
            std::cout << gen_help(arg0) << std::endl;
            return cmd_args;
        }
        if (opt_version_added && "version" == match->get_option_name())
        {
            std::cout << get_version(arg0) << std::endl;
            return cmd_args;
        }
        cmd_args->register_option(match->get_option_name(), optarg);
    }

    while (optind < argc)
    {
        cmd_args->register_extra_args(argv[optind++]);
    }
    cmd_args->set_completed();
    return cmd_args;
}


std::string SingleCommand::gen_help(const std::string &arg0) const
{
    std::stringstream r;
    r << arg0 << " - " << description << std::endl
      << std::endl;

    for (const auto &opt : options)
    {
        r << "   " << opt->gen_help_line() << std::endl;
    }
    return r.str();
}
