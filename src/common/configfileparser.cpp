//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   configfileparser.cpp
 *
 * @brief  Simple JSON based configuration file parser, targeting to
 *         integrate easily with the SingleCommand command line parser
 */

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "common/configfileparser.hpp"


namespace Configuration {

OptionMapEntry::OptionMapEntry(const std::string &option,
                               const std::string &field_label,
                               const std::string &description,
                               OptionValueType type)
    : option(option), field_label(field_label), description(description),
      type(type)
{
}


OptionMapEntry::OptionMapEntry(const std::string &option,
                               const std::string &field_label,
                               const std::string &exclusive_group,
                               const std::string &description,
                               OptionValueType type)
    : option(option), field_label(field_label), description(description),
      exclusive_group(exclusive_group), type(type)
{
}



void File::Parse(const Json::Value &config)
{
    configure_mapping();

    if (!config.isObject())
    {
        throw ConfigFileException("The configuration must be a JSON object");
    }

    // Copy the values and set the present flag in the
    // configured OptionMap for JSON fields being recognised.
    // Unknown fields are ignored.
    for (const auto &elm : config.getMemberNames())
    {
        auto it = std::find_if(map.begin(),
                               map.end(),
                               [&elm](const OptionMapEntry &e)
                               {
                                   return elm == e.field_label;
                               });
        if (map.end() == it)
        {
            continue;
        }

        const Json::Value &v = config[elm];
        switch (it->type)
        {
        case OptionValueType::Present:
            if (!v.isBool())
            {
                throw ConfigFileException("'" + elm + "' must be true or false");
            }
            it->present_value = v.asBool();
            break;

        case OptionValueType::Int:
            if (!v.isIntegral())
            {
                throw ConfigFileException("'" + elm + "' must be an integer");
            }
            it->value = std::to_string(v.asInt64());
            break;

        case OptionValueType::String:
            if (!v.isString())
            {
                throw ConfigFileException("'" + elm + "' must be a string");
            }
            it->value = v.asString();
            break;
        }
        it->present = true;
    }
}


void File::Load(const std::string &cfgfile)
{
    std::ifstream cfgs(cfgfile);
    if (cfgs.eof() || cfgs.fail())
    {
        throw ConfigFileException(cfgfile, "Could not open file");
    }

    std::stringstream buf;
    buf << cfgs.rdbuf();

    // Don't try to parse an empty file
    if (0 == buf.tellp() || buf.str().find_first_not_of(" \t\r\n") == std::string::npos)
    {
        return;
    }

    Json::Value jcfg;
    try
    {
        buf >> jcfg;
    }
    catch (const Json::Exception &excp)
    {
        throw ConfigFileException(cfgfile,
                                  "Error parsing file: " + std::string(excp.what()));
    }

    try
    {
        Parse(jcfg);
    }
    catch (const ConfigFileException &excp)
    {
        throw ConfigFileException(cfgfile, excp.GetDetail());
    }
}


std::vector<std::string> File::GetOptions(bool all_configured)
{
    configure_mapping();

    std::vector<std::string> opts;
    for (const auto &e : map)
    {
        if (all_configured
            || (e.present
                && (OptionValueType::Present == e.type ? e.present_value
                                                       : !e.value.empty())))
        {
            opts.push_back(e.option);
        }
    }
    return opts;
}


bool File::IsPresent(const std::string &key)
{
    return find_option(key)->present;
}


std::string File::GetValue(const std::string &key)
{
    auto it = find_option(key);
    if (!it->present)
    {
        throw OptionNotPresent(key);
    }

    if (OptionValueType::Present == it->type)
    {
        return (it->present_value ? "true" : "false");
    }
    return it->value;
}


void File::SetValue(const std::string &key, const std::string &value)
{
    auto it = find_option(key);
    if (OptionValueType::Present == it->type)
    {
        it->present = true;
        it->present_value = ("1" == value || "yes" == value || "true" == value);
        it->value.clear();
    }
    else
    {
        if (OptionValueType::Int == it->type && !value.empty()
            && value.find_first_not_of("-0123456789") != std::string::npos)
        {
            throw OptionException(key, "Value must be an integer");
        }
        it->value = value;
        it->present = !value.empty();
    }
}


void File::UnsetOption(const std::string &key)
{
    auto it = find_option(key);
    it->present = false;
    it->present_value = false;
    it->value.clear();
}


void File::CheckExclusiveOptions()
{
    configure_mapping();

    std::map<std::string, std::vector<std::string>> groups;
    for (const auto &e : map)
    {
        if (!e.exclusive_group.empty())
        {
            groups[e.exclusive_group].push_back(e.option);
        }
    }

    for (const auto &grp : groups)
    {
        std::vector<std::string> used;
        for (const auto &opt : grp.second)
        {
            if (IsPresent(opt))
            {
                used.push_back(opt);
            }
        }
        if (used.size() > 1)
        {
            throw ExclusiveOptionError(used);
        }
    }
}


std::vector<std::string> File::GetRelatedExclusiveOptions(const std::string &option)
{
    configure_mapping();

    std::vector<std::string> ret{};
    auto s = std::find_if(map.begin(),
                          map.end(),
                          [&option](const OptionMapEntry &e)
                          {
                              return option == e.option;
                          });
    if (map.end() == s || s->exclusive_group.empty())
    {
        return ret;
    }

    for (const auto &m : map)
    {
        if (m.option != option && s->exclusive_group == m.exclusive_group)
        {
            ret.push_back(m.option);
        }
    }
    return ret;
}


Json::Value File::Generate()
{
    configure_mapping();

    Json::Value ret(Json::objectValue);
    for (const auto &e : map)
    {
        if (!e.present)
        {
            continue;
        }
        switch (e.type)
        {
        case OptionValueType::Present:
            ret[e.field_label] = e.present_value;
            break;
        case OptionValueType::Int:
            ret[e.field_label] = Json::Value::Int64(std::stoll(e.value));
            break;
        case OptionValueType::String:
            ret[e.field_label] = e.value;
            break;
        }
        std::string comment = std::string("//  Option --") + e.option + " :: " + e.description;
        ret[e.field_label].setComment(comment, Json::CommentPlacement::commentBefore);
    }
    return ret;
}


void File::Save(const std::string &cfgfname)
{
    std::ofstream cfgfile(cfgfname);
    if (!empty())
    {
        cfgfile << Generate() << std::endl;
    }
    if (cfgfile.fail())
    {
        throw ConfigFileException(cfgfname, "Error saving the configuration file");
    }
    cfgfile.close();
}


bool File::empty() const
{
    return std::none_of(map.begin(),
                        map.end(),
                        [](const OptionMapEntry &e)
                        {
                            return e.present;
                        });
}


void File::configure_mapping()
{
    if (!map_configured)
    {
        map = ConfigureMapping();
        map_configured = true;
    }
}


OptionMap::iterator File::find_option(const std::string &key)
{
    configure_mapping();

    auto it = std::find_if(map.begin(),
                           map.end(),
                           [&key](const OptionMapEntry &e)
                           {
                               return key == e.option;
                           });
    if (it == map.end())
    {
        throw OptionNotFound(key);
    }
    return it;
}

} // namespace Configuration
