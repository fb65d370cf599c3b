//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   accounts-file.cpp
 *
 * @brief  Implementation of the accounts file parser
 */

#include <fstream>
#include <set>
#include <sstream>

#include "common/cmdargparser-exceptions.hpp"
#include "monitor/accounts-file.hpp"


namespace TunnelMonitor {
namespace AccountsFile {

static std::string required_string(const Json::Value &entry,
                                   const std::string &field,
                                   const unsigned int idx)
{
    const Json::Value &v = entry[field];
    if (!v.isString() || v.asString().empty())
    {
        throw ConfigFileException("Account entry " + std::to_string(idx)
                                  + " is missing '" + field + "'");
    }
    return v.asString();
}


std::vector<AccountCredentials> Parse(const Json::Value &data)
{
    if (!data.isObject() || !data["accounts"].isArray())
    {
        throw ConfigFileException("An 'accounts' list is required");
    }

    std::vector<AccountCredentials> ret;
    std::set<std::string> seen;
    unsigned int idx = 0;
    for (const auto &entry : data["accounts"])
    {
        if (!entry.isObject())
        {
            throw ConfigFileException("Account entry " + std::to_string(idx)
                                      + " is not an object");
        }

        AccountCredentials creds;
        creds.account_id = required_string(entry, "account_id", idx);
        creds.api_token = required_string(entry, "api_token", idx);

        const Json::Value &fn = entry["friendly_name"];
        if (!fn.isNull() && !fn.isString())
        {
            throw ConfigFileException("Account entry " + std::to_string(idx)
                                      + ": 'friendly_name' must be a string");
        }
        creds.friendly_name = (fn.isString() && !fn.asString().empty()
                                   ? fn.asString()
                                   : creds.account_id);

        if (!seen.insert(creds.account_id).second)
        {
            throw ConfigFileException("Account " + creds.account_id
                                      + " is listed more than once");
        }
        ret.push_back(creds);
        ++idx;
    }
    return ret;
}


std::vector<AccountCredentials> Load(const std::string &filename)
{
    std::ifstream accfile(filename);
    if (accfile.fail())
    {
        throw ConfigFileException(filename, "Could not open file");
    }

    Json::Value data;
    try
    {
        accfile >> data;
    }
    catch (const Json::Exception &excp)
    {
        throw ConfigFileException(filename,
                                  "Error parsing file: " + std::string(excp.what()));
    }

    try
    {
        return Parse(data);
    }
    catch (const ConfigFileException &excp)
    {
        throw ConfigFileException(filename, excp.GetDetail());
    }
}

} // namespace AccountsFile
} // namespace TunnelMonitor
