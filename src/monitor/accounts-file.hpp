//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   accounts-file.hpp
 *
 * @brief  Parser of the JSON file listing the monitored accounts
 */

#pragma once

#include <string>
#include <vector>
#include <json/json.h>

#include "monitor/records.hpp"


namespace TunnelMonitor {
namespace AccountsFile {

/**
 *  Parse the accounts list.  The expected structure is
 *
 *  {"accounts": [{"account_id": "...", "api_token": "...",
 *                 "friendly_name": "..."}, ...]}
 *
 *  friendly_name is optional and defaults to the account id.
 *
 * @param data  Json::Value with the file contents
 *
 * @return std::vector<AccountCredentials> in the order of the file
 *
 * @throws ConfigFileException on missing fields or duplicated accounts
 */
std::vector<AccountCredentials> Parse(const Json::Value &data);

/**
 *  Read and parse an accounts file
 *
 * @throws ConfigFileException if the file cannot be read or parsed
 */
std::vector<AccountCredentials> Load(const std::string &filename);

} // namespace AccountsFile
} // namespace TunnelMonitor
