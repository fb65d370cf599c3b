//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   service-configfile.hpp
 *
 * @brief  Definition of the elements used in the cftunnel-monitor
 *         configuration file
 */

#pragma once

#include <memory>
#include <string>
#include "common/configfileparser.hpp"

using namespace Configuration;


class MonitorConfigFile : public virtual Configuration::File
{
  public:
    typedef std::shared_ptr<MonitorConfigFile> Ptr;

    MonitorConfigFile() = default;


  protected:
    Configuration::OptionMap ConfigureMapping() override
    {
        return {
            // clang-format off
            OptionMapEntry{"accounts-file", "accounts_file",
                           "File listing the monitored accounts",
                           OptionValueType::String},
            OptionMapEntry{"state-file", "state_file",
                           "File where the latest snapshots are saved",
                           OptionValueType::String},
            OptionMapEntry{"refresh-interval", "refresh_interval",
                           "Seconds between refresh cycles",
                           OptionValueType::Int},
            OptionMapEntry{"version-ttl", "version_ttl",
                           "Seconds the latest release version is cached",
                           OptionValueType::Int},
            OptionMapEntry{"request-timeout", "request_timeout",
                           "HTTP request timeout in seconds",
                           OptionValueType::Int},
            OptionMapEntry{"max-parallel-fetches", "max_parallel_fetches",
                           "Concurrent connection list requests per account",
                           OptionValueType::Int},
            OptionMapEntry{"ca-bundle", "ca_bundle",
                           "Trusted CA certificates (PEM)",
                           OptionValueType::String},
            OptionMapEntry{"api-host", "api_host",
                           "Tunnel provider API host",
                           OptionValueType::String},
            OptionMapEntry{"release-host", "release_host",
                           "Release feed host",
                           OptionValueType::String},
            OptionMapEntry{"release-path", "release_path",
                           "Release feed path",
                           OptionValueType::String},
            OptionMapEntry{"journald", "journald",
                           "log_method_group",
                           "Use systemd-journald",
                           OptionValueType::Present},
            OptionMapEntry{"syslog", "syslog",
                           "log_method_group",
                           "Use syslog",
                           OptionValueType::Present},
            OptionMapEntry{"syslog-facility", "syslog_facility",
                           "Syslog facility",
                           OptionValueType::String},
            OptionMapEntry{"log-file", "log_file",
                           "log_method_group",
                           "Log file",
                           OptionValueType::String},
            OptionMapEntry{"colour", "colour",
                           "Colour log lines",
                           OptionValueType::Present},
            OptionMapEntry{"colour-by-group", "colour_by_group",
                           "Colour log lines by sending component",
                           OptionValueType::Present},
            OptionMapEntry{"log-level", "log_level",
                           "Log level",
                           OptionValueType::Int},
            OptionMapEntry{"timestamp", "timestamp",
                           "Add timestamps to log lines",
                           OptionValueType::Present},
            // clang-format on
        };
    }
};
