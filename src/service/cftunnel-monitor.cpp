//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   cftunnel-monitor.cpp
 *
 * @brief  The cftunnel-monitor service program
 */

#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <syslog.h>
#include <glib.h>
#include <glib-unix.h>

// The Core library log integration must be included before
// any of the Core library headers
#include "log/core-logger.hpp"

#include <openvpn/init/initprocess.hpp>

#include "build-config.h"
#include "common/cmdargparser.hpp"
#include "common/utils.hpp"
#include "log/ansicolours.hpp"
#include "log/log-sender.hpp"
#include "log/logwriter.hpp"
#include "log/logwriters/implementations.hpp"
#include "monitor/accounts-file.hpp"
#include "monitor/api-client.hpp"
#include "monitor/core-http-transport.hpp"
#include "monitor/refresh-orchestrator.hpp"
#include "monitor/snapshot-json.hpp"
#include "service/service-configfile.hpp"

using namespace TunnelMonitor;

#define COMMAND_NAME "cftunnel-monitor"


/**
 *  Write the effective options to a new configuration file
 */
static int generate_config(ParsedArgs::Ptr args)
{
    const std::string fname = args->GetLastValue("generate-config");

    MonitorConfigFile cfg;
    for (const auto &opt : cfg.GetOptions(true))
    {
        if (!args->Present(opt))
        {
            continue;
        }
        cfg.SetValue(opt,
                     (args->GetValueLen(opt) > 0 ? args->GetLastValue(opt)
                                                 : "true"));
    }
    cfg.CheckExclusiveOptions();
    cfg.Save(fname);
    std::cout << "Configuration saved to " << fname << std::endl;
    return 0;
}


/**
 *  Check the API token of every account.  Accounts with a rejected
 *  token are removed from the list.
 */
static std::vector<AccountCredentials> verify_accounts(APIClient::Ptr api,
                                                       LogSender::Ptr log,
                                                       const std::vector<AccountCredentials> &accounts)
{
    std::vector<AccountCredentials> ret;
    for (const auto &acc : accounts)
    {
        TokenStatus st = api->VerifyToken(acc.api_token);
        switch (st)
        {
        case TokenStatus::VALID:
            log->LogVerb1("API token for " + acc.friendly_name + " is valid");
            ret.push_back(acc);
            break;
        case TokenStatus::INVALID:
            log->LogCritical("API token for " + acc.friendly_name
                             + " was rejected, account skipped");
            break;
        case TokenStatus::CONNECTIVITY_ERROR:
            log->LogWarn("Could not verify the API token for "
                         + acc.friendly_name + ", continuing");
            ret.push_back(acc);
            break;
        }
    }
    return ret;
}


static int monitor_service(ParsedArgs::Ptr args)
{
    // Load and parse the configuration file
    if (args->Present("config"))
    {
        auto cfgfile = std::make_shared<MonitorConfigFile>();
        cfgfile->Load(args->GetLastValue("config"));
        try
        {
            cfgfile->CheckExclusiveOptions();
        }
        catch (const ExclusiveOptionError &err)
        {
            throw CommandException(COMMAND_NAME,
                                   "Error parsing configuration file ("
                                       + args->GetLastValue("config")
                                       + "): " + err.what());
        }
        args->ImportConfigFile(cfgfile);
    }

    try
    {
        args->CheckExclusiveOptions({{"syslog", "journald", "log-file"},
                                     {"syslog", "journald", "colour"},
                                     {"syslog", "journald", "colour-by-group"}});
    }
    catch (const ExclusiveOptionError &excp)
    {
        throw CommandException(COMMAND_NAME, excp.what());
    }

    if (args->Present("generate-config"))
    {
        return generate_config(args);
    }

    unsigned int log_level = 3;
    if (args->Present("log-level"))
    {
        log_level = args->GetLastUIntValue("log-level", 0);
        if (log_level > 6)
        {
            throw CommandException(COMMAND_NAME,
                                   "--log-level can only be between 0 and 6");
        }
    }

    if (!args->Present("accounts-file"))
    {
        throw CommandException(COMMAND_NAME, "--accounts-file is required");
    }
    std::vector<AccountCredentials> accounts = AccountsFile::Load(args->GetLastValue("accounts-file"));
    if (accounts.empty())
    {
        throw CommandException(COMMAND_NAME, "No accounts configured");
    }

    OrchestratorSettings orchset;
    if (args->Present("refresh-interval"))
    {
        orchset.monitor.refresh_interval = std::chrono::seconds(args->GetLastUIntValue("refresh-interval", 1));
    }
    if (args->Present("max-parallel-fetches"))
    {
        orchset.monitor.max_parallel_fetches = args->GetLastUIntValue("max-parallel-fetches", 1);
    }
    if (args->Present("version-ttl"))
    {
        orchset.version_ttl = std::chrono::seconds(args->GetLastUIntValue("version-ttl", 1));
    }

    APIClientSettings apiset;
    if (args->Present("request-timeout"))
    {
        apiset.timeout = std::chrono::seconds(args->GetLastUIntValue("request-timeout", 1));
    }
    if (args->Present("api-host"))
    {
        apiset.api_host = args->GetLastValue("api-host");
    }
    if (args->Present("release-host"))
    {
        apiset.release_host = args->GetLastValue("release-host");
    }
    if (args->Present("release-path"))
    {
        apiset.release_path = args->GetLastValue("release-path");
    }
    const std::string ca_bundle = (args->Present("ca-bundle")
                                       ? args->GetLastValue("ca-bundle")
                                       : TUNMON_DEFAULT_CA_BUNDLE);

    // Open a log destination.  With --once the snapshot goes to stdout,
    // so the log lines are sent to stderr instead.
    const bool run_once = args->Present("once");
    std::ofstream logfs;
    std::streambuf *logstream;
    if (args->Present("log-file"))
    {
        logfs.open(args->GetLastValue("log-file"), std::ios_base::app);
        if (logfs.fail())
        {
            throw CommandException(COMMAND_NAME,
                                   "Could not open log file "
                                       + args->GetLastValue("log-file"));
        }
        logstream = logfs.rdbuf();
    }
    else
    {
        logstream = (run_once ? std::cerr.rdbuf() : std::cout.rdbuf());
    }
    std::ostream logfile(logstream);

    // Prepare the appropriate log writer
    LogWriter::Ptr logwr = nullptr;
#ifdef HAVE_SYSTEMD
    if (args->Present("journald"))
    {
        logwr.reset(new JournaldWriter(COMMAND_NAME));
    }
    else
#endif // HAVE_SYSTEMD
        if (args->Present("syslog"))
    {
        int facility = LOG_DAEMON;
        if (args->Present("syslog-facility"))
        {
            try
            {
                facility = SyslogWriter::ConvertLogFacility(args->GetLastValue("syslog-facility"));
            }
            catch (const SyslogException &excp)
            {
                throw CommandException(COMMAND_NAME, excp.what());
            }
        }
        logwr.reset(new SyslogWriter(simple_basename(args->GetArgv0()), facility));
    }
    else if (args->Present("colour") || args->Present("colour-by-group")
             || (!args->Present("log-file") && is_colour_terminal()))
    {
        ColourEngine::Ptr colourengine(new ANSIColours());
        if (args->Present("colour-by-group"))
        {
            colourengine->SetColourMode(ColourEngine::ColourMode::BY_GROUP);
        }
        logwr.reset(new ColourStreamWriter(logfile, std::move(colourengine)));
    }
    else
    {
        logwr.reset(new StreamLogWriter(logfile));
    }
    logwr->EnableTimestamp(args->Present("timestamp"));

    LogSender::Ptr log = LogSender::Create(LogGroup::SERVICE, logwr, log_level);
    log->LogInfo(get_version(args->GetArgv0()));
    log->LogVerb1("Log method: " + logwr->GetLogWriterInfo());

    CoreLog::Connect(log->Derive(LogGroup::CORELIB, nullptr));
    InitProcess::Init init;

    LogSender::Ptr apilog = log->Derive(LogGroup::APICLIENT, nullptr);
    HTTP::Transport::Ptr transport = std::make_shared<HTTP::CoreTransport>(apilog, ca_bundle);
    log->LogVerb2("HTTP transport: " + transport->GetTransportInfo());
    APIClient::Ptr api = APIClient::Create(transport, apilog, apiset);

    if (args->Present("verify-credentials"))
    {
        accounts = verify_accounts(api, log, accounts);
        if (accounts.empty())
        {
            log->LogFATAL("No account with a usable API token");
            CoreLog::Disconnect();
            return 1;
        }
    }

    auto orchestrator = RefreshOrchestrator::Create(api,
                                                    log->Derive(LogGroup::REFRESH, nullptr),
                                                    orchset);
    for (const auto &acc : accounts)
    {
        orchestrator->AddAccount(acc);
    }

    if (args->Present("state-file"))
    {
        StateFileWriter::Ptr statefile = StateFileWriter::Create(args->GetLastValue("state-file"),
                                                                 log);
        orchestrator->SetPublishCallback([statefile](const AccountStatus &status)
                                         {
                                             statefile->Update(status);
                                         });
        orchestrator->SetRemoveCallback([statefile](const std::string &account_id)
                                        {
                                            statefile->Remove(account_id);
                                        });
        log->LogVerb1("Saving snapshots to " + statefile->GetFilename());
    }

    int ret = 0;
    if (run_once)
    {
        ret = (orchestrator->RefreshAll() ? 0 : 1);
        std::cout << SnapshotJSON::Export(orchestrator->GetAccountStatus())
                  << std::endl;
    }
    else
    {
        GMainLoop *main_loop = g_main_loop_new(NULL, FALSE);
        g_unix_signal_add(SIGINT, stop_handler, main_loop);
        g_unix_signal_add(SIGTERM, stop_handler, main_loop);

        orchestrator->Start();
        g_main_loop_run(main_loop);
        orchestrator->Stop();
        g_main_loop_unref(main_loop);
        log->LogInfo("Shutting down");
    }

    CoreLog::Disconnect();
    return ret;
}


int main(int argc, char **argv)
{
    SingleCommand argparser(COMMAND_NAME,
                            "Cloudflare Tunnel health monitoring service",
                            monitor_service);
    argparser.AddVersionOption();
    argparser.AddOption("config", 'c', "FILE", true,
                        "Read options from a JSON configuration file");
    argparser.AddOption("generate-config", 0, "FILE", true,
                        "Save the given options to a configuration file and exit");
    argparser.AddOption("accounts-file", 'a', "FILE", true,
                        "JSON file listing the accounts to monitor");
    argparser.AddOption("state-file", 's', "FILE", true,
                        "Save the latest snapshots of all accounts to FILE");
    argparser.AddOption("once", 0,
                        "Run a single refresh cycle and print the result as JSON");
    argparser.AddOption("verify-credentials", 0,
                        "Verify the API tokens before starting");
    argparser.AddOption("refresh-interval", 0, "SECS", true,
                        "Seconds between refresh cycles (default 60)");
    argparser.AddOption("version-ttl", 0, "SECS", true,
                        "Seconds to cache the latest cloudflared version (default 3600)");
    argparser.AddOption("request-timeout", 0, "SECS", true,
                        "HTTP request timeout (default 15)");
    argparser.AddOption("max-parallel-fetches", 0, "NUM", true,
                        "Concurrent tunnel connection requests (default 4)");
    argparser.AddOption("ca-bundle", 0, "FILE", true,
                        "PEM file with trusted CA certificates");
    argparser.AddOption("api-host", 0, "HOST", true,
                        "Tunnel provider API host");
    argparser.AddOption("release-host", 0, "HOST", true,
                        "cloudflared release feed host");
    argparser.AddOption("release-path", 0, "PATH", true,
                        "cloudflared release feed path");
    argparser.AddOption("log-level", 0, "LEVEL", true,
                        "Set the log verbosity level (default 3)");
    argparser.AddOption("timestamp", 0,
                        "Print timestamps on each log entry");
    argparser.AddOption("colour", 0,
                        "Use colours to categorize log events");
    argparser.AddOption("colour-by-group", 0,
                        "Colour log events by the sending component");
#ifdef HAVE_SYSTEMD
    argparser.AddOption("journald", 0,
                        "Send all log events to systemd-journald");
#endif // HAVE_SYSTEMD
    argparser.AddOption("syslog", 0,
                        "Send all log events to syslog");
    argparser.AddOption("syslog-facility", 0, "FACILITY", true,
                        "Use a specific syslog facility (Default: LOG_DAEMON)");
    argparser.AddOption("log-file", 0, "FILE", true,
                        "Log events to file");

    try
    {
        return argparser.RunCommand(simple_basename(argv[0]), argc, argv);
    }
    catch (const CommandException &excp)
    {
        if (excp.gotErrorMessage())
        {
            std::cerr << excp.getCommand() << ": " << excp.what() << std::endl;
        }
        return 2;
    }
    catch (const CommandArgBaseException &excp)
    {
        std::cerr << COMMAND_NAME << ": " << excp.what() << std::endl;
        return 2;
    }
    catch (const LogException &excp)
    {
        std::cerr << COMMAND_NAME << ": " << excp.what() << std::endl;
        return 2;
    }
}
