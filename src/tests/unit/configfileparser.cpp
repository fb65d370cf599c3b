//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   configfileparser.cpp
 *
 * @brief  Unit test for Configuration::File and related classes
 */

#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include <json/json.h>

#include "common/configfileparser.hpp"

using namespace Configuration;


namespace unittest {

TEST(OptionMapEntry, stringstream_rendering)
{
    OptionMapEntry interval{"refresh-interval", "refresh_interval",
                            "Refresh interval", OptionValueType::Int};
    std::stringstream r1;
    r1 << interval;
    EXPECT_EQ(r1.str(), "") << "Unset option rendered";

    interval.value = "60";
    interval.present = true;
    std::stringstream r2;
    r2 << interval;
    EXPECT_EQ(r2.str(), "Refresh interval: 60\n");

    OptionMapEntry once{"once", "once", "Single run", OptionValueType::Present};
    once.present = true;
    std::stringstream r3;
    r3 << once;
    EXPECT_EQ(r3.str(), "Single run: No\n");
    once.present_value = true;
    std::stringstream r4;
    r4 << once;
    EXPECT_EQ(r4.str(), "Single run: Yes\n");
}


class TestFile : public Configuration::File
{
  public:
    using Ptr = std::unique_ptr<TestFile>;

  protected:
    Configuration::OptionMap ConfigureMapping() override
    {
        return {
            OptionMapEntry{"refresh-interval", "refresh_interval",
                           "Refresh interval", OptionValueType::Int},
            OptionMapEntry{"accounts-file", "accounts_file",
                           "Accounts file", OptionValueType::String},
            OptionMapEntry{"timestamp", "timestamp",
                           "Timestamps", OptionValueType::Present},
            OptionMapEntry{"colour", "colour",
                           "Colours", OptionValueType::Present},
            OptionMapEntry{"syslog", "syslog", "log_method",
                           "Use syslog", OptionValueType::Present},
            OptionMapEntry{"journald", "journald", "log_method",
                           "Use journald", OptionValueType::Present},
            OptionMapEntry{"log-file", "log_file", "log_method",
                           "Log file", OptionValueType::String}};
    }
};


class ConfigurationFile : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        testfile.reset(new TestFile());
        fname = ::testing::TempDir() + "tunmon-cfgtest-"
                + std::to_string(getpid()) + ".json";
        unlink(fname.c_str());
    }

    void TearDown() override
    {
        unlink(fname.c_str());
    }

    void write_file(const std::string &content)
    {
        std::ofstream out(fname);
        out << content;
    }

  public:
    TestFile::Ptr testfile;
    std::string fname;
};


TEST_F(ConfigurationFile, parse_types)
{
    Json::Value data;
    data["refresh_interval"] = 30;
    data["accounts_file"] = "/etc/cftunnel-monitor/accounts.json";
    data["timestamp"] = true;
    data["unknown_field"] = "ignored";
    testfile->Parse(data);

    EXPECT_EQ(testfile->GetValue("refresh-interval"), "30");
    EXPECT_EQ(testfile->GetValue("accounts-file"), "/etc/cftunnel-monitor/accounts.json");
    EXPECT_EQ(testfile->GetValue("timestamp"), "true");
    EXPECT_FALSE(testfile->IsPresent("colour"));
    EXPECT_THROW(testfile->GetValue("colour"), OptionNotPresent);
    EXPECT_THROW(testfile->IsPresent("unknown-field"), OptionNotFound);
}


TEST_F(ConfigurationFile, parse_wrong_types)
{
    Json::Value d1;
    d1["refresh_interval"] = "sixty";
    EXPECT_THROW(testfile->Parse(d1), ConfigFileException);

    Json::Value d2;
    d2["accounts_file"] = 42;
    EXPECT_THROW(testfile->Parse(d2), ConfigFileException);

    Json::Value d3;
    d3["timestamp"] = "yes";
    EXPECT_THROW(testfile->Parse(d3), ConfigFileException);

    EXPECT_THROW(testfile->Parse(Json::Value(Json::arrayValue)), ConfigFileException);
}


TEST_F(ConfigurationFile, setval)
{
    testfile->SetValue("refresh-interval", "120");
    EXPECT_TRUE(testfile->IsPresent("refresh-interval"));
    EXPECT_THROW(testfile->SetValue("refresh-interval", "2m"), OptionException);

    for (const auto &v : {"1", "yes", "true"})
    {
        testfile->SetValue("timestamp", v);
        EXPECT_EQ(testfile->GetValue("timestamp"), "true") << "Value: " << v;
    }
    for (const auto &v : {"0", "no", "false", "abc"})
    {
        testfile->SetValue("timestamp", v);
        EXPECT_EQ(testfile->GetValue("timestamp"), "false") << "Value: " << v;
    }

    testfile->SetValue("accounts-file", "");
    EXPECT_FALSE(testfile->IsPresent("accounts-file"))
        << "An empty value must unset the option";
}


TEST_F(ConfigurationFile, getoptions_skips_false_flags)
{
    Json::Value data;
    data["timestamp"] = true;
    data["colour"] = false;
    data["accounts_file"] = "accounts.json";
    testfile->Parse(data);

    EXPECT_EQ(testfile->GetOptions(),
              (std::vector<std::string>{"accounts-file", "timestamp"}));
    EXPECT_EQ(testfile->GetOptions(true).size(), 7u);
}


TEST_F(ConfigurationFile, load_missing_and_empty)
{
    EXPECT_THROW(testfile->Load("/nonexistent/tunmon-config.json"), ConfigFileException);

    write_file("  \n");
    testfile->Load(fname);
    EXPECT_TRUE(testfile->empty()) << "Empty file resulted in parsed data";

    write_file("{ \"refresh_interval\": ");
    EXPECT_THROW(testfile->Load(fname), ConfigFileException);
}


TEST_F(ConfigurationFile, load_error_names_the_file)
{
    write_file(R"({"refresh_interval": true})");
    try
    {
        testfile->Load(fname);
        FAIL() << "ConfigFileException was not thrown";
    }
    catch (const ConfigFileException &excp)
    {
        const std::string msg(excp.what());
        EXPECT_NE(msg.find(fname), std::string::npos) << msg;
        EXPECT_NE(msg.find("refresh_interval"), std::string::npos) << msg;
    }
}


TEST_F(ConfigurationFile, save_and_reload)
{
    testfile->SetValue("refresh-interval", "45");
    testfile->SetValue("log-file", "/var/log/tunmon.log");
    testfile->SetValue("colour", "yes");
    testfile->Save(fname);

    TestFile reloaded;
    reloaded.Load(fname);
    EXPECT_EQ(reloaded.GetValue("refresh-interval"), "45");
    EXPECT_EQ(reloaded.GetValue("log-file"), "/var/log/tunmon.log");
    EXPECT_EQ(reloaded.GetValue("colour"), "true");
    EXPECT_FALSE(reloaded.IsPresent("syslog"));
}


TEST_F(ConfigurationFile, save_empty)
{
    testfile->Save(fname);

    struct stat fs;
    ASSERT_EQ(stat(fname.c_str(), &fs), 0) << "Configuration file not created";
    EXPECT_EQ(fs.st_size, 0) << "Saved configuration file is not empty";
}


TEST_F(ConfigurationFile, exclusive_options)
{
    Json::Value ok;
    ok["syslog"] = true;
    ok["timestamp"] = true;
    testfile->Parse(ok);
    EXPECT_NO_THROW(testfile->CheckExclusiveOptions());

    Json::Value bad;
    bad["log_file"] = "/tmp/log";
    testfile->Parse(bad);
    EXPECT_THROW(testfile->CheckExclusiveOptions(), ExclusiveOptionError);
}


TEST_F(ConfigurationFile, related_options)
{
    auto related = testfile->GetRelatedExclusiveOptions("syslog");
    ASSERT_EQ(related.size(), 2u);
    EXPECT_TRUE(std::find(related.begin(), related.end(), "journald") != related.end());
    EXPECT_TRUE(std::find(related.begin(), related.end(), "log-file") != related.end());
    EXPECT_TRUE(testfile->GetRelatedExclusiveOptions("timestamp").empty());
}

} // namespace unittest
