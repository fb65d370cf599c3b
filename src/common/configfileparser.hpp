//  cftunnel-monitor -- Cloudflare Tunnel health monitoring service
//
//  SPDX-License-Identifier: AGPL-3.0-only
//
//  Copyright (C) 2026  The cftunnel-monitor developers
//

/**
 * @file   configfileparser.hpp
 *
 * @brief  Simple JSON based configuration file parser, targeting to
 *         integrate easily with the SingleCommand command line parser
 */


#pragma once

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <json/json.h>

#include "common/cmdargparser-exceptions.hpp"


namespace Configuration {

/**
 *  Definition of value types used by the configuration file and how
 *  it will be interpreted by the command-line argument parser.
 */
enum class OptionValueType : uint8_t
{
    Int,    ///< Integer
    String, ///< String
    Present ///< Option is present, with not value argument
};


/**
 *   A single mapping between a command line option and the field it
 *   is stored in in the JSON based configuration file
 */
struct OptionMapEntry
{
    OptionMapEntry(const std::string &option,
                   const std::string &file_label,
                   const std::string &description,
                   OptionValueType type);

    OptionMapEntry(const std::string &option,
                   const std::string &file_label,
                   const std::string &exclusive_group,
                   const std::string &description,
                   OptionValueType type);


    friend std::ostream &operator<<(std::ostream &os, const OptionMapEntry &e)
    {
        if (!e.present)
        {
            return os;
        }
        os << e.description << ": ";
        switch (e.type)
        {
        case OptionValueType::Int:
        case OptionValueType::String:
            os << e.value;
            break;

        case OptionValueType::Present:
            os << (e.present_value ? "Yes" : "No");
            break;
        }
        return os << std::endl;
    }


    std::string option;          ///< Command line option name
    std::string field_label;     ///< Configuration file entry label
    std::string description;     ///< User friendly description
    std::string exclusive_group; ///< Belongs to a group with only one can be used
    OptionValueType type;        ///< Data type of this value
    bool present = false;        ///< Has this option been configured?
    bool present_value = false;  ///< Should the option be considered set or unset?
    std::string value;           ///< Value of the setting
};
using OptionMap = std::vector<OptionMapEntry>;


/**
 *  Generic JSON based configuration file parser which maps command line
 *  arguments with a field in the JSON configuration file.
 *
 *  This is a pure virtual class and the ConfigureMapping() method needs to
 *  to be implemented.
 */
class File
{
  public:
    using Ptr = std::shared_ptr<File>;

    File() = default;
    virtual ~File() = default;


    /**
     *  Parses configuration data from JSON::Value directly
     *
     * @param config  JSON::Value containing configuration data
     * @throws ConfigFileException if a value has an unexpected JSON type
     */
    virtual void Parse(const Json::Value &config);

    /**
     *  Loads a JSON configration file and parses it
     *
     * @param cfgfile  std::string containing the filename to parse
     * @throws ConfigFileException if there were issues opening or parsing the
     *         configuration file
     */
    void Load(const std::string &cfgfile);

    /**
     *  Retrieve an array of configured options
     *
     * @param  all_configured If set to true, all known options are listed,
     *                        regardless if they are set or not.
     *
     * @return Returns std::vector<std::string> of option names
     */
    std::vector<std::string> GetOptions(bool all_configured = false);

    /**
     *  Check if an option key is present or not
     *
     * @param key    std::string containing the option name to check
     * @return  Returns true if a value to the key is present.
     * @throws  OptionNotFound if the key is unknown.
     */
    bool IsPresent(const std::string &key);

    /**
     *  Retrieve the value of a specific configuration key
     *
     * @param key  std::string containing the option name to look up
     * @return  Returns std::string containing the value.  For
     *          OptionValueType::Present "true" or "false" is returned.
     * @throws  OptionNotFound if key is unknown or OptionNotPresent
     *          if the value is not set.
     */
    std::string GetValue(const std::string &key);

    /**
     *  Sets a value to a configuration option
     *
     * @param key   std::string of the command line option name to set
     * @param value std::string of the value to use.  For options of the
     *              OptionValueType::Present, the value must be "1", "yes"
     *              or "true" to be considered set.  An empty value for
     *              other types unsets the option.
     */
    void SetValue(const std::string &key, const std::string &value);

    void UnsetOption(const std::string &key);

    /**
     *  Checks that only a single option of each exclusive option group
     *  is in use.
     *
     *  @throws ExclusiveOptionError if two or more options within the
     *          same exclusive_group is found.
     */
    void CheckExclusiveOptions();

    /**
     *  Returns other options in the same exclusive option group
     *  as the given option
     *
     * @param option  std::string of the option to check
     * @return Returns a std::vector<std::string> of the related options
     */
    std::vector<std::string> GetRelatedExclusiveOptions(const std::string &option);

    /**
     *  Generates a Json::Value with all the set values
     *
     * @return  JSON::Values containing a prepared configuration file.
     */
    Json::Value Generate();

    /**
     *  Writes the currently set values to a configuration file
     *
     * @param cfgfname  std::string of the filename to use
     * @throws ConfigFileException if the file could not be written
     */
    void Save(const std::string &cfgfname);

    /**
     *  Check if the configuration contains anything
     *
     * @return  Returns true if no options are set.
     */
    bool empty() const;

    friend std::ostream &operator<<(std::ostream &os, const File &m)
    {
        for (const auto &e : m.map)
        {
            os << e;
        }
        return os;
    }


  protected:
    /**
     *  Provides the mapping between the command-line option names and
     *  their respective configuration file labels, value types and a
     *  human-readable description of the value.
     *
     * @return Must return a OptionMap to use.
     */
    virtual OptionMap ConfigureMapping() = 0;


  private:
    bool map_configured = false; ///< Has ConfigureMapping() been run?
    OptionMap map;               ///< Currently active configuration map

    void configure_mapping();
    OptionMap::iterator find_option(const std::string &key);
};

} // namespace Configuration
