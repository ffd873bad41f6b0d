// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef AGENTPAY_UTIL_SYSTEM_H
#define AGENTPAY_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char* const AGENTPAY_CONF_FILENAME;

fs::path GetDefaultDataDir();
/** Returns the -datadir path, creating it when missing. */
const fs::path& GetDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);
bool TryCreateDirectories(const fs::path& p);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

public:
    /**
     * Parse "-name=value" / "-noname" style command line arguments. A
     * leading double dash is accepted as well.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);
    /** Read key=value lines from the config file; command line wins. */
    bool ReadConfigFiles(std::string& error);
    bool ReadConfigStream(std::istream& stream, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);
    void ForceSetMultiArg(const std::string& strArg, const std::vector<std::string>& values);

    void ClearArgs();

private:
    bool GetLast(const std::string& strArg, std::string& strValue) const;
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // AGENTPAY_UTIL_SYSTEM_H
