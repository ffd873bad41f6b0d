// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"
#include "util/strencodings.h"

#include <cstdlib>
#include <cstring>
#include <fstream>

const char* const AGENTPAY_CONF_FILENAME = "agentpay.conf";

ArgsManager gArgs;

static RecursiveMutex csPathCached;
static fs::path pathCached;

static int atoi(const std::string& str)
{
    return ::atoi(str.c_str());
}

/** Interpret -nofoo as -foo=0 (and -nofoo=0 as -foo=1) */
static bool InterpretNegatedOption(std::string& key, std::string& val)
{
    // Only bare or boolean values negate, so "-network=testnet" is left alone.
    if (key.substr(0, 3) == "-no" && (val.empty() || val == "0" || val == "1")) {
        bool bool_val = val.empty() || atoi(val) != 0;
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
        return true;
    }
    return false;
}

static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string line;
    int linenr = 1;
    while (std::getline(stream, line)) {
        size_t comment = line.find('#');
        if (comment != std::string::npos) line.erase(comment);
        line = TrimString(line);
        if (line.empty()) {
            ++linenr;
            continue;
        }
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenr, line);
            return false;
        }
        std::string key = "-" + TrimString(line.substr(0, pos));
        std::string val = TrimString(line.substr(pos + 1));
        InterpretNegatedOption(key, val);
        m_config_args[key].push_back(val);
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFiles(std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    const std::string confPath = GetArg("-conf", AGENTPAY_CONF_FILENAME);
    fs::ifstream stream(GetConfigFile(confPath));

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    }
    return true;
}

bool ArgsManager::GetLast(const std::string& strArg, std::string& strValue) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.front();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result = it->second;
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string unused;
    return GetLast(strArg, unused);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::string value;
    return GetLast(strArg, value) && !InterpretBool(value);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string value;
    if (GetLast(strArg, value)) return value;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string value;
    int64_t n;
    if (GetLast(strArg, value) && ParseInt64(value, &n)) return n;
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string value;
    if (GetLast(strArg, value)) return InterpretBool(value);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ForceSetMultiArg(const std::string& strArg, const std::vector<std::string>& values)
{
    LOCK(cs_args);
    m_override_args[strArg] = values;
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    std::string ret = std::string(optIndent, ' ') + std::string(option) + std::string("\n");
    std::string indent(msgIndent, ' ');
    std::string line;
    for (size_t i = 0; i < message.size(); ++i) {
        if (line.size() + optIndent + msgIndent >= (size_t)screenWidth && message[i] == ' ') {
            ret += indent + line + "\n";
            line.clear();
            continue;
        }
        line += message[i];
    }
    if (!line.empty()) ret += indent + line + "\n";
    return ret + "\n";
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.agentpay
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".agentpay";
}

bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}

const fs::path& GetDataDir()
{
    LOCK(csPathCached);
    if (!pathCached.empty())
        return pathCached;

    if (gArgs.IsArgSet("-datadir")) {
        pathCached = fs::absolute(gArgs.GetArg("-datadir", ""));
    } else {
        pathCached = GetDefaultDataDir();
    }
    TryCreateDirectories(pathCached);
    return pathCached;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}
