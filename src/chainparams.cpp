// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"

#include "util/format.h"

#include <assert.h>
#include <stdexcept>

const std::string CBaseChainParams::MAIN = "mainnet";
const std::string CBaseChainParams::TESTNET = "testnet";

/**
 * Main network
 */
class CMainParams : public CChainParams
{
public:
    CMainParams()
    {
        strNetworkID = CBaseChainParams::MAIN;
        fTestnet = false;

        base58Prefixes[PUBKEY_ADDRESS] = std::vector<unsigned char>(1, 0);   // addresses start with '1'
        base58Prefixes[SCRIPT_ADDRESS] = std::vector<unsigned char>(1, 5);
        base58Prefixes[SECRET_KEY] = std::vector<unsigned char>(1, 128);     // WIF starts with '5', 'K' or 'L'

        nDustThreshold = 546;
        nDefaultFeePerK = 1000;
    }
};

/**
 * Testnet
 */
class CTestNetParams : public CChainParams
{
public:
    CTestNetParams()
    {
        strNetworkID = CBaseChainParams::TESTNET;
        fTestnet = true;

        base58Prefixes[PUBKEY_ADDRESS] = std::vector<unsigned char>(1, 111); // addresses start with 'm' or 'n'
        base58Prefixes[SCRIPT_ADDRESS] = std::vector<unsigned char>(1, 196);
        base58Prefixes[SECRET_KEY] = std::vector<unsigned char>(1, 239);     // WIF starts with '9' or 'c'

        nDustThreshold = 546;
        nDefaultFeePerK = 1000;
    }
};

static std::unique_ptr<CChainParams> globalChainParams;

const CChainParams& Params()
{
    assert(globalChainParams);
    return *globalChainParams;
}

std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain)
{
    if (chain == CBaseChainParams::MAIN)
        return std::unique_ptr<CChainParams>(new CMainParams());
    else if (chain == CBaseChainParams::TESTNET)
        return std::unique_ptr<CChainParams>(new CTestNetParams());
    throw std::runtime_error(strprintf("%s: Unknown chain %s.", __func__, chain));
}

void SelectParams(const std::string& network)
{
    globalChainParams = CreateChainParams(network);
}
