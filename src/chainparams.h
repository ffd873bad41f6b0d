// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_CHAINPARAMS_H
#define AGENTPAY_CHAINPARAMS_H

#include "amount.h"

#include <memory>
#include <string>
#include <vector>

/**
 * Network names accepted by -network.
 */
class CBaseChainParams
{
public:
    static const std::string MAIN;
    static const std::string TESTNET;
};

/**
 * CChainParams defines the address encoding and relay policy of the ledger
 * the escrow core settles on (mainnet or testnet).
 */
class CChainParams
{
public:
    enum Base58Type {
        PUBKEY_ADDRESS,
        SCRIPT_ADDRESS,
        SECRET_KEY,

        MAX_BASE58_TYPES
    };

    const std::vector<unsigned char>& Base58Prefix(Base58Type type) const { return base58Prefixes[type]; }
    /** Return the network string */
    const std::string& NetworkIDString() const { return strNetworkID; }
    /** Outputs below this value are not relayed. */
    CAmount DustThreshold() const { return nDustThreshold; }
    /** Default fee rate in satoshis per 1000 bytes. */
    CAmount DefaultFeePerK() const { return nDefaultFeePerK; }
    bool IsTestnet() const { return fTestnet; }

protected:
    CChainParams() {}

    std::string strNetworkID;
    std::vector<unsigned char> base58Prefixes[MAX_BASE58_TYPES];
    CAmount nDustThreshold;
    CAmount nDefaultFeePerK;
    bool fTestnet;
};

/**
 * Creates and returns a std::unique_ptr<CChainParams> of the chosen chain.
 * @returns a CChainParams* of the chosen chain.
 * @throws a std::runtime_error if the chain is not supported.
 */
std::unique_ptr<CChainParams> CreateChainParams(const std::string& chain);

/**
 * Return the currently selected parameters. This won't change after app
 * startup, except for unit tests.
 */
const CChainParams& Params();

/**
 * Sets the params returned by Params() to those for the given network.
 */
void SelectParams(const std::string& chain);

#endif // AGENTPAY_CHAINPARAMS_H
