// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SCRIPT_STANDARD_H
#define AGENTPAY_SCRIPT_STANDARD_H

#include "pubkey.h"
#include "script/script.h"

#include <string>
#include <vector>

/**
 * Locking and unlocking scripts used by the escrow core:
 * pay-to-pubkey-hash, bare m-of-n multisig and the data carrier.
 */

/** Largest key count that still encodes as a single OP_N. */
static const int MAX_MULTISIG_KEYS_OP_N = 16;

/**
 * Multisig redeem scripts spent by the coordinator never carry more than
 * this many signatures, whatever m the script declares.
 */
static const int MAX_MULTISIG_SPEND_SIGNATURES = 2;

/** OP_DUP OP_HASH160 <keyID> OP_EQUALVERIFY OP_CHECKSIG */
CScript GetScriptForDestination(const CKeyID& keyID);

/** Extract the key hash of a P2PKH script. */
bool ExtractDestination(const CScript& scriptPubKey, CKeyID& keyID);

/**
 * Create bare multisig locking script
 *
 * Keys are lower-cased, de-duplicated and sorted lexicographically by hex
 * before embedding, so every participant derives the same script.
 *
 * @param pubkeysHex  hex public keys (any order, any case)
 * @param nRequired   signatures needed (m), 1 <= m <= n
 * @param scriptOut   Output: OP_m <sorted keys> OP_n OP_CHECKMULTISIG
 * @param strError    Output: reason on failure
 * @return            true on success
 */
bool CreateMultisigScript(
    const std::vector<std::string>& pubkeysHex,
    int nRequired,
    CScript& scriptOut,
    std::string& strError
);

/**
 * Decode multisig locking script parameters
 *
 * @param script     locking script to decode
 * @param nRequired  Output: m
 * @param pubkeys    Output: embedded keys, in script order
 * @return           true if script is exactly OP_m <keys> OP_n OP_CHECKMULTISIG
 */
bool DecodeMultisigScript(
    const CScript& script,
    int& nRequired,
    std::vector<std::vector<unsigned char>>& pubkeys
);

/**
 * Check if script is a bare multisig script
 */
bool IsMultisigScript(const CScript& script);

/**
 * Create scriptSig for a multisig spend: OP_0 followed by the checksig
 * signatures, already ordered by key position in the locking script.
 */
CScript CreateMultisigSpend(const std::vector<std::vector<unsigned char>>& sigs);

/**
 * Create scriptSig for a P2PKH spend: <sig> <pubkey>
 */
CScript CreateP2PKHSpend(
    const std::vector<unsigned char>& sig,
    const CPubKey& pubkey
);

/** OP_FALSE OP_RETURN <data> */
CScript GetScriptForDataCarrier(const std::vector<unsigned char>& data);

/** Extract the single push of a data carrier output. */
bool DecodeDataCarrier(const CScript& script, std::vector<unsigned char>& data);

#endif // AGENTPAY_SCRIPT_STANDARD_H
