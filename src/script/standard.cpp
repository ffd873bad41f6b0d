// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/standard.h"

#include "util/format.h"
#include "util/strencodings.h"

#include <algorithm>

CScript GetScriptForDestination(const CKeyID& keyID)
{
    CScript script;
    script << OP_DUP << OP_HASH160 << ToByteVector(keyID) << OP_EQUALVERIFY << OP_CHECKSIG;
    return script;
}

bool ExtractDestination(const CScript& scriptPubKey, CKeyID& keyID)
{
    if (!scriptPubKey.IsPayToPubKeyHash())
        return false;
    keyID = CKeyID(uint160(std::vector<unsigned char>(scriptPubKey.begin() + 3, scriptPubKey.begin() + 23)));
    return true;
}

bool CreateMultisigScript(
    const std::vector<std::string>& pubkeysHex,
    int nRequired,
    CScript& scriptOut,
    std::string& strError)
{
    std::vector<std::string> keys;
    for (const std::string& hex : pubkeysHex) {
        std::string lower = ToLower(TrimString(hex));
        if (!IsHex(lower)) {
            strError = strprintf("Invalid public key hex: %s", hex);
            return false;
        }
        CPubKey pubkey(ParseHex(lower));
        if (!pubkey.IsFullyValid()) {
            strError = strprintf("Invalid public key: %s", hex);
            return false;
        }
        keys.push_back(lower);
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    const int nKeys = (int)keys.size();
    if (nKeys < 2) {
        strError = "At least two distinct public keys are required";
        return false;
    }
    if (nKeys > MAX_MULTISIG_KEYS_OP_N) {
        strError = strprintf("Too many public keys (%d > %d)", nKeys, MAX_MULTISIG_KEYS_OP_N);
        return false;
    }
    if (nRequired < 1 || nRequired > nKeys) {
        strError = strprintf("Required signatures must be between 1 and %d (got %d)", nKeys, nRequired);
        return false;
    }

    CScript script;
    script << CScript::EncodeOP_N(nRequired);
    for (const std::string& key : keys) {
        script << ParseHex(key);
    }
    script << CScript::EncodeOP_N(nKeys);
    script << OP_CHECKMULTISIG;

    scriptOut = script;
    return true;
}

bool DecodeMultisigScript(
    const CScript& script,
    int& nRequired,
    std::vector<std::vector<unsigned char>>& pubkeys)
{
    std::vector<unsigned char> data;
    opcodetype opcode;
    CScript::const_iterator it = script.begin();

    // OP_m
    if (!script.GetOp(it, opcode) || opcode < OP_1 || opcode > OP_16)
        return false;
    const int m = CScript::DecodeOP_N(opcode);

    // keys until OP_n
    std::vector<std::vector<unsigned char>> keys;
    while (true) {
        if (!script.GetOp(it, opcode, data))
            return false;
        if (opcode >= OP_1 && opcode <= OP_16)
            break;
        if (opcode > OP_PUSHDATA4 || (data.size() != CPubKey::COMPRESSED_SIZE && data.size() != CPubKey::SIZE))
            return false;
        keys.push_back(data);
    }

    // OP_n must match the key count
    const int n = CScript::DecodeOP_N(opcode);
    if (n != (int)keys.size() || m > n)
        return false;

    // OP_CHECKMULTISIG, and nothing after it
    if (!script.GetOp(it, opcode) || opcode != OP_CHECKMULTISIG)
        return false;
    if (it != script.end())
        return false;

    nRequired = m;
    pubkeys = keys;
    return true;
}

bool IsMultisigScript(const CScript& script)
{
    int m;
    std::vector<std::vector<unsigned char>> keys;
    return DecodeMultisigScript(script, m, keys);
}

CScript CreateMultisigSpend(const std::vector<std::vector<unsigned char>>& sigs)
{
    CScript script;
    // OP_CHECKMULTISIG pops one extra stack element
    script << OP_0;
    for (const auto& sig : sigs) {
        script << sig;
    }
    return script;
}

CScript CreateP2PKHSpend(
    const std::vector<unsigned char>& sig,
    const CPubKey& pubkey)
{
    CScript script;
    script << sig;
    script << ToByteVector(pubkey);
    return script;
}

CScript GetScriptForDataCarrier(const std::vector<unsigned char>& data)
{
    CScript script;
    script << OP_FALSE << OP_RETURN << data;
    return script;
}

bool DecodeDataCarrier(const CScript& script, std::vector<unsigned char>& data)
{
    opcodetype opcode;
    CScript::const_iterator it = script.begin();

    if (!script.GetOp(it, opcode) || opcode != OP_FALSE)
        return false;
    if (!script.GetOp(it, opcode) || opcode != OP_RETURN)
        return false;
    if (!script.GetOp(it, opcode, data) || opcode > OP_PUSHDATA4)
        return false;
    return it == script.end();
}
