// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key_io.h"

#include "chainparams.h"
#include "util/strencodings.h"

#include <algorithm>
#include <assert.h>
#include <string.h>

#include <openssl/crypto.h>

std::string EncodeDestination(const CKeyID& keyID)
{
    std::vector<unsigned char> data = Params().Base58Prefix(CChainParams::PUBKEY_ADDRESS);
    data.insert(data.end(), keyID.begin(), keyID.end());
    return EncodeBase58Check(data);
}

bool DecodeDestination(const std::string& str, CKeyID& keyID)
{
    std::vector<unsigned char> data;
    if (!DecodeBase58Check(str, data)) {
        return false;
    }
    const std::vector<unsigned char>& pubkey_prefix = Params().Base58Prefix(CChainParams::PUBKEY_ADDRESS);
    if (data.size() == keyID.size() + pubkey_prefix.size() && std::equal(pubkey_prefix.begin(), pubkey_prefix.end(), data.begin())) {
        std::copy(data.begin() + pubkey_prefix.size(), data.end(), keyID.begin());
        return true;
    }
    return false;
}

bool IsValidDestinationString(const std::string& str)
{
    CKeyID unused;
    return DecodeDestination(str, unused);
}

CKey DecodeSecret(const std::string& str)
{
    CKey key;
    std::vector<unsigned char> data;
    if (DecodeBase58Check(str, data)) {
        const std::vector<unsigned char>& privkey_prefix = Params().Base58Prefix(CChainParams::SECRET_KEY);
        if ((data.size() == 32 + privkey_prefix.size() || (data.size() == 33 + privkey_prefix.size() && data.back() == 1)) &&
            std::equal(privkey_prefix.begin(), privkey_prefix.end(), data.begin())) {
            bool compressed = data.size() == 33 + privkey_prefix.size();
            key.Set(data.begin() + privkey_prefix.size(), data.begin() + privkey_prefix.size() + 32, compressed);
        }
    }
    if (!data.empty()) {
        OPENSSL_cleanse(data.data(), data.size());
    }
    return key;
}

std::string EncodeSecret(const CKey& key)
{
    assert(key.IsValid());
    std::vector<unsigned char> data = Params().Base58Prefix(CChainParams::SECRET_KEY);
    data.insert(data.end(), key.begin(), key.end());
    if (key.IsCompressed()) {
        data.push_back(1);
    }
    std::string ret = EncodeBase58Check(data);
    OPENSSL_cleanse(data.data(), data.size());
    return ret;
}
