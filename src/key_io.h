// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_KEY_IO_H
#define AGENTPAY_KEY_IO_H

#include "key.h"
#include "pubkey.h"

#include <string>

/** Base58check P2PKH address for the selected network. */
std::string EncodeDestination(const CKeyID& keyID);
/** Decode a P2PKH address; fails on bad checksum or a foreign network prefix. */
bool DecodeDestination(const std::string& str, CKeyID& keyID);
bool IsValidDestinationString(const std::string& str);

/** Wallet import format (base58check, compression flag suffix). */
CKey DecodeSecret(const std::string& str);
std::string EncodeSecret(const CKey& key);

#endif // AGENTPAY_KEY_IO_H
