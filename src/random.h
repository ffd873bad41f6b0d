// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_RANDOM_H
#define AGENTPAY_RANDOM_H

#include "uint256.h"

#include <stdint.h>
#include <string>

/**
 * Functions to gather random data from the OpenSSL CSPRNG.
 * Any failure to obtain entropy throws std::runtime_error.
 */
void GetRandBytes(unsigned char* buf, int num);
uint64_t GetRand(uint64_t nMax);
uint256 GetRandHash();

/** Lower-case hex of nBytes random bytes (nonces, tokens). */
std::string GetRandHex(int nBytes);

/** Random RFC 4122 version 4 identifier for stored records. */
std::string GenerateId();

#endif // AGENTPAY_RANDOM_H
