// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SCRIPT_SIGHASH_H
#define AGENTPAY_SCRIPT_SIGHASH_H

#include "amount.h"
#include "uint256.h"

#include <vector>

class CScript;
struct CMutableTransaction;

/** Signature hash types/flags */
enum {
    SIGHASH_ALL = 1,
    SIGHASH_NONE = 2,
    SIGHASH_SINGLE = 3,
    SIGHASH_FORKID = 0x40,
    SIGHASH_ANYONECANPAY = 0x80,
};

/** Scope used for every signature the escrow core produces. */
static const int SIGHASH_ALL_FORKID = SIGHASH_ALL | SIGHASH_FORKID;

/** Base type (ALL/NONE/SINGLE) of a sighash scope byte. */
inline int GetBaseSigHashType(int nHashType) { return nHashType & 0x1f; }

/** True for a scope byte with the fork id bit and a known base type. */
bool IsValidForkIdSigHashType(int nHashType);

/**
 * Replay-protected (fork id) signature preimage, BIP143 layout:
 * nVersion, hashPrevouts, hashSequence, outpoint, scriptCode, amount,
 * nSequence, hashOutputs, nLockTime, sighash type.
 *
 * @param scriptCode  locking script of the output being spent
 * @param txTo        spending transaction
 * @param nIn         index of the input being signed
 * @param nHashType   scope byte, must carry SIGHASH_FORKID
 * @param amount      value of the output being spent
 */
std::vector<unsigned char> SignatureHashPreimage(const CScript& scriptCode, const CMutableTransaction& txTo, unsigned int nIn, int nHashType, const CAmount& amount);

/** Double SHA-256 of SignatureHashPreimage(). */
uint256 SignatureHash(const CScript& scriptCode, const CMutableTransaction& txTo, unsigned int nIn, int nHashType, const CAmount& amount);

#endif // AGENTPAY_SCRIPT_SIGHASH_H
