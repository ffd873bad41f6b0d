// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_PRIMITIVES_TRANSACTION_H
#define AGENTPAY_PRIMITIVES_TRANSACTION_H

#include "amount.h"
#include "script/script.h"
#include "uint256.h"

#include <string>
#include <vector>

/** An outpoint - a combination of a transaction hash and an index n into its vout */
class COutPoint
{
public:
    uint256 hash;
    uint32_t n;

    COutPoint() { SetNull(); }
    COutPoint(const uint256& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    void SetNull()
    {
        hash.SetNull();
        n = (uint32_t)-1;
    }
    bool IsNull() const { return (hash.IsNull() && n == (uint32_t)-1); }

    friend bool operator<(const COutPoint& a, const COutPoint& b)
    {
        int cmp = a.hash.Compare(b.hash);
        return cmp < 0 || (cmp == 0 && a.n < b.n);
    }

    friend bool operator==(const COutPoint& a, const COutPoint& b)
    {
        return (a.hash == b.hash && a.n == b.n);
    }

    friend bool operator!=(const COutPoint& a, const COutPoint& b)
    {
        return !(a == b);
    }

    std::string ToString() const;
};

/** An input of a transaction.  It contains the location of the previous
 * transaction's output that it claims and a signature that matches the
 * output's public key.
 */
class CTxIn
{
public:
    COutPoint prevout;
    CScript scriptSig;
    uint32_t nSequence;

    static const uint32_t SEQUENCE_FINAL = 0xffffffff;

    CTxIn() : nSequence(SEQUENCE_FINAL) {}
    explicit CTxIn(const COutPoint& prevoutIn, const CScript& scriptSigIn = CScript(), uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), scriptSig(scriptSigIn), nSequence(nSequenceIn) {}

    std::string ToString() const;
};

/** An output of a transaction.  It contains the public key that the next input
 * must be able to sign with to claim it.
 */
class CTxOut
{
public:
    CAmount nValue;
    CScript scriptPubKey;

    CTxOut() { SetNull(); }
    CTxOut(const CAmount& nValueIn, const CScript& scriptPubKeyIn) : nValue(nValueIn), scriptPubKey(scriptPubKeyIn) {}

    void SetNull()
    {
        nValue = -1;
        scriptPubKey.clear();
    }

    bool IsNull() const { return (nValue == -1); }

    friend bool operator==(const CTxOut& a, const CTxOut& b)
    {
        return (a.nValue == b.nValue && a.scriptPubKey == b.scriptPubKey);
    }

    std::string ToString() const;
};

/** A mutable version of a transaction. */
struct CMutableTransaction
{
    static const int32_t CURRENT_VERSION = 1;

    int32_t nVersion;
    std::vector<CTxIn> vin;
    std::vector<CTxOut> vout;
    uint32_t nLockTime;

    CMutableTransaction() : nVersion(CURRENT_VERSION), nLockTime(0) {}

    /** Legacy (non-segwit) wire serialization. */
    std::vector<unsigned char> Serialize() const;

    /** Compute the hash of this CMutableTransaction. This is computed on the
     * fly, as opposed to GetHash() in CTransaction, which uses a cached result.
     */
    uint256 GetHash() const;

    CAmount GetValueOut() const;

    std::string ToString() const;
};

std::string EncodeHexTx(const CMutableTransaction& tx);
/** Parse a raw transaction. Returns false on any trailing or missing data. */
bool DecodeHexTx(CMutableTransaction& tx, const std::string& strHexTx);

#endif // AGENTPAY_PRIMITIVES_TRANSACTION_H
