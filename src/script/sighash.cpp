// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/sighash.h"

#include "hash.h"
#include "primitives/transaction.h"
#include "script/script.h"
#include "serialize.h"

#include <stdexcept>

namespace {

/** Writer that feeds a double SHA-256 directly. */
class CHashStream
{
public:
    void write(const unsigned char* pch, size_t nSize) { ctx.Write(pch, nSize); }

    uint256 GetHash()
    {
        uint256 result;
        ctx.Finalize(result.begin());
        return result;
    }

private:
    CHash256 ctx;
};

uint256 GetPrevoutHash(const CMutableTransaction& txTo)
{
    CHashStream ss;
    for (const CTxIn& txin : txTo.vin) {
        ss.write(txin.prevout.hash.begin(), txin.prevout.hash.size());
        ser_writedata32(ss, txin.prevout.n);
    }
    return ss.GetHash();
}

uint256 GetSequenceHash(const CMutableTransaction& txTo)
{
    CHashStream ss;
    for (const CTxIn& txin : txTo.vin) {
        ser_writedata32(ss, txin.nSequence);
    }
    return ss.GetHash();
}

void WriteTxOut(CHashStream& ss, const CTxOut& txout)
{
    ser_writedata64(ss, (uint64_t)txout.nValue);
    WriteVarBytes(ss, txout.scriptPubKey);
}

uint256 GetOutputsHash(const CMutableTransaction& txTo)
{
    CHashStream ss;
    for (const CTxOut& txout : txTo.vout) {
        WriteTxOut(ss, txout);
    }
    return ss.GetHash();
}

} // namespace

bool IsValidForkIdSigHashType(int nHashType)
{
    if (!(nHashType & SIGHASH_FORKID)) return false;
    int nBase = GetBaseSigHashType(nHashType);
    if (nBase < SIGHASH_ALL || nBase > SIGHASH_SINGLE) return false;
    // Only the fork id and anyone-can-pay bits may be set besides the base type.
    return (nHashType & ~(0x1f | SIGHASH_FORKID | SIGHASH_ANYONECANPAY)) == 0;
}

std::vector<unsigned char> SignatureHashPreimage(const CScript& scriptCode, const CMutableTransaction& txTo, unsigned int nIn, int nHashType, const CAmount& amount)
{
    if (nIn >= txTo.vin.size()) {
        throw std::out_of_range("SignatureHashPreimage: input index out of range");
    }
    if (!IsValidForkIdSigHashType(nHashType)) {
        throw std::invalid_argument("SignatureHashPreimage: sighash type must carry SIGHASH_FORKID");
    }

    uint256 hashPrevouts;
    uint256 hashSequence;
    uint256 hashOutputs;
    const int nBase = GetBaseSigHashType(nHashType);

    if (!(nHashType & SIGHASH_ANYONECANPAY)) {
        hashPrevouts = GetPrevoutHash(txTo);
    }

    if (!(nHashType & SIGHASH_ANYONECANPAY) && nBase != SIGHASH_SINGLE && nBase != SIGHASH_NONE) {
        hashSequence = GetSequenceHash(txTo);
    }

    if (nBase != SIGHASH_SINGLE && nBase != SIGHASH_NONE) {
        hashOutputs = GetOutputsHash(txTo);
    } else if (nBase == SIGHASH_SINGLE && nIn < txTo.vout.size()) {
        CHashStream ss;
        WriteTxOut(ss, txTo.vout[nIn]);
        hashOutputs = ss.GetHash();
    }

    std::vector<unsigned char> vch;
    CVectorWriter ss(vch);
    // Version
    ser_writedata32(ss, (uint32_t)txTo.nVersion);
    // Input prevouts/nSequence (none/all, depending on flags)
    ss.write(hashPrevouts.begin(), hashPrevouts.size());
    ss.write(hashSequence.begin(), hashSequence.size());
    // The input being signed (replacing the scriptSig with scriptCode + amount)
    // The prevout may already be contained in hashPrevout, and the nSequence
    // may already be contain in hashSequence.
    ss.write(txTo.vin[nIn].prevout.hash.begin(), txTo.vin[nIn].prevout.hash.size());
    ser_writedata32(ss, txTo.vin[nIn].prevout.n);
    WriteVarBytes(ss, scriptCode);
    ser_writedata64(ss, (uint64_t)amount);
    ser_writedata32(ss, txTo.vin[nIn].nSequence);
    // Outputs (none/one/all, depending on flags)
    ss.write(hashOutputs.begin(), hashOutputs.size());
    // Locktime
    ser_writedata32(ss, txTo.nLockTime);
    // Sighash type
    ser_writedata32(ss, (uint32_t)nHashType);

    return vch;
}

uint256 SignatureHash(const CScript& scriptCode, const CMutableTransaction& txTo, unsigned int nIn, int nHashType, const CAmount& amount)
{
    std::vector<unsigned char> preimage = SignatureHashPreimage(scriptCode, txTo, nIn, nHashType, amount);
    return Hash(preimage.begin(), preimage.end());
}
