// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "primitives/transaction.h"

#include "hash.h"
#include "serialize.h"
#include "util/format.h"
#include "util/strencodings.h"

std::string COutPoint::ToString() const
{
    return strprintf("COutPoint(%s, %u)", hash.ToString().substr(0, 10), n);
}

std::string CTxIn::ToString() const
{
    std::string str;
    str += "CTxIn(";
    str += prevout.ToString();
    str += strprintf(", scriptSig=%s", HexStr(scriptSig).substr(0, 24));
    if (nSequence != SEQUENCE_FINAL)
        str += strprintf(", nSequence=%u", nSequence);
    str += ")";
    return str;
}

std::string CTxOut::ToString() const
{
    return strprintf("CTxOut(nValue=%d.%08d, scriptPubKey=%s)", nValue / COIN, nValue % COIN, HexStr(scriptPubKey).substr(0, 30));
}

std::vector<unsigned char> CMutableTransaction::Serialize() const
{
    std::vector<unsigned char> vch;
    CVectorWriter s(vch);
    ser_writedata32(s, (uint32_t)nVersion);
    WriteCompactSize(s, vin.size());
    for (const CTxIn& txin : vin) {
        s.write(txin.prevout.hash.begin(), txin.prevout.hash.size());
        ser_writedata32(s, txin.prevout.n);
        WriteVarBytes(s, txin.scriptSig);
        ser_writedata32(s, txin.nSequence);
    }
    WriteCompactSize(s, vout.size());
    for (const CTxOut& txout : vout) {
        ser_writedata64(s, (uint64_t)txout.nValue);
        WriteVarBytes(s, txout.scriptPubKey);
    }
    ser_writedata32(s, nLockTime);
    return vch;
}

uint256 CMutableTransaction::GetHash() const
{
    std::vector<unsigned char> vch = Serialize();
    return Hash(vch.begin(), vch.end());
}

CAmount CMutableTransaction::GetValueOut() const
{
    CAmount nValueOut = 0;
    for (const auto& tx_out : vout) {
        nValueOut += tx_out.nValue;
    }
    return nValueOut;
}

std::string CMutableTransaction::ToString() const
{
    std::string str;
    str += strprintf("CMutableTransaction(hash=%s, ver=%d, vin.size=%u, vout.size=%u, nLockTime=%u)\n",
        GetHash().ToString().substr(0, 10),
        nVersion,
        vin.size(),
        vout.size(),
        nLockTime);
    for (const auto& tx_in : vin)
        str += "    " + tx_in.ToString() + "\n";
    for (const auto& tx_out : vout)
        str += "    " + tx_out.ToString() + "\n";
    return str;
}

std::string EncodeHexTx(const CMutableTransaction& tx)
{
    return HexStr(tx.Serialize());
}

bool DecodeHexTx(CMutableTransaction& tx, const std::string& strHexTx)
{
    if (!IsHex(strHexTx)) {
        return false;
    }

    std::vector<unsigned char> txData(ParseHex(strHexTx));
    CSpanReader s(txData.data(), txData.data() + txData.size());
    CMutableTransaction txNew;
    try {
        txNew.nVersion = (int32_t)ser_readdata32(s);
        uint64_t nIn = ReadCompactSize(s);
        for (uint64_t i = 0; i < nIn; i++) {
            CTxIn txin;
            s.read(txin.prevout.hash.begin(), txin.prevout.hash.size());
            txin.prevout.n = ser_readdata32(s);
            std::vector<unsigned char> script = ReadVarBytes(s);
            txin.scriptSig = CScript(script.data(), script.data() + script.size());
            txin.nSequence = ser_readdata32(s);
            txNew.vin.push_back(txin);
        }
        uint64_t nOut = ReadCompactSize(s);
        for (uint64_t i = 0; i < nOut; i++) {
            CTxOut txout;
            txout.nValue = (CAmount)ser_readdata64(s);
            std::vector<unsigned char> script = ReadVarBytes(s);
            txout.scriptPubKey = CScript(script.data(), script.data() + script.size());
            txNew.vout.push_back(txout);
        }
        txNew.nLockTime = ser_readdata32(s);
    } catch (const std::exception&) {
        return false;
    }
    if (!s.empty()) {
        return false;
    }

    tx = txNew;
    return true;
}
