// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/txbuilder.h"

#include "chainparams.h"
#include "hash.h"
#include "key.h"
#include "logging.h"
#include "script/sighash.h"
#include "script/standard.h"
#include "util/strencodings.h"

#include <algorithm>

CAmount EstimateFee(size_t nInputs, size_t nOutputs, const FeePolicy& policy)
{
    const size_t estSize = BASE_TX_SIZE +
                           nInputs * INPUT_SIZE +
                           (nOutputs + 1) * OUTPUT_SIZE;
    // ceil(size * rate)
    const CAmount nSizeFee = ((CAmount)estSize * policy.nFeePerK + 999) / 1000;
    return std::max(policy.nMinFee, nSizeFee);
}

bool SignP2PKHInputs(CMutableTransaction& mtx, const std::vector<CUtxo>& utxos, const CKey& key, std::string& strError)
{
    if (utxos.size() != mtx.vin.size()) {
        strError = strprintf("Input count mismatch: %u utxos for %u inputs", utxos.size(), mtx.vin.size());
        return false;
    }

    const CPubKey pubkey = key.GetPubKey();
    const CKeyID keyID = pubkey.GetID();

    for (size_t i = 0; i < mtx.vin.size(); i++) {
        const CUtxo& utxo = utxos[i];
        CKeyID owner;
        if (!ExtractDestination(utxo.scriptPubKey, owner) || owner != keyID) {
            strError = strprintf("Input %u (%s) is not spendable by the signing key", i, utxo.outpoint.ToString());
            return false;
        }

        const uint256 hash = SignatureHash(utxo.scriptPubKey, mtx, i, SIGHASH_ALL_FORKID, utxo.nValue);
        std::vector<unsigned char> vchSig;
        if (!key.Sign(hash, vchSig)) {
            strError = strprintf("Signing input %u failed", i);
            return false;
        }
        vchSig.push_back((unsigned char)SIGHASH_ALL_FORKID);
        mtx.vin[i].scriptSig = CreateP2PKHSpend(vchSig, pubkey);
    }
    return true;
}

// Shared body of the three wallet builders: add inputs, the given outputs
// and change, then sign.
static TxBuildResult BuildAndSign(
    const std::vector<CUtxo>& utxos,
    const std::vector<CTxOut>& outputs,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy)
{
    TxBuildResult result;

    if (utxos.empty()) {
        result.code = ErrorCode::INSUFFICIENT_FUNDS;
        result.error = "No UTXOs available. Please fund your wallet.";
        return result;
    }
    if (outputs.empty()) {
        result.error = "No outputs provided";
        return result;
    }

    CAmount totalIn = 0;
    for (const auto& utxo : utxos) {
        if (!MoneyRange(utxo.nValue)) {
            result.error = strprintf("Input %s has an out of range value", utxo.outpoint.ToString());
            return result;
        }
        totalIn += utxo.nValue;
    }

    CAmount totalOut = 0;
    for (const auto& out : outputs) {
        if (out.nValue < 0 || !MoneyRange(out.nValue)) {
            result.error = "Output value out of range";
            return result;
        }
        totalOut += out.nValue;
    }

    const CAmount fee = EstimateFee(utxos.size(), outputs.size(), policy);

    if (totalIn < totalOut + fee) {
        result.code = ErrorCode::INSUFFICIENT_FUNDS;
        result.error = strprintf("Insufficient funds: have %lld, need %lld + %lld fee",
                                 (long long)totalIn, (long long)totalOut, (long long)fee);
        return result;
    }

    CMutableTransaction mtx;
    for (const auto& utxo : utxos) {
        mtx.vin.emplace_back(utxo.outpoint);
    }
    mtx.vout = outputs;

    const CAmount change = totalIn - totalOut - fee;
    if (change > Params().DustThreshold()) {
        mtx.vout.emplace_back(change, changeScript);
        result.change = change;
    }

    if (!SignP2PKHInputs(mtx, utxos, key, result.error)) {
        result.code = ErrorCode::CRYPTO_ERROR;
        return result;
    }

    result.success = true;
    result.mtx = mtx;
    // Sub-dust change is left to the miner.
    result.fee = totalIn - mtx.GetValueOut();

    LogPrint(BCLog::ESCROW, "%s: %u inputs, %u outputs, fee %lld, change %lld\n",
             __func__, mtx.vin.size(), mtx.vout.size(), (long long)result.fee, (long long)result.change);
    return result;
}

TxBuildResult BuildTransaction(
    const std::vector<CUtxo>& utxos,
    const std::vector<CRecipient>& recipients,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy)
{
    std::vector<CTxOut> outputs;
    for (const auto& recipient : recipients) {
        if (recipient.nAmount <= 0) {
            TxBuildResult result;
            result.error = "Recipient amount must be positive";
            return result;
        }
        outputs.emplace_back(recipient.nAmount, recipient.scriptPubKey);
    }
    return BuildAndSign(utxos, outputs, changeScript, key, policy);
}

TxBuildResult BuildFundingTransaction(
    const std::vector<CUtxo>& utxos,
    const CScript& lockingScript,
    CAmount amount,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy)
{
    if (amount <= 0) {
        TxBuildResult result;
        result.error = "Escrow amount must be positive";
        return result;
    }
    if (lockingScript.empty()) {
        TxBuildResult result;
        result.error = "Empty escrow locking script";
        return result;
    }
    return BuildAndSign(utxos, {CTxOut(amount, lockingScript)}, changeScript, key, policy);
}

TxBuildResult BuildAnchorTransaction(
    const std::vector<CUtxo>& utxos,
    const std::vector<unsigned char>& data,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy)
{
    if (data.empty() || data.size() > MAX_SCRIPT_ELEMENT_SIZE) {
        TxBuildResult result;
        result.error = "Anchor data must be 1-520 bytes";
        return result;
    }
    return BuildAndSign(utxos, {CTxOut(0, GetScriptForDataCarrier(data))}, changeScript, key, policy);
}

CMutableTransaction BuildMultisigSpendTemplate(
    const CUtxo& utxo,
    const std::vector<CRecipient>& outputs,
    const Optional<CScript>& changeScript)
{
    if (outputs.empty()) {
        throw ValidationError("Multisig spend needs at least one output");
    }

    CMutableTransaction mtx;
    mtx.vin.emplace_back(utxo.outpoint);

    CAmount totalOut = 0;
    for (const auto& out : outputs) {
        if (out.nAmount <= 0) {
            throw ValidationError("Multisig spend output must be positive");
        }
        mtx.vout.emplace_back(out.nAmount, out.scriptPubKey);
        totalOut += out.nAmount;
    }
    if (totalOut >= utxo.nValue) {
        throw ValidationError(strprintf("Multisig spend leaves no fee: %lld out of %lld",
                                        (long long)totalOut, (long long)utxo.nValue));
    }

    if (changeScript) {
        const CAmount change = utxo.nValue - totalOut - MULTISIG_SPEND_FEE;
        if (change > Params().DustThreshold()) {
            mtx.vout.emplace_back(change, *changeScript);
        }
    }
    return mtx;
}

MultisigSigningPayload GetMultisigSigningPayload(
    const CUtxo& utxo,
    const CScript& lockingScript,
    const std::vector<CRecipient>& outputs,
    const Optional<CScript>& changeScript)
{
    if (!IsMultisigScript(lockingScript)) {
        throw ValidationError("Escrow locking script is not a bare multisig script");
    }

    const CMutableTransaction mtx = BuildMultisigSpendTemplate(utxo, outputs, changeScript);
    const std::vector<unsigned char> preimage = SignatureHashPreimage(lockingScript, mtx, 0, SIGHASH_ALL_FORKID, utxo.nValue);
    const uint256 digest = Hash(preimage.begin(), preimage.end());

    MultisigSigningPayload payload;
    payload.txHex = EncodeHexTx(mtx);
    payload.preimageHex = HexStr(preimage);
    payload.digestHex = HexStr(digest.begin(), digest.end());
    payload.nSigHashType = SIGHASH_ALL_FORKID;
    return payload;
}
