// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2017-2021 The PIVX Core developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "contract/contract.h"
#include "dispute/dispute.h"
#include "escrow/payment.h"
#include "key_io.h"
#include "pubkey.h"
#include "script/script.h"
#include "script/sigencoding.h"
#include "script/standard.h"
#include "util/error.h"
#include "util/strencodings.h"
#include "wallet/wallet.h"

#include <map>

#include <univalue.h>

const std::map<unsigned char, std::string> mapSigHashTypes = {
    {static_cast<unsigned char>(SIGHASH_ALL | SIGHASH_FORKID), std::string("ALL|FORKID")},
    {static_cast<unsigned char>(SIGHASH_ALL | SIGHASH_FORKID | SIGHASH_ANYONECANPAY), std::string("ALL|FORKID|ANYONECANPAY")},
    {static_cast<unsigned char>(SIGHASH_NONE | SIGHASH_FORKID), std::string("NONE|FORKID")},
    {static_cast<unsigned char>(SIGHASH_NONE | SIGHASH_FORKID | SIGHASH_ANYONECANPAY), std::string("NONE|FORKID|ANYONECANPAY")},
    {static_cast<unsigned char>(SIGHASH_SINGLE | SIGHASH_FORKID), std::string("SINGLE|FORKID")},
    {static_cast<unsigned char>(SIGHASH_SINGLE | SIGHASH_FORKID | SIGHASH_ANYONECANPAY), std::string("SINGLE|FORKID|ANYONECANPAY")},
};

/** DER signature with a trailing scope byte, shape only. */
static bool LooksLikeChecksig(const std::vector<unsigned char>& vch)
{
    if (vch.size() < 9 || vch.size() > 73) return false;
    if (vch[0] != 0x30) return false;
    return vch[1] == vch.size() - 3;
}

/**
 * Create the assembly string representation of a CScript object.
 * @param[in] script    CScript object to convert into the asm string representation.
 * @param[in] fAttemptSighashDecode    Whether to attempt to decode sighash types on data within the script that matches the format
 *                                     of a signature. Only pass true for scripts you believe could contain signatures.
 */
std::string ScriptToAsmStr(const CScript& script, const bool fAttemptSighashDecode)
{
    std::string str;
    opcodetype opcode;
    std::vector<unsigned char> vch;
    CScript::const_iterator pc = script.begin();
    while (pc < script.end()) {
        if (!str.empty()) {
            str += " ";
        }
        if (!script.GetOp(pc, opcode, vch)) {
            str += "[error]";
            return str;
        }
        if (0 <= opcode && opcode <= OP_PUSHDATA4) {
            if (vch.empty()) {
                str += "0";
            } else if (fAttemptSighashDecode && !script.IsUnspendable() && LooksLikeChecksig(vch) &&
                       mapSigHashTypes.count(vch.back())) {
                const std::string strSigHashDecode = "[" + mapSigHashTypes.find(vch.back())->second + "]";
                vch.pop_back();
                str += HexStr(vch) + strSigHashDecode;
            } else {
                str += HexStr(vch);
            }
        } else {
            str += GetOpName(opcode);
        }
    }
    return str;
}

void ScriptPubKeyToUniv(const CScript& scriptPubKey, UniValue& out, bool fIncludeHex)
{
    out.pushKV("asm", ScriptToAsmStr(scriptPubKey));
    if (fIncludeHex)
        out.pushKV("hex", HexStr(scriptPubKey));

    CKeyID keyID;
    int nRequired;
    std::vector<std::vector<unsigned char>> pubkeys;
    std::vector<unsigned char> data;
    if (ExtractDestination(scriptPubKey, keyID)) {
        out.pushKV("type", "pubkeyhash");
        out.pushKV("address", EncodeDestination(keyID));
    } else if (DecodeMultisigScript(scriptPubKey, nRequired, pubkeys)) {
        out.pushKV("type", "multisig");
        out.pushKV("reqSigs", nRequired);
        UniValue a(UniValue::VARR);
        for (const std::vector<unsigned char>& pubkey : pubkeys)
            a.push_back(HexStr(pubkey));
        out.pushKV("pubkeys", a);
    } else if (DecodeDataCarrier(scriptPubKey, data)) {
        out.pushKV("type", "nulldata");
        out.pushKV("data", HexStr(data));
    } else {
        out.pushKV("type", "nonstandard");
    }
}

static UniValue OptionalToUniv(const Optional<std::string>& value)
{
    return value ? UniValue(*value) : UniValue(UniValue::VNULL);
}

static UniValue OptionalToUniv(const Optional<int64_t>& value)
{
    return value ? UniValue(*value) : UniValue(UniValue::VNULL);
}

UniValue WalletToUniv(const CAgentWallet& wallet)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", wallet.id);
    obj.pushKV("publicKey", wallet.publicKey);
    obj.pushKV("address", wallet.address);
    obj.pushKV("createdAt", wallet.nCreateTime);
    return obj;
}

UniValue PaymentToUniv(const CPayment& payment)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", payment.id);
    obj.pushKV("serviceId", payment.serviceId);
    obj.pushKV("contractId", OptionalToUniv(payment.contractId));
    obj.pushKV("buyerWalletId", payment.buyerWalletId);
    obj.pushKV("sellerWalletId", payment.sellerWalletId);
    obj.pushKV("amount", (int64_t)payment.nAmount);
    obj.pushKV("platformFee", (int64_t)payment.nPlatformFee);
    obj.pushKV("currency", CurrencyToString(payment.currency));
    obj.pushKV("escrowMode", EscrowModeToString(payment.escrowMode));
    obj.pushKV("status", PaymentStatusToString(payment.status));
    obj.pushKV("consumedBy", OptionalToUniv(payment.consumedBy));
    obj.pushKV("escrowTxId", OptionalToUniv(payment.escrowTxId));
    obj.pushKV("escrowVout", OptionalToUniv(payment.nEscrowVout));
    obj.pushKV("escrowScript", OptionalToUniv(payment.escrowScriptHex));
    obj.pushKV("releaseTxId", OptionalToUniv(payment.releaseTxId));
    obj.pushKV("refundTxId", OptionalToUniv(payment.refundTxId));
    obj.pushKV("createdAt", payment.nCreateTime);
    obj.pushKV("completedAt", OptionalToUniv(payment.nCompleteTime));
    return obj;
}

UniValue ApprovalToUniv(const CSettlementApproval& approval)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", approval.id);
    obj.pushKV("paymentId", approval.paymentId);
    obj.pushKV("action", SettlementActionToString(approval.action));
    obj.pushKV("actorType", SettlementActorTypeToString(approval.actorType));
    obj.pushKV("actorId", approval.actorId);
    obj.pushKV("signature", approval.signature);
    obj.pushKV("message", approval.message);
    obj.pushKV("createdAt", approval.nCreateTime);
    return obj;
}

UniValue ContractToUniv(const CServiceContract& contract)
{
    const CContractTerms& terms = contract.terms;
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", contract.id);
    obj.pushKV("paymentId", OptionalToUniv(contract.paymentId));
    obj.pushKV("serviceId", terms.serviceId);
    obj.pushKV("buyerWalletId", terms.buyerWalletId);
    obj.pushKV("providerWalletId", terms.providerWalletId);
    obj.pushKV("buyerAddress", terms.buyerAddress);
    obj.pushKV("providerAddress", terms.providerAddress);
    obj.pushKV("amount", (int64_t)terms.nAmount);
    obj.pushKV("currency", CurrencyToString(terms.currency));
    obj.pushKV("termsHash", terms.termsHash);
    obj.pushKV("disputeWindow", terms.nDisputeWindow);
    obj.pushKV("contractHash", contract.contractHash);
    obj.pushKV("buyerSignature", contract.buyerSignature);
    obj.pushKV("providerSignature", contract.providerSignature);
    obj.pushKV("status", ContractStatusToString(contract.status));
    obj.pushKV("contractTxId", OptionalToUniv(contract.contractTxId));
    obj.pushKV("settlementTxId", OptionalToUniv(contract.settlementTxId));
    obj.pushKV("createdAt", contract.nCreateTime);
    obj.pushKV("settledAt", OptionalToUniv(contract.nSettleTime));
    return obj;
}

UniValue DisputeToUniv(const CDispute& dispute)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", dispute.id);
    obj.pushKV("paymentId", dispute.paymentId);
    obj.pushKV("buyerWalletId", dispute.buyerWalletId);
    obj.pushKV("providerWalletId", dispute.providerWalletId);
    obj.pushKV("reason", dispute.reason);
    obj.pushKV("evidence", OptionalToUniv(dispute.evidence));
    obj.pushKV("status", DisputeStatusToString(dispute.status));
    obj.pushKV("resolution", dispute.resolution ? UniValue(DisputeResolutionToString(*dispute.resolution))
                                                : UniValue(UniValue::VNULL));
    obj.pushKV("resolvedBy", OptionalToUniv(dispute.resolvedBy));
    obj.pushKV("resolvedAt", OptionalToUniv(dispute.nResolveTime));
    obj.pushKV("createdAt", dispute.nCreateTime);
    return obj;
}

UniValue NormalizedSignatureToUniv(const NormalizedSignature& sig)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("checksigHex", sig.checksigHex);
    obj.pushKV("scope", sig.nSigHashType);
    obj.pushKV("detectedFormat", SignatureFormatName(sig.inputFormat));
    if (sig.verified)
        obj.pushKV("verified", *sig.verified);
    return obj;
}

UniValue ErrorToUniv(const AgentPayError& error)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("code", ErrorCodeToString(error.GetCode()));
    obj.pushKV("status", ErrorCodeToHTTPStatus(error.GetCode()));
    obj.pushKV("message", std::string(error.what()));
    return obj;
}
