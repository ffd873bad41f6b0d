// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/multisig.h"

#include "logging.h"
#include "script/sigencoding.h"
#include "script/sighash.h"
#include "script/standard.h"
#include "util/strencodings.h"

#include <map>

static int FindKeyPosition(const std::vector<std::vector<unsigned char>>& pubkeys, const std::vector<unsigned char>& key)
{
    for (size_t i = 0; i < pubkeys.size(); i++) {
        if (pubkeys[i] == key) return (int)i;
    }
    return -1;
}

CMutableTransaction SpendMultisigUtxo(const MultisigSpendRequest& request)
{
    int nRequired = 0;
    std::vector<std::vector<unsigned char>> pubkeys;
    if (!DecodeMultisigScript(request.lockingScript, nRequired, pubkeys)) {
        throw ValidationError("Escrow locking script is not a bare multisig script");
    }

    CMutableTransaction mtx = BuildMultisigSpendTemplate(request.utxo, request.outputs, request.changeScript);
    const uint256 digest = SignatureHash(request.lockingScript, mtx, 0, SIGHASH_ALL_FORKID, request.utxo.nValue);
    const std::string digestHex = HexStr(digest.begin(), digest.end());

    // Script key position -> checksig signature. Ordered, so iteration is script order.
    std::map<int, std::vector<unsigned char>> sigs;

    for (const CKey& key : request.signerKeys) {
        const CPubKey pubkey = key.GetPubKey();
        const int pos = FindKeyPosition(pubkeys, std::vector<unsigned char>(pubkey.begin(), pubkey.end()));
        if (pos < 0) {
            throw ValidationError(strprintf("Signer key %s is not part of the escrow script", pubkey.GetHex()));
        }
        std::vector<unsigned char> vchSig;
        if (!key.Sign(digest, vchSig)) {
            throw CryptoError("Signing the multisig spend failed");
        }
        vchSig.push_back((unsigned char)SIGHASH_ALL_FORKID);
        sigs[pos] = vchSig;
    }

    for (const CExternalSignature& ext : request.externalSignatures) {
        const std::string pubkeyHex = ToLower(TrimString(ext.publicKeyHex));
        const int pos = FindKeyPosition(pubkeys, ParseHex(pubkeyHex));
        if (pos < 0 || !IsHex(pubkeyHex)) {
            throw CryptoVerificationError(strprintf("Signature key %s is not part of the escrow script", pubkeyHex));
        }

        SignatureNormalizeOptions options;
        options.nSigHashType = SIGHASH_ALL_FORKID;
        options.digestHex = digestHex;
        options.publicKeyHex = pubkeyHex;
        const NormalizedSignature normalized = NormalizeSignatureToChecksig(ext.signature, options);

        sigs[pos] = ParseHex(normalized.checksigHex);
        LogPrint(BCLog::CRYPTO, "%s: accepted %s signature for key %d\n", __func__,
                 SignatureFormatName(normalized.inputFormat), pos);
    }

    if (sigs.size() < (size_t)MAX_MULTISIG_SPEND_SIGNATURES) {
        throw ValidationError(strprintf("Multisig spend requires at least %d signatures, have %u",
                                        MAX_MULTISIG_SPEND_SIGNATURES, sigs.size()));
    }

    // Only the first two in script order are combined, whatever m the script declares.
    std::vector<std::vector<unsigned char>> ordered;
    for (const auto& entry : sigs) {
        if (ordered.size() == (size_t)MAX_MULTISIG_SPEND_SIGNATURES) break;
        ordered.push_back(entry.second);
    }
    if (nRequired > MAX_MULTISIG_SPEND_SIGNATURES) {
        LogPrintf("%s: script requires %d signatures, spending with %d\n", __func__, nRequired, MAX_MULTISIG_SPEND_SIGNATURES);
    }

    mtx.vin[0].scriptSig = CreateMultisigSpend(ordered);
    return mtx;
}
