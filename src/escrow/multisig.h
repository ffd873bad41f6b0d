// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_MULTISIG_H
#define AGENTPAY_ESCROW_MULTISIG_H

#include "escrow/txbuilder.h"
#include "key.h"

#include <string>
#include <vector>

/** A co-signer's transaction signature, in any accepted encoding. */
struct CExternalSignature
{
    std::string publicKeyHex;
    std::string signature;
};

struct MultisigSpendRequest
{
    CUtxo utxo;                     // the escrow output
    CScript lockingScript;          // its bare multisig script
    std::vector<CRecipient> outputs;
    Optional<CScript> changeScript;

    std::vector<CKey> signerKeys;   // keys held locally
    std::vector<CExternalSignature> externalSignatures;
};

/**
 * Assemble a fully signed spend of a multisig escrow output.
 *
 * Local keys sign the ALL|FORKID digest directly. External signatures are
 * normalized and must verify against the digest and their claimed key, or
 * the whole spend is rejected. Signatures are placed after OP_0 in the order
 * their keys appear in the locking script, and exactly the first
 * MAX_MULTISIG_SPEND_SIGNATURES of them are used.
 *
 * @throws ValidationError           fewer than two usable signatures, foreign local key
 * @throws CryptoVerificationError   external signature invalid or for a foreign key
 * @throws UnsupportedSignatureFormat external signature in no known encoding
 */
CMutableTransaction SpendMultisigUtxo(const MultisigSpendRequest& request);

#endif // AGENTPAY_ESCROW_MULTISIG_H
