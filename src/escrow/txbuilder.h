// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_TXBUILDER_H
#define AGENTPAY_ESCROW_TXBUILDER_H

/**
 * Escrow transaction builders
 *
 * Wallet-level construction of the transactions the escrow core emits:
 * - funding: wallet UTXOs -> escrow output (platform P2PKH or bare multisig)
 * - payout: wallet UTXOs -> P2PKH recipients
 * - anchor: wallet UTXOs -> OP_FALSE OP_RETURN <hash>
 * - multisig spend payload: escrow output -> recipients, unsigned
 *
 * Fees follow a linear size model. Change is added only above the dust
 * threshold; anything smaller is left to the miner.
 */

#include "amount.h"
#include "chain/chainclient.h"
#include "optional.h"
#include "primitives/transaction.h"
#include "script/script.h"
#include "util/error.h"

#include <string>
#include <vector>

class CKey;

// Estimated tx sizes for fee calculation
static const size_t BASE_TX_SIZE = 10;      // version, locktime, counts
static const size_t INPUT_SIZE = 148;       // P2PKH input with signature
static const size_t OUTPUT_SIZE = 34;       // P2PKH output

static const CAmount DEFAULT_MIN_FEE = 250;
static const CAmount DEFAULT_FEE_PER_BYTE = 1;

/** Flat fee reserved when spending a single 2-of-n escrow output. */
static const CAmount MULTISIG_SPEND_FEE = 420;

struct FeePolicy
{
    CAmount nFeePerK{DEFAULT_FEE_PER_BYTE * 1000};  // satoshis per 1000 bytes
    CAmount nMinFee{DEFAULT_MIN_FEE};
};

/**
 * Fee for a transaction with nInputs inputs and nOutputs requested outputs.
 * One extra output is always budgeted for change.
 */
CAmount EstimateFee(size_t nInputs, size_t nOutputs, const FeePolicy& policy);

/** A P2PKH or script destination and its value. */
struct CRecipient
{
    CScript scriptPubKey;
    CAmount nAmount;
};

/**
 * TxBuildResult - Result from the wallet transaction builders
 */
struct TxBuildResult
{
    bool success{false};
    std::string error;
    ErrorCode code{ErrorCode::VALIDATION_ERROR};
    CMutableTransaction mtx;
    CAmount fee{0};
    CAmount change{0};          // 0 when no change output was added
};

/**
 * BuildTransaction - Pay P2PKH recipients from wallet UTXOs
 *
 * - vin[0..N]  = utxos, all signed by key with ALL|FORKID
 * - vout[0..M] = recipients, in caller order
 * - vout[M+1]  = change to changeScript (only when above dust)
 *
 * @param utxos        inputs, all locked to key
 * @param recipients   outputs to pay
 * @param changeScript destination for change
 * @param key          signing key of the inputs
 * @param policy       fee policy
 */
TxBuildResult BuildTransaction(
    const std::vector<CUtxo>& utxos,
    const std::vector<CRecipient>& recipients,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy);

/**
 * BuildFundingTransaction - Lock amount into an escrow script
 *
 * vout[0] is always the escrow output.
 */
TxBuildResult BuildFundingTransaction(
    const std::vector<CUtxo>& utxos,
    const CScript& lockingScript,
    CAmount amount,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy);

/**
 * BuildAnchorTransaction - Record a hash in a zero-value data carrier
 *
 * vout[0] = OP_FALSE OP_RETURN <data>, vout[1] = change (optional)
 */
TxBuildResult BuildAnchorTransaction(
    const std::vector<CUtxo>& utxos,
    const std::vector<unsigned char>& data,
    const CScript& changeScript,
    const CKey& key,
    const FeePolicy& policy);

/**
 * Sign every input of mtx as a P2PKH spend by key.
 * utxos[i] must describe the output spent by vin[i].
 * @return false if an input is not locked to key or signing fails
 */
bool SignP2PKHInputs(CMutableTransaction& mtx, const std::vector<CUtxo>& utxos, const CKey& key, std::string& strError);

/** What an external signer needs to co-sign a multisig escrow spend. */
struct MultisigSigningPayload
{
    std::string txHex;          // unsigned spending transaction
    std::string preimageHex;
    std::string digestHex;      // double SHA-256 of the preimage, natural byte order
    int nSigHashType;
};

/**
 * Build the unsigned transaction spending a multisig escrow output and the
 * digest each co-signer has to sign.
 *
 * When changeScript is given, whatever the outputs leave above
 * MULTISIG_SPEND_FEE is returned there if it clears the dust threshold.
 *
 * @throws ValidationError if the script is not multisig or the outputs leave no fee
 */
MultisigSigningPayload GetMultisigSigningPayload(
    const CUtxo& utxo,
    const CScript& lockingScript,
    const std::vector<CRecipient>& outputs,
    const Optional<CScript>& changeScript = boost::none);

/** Unsigned spending transaction behind GetMultisigSigningPayload(). */
CMutableTransaction BuildMultisigSpendTemplate(
    const CUtxo& utxo,
    const std::vector<CRecipient>& outputs,
    const Optional<CScript>& changeScript = boost::none);

#endif // AGENTPAY_ESCROW_TXBUILDER_H
