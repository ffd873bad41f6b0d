// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_CHAIN_CHAINCLIENT_H
#define AGENTPAY_CHAIN_CHAINCLIENT_H

#include "amount.h"
#include "optional.h"
#include "primitives/transaction.h"
#include "script/script.h"

#include <string>
#include <vector>

class CKey;

/** An unspent output owned by a wallet address. */
struct CUtxo
{
    COutPoint outpoint;
    CAmount nValue{0};
    CScript scriptPubKey;
};

/**
 * Abstract access to the ledger. The escrow core never talks to a node or
 * an indexer directly; production wires an HTTP indexer client, tests an
 * in-memory ledger.
 *
 * Every method throws ExternalServiceError when the remote side fails or
 * rejects the request.
 */
class CChainClient
{
public:
    virtual ~CChainClient() {}

    /** Unspent outputs paying to a P2PKH address. */
    virtual std::vector<CUtxo> GetUtxos(const std::string& address) = 0;

    /** The output at outpoint if it exists and is unspent, any script type. */
    virtual Optional<CUtxo> GetTxOut(const COutPoint& outpoint) = 0;

    /** Broadcast a raw transaction. Returns the txid (display hex). */
    virtual std::string Broadcast(const std::string& txHex) = 0;

    /**
     * Move token units (MNEE) between addresses through the token service.
     * Returns the transfer txid.
     */
    virtual std::string TransferToken(const std::string& fromAddress, const std::string& toAddress, CAmount amount, const CKey& key) = 0;
};

#endif // AGENTPAY_CHAIN_CHAINCLIENT_H
