// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_WALLET_WALLET_H
#define AGENTPAY_WALLET_WALLET_H

#include "chain/chainclient.h"
#include "key.h"
#include "optional.h"
#include "wallet/crypter.h"

#include <memory>
#include <string>
#include <vector>

class SQLiteDatabase;

/** Public view of an agent wallet. The private key never leaves the store in clear. */
struct CAgentWallet
{
    std::string id;
    std::string publicKey;  // compressed, lower-case hex
    std::string address;    // base58check P2PKH
    int64_t nCreateTime{0};

    CKeyID GetKeyID() const;
};

/** Returned once by CWalletManager::Create(); the only time secrets are shown. */
struct CNewWallet
{
    CAgentWallet wallet;
    std::string privateKeyWif;
    std::string apiKey;
};

/**
 * Agent wallet store.
 *
 * Keys are kept as WIF encrypted with CAtRestCrypter and decrypted only for
 * the duration of a signing call. The UTXO table is an advisory cache of the
 * chain client's view.
 */
class CWalletManager
{
public:
    CWalletManager(SQLiteDatabase& db, const std::string& masterSecret, CChainClient& chain);

    /** Generate a fresh compressed key, persist it encrypted and issue an API key. */
    CNewWallet Create();

    /**
     * Import an existing WIF (e.g. the platform wallet). Idempotent: an
     * already known address returns the stored wallet.
     * @throws ValidationError on a malformed WIF or a foreign network prefix
     */
    CAgentWallet ImportFromWif(const std::string& wif);

    Optional<CAgentWallet> GetById(const std::string& walletId) const;
    Optional<CAgentWallet> GetByAddress(const std::string& address) const;

    /** @throws NotFoundError */
    CAgentWallet GetByIdOrThrow(const std::string& walletId) const;

    /** Resolve the wallet owning an API key (hash lookup). */
    Optional<CAgentWallet> GetByApiKey(const std::string& apiKey) const;
    /** Replace the API key; the previous one stops working immediately. */
    std::string RotateApiKey(const std::string& walletId);

    /**
     * Decrypt a wallet's signing key.
     * @throws NotFoundError, CryptoError
     */
    CKey GetSigningKey(const std::string& walletId) const;

    /**
     * Unspent outputs of a wallet. Resyncs the cache from the chain client;
     * on ExternalServiceError the cached unspent set is returned instead.
     */
    std::vector<CUtxo> GetUtxos(const std::string& walletId);

    /** Mark outputs consumed by a broadcast transaction as spent in the cache. */
    void MarkSpent(const std::vector<CUtxo>& utxos);

    /** Sum of GetUtxos(). */
    CAmount GetBalance(const std::string& walletId);

private:
    SQLiteDatabase& m_db;
    CChainClient& m_chain;
    std::unique_ptr<CAtRestCrypter> m_crypter;

    std::vector<CUtxo> ReadCachedUtxos(const std::string& address) const;
    void SyncUtxos(const std::string& address, const std::vector<CUtxo>& utxos);
};

/** SHA-256 hex of an API credential, as stored. */
std::string HashApiKey(const std::string& apiKey);

#endif // AGENTPAY_WALLET_WALLET_H
