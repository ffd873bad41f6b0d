// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/wallet.h"

#include "hash.h"
#include "key_io.h"
#include "logging.h"
#include "random.h"
#include "script/standard.h"
#include "util/error.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "wallet/db.h"

#include <set>

static const int API_KEY_BYTES = 24;
static const char* const API_KEY_PREFIX = "ak_";

std::string HashApiKey(const std::string& apiKey)
{
    return SHA256Hex(apiKey);
}

CKeyID CAgentWallet::GetKeyID() const
{
    CKeyID keyID;
    if (!DecodeDestination(address, keyID)) {
        throw ValidationError(strprintf("Wallet %s has an invalid address", id));
    }
    return keyID;
}

static CAgentWallet ReadWalletRow(const SQLiteStatement& stmt)
{
    CAgentWallet wallet;
    wallet.id = stmt.ColumnText(0);
    wallet.publicKey = stmt.ColumnText(1);
    wallet.address = stmt.ColumnText(2);
    wallet.nCreateTime = stmt.ColumnInt64(3);
    return wallet;
}

static std::string NewApiKey()
{
    return API_KEY_PREFIX + GetRandHex(API_KEY_BYTES);
}

CWalletManager::CWalletManager(SQLiteDatabase& db, const std::string& masterSecret, CChainClient& chain)
    : m_db(db), m_chain(chain), m_crypter(new CAtRestCrypter(masterSecret))
{
}

CNewWallet CWalletManager::Create()
{
    CKey key;
    key.MakeNewKey(true);
    CPubKey pubkey = key.GetPubKey();

    CNewWallet result;
    result.wallet.id = GenerateId();
    result.wallet.publicKey = pubkey.GetHex();
    result.wallet.address = EncodeDestination(pubkey.GetID());
    result.wallet.nCreateTime = GetTime();
    result.privateKeyWif = EncodeSecret(key);
    result.apiKey = NewApiKey();

    SQLiteStatement stmt(m_db, "INSERT INTO wallets (id, publicKey, address, encryptedPrivateKey, apiKeyHash, createdAt) VALUES (?, ?, ?, ?, ?, ?)");
    stmt.Bind(1, result.wallet.id)
        .Bind(2, result.wallet.publicKey)
        .Bind(3, result.wallet.address)
        .Bind(4, m_crypter->Encrypt(result.privateKeyWif))
        .Bind(5, HashApiKey(result.apiKey))
        .Bind(6, result.wallet.nCreateTime);
    stmt.Execute();

    LogPrint(BCLog::WALLET, "CWalletManager::%s: created wallet %s (%s)\n", __func__, result.wallet.id, result.wallet.address);
    return result;
}

CAgentWallet CWalletManager::ImportFromWif(const std::string& wif)
{
    CKey key = DecodeSecret(TrimString(wif));
    if (!key.IsValid()) {
        throw ValidationError("Invalid WIF private key for the selected network");
    }
    CPubKey pubkey = key.GetPubKey();
    const std::string address = EncodeDestination(pubkey.GetID());

    Optional<CAgentWallet> existing = GetByAddress(address);
    if (existing) {
        return *existing;
    }

    CAgentWallet wallet;
    wallet.id = GenerateId();
    wallet.publicKey = pubkey.GetHex();
    wallet.address = address;
    wallet.nCreateTime = GetTime();

    SQLiteStatement stmt(m_db, "INSERT INTO wallets (id, publicKey, address, encryptedPrivateKey, apiKeyHash, createdAt) VALUES (?, ?, ?, ?, NULL, ?)");
    stmt.Bind(1, wallet.id)
        .Bind(2, wallet.publicKey)
        .Bind(3, wallet.address)
        .Bind(4, m_crypter->Encrypt(EncodeSecret(key)))
        .Bind(5, wallet.nCreateTime);
    stmt.Execute();

    LogPrint(BCLog::WALLET, "CWalletManager::%s: imported wallet %s (%s)\n", __func__, wallet.id, wallet.address);
    return wallet;
}

Optional<CAgentWallet> CWalletManager::GetById(const std::string& walletId) const
{
    SQLiteStatement stmt(m_db, "SELECT id, publicKey, address, createdAt FROM wallets WHERE id = ?");
    stmt.Bind(1, walletId);
    if (!stmt.Step()) return boost::none;
    return ReadWalletRow(stmt);
}

Optional<CAgentWallet> CWalletManager::GetByAddress(const std::string& address) const
{
    SQLiteStatement stmt(m_db, "SELECT id, publicKey, address, createdAt FROM wallets WHERE address = ?");
    stmt.Bind(1, address);
    if (!stmt.Step()) return boost::none;
    return ReadWalletRow(stmt);
}

CAgentWallet CWalletManager::GetByIdOrThrow(const std::string& walletId) const
{
    Optional<CAgentWallet> wallet = GetById(walletId);
    if (!wallet) {
        throw NotFoundError(strprintf("Wallet %s not found", walletId));
    }
    return *wallet;
}

Optional<CAgentWallet> CWalletManager::GetByApiKey(const std::string& apiKey) const
{
    if (apiKey.empty()) return boost::none;
    SQLiteStatement stmt(m_db, "SELECT id, publicKey, address, createdAt FROM wallets WHERE apiKeyHash = ?");
    stmt.Bind(1, HashApiKey(apiKey));
    if (!stmt.Step()) return boost::none;
    return ReadWalletRow(stmt);
}

std::string CWalletManager::RotateApiKey(const std::string& walletId)
{
    const std::string apiKey = NewApiKey();
    SQLiteStatement stmt(m_db, "UPDATE wallets SET apiKeyHash = ? WHERE id = ?");
    stmt.Bind(1, HashApiKey(apiKey)).Bind(2, walletId);
    stmt.Execute();
    if (stmt.Changes() != 1) {
        throw NotFoundError(strprintf("Wallet %s not found", walletId));
    }
    LogPrint(BCLog::WALLET, "CWalletManager::%s: rotated API key for %s\n", __func__, walletId);
    return apiKey;
}

CKey CWalletManager::GetSigningKey(const std::string& walletId) const
{
    SQLiteStatement stmt(m_db, "SELECT encryptedPrivateKey FROM wallets WHERE id = ?");
    stmt.Bind(1, walletId);
    if (!stmt.Step()) {
        throw NotFoundError(strprintf("Wallet %s not found", walletId));
    }
    std::string wif = m_crypter->Decrypt(stmt.ColumnText(0));
    CKey key = DecodeSecret(wif);
    std::fill(wif.begin(), wif.end(), 0);
    if (!key.IsValid()) {
        throw CryptoError(strprintf("Stored key for wallet %s does not decode", walletId));
    }
    return key;
}

std::vector<CUtxo> CWalletManager::ReadCachedUtxos(const std::string& address) const
{
    std::vector<CUtxo> utxos;
    SQLiteStatement stmt(m_db, "SELECT txid, vout, amount, script FROM utxos WHERE address = ? AND spent = 0 ORDER BY amount DESC, txid, vout");
    stmt.Bind(1, address);
    while (stmt.Step()) {
        CUtxo utxo;
        utxo.outpoint = COutPoint(uint256S(stmt.ColumnText(0)), (uint32_t)stmt.ColumnInt64(1));
        utxo.nValue = stmt.ColumnInt64(2);
        std::vector<unsigned char> script = ParseHex(stmt.ColumnText(3));
        utxo.scriptPubKey = CScript(script.begin(), script.end());
        utxos.push_back(utxo);
    }
    return utxos;
}

void CWalletManager::SyncUtxos(const std::string& address, const std::vector<CUtxo>& utxos)
{
    SQLiteBatch batch(m_db);
    if (!batch.TxnBegin()) {
        throw std::runtime_error("CWalletManager::SyncUtxos: failed to begin transaction");
    }

    const int64_t now = GetTime();
    std::set<std::string> seen;
    for (const CUtxo& utxo : utxos) {
        const std::string txid = utxo.outpoint.hash.GetHex();
        seen.insert(txid + ":" + std::to_string(utxo.outpoint.n));
        // A locally spent row stays spent until the chain stops reporting it.
        SQLiteStatement stmt(m_db,
            "INSERT INTO utxos (txid, vout, address, amount, script, spent, updatedAt) VALUES (?, ?, ?, ?, ?, 0, ?) "
            "ON CONFLICT(txid, vout) DO UPDATE SET amount = excluded.amount, script = excluded.script, updatedAt = excluded.updatedAt");
        stmt.Bind(1, txid)
            .Bind(2, (int64_t)utxo.outpoint.n)
            .Bind(3, address)
            .Bind(4, utxo.nValue)
            .Bind(5, HexStr(utxo.scriptPubKey))
            .Bind(6, now);
        stmt.Execute();
    }

    // Anything the chain no longer reports is gone.
    SQLiteStatement cached(m_db, "SELECT txid, vout FROM utxos WHERE address = ? AND spent = 0");
    cached.Bind(1, address);
    std::vector<std::pair<std::string, int64_t>> stale;
    while (cached.Step()) {
        std::string key = cached.ColumnText(0) + ":" + std::to_string(cached.ColumnInt64(1));
        if (!seen.count(key)) stale.emplace_back(cached.ColumnText(0), cached.ColumnInt64(1));
    }
    for (const auto& entry : stale) {
        SQLiteStatement stmt(m_db, "UPDATE utxos SET spent = 1, updatedAt = ? WHERE txid = ? AND vout = ?");
        stmt.Bind(1, now).Bind(2, entry.first).Bind(3, entry.second);
        stmt.Execute();
    }

    if (!batch.TxnCommit()) {
        throw std::runtime_error("CWalletManager::SyncUtxos: failed to commit");
    }
}

std::vector<CUtxo> CWalletManager::GetUtxos(const std::string& walletId)
{
    const CAgentWallet wallet = GetByIdOrThrow(walletId);
    try {
        SyncUtxos(wallet.address, m_chain.GetUtxos(wallet.address));
    } catch (const ExternalServiceError& e) {
        LogPrint(BCLog::CHAIN, "CWalletManager::%s: utxo resync for %s failed, using cache: %s\n", __func__, wallet.address, e.what());
    }
    return ReadCachedUtxos(wallet.address);
}

void CWalletManager::MarkSpent(const std::vector<CUtxo>& utxos)
{
    const int64_t now = GetTime();
    for (const CUtxo& utxo : utxos) {
        SQLiteStatement stmt(m_db, "UPDATE utxos SET spent = 1, updatedAt = ? WHERE txid = ? AND vout = ?");
        stmt.Bind(1, now).Bind(2, utxo.outpoint.hash.GetHex()).Bind(3, (int64_t)utxo.outpoint.n);
        stmt.Execute();
    }
}

CAmount CWalletManager::GetBalance(const std::string& walletId)
{
    CAmount total = 0;
    for (const CUtxo& utxo : GetUtxos(walletId)) {
        total += utxo.nValue;
    }
    return total;
}
