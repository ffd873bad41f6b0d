// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_CONTRACT_CONTRACT_H
#define AGENTPAY_CONTRACT_CONTRACT_H

/**
 * Service contracts
 *
 * Every execution is bound by a contract over canonical terms. Both parties
 * sign "Contract:" + SHA256(canonical payload) with their wallet keys, and
 * the hash may be anchored on chain in a zero-value data carrier.
 *
 * Canonical payload field order:
 *   version, domain, serviceId, buyerWalletId, providerWalletId,
 *   buyerAddress, providerAddress, amount, currency, termsHash, disputeWindow
 */

#include "amount.h"
#include "escrow/payment.h"
#include "escrow/txbuilder.h"
#include "optional.h"

#include <stdint.h>
#include <string>
#include <vector>

class CChainClient;
class CKey;
class CWalletManager;
class SQLiteDatabase;

static const int CONTRACT_VERSION = 1;
static const char* const CONTRACT_DOMAIN = "agentpay.service.contract";
static const char* const CONTRACT_MESSAGE_PREFIX = "Contract:";

enum class ContractStatus {
    ACTIVE,
    RELEASED,
    REFUNDED,
    DISPUTED,
};

std::string ContractStatusToString(ContractStatus status);
bool ContractStatusFromString(const std::string& str, ContractStatus& status);

/** The terms both parties commit to. */
struct CContractTerms
{
    std::string serviceId;
    std::string buyerWalletId;
    std::string providerWalletId;
    std::string buyerAddress;
    std::string providerAddress;
    CAmount nAmount{0};
    Currency currency{Currency::BSV};
    std::string termsHash;          // hash of the service request the parties agreed on
    int64_t nDisputeWindow{0};      // minutes
};

class CServiceContract
{
public:
    std::string id;
    Optional<std::string> paymentId;
    CContractTerms terms;
    std::string contractHash;
    std::string buyerSignature;     // base64 compact message signatures
    std::string providerSignature;
    ContractStatus status{ContractStatus::ACTIVE};
    Optional<std::string> contractTxId;     // anchor transaction
    Optional<std::string> settlementTxId;
    int64_t nCreateTime{0};
    Optional<int64_t> nSettleTime;
};

/** Outcome of VerifyContract(). Each failed check adds its own reason. */
struct CContractVerification
{
    bool fValid{false};
    std::vector<std::string> errors;
    Optional<CServiceContract> contract;
};

static const char* const CONTRACT_ERR_NOT_FOUND = "Contract not found";
static const char* const CONTRACT_ERR_HASH_MISMATCH = "Contract hash mismatch";
static const char* const CONTRACT_ERR_BUYER_SIGNATURE = "Buyer signature invalid";
static const char* const CONTRACT_ERR_PROVIDER_SIGNATURE = "Provider signature invalid";

/** Deterministic JSON of the terms; independent of how the caller built them. */
std::string CanonicalContractPayload(const CContractTerms& terms);
/** Lower-case hex SHA-256 of CanonicalContractPayload(). */
std::string ComputeContractHash(const CContractTerms& terms);
/** The string both parties sign. */
std::string GetContractMessage(const std::string& contractHash);

class CContractManager
{
public:
    CContractManager(SQLiteDatabase& db, CWalletManager& wallets, CChainClient& chain,
                     const FeePolicy& feePolicy, bool fAnchor);

    /**
     * Sign the terms with both keys, verify each signature against the
     * party's stored public key and persist the contract. Nothing is stored
     * unless both verify. Anchoring is attempted afterwards and its failure
     * only leaves contractTxId empty.
     *
     * @throws ValidationError, NotFoundError, CryptoVerificationError
     */
    CServiceContract CreateAndAnchor(const CContractTerms& terms, const CKey& buyerKey, const CKey& providerKey);

    /** Recompute the hash from the stored terms and re-verify both signatures. */
    CContractVerification VerifyContract(const std::string& contractId) const;

    Optional<CServiceContract> GetById(const std::string& contractId) const;
    Optional<CServiceContract> GetByPaymentId(const std::string& paymentId) const;

    /** Record the payment opened under this contract. */
    bool LinkPayment(const std::string& contractId, const std::string& paymentId);

    /** Mirror the linked payment's status. */
    void SetStatusByPaymentId(const std::string& paymentId, ContractStatus status,
                              const Optional<std::string>& settlementTxId = boost::none);

private:
    SQLiteDatabase& m_db;
    CWalletManager& m_wallets;
    CChainClient& m_chain;
    FeePolicy m_feePolicy;
    bool m_fAnchor;

    Optional<std::string> Anchor(const CContractTerms& terms, const std::string& contractHash, const CKey& key);
};

#endif // AGENTPAY_CONTRACT_CONTRACT_H
