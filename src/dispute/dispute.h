// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_DISPUTE_DISPUTE_H
#define AGENTPAY_DISPUTE_DISPUTE_H

#include "escrow/payment.h"
#include "optional.h"

#include <stdint.h>
#include <string>
#include <vector>

class CAdminAuth;
class CAuditLog;
class CServiceRegistry;
class CSettlementEngine;
class SQLiteDatabase;
struct CAdminCredentials;

static const size_t MAX_DISPUTE_REASON_LENGTH = 1000;
static const size_t MAX_DISPUTE_EVIDENCE_LENGTH = 10000;
static const int64_t DEFAULT_DISPUTE_REVIEW_PERIOD = 7 * 24 * 60 * 60;   // seconds

enum class DisputeStatus {
    OPEN,
    UNDER_REVIEW,
    RESOLVED_REFUND,
    RESOLVED_RELEASE,
    RESOLVED_SPLIT,     // never reached, split is not implemented
    EXPIRED,
};

enum class DisputeResolution {
    REFUND,
    RELEASE,
    SPLIT,
};

std::string DisputeStatusToString(DisputeStatus status);
bool DisputeStatusFromString(const std::string& str, DisputeStatus& status);
std::string DisputeResolutionToString(DisputeResolution resolution);
bool DisputeResolutionFromString(const std::string& str, DisputeResolution& resolution);

class CDispute
{
public:
    std::string id;
    std::string paymentId;
    std::string buyerWalletId;
    std::string providerWalletId;
    std::string reason;
    Optional<std::string> evidence;
    DisputeStatus status{DisputeStatus::OPEN};
    Optional<DisputeResolution> resolution;
    Optional<std::string> resolvedBy;
    Optional<int64_t> nResolveTime;
    int64_t nCreateTime{0};
    int64_t nUpdateTime{0};

    /** open or under_review */
    bool IsActive() const;
    std::string ToString() const;
};

/** Privileged resolution request body. */
struct CResolveRequest
{
    DisputeResolution resolution{DisputeResolution::REFUND};
    //! Allow-listed admin address whose signature approves the settlement.
    std::string adminAddress;
    //! Signature over the payment's settlement message for the action.
    std::string adminSignature;
    //! Admin co-signature of the multisig spend; required for multisig escrow.
    Optional<std::string> adminTxSignatureHex;
};

struct CResolveResult
{
    CDispute dispute;
    CPayment payment;
};

/**
 * One dispute per payment, opened by the buyer inside the service's dispute
 * window and closed by an admin through the settlement engine.
 *
 * An active dispute older than the review period expires the next time it
 * is read, and its payment goes back to escrow.
 */
class CDisputeResolver
{
public:
    CDisputeResolver(SQLiteDatabase& db, CSettlementEngine& engine, CServiceRegistry& registry,
                     CAdminAuth& adminAuth, CAuditLog& audit,
                     int64_t nReviewPeriod = DEFAULT_DISPUTE_REVIEW_PERIOD);

    /**
     * @throws NotFoundError, ValidationError
     * @throws AuthError if buyerWalletId is not the payment's buyer
     */
    CDispute Open(const std::string& paymentId, const std::string& buyerWalletId, const std::string& reason,
                  const Optional<std::string>& evidence = boost::none);

    /** open -> under_review. @throws AuthError, NotFoundError, ValidationError */
    CDispute MarkUnderReview(const std::string& disputeId, const CAdminCredentials& credentials);

    /**
     * Settle the disputed payment in the requested direction.
     *
     * @throws AuthError, CryptoVerificationError, ValidationError, NotFoundError
     * @throws NotImplementedError for split, leaving everything unchanged
     */
    CResolveResult Resolve(const std::string& disputeId, const CAdminCredentials& credentials,
                           const CResolveRequest& request);

    Optional<CDispute> GetById(const std::string& disputeId);
    Optional<CDispute> GetByPaymentId(const std::string& paymentId);
    std::vector<CDispute> ListByWallet(const std::string& walletId);

private:
    SQLiteDatabase& m_db;
    CSettlementEngine& m_engine;
    CServiceRegistry& m_registry;
    CAdminAuth& m_adminAuth;
    CAuditLog& m_audit;
    int64_t m_nReviewPeriod;

    /** Expire the dispute if its review period has passed. */
    void CheckExpiry(CDispute& dispute);
    CDispute GetByIdOrThrow(const std::string& disputeId);
};

#endif // AGENTPAY_DISPUTE_DISPUTE_H
