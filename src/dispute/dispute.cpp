// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispute/dispute.h"

#include "admin/adminauth.h"
#include "admin/audit.h"
#include "dispute/disputedb.h"
#include "escrow/settlement.h"
#include "logging.h"
#include "random.h"
#include "registry/registry.h"
#include "util/error.h"
#include "util/time.h"
#include "wallet/db.h"

#include <univalue.h>

std::string DisputeStatusToString(DisputeStatus status)
{
    switch (status) {
    case DisputeStatus::OPEN: return "open";
    case DisputeStatus::UNDER_REVIEW: return "under_review";
    case DisputeStatus::RESOLVED_REFUND: return "resolved_refund";
    case DisputeStatus::RESOLVED_RELEASE: return "resolved_release";
    case DisputeStatus::RESOLVED_SPLIT: return "resolved_split";
    case DisputeStatus::EXPIRED: return "expired";
    } // no default case, so the compiler can warn about missing cases
    return "unknown";
}

bool DisputeStatusFromString(const std::string& str, DisputeStatus& status)
{
    if (str == "open") status = DisputeStatus::OPEN;
    else if (str == "under_review") status = DisputeStatus::UNDER_REVIEW;
    else if (str == "resolved_refund") status = DisputeStatus::RESOLVED_REFUND;
    else if (str == "resolved_release") status = DisputeStatus::RESOLVED_RELEASE;
    else if (str == "resolved_split") status = DisputeStatus::RESOLVED_SPLIT;
    else if (str == "expired") status = DisputeStatus::EXPIRED;
    else return false;
    return true;
}

std::string DisputeResolutionToString(DisputeResolution resolution)
{
    switch (resolution) {
    case DisputeResolution::REFUND: return "refund";
    case DisputeResolution::RELEASE: return "release";
    case DisputeResolution::SPLIT: return "split";
    } // no default case, so the compiler can warn about missing cases
    return "unknown";
}

bool DisputeResolutionFromString(const std::string& str, DisputeResolution& resolution)
{
    if (str == "refund") resolution = DisputeResolution::REFUND;
    else if (str == "release") resolution = DisputeResolution::RELEASE;
    else if (str == "split") resolution = DisputeResolution::SPLIT;
    else return false;
    return true;
}

bool CDispute::IsActive() const
{
    return status == DisputeStatus::OPEN || status == DisputeStatus::UNDER_REVIEW;
}

std::string CDispute::ToString() const
{
    return strprintf("CDispute(id=%s, payment=%s, buyer=%s, provider=%s, status=%s)",
                     id, paymentId, buyerWalletId, providerWalletId, DisputeStatusToString(status));
}

CDisputeResolver::CDisputeResolver(SQLiteDatabase& db, CSettlementEngine& engine, CServiceRegistry& registry,
                                   CAdminAuth& adminAuth, CAuditLog& audit, int64_t nReviewPeriod)
    : m_db(db), m_engine(engine), m_registry(registry), m_adminAuth(adminAuth), m_audit(audit),
      m_nReviewPeriod(nReviewPeriod)
{
}

CDispute CDisputeResolver::Open(const std::string& paymentId, const std::string& buyerWalletId,
                                const std::string& reason, const Optional<std::string>& evidence)
{
    if (reason.empty() || reason.size() > MAX_DISPUTE_REASON_LENGTH) {
        throw ValidationError(strprintf("Reason must be 1-%u characters", MAX_DISPUTE_REASON_LENGTH));
    }
    if (evidence && evidence->size() > MAX_DISPUTE_EVIDENCE_LENGTH) {
        throw ValidationError(strprintf("Evidence must be at most %u characters", MAX_DISPUTE_EVIDENCE_LENGTH));
    }

    SQLiteBatch batch(m_db);
    CDisputeDB disputedb(m_db);

    const Optional<CPayment> payment = m_engine.GetPayment(paymentId);
    if (!payment) {
        throw NotFoundError("Payment not found");
    }
    if (payment->buyerWalletId != buyerWalletId) {
        throw AuthError("Only buyer can open dispute");
    }
    CDispute existing;
    if (disputedb.ReadByPaymentId(paymentId, existing)) {
        throw ValidationError("Dispute already exists for this payment");
    }
    if (payment->status != PaymentStatus::ESCROWED && payment->status != PaymentStatus::DISPUTED) {
        throw ValidationError("Can only dispute escrowed payments");
    }

    const Optional<CService> service = m_registry.Get(payment->serviceId);
    if (!service) {
        throw NotFoundError("Service not found");
    }
    const int64_t now = GetTime();
    const int64_t nStart = payment->nCompleteTime ? *payment->nCompleteTime : payment->nCreateTime;
    if (now > nStart + service->nDisputeWindow * 60) {
        throw ValidationError(strprintf("Dispute window expired. Must file within %d minutes of execution",
                                        service->nDisputeWindow));
    }

    CDispute dispute;
    dispute.id = GenerateId();
    dispute.paymentId = paymentId;
    dispute.buyerWalletId = buyerWalletId;
    dispute.providerWalletId = payment->sellerWalletId;
    dispute.reason = reason;
    dispute.evidence = evidence;
    dispute.status = DisputeStatus::OPEN;
    dispute.nCreateTime = now;
    dispute.nUpdateTime = now;

    if (!batch.TxnBegin()) {
        throw std::runtime_error("CDisputeResolver::Open: cannot begin transaction");
    }
    disputedb.WriteDispute(dispute);
    if (!m_engine.MarkDisputed(paymentId)) {
        throw ValidationError("Can only dispute escrowed payments");
    }
    if (!batch.TxnCommit()) {
        throw std::runtime_error("CDisputeResolver::Open: cannot commit transaction");
    }

    LogPrint(BCLog::DISPUTE, "CDisputeResolver::%s: %s\n", __func__, dispute.ToString());
    return dispute;
}

CDispute CDisputeResolver::MarkUnderReview(const std::string& disputeId, const CAdminCredentials& credentials)
{
    UniValue context(UniValue::VOBJ);
    context.pushKV("disputeId", disputeId);

    std::string actor;
    try {
        actor = m_adminAuth.Authorize(credentials);
    } catch (const AuthError&) {
        m_audit.Record("unauthenticated", "dispute.review", "failure", context);
        throw;
    }

    const CDispute dispute = GetByIdOrThrow(disputeId);
    if (!CDisputeDB(m_db).UpdateStatus(dispute.id, DisputeStatus::OPEN, DisputeStatus::UNDER_REVIEW, GetTime())) {
        m_audit.Record(actor, "dispute.review", "failure", context);
        throw ValidationError(strprintf("Dispute is %s, not open", DisputeStatusToString(dispute.status)));
    }
    m_audit.Record(actor, "dispute.review", "success", context);
    return GetByIdOrThrow(disputeId);
}

CResolveResult CDisputeResolver::Resolve(const std::string& disputeId, const CAdminCredentials& credentials,
                                         const CResolveRequest& request)
{
    UniValue context(UniValue::VOBJ);
    context.pushKV("disputeId", disputeId);
    context.pushKV("resolution", DisputeResolutionToString(request.resolution));

    std::string actor;
    try {
        actor = m_adminAuth.Authorize(credentials);
    } catch (const AuthError&) {
        m_audit.Record("unauthenticated", "dispute.resolve", "failure", context);
        throw;
    }

    CResolveResult result;
    try {
        const CDispute dispute = GetByIdOrThrow(disputeId);
        context.pushKV("paymentId", dispute.paymentId);

        if (!dispute.IsActive()) {
            throw ValidationError(dispute.status == DisputeStatus::EXPIRED ? "Dispute has expired" : "Dispute already resolved");
        }
        if (request.resolution == DisputeResolution::SPLIT) {
            m_audit.Record(actor, "dispute.resolve", "not_implemented", context);
            throw NotImplementedError("Split resolution is not implemented");
        }
        // A step-up session speaks for exactly one admin wallet.
        if (actor != ADMIN_ACTOR_STATIC_KEY && actor != request.adminAddress) {
            throw AuthError("Admin approval must come from the authenticated admin wallet");
        }

        const SettlementAction action = request.resolution == DisputeResolution::RELEASE
            ? SettlementAction::RELEASE : SettlementAction::REFUND;

        m_engine.CreateAdminApproval(dispute.paymentId, action, request.adminAddress, request.adminSignature);
        if (m_engine.GetSettlementQuorum(dispute.paymentId, action).fTxSignatureRequired && !request.adminTxSignatureHex) {
            throw ValidationError("adminTxSignatureHex is required for multisig escrow");
        }

        const Optional<CPayment> payment = m_engine.SettleDisputed(dispute.paymentId, action, request.adminTxSignatureHex);
        if (!payment) {
            throw ValidationError("Payment is not in dispute");
        }

        const DisputeStatus status = action == SettlementAction::RELEASE
            ? DisputeStatus::RESOLVED_RELEASE : DisputeStatus::RESOLVED_REFUND;
        if (!CDisputeDB(m_db).Close(dispute.id, status, request.resolution, request.adminAddress, GetTime())) {
            LogPrintf("CDisputeResolver::%s: payment %s settled but dispute %s was already closed\n", __func__,
                      dispute.paymentId, dispute.id);
        }
        result.payment = *payment;
        result.dispute = GetByIdOrThrow(disputeId);
    } catch (const NotImplementedError&) {
        throw;
    } catch (const AgentPayError& e) {
        context.pushKV("error", e.what());
        m_audit.Record(actor, "dispute.resolve", "failure", context);
        throw;
    }

    m_audit.Record(actor, "dispute.resolve", "success", context);
    LogPrint(BCLog::DISPUTE, "CDisputeResolver::%s: %s\n", __func__, result.dispute.ToString());
    return result;
}

void CDisputeResolver::CheckExpiry(CDispute& dispute)
{
    if (!dispute.IsActive()) return;
    const int64_t now = GetTime();
    if (now - dispute.nCreateTime <= m_nReviewPeriod) return;

    SQLiteBatch batch(m_db);
    CDisputeDB disputedb(m_db);
    if (!batch.TxnBegin()) {
        throw std::runtime_error("CDisputeResolver::CheckExpiry: cannot begin transaction");
    }
    if (disputedb.Close(dispute.id, DisputeStatus::EXPIRED, boost::none, boost::none, now)) {
        if (!m_engine.ReturnToEscrow(dispute.paymentId)) {
            LogPrint(BCLog::DISPUTE, "CDisputeResolver::%s: payment %s was no longer disputed\n", __func__, dispute.paymentId);
        }
        LogPrint(BCLog::DISPUTE, "CDisputeResolver::%s: dispute %s expired\n", __func__, dispute.id);
    }
    if (!batch.TxnCommit()) {
        throw std::runtime_error("CDisputeResolver::CheckExpiry: cannot commit transaction");
    }
    if (!disputedb.ReadDispute(dispute.id, dispute)) {
        throw std::runtime_error("CDisputeResolver::CheckExpiry: dispute vanished");
    }
}

CDispute CDisputeResolver::GetByIdOrThrow(const std::string& disputeId)
{
    const Optional<CDispute> dispute = GetById(disputeId);
    if (!dispute) {
        throw NotFoundError("Dispute not found");
    }
    return *dispute;
}

Optional<CDispute> CDisputeResolver::GetById(const std::string& disputeId)
{
    CDispute dispute;
    if (!CDisputeDB(m_db).ReadDispute(disputeId, dispute)) return boost::none;
    CheckExpiry(dispute);
    return dispute;
}

Optional<CDispute> CDisputeResolver::GetByPaymentId(const std::string& paymentId)
{
    CDispute dispute;
    if (!CDisputeDB(m_db).ReadByPaymentId(paymentId, dispute)) return boost::none;
    CheckExpiry(dispute);
    return dispute;
}

std::vector<CDispute> CDisputeResolver::ListByWallet(const std::string& walletId)
{
    std::vector<CDispute> disputes = CDisputeDB(m_db).ListByWallet(walletId);
    for (CDispute& dispute : disputes) {
        CheckExpiry(dispute);
    }
    return disputes;
}
