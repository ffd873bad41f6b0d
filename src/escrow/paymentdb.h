// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_PAYMENTDB_H
#define AGENTPAY_ESCROW_PAYMENTDB_H

/**
 * Payment Database Layer
 *
 * Persistence for payments and settlement approvals:
 * - WritePayment / ReadPayment / ListByWallet
 * - conditional status transitions (UPDATE ... WHERE status = expected)
 * - set-if-absent consumption binding
 * - approvals, unique per (payment, action, actor type, actor)
 *
 * Every state change that matters for fund safety is a conditional update:
 * callers learn from the return value whether they won the transition.
 */

#include "escrow/payment.h"

#include <vector>

class SQLiteDatabase;

enum class PaymentRole {
    BUYER,
    SELLER,
    ANY,
};

class CPaymentDB
{
private:
    SQLiteDatabase& m_db;

public:
    explicit CPaymentDB(SQLiteDatabase& db) : m_db(db) {}

    // === Payment Record Operations ===

    /**
     * WritePayment - Insert a new payment record
     * @throws std::runtime_error if the id already exists
     */
    void WritePayment(const CPayment& payment);

    /**
     * ReadPayment - Retrieve payment by id
     * @param id The payment id
     * @param payment Output: the payment record
     * @return true if found
     */
    bool ReadPayment(const std::string& id, CPayment& payment) const;

    /** Payments a wallet takes part in, newest first. */
    std::vector<CPayment> ListByWallet(const std::string& walletId, PaymentRole role) const;

    // === Conditional Transitions ===

    /**
     * MarkEscrowed - pending -> escrowed, recording the escrow output
     * @return true if this call performed the transition
     */
    bool MarkEscrowed(const std::string& id, const std::string& txid, const Optional<int64_t>& nVout);

    /**
     * UpdateStatus - expected -> status, nothing else touched
     * @return true if this call performed the transition
     */
    bool UpdateStatus(const std::string& id, PaymentStatus expected, PaymentStatus status);

    /**
     * RecordSettlementTx - store a broadcast settlement txid, status unchanged
     * @return true if the payment is still in the expected status
     */
    bool RecordSettlementTx(const std::string& id, PaymentStatus expected, SettlementAction action, const std::string& txid);

    /**
     * CompleteSettlement - expected -> released|refunded with its settlement txid
     * @return true if this call performed the transition
     */
    bool CompleteSettlement(const std::string& id, PaymentStatus expected, SettlementAction action,
                            const std::string& txid, int64_t nCompleteTime);

    /** Link the service contract created for this payment. */
    bool LinkContract(const std::string& id, const std::string& contractId);

    /**
     * BindConsumption - Set the consumer reference if none is bound yet
     * @return true if this call bound it
     */
    bool BindConsumption(const std::string& id, const std::string& consumerRef);

    // === Settlement Approvals ===

    /**
     * WriteApproval - Record an approval; a duplicate for the same
     * (payment, action, actor type, actor) is ignored and the stored one kept.
     * @return the stored approval
     */
    CSettlementApproval WriteApproval(const CSettlementApproval& approval);

    /** Approvals for a payment, optionally for one action, oldest first. */
    std::vector<CSettlementApproval> ReadApprovals(const std::string& paymentId,
                                                   const Optional<SettlementAction>& action = boost::none) const;

    /** Distinct actor types that approved (payment, action). */
    std::vector<SettlementActorType> ReadApprovalActorTypes(const std::string& paymentId, SettlementAction action) const;
};

#endif // AGENTPAY_ESCROW_PAYMENTDB_H
