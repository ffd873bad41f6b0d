// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_DISPUTE_DISPUTEDB_H
#define AGENTPAY_DISPUTE_DISPUTEDB_H

#include "dispute/dispute.h"

class SQLiteDatabase;

/**
 * Dispute Database Layer
 *
 * Status changes are conditional on the dispute still being active.
 */
class CDisputeDB
{
private:
    SQLiteDatabase& m_db;

public:
    explicit CDisputeDB(SQLiteDatabase& db) : m_db(db) {}

    void WriteDispute(const CDispute& dispute);
    bool ReadDispute(const std::string& id, CDispute& dispute) const;
    bool ReadByPaymentId(const std::string& paymentId, CDispute& dispute) const;
    std::vector<CDispute> ListByWallet(const std::string& walletId) const;

    /** expected -> status. */
    bool UpdateStatus(const std::string& id, DisputeStatus expected, DisputeStatus status, int64_t nTime);

    /** Active -> resolved_* or expired, recording who closed it. */
    bool Close(const std::string& id, DisputeStatus status, const Optional<DisputeResolution>& resolution,
               const Optional<std::string>& resolvedBy, int64_t nTime);
};

#endif // AGENTPAY_DISPUTE_DISPUTEDB_H
