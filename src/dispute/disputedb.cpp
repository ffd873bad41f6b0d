// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispute/disputedb.h"

#include "util/format.h"
#include "wallet/db.h"

#include <stdexcept>

static const char* const DISPUTE_COLUMNS =
    "id, paymentId, buyerWalletId, providerWalletId, reason, evidence, status, resolution, "
    "resolvedBy, resolvedAt, createdAt, updatedAt";

static CDispute ReadDisputeRow(const SQLiteStatement& stmt)
{
    CDispute dispute;
    dispute.id = stmt.ColumnText(0);
    dispute.paymentId = stmt.ColumnText(1);
    dispute.buyerWalletId = stmt.ColumnText(2);
    dispute.providerWalletId = stmt.ColumnText(3);
    dispute.reason = stmt.ColumnText(4);
    dispute.evidence = stmt.ColumnOptionalText(5);
    if (!DisputeStatusFromString(stmt.ColumnText(6), dispute.status)) {
        throw std::runtime_error(strprintf("dispute %s: bad status column", dispute.id));
    }
    const Optional<std::string> resolution = stmt.ColumnOptionalText(7);
    if (resolution) {
        DisputeResolution value;
        if (!DisputeResolutionFromString(*resolution, value)) {
            throw std::runtime_error(strprintf("dispute %s: bad resolution column", dispute.id));
        }
        dispute.resolution = value;
    }
    dispute.resolvedBy = stmt.ColumnOptionalText(8);
    dispute.nResolveTime = stmt.ColumnOptionalInt64(9);
    dispute.nCreateTime = stmt.ColumnInt64(10);
    dispute.nUpdateTime = stmt.ColumnInt64(11);
    return dispute;
}

static Optional<std::string> ResolutionColumn(const Optional<DisputeResolution>& resolution)
{
    if (!resolution) return boost::none;
    return DisputeResolutionToString(*resolution);
}

void CDisputeDB::WriteDispute(const CDispute& dispute)
{
    SQLiteStatement stmt(m_db, strprintf(
        "INSERT INTO disputes (%s) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", DISPUTE_COLUMNS));
    stmt.Bind(1, dispute.id)
        .Bind(2, dispute.paymentId)
        .Bind(3, dispute.buyerWalletId)
        .Bind(4, dispute.providerWalletId)
        .Bind(5, dispute.reason)
        .Bind(6, dispute.evidence)
        .Bind(7, DisputeStatusToString(dispute.status))
        .Bind(8, ResolutionColumn(dispute.resolution))
        .Bind(9, dispute.resolvedBy)
        .Bind(10, dispute.nResolveTime)
        .Bind(11, dispute.nCreateTime)
        .Bind(12, dispute.nUpdateTime);
    stmt.Execute();
}

bool CDisputeDB::ReadDispute(const std::string& id, CDispute& dispute) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM disputes WHERE id = ?", DISPUTE_COLUMNS));
    stmt.Bind(1, id);
    if (!stmt.Step()) return false;
    dispute = ReadDisputeRow(stmt);
    return true;
}

bool CDisputeDB::ReadByPaymentId(const std::string& paymentId, CDispute& dispute) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM disputes WHERE paymentId = ?", DISPUTE_COLUMNS));
    stmt.Bind(1, paymentId);
    if (!stmt.Step()) return false;
    dispute = ReadDisputeRow(stmt);
    return true;
}

std::vector<CDispute> CDisputeDB::ListByWallet(const std::string& walletId) const
{
    std::vector<CDispute> disputes;
    SQLiteStatement stmt(m_db, strprintf(
        "SELECT %s FROM disputes WHERE buyerWalletId = ? OR providerWalletId = ? ORDER BY createdAt DESC",
        DISPUTE_COLUMNS));
    stmt.Bind(1, walletId).Bind(2, walletId);
    while (stmt.Step()) {
        disputes.push_back(ReadDisputeRow(stmt));
    }
    return disputes;
}

bool CDisputeDB::UpdateStatus(const std::string& id, DisputeStatus expected, DisputeStatus status, int64_t nTime)
{
    SQLiteStatement stmt(m_db, "UPDATE disputes SET status = ?, updatedAt = ? WHERE id = ? AND status = ?");
    stmt.Bind(1, DisputeStatusToString(status))
        .Bind(2, nTime)
        .Bind(3, id)
        .Bind(4, DisputeStatusToString(expected));
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CDisputeDB::Close(const std::string& id, DisputeStatus status, const Optional<DisputeResolution>& resolution,
                       const Optional<std::string>& resolvedBy, int64_t nTime)
{
    SQLiteStatement stmt(m_db,
        "UPDATE disputes SET status = ?, resolution = ?, resolvedBy = ?, resolvedAt = ?, updatedAt = ? "
        "WHERE id = ? AND status IN ('open', 'under_review')");
    stmt.Bind(1, DisputeStatusToString(status))
        .Bind(2, ResolutionColumn(resolution))
        .Bind(3, resolvedBy)
        .Bind(4, nTime)
        .Bind(5, nTime)
        .Bind(6, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}
