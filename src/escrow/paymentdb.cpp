// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/paymentdb.h"

#include "logging.h"
#include "util/time.h"
#include "wallet/db.h"

#include <stdexcept>

static const char* const PAYMENT_COLUMNS =
    "id, serviceId, contractId, buyerWalletId, sellerWalletId, amount, platformFee, currency, "
    "escrowMode, status, consumedBy, escrowTxId, escrowVout, escrowScript, releaseTxId, refundTxId, "
    "createdAt, completedAt";

static const char* const APPROVAL_COLUMNS =
    "id, paymentId, action, actorType, actorId, signature, message, createdAt";

static CPayment ReadPaymentRow(const SQLiteStatement& stmt)
{
    CPayment payment;
    payment.id = stmt.ColumnText(0);
    payment.serviceId = stmt.ColumnText(1);
    payment.contractId = stmt.ColumnOptionalText(2);
    payment.buyerWalletId = stmt.ColumnText(3);
    payment.sellerWalletId = stmt.ColumnText(4);
    payment.nAmount = stmt.ColumnInt64(5);
    payment.nPlatformFee = stmt.ColumnInt64(6);
    if (!CurrencyFromString(stmt.ColumnText(7), payment.currency)) {
        throw std::runtime_error(strprintf("payment %s: bad currency column", payment.id));
    }
    if (!EscrowModeFromString(stmt.ColumnText(8), payment.escrowMode)) {
        throw std::runtime_error(strprintf("payment %s: bad escrowMode column", payment.id));
    }
    if (!PaymentStatusFromString(stmt.ColumnText(9), payment.status)) {
        throw std::runtime_error(strprintf("payment %s: bad status column", payment.id));
    }
    payment.consumedBy = stmt.ColumnOptionalText(10);
    payment.escrowTxId = stmt.ColumnOptionalText(11);
    payment.nEscrowVout = stmt.ColumnOptionalInt64(12);
    payment.escrowScriptHex = stmt.ColumnOptionalText(13);
    payment.releaseTxId = stmt.ColumnOptionalText(14);
    payment.refundTxId = stmt.ColumnOptionalText(15);
    payment.nCreateTime = stmt.ColumnInt64(16);
    payment.nCompleteTime = stmt.ColumnOptionalInt64(17);
    return payment;
}

static CSettlementApproval ReadApprovalRow(const SQLiteStatement& stmt)
{
    CSettlementApproval approval;
    approval.id = stmt.ColumnInt64(0);
    approval.paymentId = stmt.ColumnText(1);
    if (!SettlementActionFromString(stmt.ColumnText(2), approval.action) ||
        !SettlementActorTypeFromString(stmt.ColumnText(3), approval.actorType)) {
        throw std::runtime_error(strprintf("approval %d: bad action or actor column", approval.id));
    }
    approval.actorId = stmt.ColumnText(4);
    approval.signature = stmt.ColumnText(5);
    approval.message = stmt.ColumnText(6);
    approval.nCreateTime = stmt.ColumnInt64(7);
    return approval;
}

void CPaymentDB::WritePayment(const CPayment& payment)
{
    SQLiteStatement stmt(m_db, strprintf("INSERT INTO payments (%s) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)", PAYMENT_COLUMNS));
    stmt.Bind(1, payment.id)
        .Bind(2, payment.serviceId)
        .Bind(3, payment.contractId)
        .Bind(4, payment.buyerWalletId)
        .Bind(5, payment.sellerWalletId)
        .Bind(6, payment.nAmount)
        .Bind(7, payment.nPlatformFee)
        .Bind(8, CurrencyToString(payment.currency))
        .Bind(9, EscrowModeToString(payment.escrowMode))
        .Bind(10, PaymentStatusToString(payment.status))
        .Bind(11, payment.consumedBy)
        .Bind(12, payment.escrowTxId)
        .Bind(13, payment.nEscrowVout)
        .Bind(14, payment.escrowScriptHex)
        .Bind(15, payment.releaseTxId)
        .Bind(16, payment.refundTxId)
        .Bind(17, payment.nCreateTime)
        .Bind(18, payment.nCompleteTime);
    stmt.Execute();
}

bool CPaymentDB::ReadPayment(const std::string& id, CPayment& payment) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM payments WHERE id = ?", PAYMENT_COLUMNS));
    stmt.Bind(1, id);
    if (!stmt.Step()) return false;
    payment = ReadPaymentRow(stmt);
    return true;
}

std::vector<CPayment> CPaymentDB::ListByWallet(const std::string& walletId, PaymentRole role) const
{
    std::string where;
    switch (role) {
    case PaymentRole::BUYER: where = "buyerWalletId = ?1"; break;
    case PaymentRole::SELLER: where = "sellerWalletId = ?1"; break;
    case PaymentRole::ANY: where = "(buyerWalletId = ?1 OR sellerWalletId = ?1)"; break;
    }

    std::vector<CPayment> payments;
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM payments WHERE %s ORDER BY createdAt DESC, id", PAYMENT_COLUMNS, where));
    stmt.Bind(1, walletId);
    while (stmt.Step()) {
        payments.push_back(ReadPaymentRow(stmt));
    }
    return payments;
}

bool CPaymentDB::MarkEscrowed(const std::string& id, const std::string& txid, const Optional<int64_t>& nVout)
{
    SQLiteStatement stmt(m_db,
        "UPDATE payments SET status = 'escrowed', escrowTxId = ?, escrowVout = ? WHERE id = ? AND status = 'pending'");
    stmt.Bind(1, txid).Bind(2, nVout).Bind(3, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CPaymentDB::UpdateStatus(const std::string& id, PaymentStatus expected, PaymentStatus status)
{
    SQLiteStatement stmt(m_db, "UPDATE payments SET status = ? WHERE id = ? AND status = ?");
    stmt.Bind(1, PaymentStatusToString(status)).Bind(2, id).Bind(3, PaymentStatusToString(expected));
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CPaymentDB::RecordSettlementTx(const std::string& id, PaymentStatus expected, SettlementAction action,
                                    const std::string& txid)
{
    SQLiteStatement stmt(m_db, strprintf("UPDATE payments SET %s = ? WHERE id = ? AND status = ?",
                                         action == SettlementAction::RELEASE ? "releaseTxId" : "refundTxId"));
    stmt.Bind(1, txid).Bind(2, id).Bind(3, PaymentStatusToString(expected));
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CPaymentDB::CompleteSettlement(const std::string& id, PaymentStatus expected, SettlementAction action,
                                    const std::string& txid, int64_t nCompleteTime)
{
    const bool fRelease = action == SettlementAction::RELEASE;
    SQLiteStatement stmt(m_db, strprintf(
        "UPDATE payments SET status = ?, %s = ?, completedAt = ? WHERE id = ? AND status = ?",
        fRelease ? "releaseTxId" : "refundTxId"));
    stmt.Bind(1, PaymentStatusToString(fRelease ? PaymentStatus::RELEASED : PaymentStatus::REFUNDED))
        .Bind(2, txid)
        .Bind(3, nCompleteTime)
        .Bind(4, id)
        .Bind(5, PaymentStatusToString(expected));
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CPaymentDB::LinkContract(const std::string& id, const std::string& contractId)
{
    SQLiteStatement stmt(m_db, "UPDATE payments SET contractId = ? WHERE id = ? AND contractId IS NULL");
    stmt.Bind(1, contractId).Bind(2, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CPaymentDB::BindConsumption(const std::string& id, const std::string& consumerRef)
{
    SQLiteStatement stmt(m_db, "UPDATE payments SET consumedBy = ? WHERE id = ? AND consumedBy IS NULL");
    stmt.Bind(1, consumerRef).Bind(2, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}

CSettlementApproval CPaymentDB::WriteApproval(const CSettlementApproval& approval)
{
    const std::string action = SettlementActionToString(approval.action);
    const std::string actorType = SettlementActorTypeToString(approval.actorType);

    SQLiteStatement insert(m_db,
        "INSERT OR IGNORE INTO settlement_approvals (paymentId, action, actorType, actorId, signature, message, createdAt) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    insert.Bind(1, approval.paymentId)
        .Bind(2, action)
        .Bind(3, actorType)
        .Bind(4, approval.actorId)
        .Bind(5, approval.signature)
        .Bind(6, approval.message)
        .Bind(7, approval.nCreateTime ? approval.nCreateTime : GetTime());
    insert.Execute();

    SQLiteStatement stmt(m_db, strprintf(
        "SELECT %s FROM settlement_approvals WHERE paymentId = ? AND action = ? AND actorType = ? AND actorId = ?",
        APPROVAL_COLUMNS));
    stmt.Bind(1, approval.paymentId).Bind(2, action).Bind(3, actorType).Bind(4, approval.actorId);
    if (!stmt.Step()) {
        throw std::runtime_error("Failed to store settlement approval");
    }
    return ReadApprovalRow(stmt);
}

std::vector<CSettlementApproval> CPaymentDB::ReadApprovals(const std::string& paymentId,
                                                           const Optional<SettlementAction>& action) const
{
    std::vector<CSettlementApproval> approvals;
    SQLiteStatement stmt(m_db, strprintf(
        "SELECT %s FROM settlement_approvals WHERE paymentId = ?%s ORDER BY createdAt ASC, id ASC",
        APPROVAL_COLUMNS, action ? " AND action = ?" : ""));
    stmt.Bind(1, paymentId);
    if (action) stmt.Bind(2, SettlementActionToString(*action));
    while (stmt.Step()) {
        approvals.push_back(ReadApprovalRow(stmt));
    }
    return approvals;
}

std::vector<SettlementActorType> CPaymentDB::ReadApprovalActorTypes(const std::string& paymentId, SettlementAction action) const
{
    std::vector<SettlementActorType> types;
    SQLiteStatement stmt(m_db,
        "SELECT DISTINCT actorType FROM settlement_approvals WHERE paymentId = ? AND action = ? ORDER BY actorType");
    stmt.Bind(1, paymentId).Bind(2, SettlementActionToString(action));
    while (stmt.Step()) {
        SettlementActorType type;
        if (!SettlementActorTypeFromString(stmt.ColumnText(0), type)) {
            throw std::runtime_error("settlement_approvals: bad actorType column");
        }
        types.push_back(type);
    }
    return types;
}
