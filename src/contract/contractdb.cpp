// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "contract/contractdb.h"

#include "util/format.h"
#include "wallet/db.h"

#include <stdexcept>

static const char* const CONTRACT_COLUMNS =
    "id, serviceId, paymentId, buyerWalletId, providerWalletId, buyerAddress, providerAddress, "
    "amount, currency, termsHash, disputeWindow, contractHash, buyerSignature, providerSignature, "
    "status, contractTxId, settlementTxId, createdAt, settledAt";

static CServiceContract ReadContractRow(const SQLiteStatement& stmt)
{
    CServiceContract contract;
    contract.id = stmt.ColumnText(0);
    contract.terms.serviceId = stmt.ColumnText(1);
    contract.paymentId = stmt.ColumnOptionalText(2);
    contract.terms.buyerWalletId = stmt.ColumnText(3);
    contract.terms.providerWalletId = stmt.ColumnText(4);
    contract.terms.buyerAddress = stmt.ColumnText(5);
    contract.terms.providerAddress = stmt.ColumnText(6);
    contract.terms.nAmount = stmt.ColumnInt64(7);
    if (!CurrencyFromString(stmt.ColumnText(8), contract.terms.currency)) {
        throw std::runtime_error(strprintf("contract %s: bad currency column", contract.id));
    }
    contract.terms.termsHash = stmt.ColumnText(9);
    contract.terms.nDisputeWindow = stmt.ColumnInt64(10);
    contract.contractHash = stmt.ColumnText(11);
    contract.buyerSignature = stmt.ColumnText(12);
    contract.providerSignature = stmt.ColumnText(13);
    if (!ContractStatusFromString(stmt.ColumnText(14), contract.status)) {
        throw std::runtime_error(strprintf("contract %s: bad status column", contract.id));
    }
    contract.contractTxId = stmt.ColumnOptionalText(15);
    contract.settlementTxId = stmt.ColumnOptionalText(16);
    contract.nCreateTime = stmt.ColumnInt64(17);
    contract.nSettleTime = stmt.ColumnOptionalInt64(18);
    return contract;
}

void CContractDB::WriteContract(const CServiceContract& contract)
{
    const CContractTerms& terms = contract.terms;
    SQLiteStatement stmt(m_db, strprintf(
        "INSERT INTO service_contracts (%s) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        CONTRACT_COLUMNS));
    stmt.Bind(1, contract.id)
        .Bind(2, terms.serviceId)
        .Bind(3, contract.paymentId)
        .Bind(4, terms.buyerWalletId)
        .Bind(5, terms.providerWalletId)
        .Bind(6, terms.buyerAddress)
        .Bind(7, terms.providerAddress)
        .Bind(8, terms.nAmount)
        .Bind(9, CurrencyToString(terms.currency))
        .Bind(10, terms.termsHash)
        .Bind(11, terms.nDisputeWindow)
        .Bind(12, contract.contractHash)
        .Bind(13, contract.buyerSignature)
        .Bind(14, contract.providerSignature)
        .Bind(15, ContractStatusToString(contract.status))
        .Bind(16, contract.contractTxId)
        .Bind(17, contract.settlementTxId)
        .Bind(18, contract.nCreateTime)
        .Bind(19, contract.nSettleTime);
    stmt.Execute();
}

bool CContractDB::ReadContract(const std::string& id, CServiceContract& contract) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM service_contracts WHERE id = ?", CONTRACT_COLUMNS));
    stmt.Bind(1, id);
    if (!stmt.Step()) return false;
    contract = ReadContractRow(stmt);
    return true;
}

bool CContractDB::ReadByPaymentId(const std::string& paymentId, CServiceContract& contract) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM service_contracts WHERE paymentId = ?", CONTRACT_COLUMNS));
    stmt.Bind(1, paymentId);
    if (!stmt.Step()) return false;
    contract = ReadContractRow(stmt);
    return true;
}

bool CContractDB::LinkPayment(const std::string& id, const std::string& paymentId)
{
    SQLiteStatement stmt(m_db, "UPDATE service_contracts SET paymentId = ? WHERE id = ? AND paymentId IS NULL");
    stmt.Bind(1, paymentId).Bind(2, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CContractDB::WriteAnchor(const std::string& id, const std::string& txid)
{
    SQLiteStatement stmt(m_db, "UPDATE service_contracts SET contractTxId = ? WHERE id = ?");
    stmt.Bind(1, txid).Bind(2, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}

bool CContractDB::UpdateStatusByPaymentId(const std::string& paymentId, ContractStatus status,
                                          const Optional<std::string>& settlementTxId, int64_t nTime)
{
    const bool fFinal = status == ContractStatus::RELEASED || status == ContractStatus::REFUNDED;
    SQLiteStatement stmt(m_db,
        "UPDATE service_contracts SET status = ?, settlementTxId = COALESCE(?, settlementTxId), settledAt = ? "
        "WHERE paymentId = ?");
    stmt.Bind(1, ContractStatusToString(status))
        .Bind(2, settlementTxId)
        .Bind(3, fFinal ? Optional<int64_t>(nTime) : Optional<int64_t>())
        .Bind(4, paymentId);
    stmt.Execute();
    return stmt.Changes() > 0;
}
