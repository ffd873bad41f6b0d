// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_CONTRACT_CONTRACTDB_H
#define AGENTPAY_CONTRACT_CONTRACTDB_H

#include "contract/contract.h"

class SQLiteDatabase;

/**
 * Contract Database Layer
 *
 * Contracts are never deleted. After insertion only the payment link,
 * status, settlement txid and anchor txid change.
 */
class CContractDB
{
private:
    SQLiteDatabase& m_db;

public:
    explicit CContractDB(SQLiteDatabase& db) : m_db(db) {}

    void WriteContract(const CServiceContract& contract);

    bool ReadContract(const std::string& id, CServiceContract& contract) const;

    bool ReadByPaymentId(const std::string& paymentId, CServiceContract& contract) const;

    /** Set paymentId once. */
    bool LinkPayment(const std::string& id, const std::string& paymentId);

    bool WriteAnchor(const std::string& id, const std::string& txid);

    /**
     * UpdateStatusByPaymentId - Mirror a payment transition onto its contract
     * @return true if a contract is linked to the payment
     */
    bool UpdateStatusByPaymentId(const std::string& paymentId, ContractStatus status,
                                 const Optional<std::string>& settlementTxId, int64_t nTime);
};

#endif // AGENTPAY_CONTRACT_CONTRACTDB_H
