// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_EXECUTION_H
#define AGENTPAY_ESCROW_EXECUTION_H

#include "contract/contract.h"
#include "escrow/payment.h"
#include "optional.h"
#include "registry/registry.h"

#include <string>

class CContractManager;
class CSettlementEngine;
class CWalletManager;

/** What a caller holds after a successful execution request. */
struct CExecutionTicket
{
    CService service;
    CServiceContract contract;
    CPayment payment;
};

/**
 * Entry point of a paid execution: price the service, bind both parties to
 * a signed contract, escrow the buyer's funds under it and settle on the
 * outcome.
 */
class CExecutionService
{
public:
    CExecutionService(CServiceRegistry& registry, CWalletManager& wallets,
                      CContractManager& contracts, CSettlementEngine& engine);

    /**
     * @param requestPayload the buyer's request as sent to the provider; its
     *        SHA-256 becomes the contract's terms hash
     * @throws NotFoundError, ValidationError, CryptoVerificationError,
     *         InsufficientFundsError, ExternalServiceError
     */
    CExecutionTicket RequestExecution(const std::string& serviceId, const std::string& buyerWalletId,
                                      const std::string& requestPayload);

    /**
     * Settle an escrowed execution. Success adds the seller's release
     * approval and releases; failure adds the seller's refund approval and
     * refunds. Returns boost::none if the payment is no longer escrowed.
     */
    Optional<CPayment> CompleteExecution(const std::string& paymentId, bool fSuccess);

private:
    CServiceRegistry& m_registry;
    CWalletManager& m_wallets;
    CContractManager& m_contracts;
    CSettlementEngine& m_engine;
};

#endif // AGENTPAY_ESCROW_EXECUTION_H
