// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/execution.h"

#include "escrow/settlement.h"
#include "hash.h"
#include "key.h"
#include "logging.h"
#include "util/error.h"
#include "wallet/wallet.h"

CExecutionService::CExecutionService(CServiceRegistry& registry, CWalletManager& wallets,
                                     CContractManager& contracts, CSettlementEngine& engine)
    : m_registry(registry), m_wallets(wallets), m_contracts(contracts), m_engine(engine)
{
}

CExecutionTicket CExecutionService::RequestExecution(const std::string& serviceId, const std::string& buyerWalletId,
                                                     const std::string& requestPayload)
{
    const Optional<CService> service = m_registry.Get(serviceId);
    if (!service) {
        throw NotFoundError("Service not found");
    }
    if (!service->fActive) {
        throw ValidationError("Service is not active");
    }
    if (service->providerWalletId == buyerWalletId) {
        throw ValidationError("Cannot pay for your own service");
    }

    const CAgentWallet buyer = m_wallets.GetByIdOrThrow(buyerWalletId);
    const CAgentWallet provider = m_wallets.GetByIdOrThrow(service->providerWalletId);

    CContractTerms terms;
    terms.serviceId = service->id;
    terms.buyerWalletId = buyer.id;
    terms.providerWalletId = provider.id;
    terms.buyerAddress = buyer.address;
    terms.providerAddress = provider.address;
    terms.nAmount = service->nPrice;
    terms.currency = service->currency;
    terms.termsHash = SHA256Hex(requestPayload);
    terms.nDisputeWindow = service->nDisputeWindow;

    CExecutionTicket ticket;
    ticket.service = *service;
    ticket.contract = m_contracts.CreateAndAnchor(terms, m_wallets.GetSigningKey(buyer.id),
                                                  m_wallets.GetSigningKey(provider.id));

    CPaymentRequest request;
    request.serviceId = service->id;
    request.buyerWalletId = buyer.id;
    request.sellerWalletId = provider.id;
    request.nAmount = service->nPrice;
    request.currency = service->currency;
    request.contractId = ticket.contract.id;
    ticket.payment = m_engine.Create(request);

    if (m_contracts.LinkPayment(ticket.contract.id, ticket.payment.id)) {
        ticket.contract.paymentId = ticket.payment.id;
    }
    LogPrint(BCLog::ESCROW, "CExecutionService::%s: service %s, contract %s, payment %s (%s)\n", __func__,
             service->id, ticket.contract.id, ticket.payment.id, PaymentStatusToString(ticket.payment.status));
    return ticket;
}

Optional<CPayment> CExecutionService::CompleteExecution(const std::string& paymentId, bool fSuccess)
{
    const Optional<CPayment> payment = m_engine.GetPayment(paymentId);
    if (!payment) {
        throw NotFoundError("Payment not found");
    }
    if (payment->status != PaymentStatus::ESCROWED) {
        return boost::none;
    }

    if (fSuccess) {
        m_engine.CreateAutoWalletApproval(paymentId, SettlementAction::RELEASE, SettlementActorType::SELLER);
        return m_engine.Release(paymentId);
    }
    m_engine.CreateAutoWalletApproval(paymentId, SettlementAction::REFUND, SettlementActorType::SELLER);
    return m_engine.Refund(paymentId);
}
