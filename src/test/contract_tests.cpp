// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "contract/contract.h"

#include "escrow/execution.h"
#include "escrow/settlement.h"
#include "hash.h"
#include "registry/registry.h"
#include "test/test_agentpay.h"
#include "util/error.h"
#include "util/message.h"
#include "wallet/db.h"

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(contract_tests, EscrowTestingSetup)

// =============================================================================
// Helper functions
// =============================================================================

static CContractTerms MakeTerms(const CAgentWallet& buyer, const CAgentWallet& provider, CAmount nAmount)
{
    CContractTerms terms;
    terms.serviceId = "svc-1";
    terms.buyerWalletId = buyer.id;
    terms.providerWalletId = provider.id;
    terms.buyerAddress = buyer.address;
    terms.providerAddress = provider.address;
    terms.nAmount = nAmount;
    terms.currency = Currency::BSV;
    terms.termsHash = SHA256Hex("{\"text\":\"hello\"}");
    terms.nDisputeWindow = 30;
    return terms;
}

static void TamperContract(SQLiteDatabase& db, const std::string& sql, const std::string& contractId)
{
    SQLiteStatement stmt(db, sql);
    stmt.Bind(1, contractId);
    stmt.Execute();
    BOOST_REQUIRE_EQUAL(stmt.Changes(), 1);
}

static bool HasOnlyError(const CContractVerification& verification, const char* error)
{
    return !verification.fValid && verification.errors.size() == 1 && verification.errors[0] == error;
}

// =============================================================================
// Canonical payload
// =============================================================================

BOOST_AUTO_TEST_CASE(canonical_payload_deterministic)
{
    const CContractTerms terms = MakeTerms(buyer, seller, 1000);

    const std::string payload = CanonicalContractPayload(terms);
    BOOST_CHECK_EQUAL(payload, CanonicalContractPayload(terms));
    BOOST_CHECK(payload.find("\"version\":1,\"domain\":\"agentpay.service.contract\",\"serviceId\":\"svc-1\"") == 1);
    BOOST_CHECK(payload.find("\"amount\":1000,\"currency\":\"BSV\"") != std::string::npos);

    const std::string hash = ComputeContractHash(terms);
    BOOST_CHECK_EQUAL(hash.size(), 64U);
    BOOST_CHECK_EQUAL(hash, SHA256Hex(payload));
    BOOST_CHECK_EQUAL(GetContractMessage(hash), "Contract:" + hash);

    CContractTerms other = terms;
    other.nDisputeWindow = 31;
    BOOST_CHECK(ComputeContractHash(other) != hash);
}

// =============================================================================
// Creation and verification
// =============================================================================

BOOST_AUTO_TEST_CASE(execution_creates_signed_contract)
{
    const CService service = RegisterService(seller, 1000);
    const CAmount nBuyerStart = chain.GetBalance(buyer.address);

    const CExecutionTicket ticket = execution->RequestExecution(service.id, buyer.id, "{\"text\":\"hello\"}");

    BOOST_CHECK_EQUAL(ticket.service.id, service.id);
    BOOST_CHECK_EQUAL(ticket.payment.nAmount, 1000);
    BOOST_CHECK_EQUAL(ticket.payment.nPlatformFee, 20);
    BOOST_CHECK(ticket.payment.status == PaymentStatus::ESCROWED);
    BOOST_REQUIRE(ticket.payment.contractId);
    BOOST_CHECK_EQUAL(*ticket.payment.contractId, ticket.contract.id);

    BOOST_REQUIRE(ticket.contract.paymentId);
    BOOST_CHECK_EQUAL(*ticket.contract.paymentId, ticket.payment.id);
    BOOST_CHECK(ticket.contract.status == ContractStatus::ACTIVE);
    BOOST_CHECK_EQUAL(ticket.contract.terms.termsHash, SHA256Hex("{\"text\":\"hello\"}"));
    BOOST_CHECK_EQUAL(ticket.contract.terms.nDisputeWindow, service.nDisputeWindow);
    BOOST_CHECK(ticket.contract.contractTxId);

    // Both parties signed the contract message with their own keys
    const std::string message = GetContractMessage(ticket.contract.contractHash);
    BOOST_CHECK(MessageVerify(buyer.address, ticket.contract.buyerSignature, message) == MessageVerificationResult::OK);
    BOOST_CHECK(MessageVerify(seller.address, ticket.contract.providerSignature, message) == MessageVerificationResult::OK);

    const CContractVerification verification = contracts->VerifyContract(ticket.contract.id);
    BOOST_CHECK(verification.fValid);
    BOOST_CHECK(verification.errors.empty());

    const Optional<CServiceContract> stored = contracts->GetByPaymentId(ticket.payment.id);
    BOOST_REQUIRE(stored);
    BOOST_CHECK_EQUAL(stored->id, ticket.contract.id);
    BOOST_REQUIRE(stored->contractTxId);
    BOOST_CHECK_EQUAL(*stored->contractTxId, *ticket.contract.contractTxId);

    // Anchor fee, escrow and funding fee all came out of the buyer
    BOOST_CHECK(chain.GetBalance(buyer.address) < nBuyerStart - 1000);
    BOOST_CHECK_EQUAL(chain.GetBalance(platform.address), 500000 + 1000);
}

BOOST_AUTO_TEST_CASE(anchor_failure_is_not_fatal)
{
    chain.fFailBroadcast = true;
    const CServiceContract contract = contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000),
                                                                 wallets->GetSigningKey(buyer.id),
                                                                 wallets->GetSigningKey(seller.id));
    BOOST_CHECK(!contract.contractTxId);
    chain.fFailBroadcast = false;

    const Optional<CServiceContract> stored = contracts->GetById(contract.id);
    BOOST_REQUIRE(stored);
    BOOST_CHECK(!stored->contractTxId);
    BOOST_CHECK(contracts->VerifyContract(contract.id).fValid);

    // A buyer without coins cannot anchor either
    const CServiceContract unfunded = contracts->CreateAndAnchor(MakeTerms(seller, buyer, 1000),
                                                                 wallets->GetSigningKey(seller.id),
                                                                 wallets->GetSigningKey(buyer.id));
    BOOST_CHECK(!unfunded.contractTxId);
}

BOOST_AUTO_TEST_CASE(create_rejects_wrong_keys)
{
    // Signed by a key that is not the buyer's stored key
    BOOST_CHECK_THROW(contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000), GenerateRandomKey(),
                                                 wallets->GetSigningKey(seller.id)),
                      CryptoVerificationError);
    BOOST_CHECK_THROW(contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000), wallets->GetSigningKey(buyer.id),
                                                 GenerateRandomKey()),
                      CryptoVerificationError);

    CContractTerms terms = MakeTerms(buyer, seller, 0);
    BOOST_CHECK_THROW(contracts->CreateAndAnchor(terms, wallets->GetSigningKey(buyer.id),
                                                 wallets->GetSigningKey(seller.id)),
                      ValidationError);
    terms = MakeTerms(buyer, seller, 1000);
    terms.providerAddress = "not-an-address";
    BOOST_CHECK_THROW(contracts->CreateAndAnchor(terms, wallets->GetSigningKey(buyer.id),
                                                 wallets->GetSigningKey(seller.id)),
                      ValidationError);
}

BOOST_AUTO_TEST_CASE(verify_reports_each_failure)
{
    const CServiceContract contract = contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000),
                                                                 wallets->GetSigningKey(buyer.id),
                                                                 wallets->GetSigningKey(seller.id));
    BOOST_REQUIRE(contracts->VerifyContract(contract.id).fValid);

    const CContractVerification missing = contracts->VerifyContract("no-such-contract");
    BOOST_CHECK(HasOnlyError(missing, CONTRACT_ERR_NOT_FOUND));
    BOOST_CHECK(!missing.contract);

    // Edited terms break the hash but not the signatures over the stored hash
    TamperContract(*db, "UPDATE service_contracts SET termsHash = 'edited' WHERE id = ?", contract.id);
    BOOST_CHECK(HasOnlyError(contracts->VerifyContract(contract.id), CONTRACT_ERR_HASH_MISMATCH));
}

BOOST_AUTO_TEST_CASE(verify_detects_amount_change)
{
    const CServiceContract contract = contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000),
                                                                 wallets->GetSigningKey(buyer.id),
                                                                 wallets->GetSigningKey(seller.id));
    TamperContract(*db, "UPDATE service_contracts SET amount = 1 WHERE id = ?", contract.id);

    const CContractVerification verification = contracts->VerifyContract(contract.id);
    BOOST_CHECK(HasOnlyError(verification, CONTRACT_ERR_HASH_MISMATCH));
    BOOST_REQUIRE(verification.contract);
    BOOST_CHECK_EQUAL(verification.contract->terms.nAmount, 1);
}

BOOST_AUTO_TEST_CASE(verify_detects_swapped_signatures)
{
    const CServiceContract first = contracts->CreateAndAnchor(MakeTerms(buyer, seller, 1000),
                                                              wallets->GetSigningKey(buyer.id),
                                                              wallets->GetSigningKey(seller.id));
    TamperContract(*db, "UPDATE service_contracts SET buyerSignature = providerSignature WHERE id = ?", first.id);
    BOOST_CHECK(HasOnlyError(contracts->VerifyContract(first.id), CONTRACT_ERR_BUYER_SIGNATURE));

    const CServiceContract second = contracts->CreateAndAnchor(MakeTerms(buyer, seller, 2000),
                                                               wallets->GetSigningKey(buyer.id),
                                                               wallets->GetSigningKey(seller.id));
    TamperContract(*db, "UPDATE service_contracts SET providerSignature = buyerSignature WHERE id = ?", second.id);
    BOOST_CHECK(HasOnlyError(contracts->VerifyContract(second.id), CONTRACT_ERR_PROVIDER_SIGNATURE));
}

// =============================================================================
// Execution lifecycle
// =============================================================================

BOOST_AUTO_TEST_CASE(complete_execution_success_releases)
{
    const CService service = RegisterService(seller, 1000);
    const CExecutionTicket ticket = execution->RequestExecution(service.id, buyer.id, "job");

    const Optional<CPayment> released = execution->CompleteExecution(ticket.payment.id, true);
    BOOST_REQUIRE(released);
    BOOST_CHECK(released->status == PaymentStatus::RELEASED);
    BOOST_REQUIRE(released->releaseTxId);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 980);

    const Optional<CServiceContract> contract = contracts->GetById(ticket.contract.id);
    BOOST_REQUIRE(contract);
    BOOST_CHECK(contract->status == ContractStatus::RELEASED);
    BOOST_REQUIRE(contract->settlementTxId);
    BOOST_CHECK_EQUAL(*contract->settlementTxId, *released->releaseTxId);
    BOOST_CHECK(contract->nSettleTime);

    // Settled executions are left alone
    BOOST_CHECK(!execution->CompleteExecution(ticket.payment.id, false));
}

BOOST_AUTO_TEST_CASE(complete_execution_failure_refunds)
{
    const CService service = RegisterService(seller, 1000);
    const CExecutionTicket ticket = execution->RequestExecution(service.id, buyer.id, "job");

    const Optional<CPayment> refunded = execution->CompleteExecution(ticket.payment.id, false);
    BOOST_REQUIRE(refunded);
    BOOST_CHECK(refunded->status == PaymentStatus::REFUNDED);
    BOOST_REQUIRE(refunded->refundTxId);

    const Optional<CServiceContract> contract = contracts->GetById(ticket.contract.id);
    BOOST_REQUIRE(contract);
    BOOST_CHECK(contract->status == ContractStatus::REFUNDED);
    BOOST_REQUIRE(contract->settlementTxId);
    BOOST_CHECK_EQUAL(*contract->settlementTxId, *refunded->refundTxId);

    BOOST_CHECK_THROW(execution->CompleteExecution("no-such-payment", true), NotFoundError);
}

BOOST_AUTO_TEST_CASE(request_execution_rejects)
{
    BOOST_CHECK_THROW(execution->RequestExecution("no-such-service", buyer.id, "job"), NotFoundError);

    const CService own = RegisterService(buyer, 1000);
    BOOST_CHECK_THROW(execution->RequestExecution(own.id, buyer.id, "job"), ValidationError);

    const CService inactive = RegisterService(seller, 1000);
    BOOST_REQUIRE(registry->SetActive(inactive.id, false));
    BOOST_CHECK_THROW(execution->RequestExecution(inactive.id, buyer.id, "job"), ValidationError);

    const CService service = RegisterService(seller, 1000);
    BOOST_CHECK_THROW(execution->RequestExecution(service.id, "no-such-wallet", "job"), NotFoundError);
}

BOOST_AUTO_TEST_CASE(contract_status_strings)
{
    ContractStatus status;
    BOOST_CHECK(ContractStatusFromString("disputed", status));
    BOOST_CHECK(status == ContractStatus::DISPUTED);
    BOOST_CHECK_EQUAL(ContractStatusToString(ContractStatus::REFUNDED), "refunded");
    BOOST_CHECK(!ContractStatusFromString("Active", status));
}

BOOST_AUTO_TEST_SUITE_END()
