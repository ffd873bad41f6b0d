// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/settlement.h"

#include "escrow/paymentdb.h"
#include "key_io.h"
#include "random.h"
#include "registry/registry.h"
#include "test/test_agentpay.h"
#include "util/error.h"
#include "util/message.h"
#include "util/time.h"
#include "wallet/db.h"

#include <algorithm>

#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(settlement_tests, EscrowTestingSetup)

// =============================================================================
// Helper functions
// =============================================================================

static bool HasActorType(const CSettlementQuorum& quorum, SettlementActorType type)
{
    return std::find(quorum.actorTypes.begin(), quorum.actorTypes.end(), type) != quorum.actorTypes.end();
}

static CPaymentRequest MakeRequest(const std::string& buyerId, const std::string& sellerId, CAmount nAmount,
                                   Currency currency = Currency::BSV)
{
    CPaymentRequest request;
    request.serviceId = "svc-test";
    request.buyerWalletId = buyerId;
    request.sellerWalletId = sellerId;
    request.nAmount = nAmount;
    request.currency = currency;
    return request;
}

// =============================================================================
// Platform fee
// =============================================================================

BOOST_AUTO_TEST_CASE(platform_fee_rounds_up)
{
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(10000), 200);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(1), 1);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(50), 1);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(51), 2);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(0), 0);

    CSettlementOptions options = engine->GetOptions();
    options.nPlatformFeeBps = 0;
    const CSettlementEngine noFee(*db, *wallets, chain, options);
    BOOST_CHECK_EQUAL(noFee.CalculatePlatformFee(10000), 0);
    BOOST_CHECK_EQUAL(noFee.CalculatePlatformFee(MAX_MONEY), 0);
}

BOOST_AUTO_TEST_CASE(platform_fee_large_amounts)
{
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(MAX_MONEY), MAX_MONEY / 50);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(MAX_MONEY - 1), MAX_MONEY / 50);
    BOOST_CHECK_EQUAL(engine->CalculatePlatformFee(1000000000000001LL), 20000000000001LL);

    CSettlementOptions options = engine->GetOptions();
    options.nPlatformFeeBps = 10000;
    const CSettlementEngine fullFee(*db, *wallets, chain, options);
    BOOST_CHECK_EQUAL(fullFee.CalculatePlatformFee(MAX_MONEY), MAX_MONEY);
    BOOST_CHECK_EQUAL(fullFee.CalculatePlatformFee(987654321012345LL), 987654321012345LL);

    options.nPlatformFeeBps = 9999;
    const CSettlementEngine highFee(*db, *wallets, chain, options);
    BOOST_CHECK_EQUAL(highFee.CalculatePlatformFee(MAX_MONEY), MAX_MONEY / 10000 * 9999);
    BOOST_CHECK_EQUAL(highFee.CalculatePlatformFee(10001), 10000);
}

// =============================================================================
// Create and fund
// =============================================================================

BOOST_AUTO_TEST_CASE(create_funds_platform_escrow)
{
    const CPayment payment = OpenPayment(10000);

    BOOST_CHECK(payment.status == PaymentStatus::ESCROWED);
    BOOST_CHECK(payment.escrowMode == EscrowMode::PLATFORM);
    BOOST_CHECK_EQUAL(payment.nAmount, 10000);
    BOOST_CHECK_EQUAL(payment.nPlatformFee, 200);
    BOOST_CHECK_EQUAL(payment.GetSellerPayout(), 9800);
    BOOST_REQUIRE(payment.escrowTxId);
    BOOST_CHECK(payment.nEscrowVout && *payment.nEscrowVout == 0);
    BOOST_CHECK(!payment.escrowScriptHex);
    BOOST_CHECK(!payment.consumedBy);

    // 10000 locked to the platform wallet, 250 fee
    BOOST_CHECK_EQUAL(chain.GetBalance(platform.address), 510000);
    BOOST_CHECK_EQUAL(chain.GetBalance(buyer.address), 200000 - 10000 - 250);
    BOOST_CHECK(chain.IsUnspent(COutPoint(uint256S(*payment.escrowTxId), 0)));
}

BOOST_AUTO_TEST_CASE(create_seeds_default_approvals)
{
    const CPayment payment = OpenPayment(10000);

    const CSettlementQuorum release = engine->GetSettlementQuorum(payment.id, SettlementAction::RELEASE);
    BOOST_CHECK(!release.fReady);
    BOOST_CHECK_EQUAL(release.nRequired, 2);
    BOOST_CHECK_EQUAL(release.actorTypes.size(), 1U);
    BOOST_CHECK(HasActorType(release, SettlementActorType::BUYER));
    BOOST_CHECK(!release.fTxSignatureRequired);

    const CSettlementQuorum refund = engine->GetSettlementQuorum(payment.id, SettlementAction::REFUND);
    BOOST_CHECK(refund.fReady);
    BOOST_CHECK(HasActorType(refund, SettlementActorType::BUYER));
    BOOST_CHECK(HasActorType(refund, SettlementActorType::SELLER));

    // Every stored approval signs the message for its action
    for (const CSettlementApproval& approval : engine->GetSettlementApprovals(payment.id)) {
        BOOST_CHECK_EQUAL(approval.message, engine->GetSettlementMessage(payment.id, approval.action));
        const CAgentWallet wallet = *wallets->GetById(approval.actorId);
        BOOST_CHECK(MessageVerify(wallet.address, approval.signature, approval.message) == MessageVerificationResult::OK);
    }
    BOOST_CHECK_EQUAL(engine->GetSettlementApprovals(payment.id).size(), 3U);
    BOOST_CHECK_EQUAL(engine->GetSettlementApprovals(payment.id, SettlementAction::REFUND).size(), 2U);
}

BOOST_AUTO_TEST_CASE(create_validation)
{
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, seller.id, 0)), ValidationError);
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, seller.id, -5)), ValidationError);
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, seller.id, MAX_MONEY + 1)), ValidationError);
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, buyer.id, 1000)), ValidationError);
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, "missing", 1000)), NotFoundError);
    BOOST_CHECK_THROW(engine->Create(MakeRequest("missing", seller.id, 1000)), NotFoundError);
    BOOST_CHECK(engine->ListByWallet(buyer.id).empty());
}

BOOST_AUTO_TEST_CASE(create_insufficient_funds_leaves_pending)
{
    const CAgentWallet poor = NewFundedWallet(1000);

    BOOST_CHECK_THROW(engine->Create(MakeRequest(poor.id, seller.id, 5000)), InsufficientFundsError);

    const std::vector<CPayment> payments = engine->ListByWallet(poor.id, PaymentRole::BUYER);
    BOOST_REQUIRE_EQUAL(payments.size(), 1U);
    BOOST_CHECK(payments[0].status == PaymentStatus::PENDING);
    BOOST_CHECK(!payments[0].escrowTxId);
    BOOST_CHECK_EQUAL(chain.GetBalance(poor.address), 1000);

    // Unfunded wallet: no UTXOs at all
    BOOST_CHECK_THROW(engine->Create(MakeRequest(seller.id, buyer.id, 5000)), InsufficientFundsError);
}

BOOST_AUTO_TEST_CASE(create_broadcast_failure_then_external_confirmation)
{
    chain.fFailBroadcast = true;
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, seller.id, 10000)), ExternalServiceError);
    chain.fFailBroadcast = false;

    const std::vector<CPayment> payments = engine->ListByWallet(buyer.id);
    BOOST_REQUIRE_EQUAL(payments.size(), 1U);
    BOOST_CHECK(payments[0].status == PaymentStatus::PENDING);
    BOOST_CHECK(engine->GetSettlementApprovals(payments[0].id).empty());

    // Funded out of band
    const CUtxo escrow = chain.Fund(platform.address, 10000);
    const std::string txid = escrow.outpoint.hash.GetHex();
    const Optional<CPayment> escrowed = engine->MarkEscrowed(payments[0].id, txid, int64_t(escrow.outpoint.n));
    BOOST_REQUIRE(escrowed);
    BOOST_CHECK(escrowed->status == PaymentStatus::ESCROWED);
    BOOST_CHECK_EQUAL(*escrowed->escrowTxId, txid);
    BOOST_CHECK(engine->GetSettlementQuorum(payments[0].id, SettlementAction::REFUND).fReady);

    // Only once
    BOOST_CHECK(!engine->MarkEscrowed(payments[0].id, txid, int64_t(escrow.outpoint.n)));
    BOOST_CHECK_THROW(engine->MarkEscrowed(payments[0].id, ""), ValidationError);
}

BOOST_AUTO_TEST_CASE(external_confirmation_checks_escrow_output)
{
    chain.fFailBroadcast = true;
    BOOST_CHECK_THROW(engine->Create(MakeRequest(buyer.id, seller.id, 10000)), ExternalServiceError);
    chain.fFailBroadcast = false;
    const std::string paymentId = engine->ListByWallet(buyer.id).at(0).id;

    const CUtxo wrongScript = chain.Fund(seller.address, 10000);
    const CUtxo tooSmall = chain.Fund(platform.address, 9999);
    const CUtxo escrow = chain.Fund(platform.address, 10000);

    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, escrow.outpoint.hash.GetHex()), ValidationError);
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, "not-a-txid", int64_t(0)), ValidationError);
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, escrow.outpoint.hash.GetHex(), int64_t(escrow.outpoint.n + 1)), ValidationError);
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, GetRandHash().GetHex(), int64_t(0)), ValidationError);
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, wrongScript.outpoint.hash.GetHex(), int64_t(wrongScript.outpoint.n)), ValidationError);
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, tooSmall.outpoint.hash.GetHex(), int64_t(tooSmall.outpoint.n)), ValidationError);
    BOOST_CHECK(engine->GetPayment(paymentId)->status == PaymentStatus::PENDING);

    chain.fOffline = true;
    BOOST_CHECK_THROW(engine->MarkEscrowed(paymentId, escrow.outpoint.hash.GetHex(), int64_t(escrow.outpoint.n)), ExternalServiceError);
    chain.fOffline = false;

    BOOST_CHECK(engine->MarkEscrowed(paymentId, escrow.outpoint.hash.GetHex(), int64_t(escrow.outpoint.n)));
    BOOST_CHECK(engine->GetPayment(paymentId)->status == PaymentStatus::ESCROWED);
}

BOOST_AUTO_TEST_CASE(create_requires_platform_wallet)
{
    CSettlementOptions options = engine->GetOptions();
    options.platformWalletId = boost::none;
    CSettlementEngine unconfigured(*db, *wallets, chain, options);

    BOOST_CHECK_THROW(unconfigured.Create(MakeRequest(buyer.id, seller.id, 10000)), ValidationError);
    const std::vector<CPayment> payments = unconfigured.ListByWallet(buyer.id);
    BOOST_REQUIRE_EQUAL(payments.size(), 1U);
    BOOST_CHECK(payments[0].status == PaymentStatus::PENDING);
    BOOST_CHECK_EQUAL(chain.GetBalance(buyer.address), 200000);
}

// =============================================================================
// Settlement message
// =============================================================================

BOOST_AUTO_TEST_CASE(settlement_message_binds_payment_and_action)
{
    const CPayment first = OpenPayment(10000);
    const CPayment second = OpenPayment(10000);

    const std::string release = engine->GetSettlementMessage(first.id, SettlementAction::RELEASE);
    const std::string refund = engine->GetSettlementMessage(first.id, SettlementAction::REFUND);

    BOOST_CHECK(boost::starts_with(release, SETTLEMENT_MESSAGE_PREFIX));
    BOOST_CHECK_EQUAL(release.size(), std::string(SETTLEMENT_MESSAGE_PREFIX).size() + 64);
    BOOST_CHECK(release != refund);
    BOOST_CHECK(release != engine->GetSettlementMessage(second.id, SettlementAction::RELEASE));

    // Deterministic over the stored record
    BOOST_CHECK_EQUAL(release, engine->GetSettlementMessage(first.id, SettlementAction::RELEASE));
    BOOST_CHECK_EQUAL(release, ComputeSettlementMessage(*engine->GetPayment(first.id), SettlementAction::RELEASE));

    CPayment altered = *engine->GetPayment(first.id);
    altered.nAmount += 1;
    BOOST_CHECK(release != ComputeSettlementMessage(altered, SettlementAction::RELEASE));
    altered = *engine->GetPayment(first.id);
    altered.contractId = std::string("contract");
    BOOST_CHECK(release != ComputeSettlementMessage(altered, SettlementAction::RELEASE));

    BOOST_CHECK_THROW(engine->GetSettlementMessage("missing", SettlementAction::RELEASE), NotFoundError);
}

// =============================================================================
// Approvals and quorum
// =============================================================================

BOOST_AUTO_TEST_CASE(release_requires_quorum)
{
    const CPayment payment = OpenPayment(10000);

    try {
        engine->Release(payment.id);
        BOOST_ERROR("expected AuthError");
    } catch (const AuthError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Settlement quorum not met for 'release'. Need 2 of buyer/seller/admin, have 1."));
    }
    BOOST_CHECK(engine->GetPayment(payment.id)->status == PaymentStatus::ESCROWED);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 0);
}

BOOST_AUTO_TEST_CASE(release_with_seller_approval)
{
    const CPayment payment = OpenPayment(10000);

    const CSettlementApproval approval = engine->CreateAutoWalletApproval(payment.id, SettlementAction::RELEASE, SettlementActorType::SELLER);
    BOOST_CHECK(approval.actorType == SettlementActorType::SELLER);
    BOOST_CHECK_EQUAL(approval.actorId, seller.id);
    BOOST_CHECK(engine->GetSettlementQuorum(payment.id, SettlementAction::RELEASE).fReady);

    const Optional<CPayment> released = engine->Release(payment.id);
    BOOST_REQUIRE(released);
    BOOST_CHECK(released->status == PaymentStatus::RELEASED);
    BOOST_REQUIRE(released->releaseTxId);
    BOOST_CHECK(!released->refundTxId);
    BOOST_CHECK(released->nCompleteTime);

    // Seller gets amount minus platform fee; the platform pays the network fee
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);
    BOOST_CHECK_EQUAL(chain.GetBalance(platform.address), 510000 - 9800 - 374);
}

BOOST_AUTO_TEST_CASE(refund_with_default_approvals)
{
    const CPayment payment = OpenPayment(10000);

    const Optional<CPayment> refunded = engine->Refund(payment.id);
    BOOST_REQUIRE(refunded);
    BOOST_CHECK(refunded->status == PaymentStatus::REFUNDED);
    BOOST_REQUIRE(refunded->refundTxId);
    BOOST_CHECK(!refunded->releaseTxId);

    // Full amount back to the buyer
    BOOST_CHECK_EQUAL(chain.GetBalance(buyer.address), 200000 - 250);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 0);
}

BOOST_AUTO_TEST_CASE(settlement_idempotent)
{
    const CPayment payment = OpenPayment(10000);
    engine->CreateAutoWalletApproval(payment.id, SettlementAction::RELEASE, SettlementActorType::SELLER);

    const Optional<CPayment> released = engine->Release(payment.id);
    BOOST_REQUIRE(released);
    const size_t nBroadcasts = chain.GetBroadcasts().size();

    BOOST_CHECK(!engine->Release(payment.id));
    BOOST_CHECK(!engine->Refund(payment.id));
    BOOST_CHECK_EQUAL(chain.GetBroadcasts().size(), nBroadcasts);

    const CPayment stored = *engine->GetPayment(payment.id);
    BOOST_CHECK(stored.status == PaymentStatus::RELEASED);
    BOOST_CHECK_EQUAL(*stored.releaseTxId, *released->releaseTxId);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);

    BOOST_CHECK(!engine->Release("missing"));
}

BOOST_AUTO_TEST_CASE(settlement_broadcast_failure_keeps_escrow)
{
    const CPayment payment = OpenPayment(10000);

    chain.fFailBroadcast = true;
    BOOST_CHECK_THROW(engine->Refund(payment.id), ExternalServiceError);
    chain.fFailBroadcast = false;

    const CPayment stored = *engine->GetPayment(payment.id);
    BOOST_CHECK(stored.status == PaymentStatus::ESCROWED);
    BOOST_CHECK(!stored.refundTxId);

    BOOST_REQUIRE(engine->Refund(payment.id));
    BOOST_CHECK(engine->GetPayment(payment.id)->status == PaymentStatus::REFUNDED);
}

BOOST_AUTO_TEST_CASE(settlement_completes_recorded_broadcast)
{
    const CPayment payment = OpenPayment(10000);
    engine->CreateAutoWalletApproval(payment.id, SettlementAction::RELEASE, SettlementActorType::SELLER);

    // The payout reaches the chain, then the status write fails.
    SQLiteStatement(*db, "CREATE TRIGGER fail_release BEFORE UPDATE OF status ON payments "
                         "WHEN NEW.status = 'released' BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END").Execute();
    const size_t nBroadcasts = chain.GetBroadcasts().size();
    BOOST_CHECK_THROW(engine->Release(payment.id), std::runtime_error);
    BOOST_REQUIRE_EQUAL(chain.GetBroadcasts().size(), nBroadcasts + 1);
    const std::string txid = chain.GetBroadcasts().back().GetHash().GetHex();

    CPayment stored = *engine->GetPayment(payment.id);
    BOOST_CHECK(stored.status == PaymentStatus::ESCROWED);
    BOOST_REQUIRE(stored.releaseTxId);
    BOOST_CHECK_EQUAL(*stored.releaseTxId, txid);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);

    // No second payout in either direction
    BOOST_CHECK_THROW(engine->Refund(payment.id), ValidationError);
    SQLiteStatement(*db, "DROP TRIGGER fail_release").Execute();
    const Optional<CPayment> released = engine->Release(payment.id);
    BOOST_REQUIRE(released);
    BOOST_CHECK(released->status == PaymentStatus::RELEASED);
    BOOST_CHECK_EQUAL(*released->releaseTxId, txid);
    BOOST_CHECK_EQUAL(chain.GetBroadcasts().size(), nBroadcasts + 1);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);
}

BOOST_AUTO_TEST_CASE(settlement_record_failure_reports_txid)
{
    const CPayment payment = OpenPayment(10000);

    SQLiteStatement(*db, "CREATE TRIGGER fail_refund_txid BEFORE UPDATE OF refundTxId ON payments "
                         "WHEN NEW.status = 'escrowed' BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END").Execute();
    const size_t nBroadcasts = chain.GetBroadcasts().size();
    std::string strError;
    try {
        engine->Refund(payment.id);
    } catch (const std::runtime_error& e) {
        strError = e.what();
    }
    BOOST_REQUIRE_EQUAL(chain.GetBroadcasts().size(), nBroadcasts + 1);
    BOOST_CHECK(strError.find(chain.GetBroadcasts().back().GetHash().GetHex()) != std::string::npos);
    BOOST_CHECK(engine->GetPayment(payment.id)->status == PaymentStatus::ESCROWED);
}

BOOST_AUTO_TEST_CASE(wallet_approval_signatures)
{
    const CPayment payment = OpenPayment(10000);
    const std::string message = engine->GetSettlementMessage(payment.id, SettlementAction::RELEASE);

    std::string sellerSig;
    BOOST_REQUIRE(MessageSign(wallets->GetSigningKey(seller.id), message, sellerSig));
    std::string buyerSig;
    BOOST_REQUIRE(MessageSign(wallets->GetSigningKey(buyer.id), message, buyerSig));

    // A stranger cannot approve, whatever they sign
    const CAgentWallet stranger = wallets->Create().wallet;
    std::string strangerSig;
    BOOST_REQUIRE(MessageSign(wallets->GetSigningKey(stranger.id), message, strangerSig));
    BOOST_CHECK_THROW(engine->CreateWalletApproval(payment.id, SettlementAction::RELEASE, stranger.id, strangerSig), AuthError);

    // The seller slot needs the seller's key
    BOOST_CHECK_THROW(engine->CreateWalletApproval(payment.id, SettlementAction::RELEASE, seller.id, buyerSig), CryptoVerificationError);

    // A refund signature does not approve a release
    std::string refundSig;
    BOOST_REQUIRE(MessageSign(wallets->GetSigningKey(seller.id),
                              engine->GetSettlementMessage(payment.id, SettlementAction::REFUND), refundSig));
    BOOST_CHECK_THROW(engine->CreateWalletApproval(payment.id, SettlementAction::RELEASE, seller.id, refundSig), CryptoVerificationError);
    BOOST_CHECK(!engine->GetSettlementQuorum(payment.id, SettlementAction::RELEASE).fReady);

    const CSettlementApproval approval = engine->CreateWalletApproval(payment.id, SettlementAction::RELEASE, seller.id, sellerSig);
    BOOST_CHECK(approval.actorType == SettlementActorType::SELLER);
    BOOST_CHECK(engine->GetSettlementQuorum(payment.id, SettlementAction::RELEASE).fReady);

    // Recording the same approval again keeps a single row
    engine->CreateWalletApproval(payment.id, SettlementAction::RELEASE, seller.id, sellerSig);
    BOOST_CHECK_EQUAL(engine->GetSettlementApprovals(payment.id, SettlementAction::RELEASE).size(), 2U);

    BOOST_CHECK_THROW(engine->CreateAutoWalletApproval(payment.id, SettlementAction::RELEASE, SettlementActorType::ADMIN), ValidationError);
}

BOOST_AUTO_TEST_CASE(admin_approval_completes_quorum)
{
    const CPayment payment = OpenPayment(10000);

    // Not on the allow-list
    const CKey outsider = GenerateRandomKey();
    const std::string outsiderAddress = EncodeDestination(outsider.GetPubKey().GetID());
    std::string outsiderSig;
    BOOST_REQUIRE(MessageSign(outsider, engine->GetSettlementMessage(payment.id, SettlementAction::RELEASE), outsiderSig));
    BOOST_CHECK_THROW(engine->CreateAdminApproval(payment.id, SettlementAction::RELEASE, outsiderAddress, outsiderSig), AuthError);

    // Allow-listed address, signature over the other action
    BOOST_CHECK_THROW(engine->CreateAdminApproval(payment.id, SettlementAction::RELEASE, adminAddress,
                                                  SignAdminApproval(payment.id, SettlementAction::REFUND)),
                      CryptoVerificationError);

    const CSettlementApproval approval = engine->CreateAdminApproval(payment.id, SettlementAction::RELEASE, adminAddress,
                                                                     SignAdminApproval(payment.id, SettlementAction::RELEASE));
    BOOST_CHECK(approval.actorType == SettlementActorType::ADMIN);
    BOOST_CHECK_EQUAL(approval.actorId, adminAddress);

    const CSettlementQuorum quorum = engine->GetSettlementQuorum(payment.id, SettlementAction::RELEASE);
    BOOST_CHECK(quorum.fReady);
    BOOST_CHECK(HasActorType(quorum, SettlementActorType::ADMIN));

    BOOST_REQUIRE(engine->Release(payment.id));
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);
}

// =============================================================================
// Consumption binding
// =============================================================================

BOOST_AUTO_TEST_CASE(bind_consumption_first_wins)
{
    const CPayment payment = OpenPayment(10000);

    BOOST_CHECK_EQUAL(engine->BindConsumption(payment.id, "job-1"), "job-1");
    BOOST_CHECK_EQUAL(engine->BindConsumption(payment.id, "job-2"), "job-1");
    BOOST_CHECK_EQUAL(engine->BindConsumption(payment.id, "job-1"), "job-1");
    BOOST_CHECK_EQUAL(*engine->GetPayment(payment.id)->consumedBy, "job-1");

    BOOST_CHECK_THROW(engine->BindConsumption(payment.id, ""), ValidationError);
    BOOST_CHECK_THROW(engine->BindConsumption("missing", "job-3"), NotFoundError);
}

// =============================================================================
// Token escrow
// =============================================================================

BOOST_AUTO_TEST_CASE(token_escrow_release)
{
    chain.FundToken(buyer.address, 5000);

    const CPayment payment = OpenPayment(1000, Currency::MNEE);
    BOOST_CHECK(payment.status == PaymentStatus::ESCROWED);
    BOOST_CHECK(payment.currency == Currency::MNEE);
    BOOST_CHECK(payment.escrowMode == EscrowMode::PLATFORM);
    BOOST_CHECK_EQUAL(payment.nPlatformFee, 20);
    BOOST_CHECK(!payment.nEscrowVout);
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(buyer.address), 4000);
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(platform.address), 1000);
    // No satoshis move
    BOOST_CHECK_EQUAL(chain.GetBalance(buyer.address), 200000);

    engine->CreateAutoWalletApproval(payment.id, SettlementAction::RELEASE, SettlementActorType::SELLER);
    const Optional<CPayment> released = engine->Release(payment.id);
    BOOST_REQUIRE(released);
    BOOST_CHECK(released->status == PaymentStatus::RELEASED);
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(seller.address), 980);
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(platform.address), 20);
}

BOOST_AUTO_TEST_CASE(token_escrow_refund_and_shortfall)
{
    chain.FundToken(buyer.address, 1500);

    const CPayment payment = OpenPayment(1000, Currency::MNEE);
    BOOST_REQUIRE(engine->Refund(payment.id));
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(buyer.address), 1500);
    BOOST_CHECK_EQUAL(chain.GetTokenBalance(platform.address), 0);

    // Token balance too low
    BOOST_CHECK_THROW(OpenPayment(2000, Currency::MNEE), ExternalServiceError);
}

// =============================================================================
// Queries
// =============================================================================

BOOST_AUTO_TEST_CASE(list_by_wallet_roles)
{
    const CPayment first = OpenPayment(10000);
    const CPayment second = OpenPayment(20000);

    BOOST_CHECK_EQUAL(engine->ListByWallet(buyer.id, PaymentRole::BUYER).size(), 2U);
    BOOST_CHECK_EQUAL(engine->ListByWallet(buyer.id, PaymentRole::SELLER).size(), 0U);
    BOOST_CHECK_EQUAL(engine->ListByWallet(seller.id, PaymentRole::SELLER).size(), 2U);
    BOOST_CHECK_EQUAL(engine->ListByWallet(seller.id).size(), 2U);
    BOOST_CHECK(engine->ListByWallet(platform.id).empty());

    BOOST_CHECK(!engine->GetPayment("missing"));
    BOOST_CHECK(engine->GetPayment(first.id));
    BOOST_CHECK(engine->GetPayment(second.id));
}

BOOST_AUTO_TEST_CASE(enum_strings)
{
    BOOST_CHECK_EQUAL(PaymentStatusToString(PaymentStatus::ESCROWED), "escrowed");
    BOOST_CHECK_EQUAL(SettlementActionToString(SettlementAction::REFUND), "refund");
    BOOST_CHECK_EQUAL(SettlementActorTypeToString(SettlementActorType::SELLER), "seller");
    BOOST_CHECK_EQUAL(EscrowModeToString(EscrowMode::MULTISIG), "multisig");
    BOOST_CHECK_EQUAL(CurrencyToString(Currency::MNEE), "MNEE");

    PaymentStatus status;
    BOOST_CHECK(PaymentStatusFromString("disputed", status));
    BOOST_CHECK(status == PaymentStatus::DISPUTED);
    BOOST_CHECK(!PaymentStatusFromString("bogus", status));

    BOOST_CHECK(IsFinalPaymentStatus(PaymentStatus::RELEASED));
    BOOST_CHECK(IsFinalPaymentStatus(PaymentStatus::REFUNDED));
    BOOST_CHECK(!IsFinalPaymentStatus(PaymentStatus::DISPUTED));
}

BOOST_AUTO_TEST_SUITE_END()
