// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispute/dispute.h"

#include "admin/audit.h"
#include "escrow/settlement.h"
#include "key_io.h"
#include "test/test_agentpay.h"
#include "util/error.h"
#include "util/message.h"
#include "util/strencodings.h"
#include "util/time.h"

#include <boost/test/unit_test.hpp>

static const int64_t DISPUTE_TEST_TIME = 1750000000;

struct DisputeTestingSetup : public EscrowTestingSetup
{
    explicit DisputeTestingSetup(EscrowMode mode = EscrowMode::PLATFORM) : EscrowTestingSetup(mode)
    {
        SetMockTime(DISPUTE_TEST_TIME);
    }

    CResolveRequest MakeResolveRequest(const std::string& paymentId, DisputeResolution resolution) const
    {
        CResolveRequest request;
        request.resolution = resolution;
        request.adminAddress = adminAddress;
        request.adminSignature = SignAdminApproval(paymentId, resolution == DisputeResolution::RELEASE
                                                                  ? SettlementAction::RELEASE
                                                                  : SettlementAction::REFUND);
        return request;
    }

    std::string OpenSessionToken()
    {
        const CAdminChallenge challenge = adminAuth->CreateChallenge(adminAddress);
        std::string signature;
        BOOST_REQUIRE(MessageSign(adminWalletKey, challenge.challenge, signature));
        return adminAuth->VerifyChallenge(challenge.nonce, adminAddress, signature).token;
    }

    PaymentStatus StoredStatus(const std::string& paymentId) const
    {
        const Optional<CPayment> payment = engine->GetPayment(paymentId);
        BOOST_REQUIRE(payment);
        return payment->status;
    }
};

struct MultisigDisputeTestingSetup : public DisputeTestingSetup
{
    MultisigDisputeTestingSetup() : DisputeTestingSetup(EscrowMode::MULTISIG) {}
};

BOOST_FIXTURE_TEST_SUITE(dispute_tests, DisputeTestingSetup)

// =============================================================================
// Opening disputes
// =============================================================================

BOOST_AUTO_TEST_CASE(open_marks_payment_disputed)
{
    const CPayment payment = OpenPayment(10000);

    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Result was empty", std::string("log excerpt"));
    BOOST_CHECK(dispute.status == DisputeStatus::OPEN);
    BOOST_CHECK_EQUAL(dispute.paymentId, payment.id);
    BOOST_CHECK_EQUAL(dispute.providerWalletId, seller.id);
    BOOST_CHECK_EQUAL(dispute.nCreateTime, DISPUTE_TEST_TIME);
    BOOST_CHECK(dispute.IsActive());
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);

    const Optional<CDispute> byPayment = disputes->GetByPaymentId(payment.id);
    BOOST_REQUIRE(byPayment);
    BOOST_CHECK_EQUAL(byPayment->id, dispute.id);
    BOOST_REQUIRE(byPayment->evidence);
    BOOST_CHECK_EQUAL(*byPayment->evidence, "log excerpt");

    BOOST_CHECK_EQUAL(disputes->ListByWallet(buyer.id).size(), 1U);
    BOOST_CHECK_EQUAL(disputes->ListByWallet(seller.id).size(), 1U);
    BOOST_CHECK(disputes->ListByWallet(platform.id).empty());

    // A disputed payment cannot be settled through the normal path
    BOOST_CHECK(!engine->Refund(payment.id));
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);
}

BOOST_AUTO_TEST_CASE(open_rejects)
{
    const CPayment payment = OpenPayment(10000);

    BOOST_CHECK_THROW(disputes->Open(payment.id, buyer.id, ""), ValidationError);
    BOOST_CHECK_THROW(disputes->Open(payment.id, buyer.id, std::string(MAX_DISPUTE_REASON_LENGTH + 1, 'x')), ValidationError);
    BOOST_CHECK_THROW(disputes->Open(payment.id, buyer.id, "x", std::string(MAX_DISPUTE_EVIDENCE_LENGTH + 1, 'e')), ValidationError);
    BOOST_CHECK_THROW(disputes->Open("no-such-payment", buyer.id, "bad"), NotFoundError);

    try {
        disputes->Open(payment.id, seller.id, "bad");
        BOOST_ERROR("expected AuthError");
    } catch (const AuthError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Only buyer can open dispute"));
    }

    // The longest accepted reason
    disputes->Open(payment.id, buyer.id, std::string(MAX_DISPUTE_REASON_LENGTH, 'x'));
    try {
        disputes->Open(payment.id, buyer.id, "again");
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Dispute already exists for this payment"));
    }
}

BOOST_AUTO_TEST_CASE(open_requires_escrowed_payment)
{
    const CPayment payment = OpenPayment(10000);
    BOOST_REQUIRE(engine->Refund(payment.id));

    try {
        disputes->Open(payment.id, buyer.id, "too late");
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Can only dispute escrowed payments"));
    }
    BOOST_CHECK(!disputes->GetByPaymentId(payment.id));
}

BOOST_AUTO_TEST_CASE(open_window_expires)
{
    const CPayment payment = OpenPayment(10000);

    SetMockTime(DISPUTE_TEST_TIME + 30 * 60 + 1);
    try {
        disputes->Open(payment.id, buyer.id, "late");
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Dispute window expired. Must file within 30 minutes of execution"));
    }
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::ESCROWED);

    // The last second of the window is still in time
    SetMockTime(DISPUTE_TEST_TIME + 30 * 60);
    BOOST_CHECK(disputes->Open(payment.id, buyer.id, "just in time").IsActive());
}

// =============================================================================
// Review and resolution
// =============================================================================

BOOST_AUTO_TEST_CASE(resolve_refund)
{
    const CPayment payment = OpenPayment(10000);
    const CAmount nBuyerBefore = chain.GetBalance(buyer.address);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Wrong output");

    const CResolveResult result = disputes->Resolve(dispute.id, AdminCredentials(),
                                                    MakeResolveRequest(payment.id, DisputeResolution::REFUND));
    BOOST_CHECK(result.payment.status == PaymentStatus::REFUNDED);
    BOOST_REQUIRE(result.payment.refundTxId);
    BOOST_CHECK(result.dispute.status == DisputeStatus::RESOLVED_REFUND);
    BOOST_REQUIRE(result.dispute.resolution);
    BOOST_CHECK(*result.dispute.resolution == DisputeResolution::REFUND);
    BOOST_REQUIRE(result.dispute.resolvedBy);
    BOOST_CHECK_EQUAL(*result.dispute.resolvedBy, adminAddress);
    BOOST_CHECK(result.dispute.nResolveTime);
    BOOST_CHECK(!result.dispute.IsActive());

    BOOST_CHECK_EQUAL(chain.GetBalance(buyer.address), nBuyerBefore + 10000);
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::REFUNDED);

    try {
        disputes->Resolve(dispute.id, AdminCredentials(), MakeResolveRequest(payment.id, DisputeResolution::RELEASE));
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Dispute already resolved"));
    }

    audit->Flush();
    const std::vector<CAuditRecord> records = audit->ReadRecent(2);
    BOOST_REQUIRE_EQUAL(records.size(), 2U);
    BOOST_CHECK_EQUAL(records[0].outcome, "failure");
    BOOST_CHECK_EQUAL(records[1].action, "dispute.resolve");
    BOOST_CHECK_EQUAL(records[1].outcome, "success");
    BOOST_CHECK_EQUAL(records[1].actor, ADMIN_ACTOR_STATIC_KEY);
    BOOST_CHECK_EQUAL(records[1].context["paymentId"].get_str(), payment.id);
}

BOOST_AUTO_TEST_CASE(resolve_release)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Provider disagrees");
    disputes->MarkUnderReview(dispute.id, AdminCredentials());

    const CResolveResult result = disputes->Resolve(dispute.id, AdminCredentials(),
                                                    MakeResolveRequest(payment.id, DisputeResolution::RELEASE));
    BOOST_CHECK(result.payment.status == PaymentStatus::RELEASED);
    BOOST_CHECK(result.dispute.status == DisputeStatus::RESOLVED_RELEASE);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9800);
}

BOOST_AUTO_TEST_CASE(resolve_split_not_implemented)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Half done");

    CResolveRequest request = MakeResolveRequest(payment.id, DisputeResolution::REFUND);
    request.resolution = DisputeResolution::SPLIT;
    try {
        disputes->Resolve(dispute.id, AdminCredentials(), request);
        BOOST_ERROR("expected NotImplementedError");
    } catch (const NotImplementedError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Split resolution is not implemented"));
        BOOST_CHECK(e.GetCode() == ErrorCode::NOT_IMPLEMENTED);
    }

    const Optional<CDispute> stored = disputes->GetById(dispute.id);
    BOOST_REQUIRE(stored);
    BOOST_CHECK(stored->status == DisputeStatus::OPEN);
    BOOST_CHECK(!stored->resolution);
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);
    BOOST_CHECK(engine->GetSettlementApprovals(payment.id).size() == 3U);

    audit->Flush();
    const std::vector<CAuditRecord> records = audit->ReadRecent(1);
    BOOST_REQUIRE_EQUAL(records.size(), 1U);
    BOOST_CHECK_EQUAL(records[0].outcome, "not_implemented");
}

BOOST_AUTO_TEST_CASE(mark_under_review)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Slow");

    CAdminCredentials wrong;
    wrong.adminKey = std::string("wrong-key");
    BOOST_CHECK_THROW(disputes->MarkUnderReview(dispute.id, wrong), AuthError);

    audit->Flush();
    std::vector<CAuditRecord> records = audit->ReadRecent(1);
    BOOST_REQUIRE_EQUAL(records.size(), 1U);
    BOOST_CHECK_EQUAL(records[0].actor, "unauthenticated");
    BOOST_CHECK_EQUAL(records[0].action, "dispute.review");
    BOOST_CHECK_EQUAL(records[0].outcome, "failure");

    const CDispute reviewed = disputes->MarkUnderReview(dispute.id, AdminCredentials());
    BOOST_CHECK(reviewed.status == DisputeStatus::UNDER_REVIEW);
    BOOST_CHECK(reviewed.IsActive());

    // Only open disputes move to review
    BOOST_CHECK_THROW(disputes->MarkUnderReview(dispute.id, AdminCredentials()), ValidationError);
    BOOST_CHECK_THROW(disputes->MarkUnderReview("no-such-dispute", AdminCredentials()), NotFoundError);
}

BOOST_AUTO_TEST_CASE(resolve_requires_admin)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Wrong output");

    BOOST_CHECK_THROW(disputes->Resolve(dispute.id, CAdminCredentials(),
                                        MakeResolveRequest(payment.id, DisputeResolution::REFUND)),
                      AuthError);

    // Approval signed over the other action
    CResolveRequest request = MakeResolveRequest(payment.id, DisputeResolution::RELEASE);
    request.resolution = DisputeResolution::REFUND;
    BOOST_CHECK_THROW(disputes->Resolve(dispute.id, AdminCredentials(), request), CryptoVerificationError);

    // Address outside the allow-list
    request = MakeResolveRequest(payment.id, DisputeResolution::REFUND);
    request.adminAddress = buyer.address;
    BOOST_CHECK_THROW(disputes->Resolve(dispute.id, AdminCredentials(), request), AuthError);

    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);
    BOOST_CHECK(disputes->GetById(dispute.id)->IsActive());
}

BOOST_AUTO_TEST_CASE(resolve_session_must_match_admin_address)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Wrong output");

    CAdminCredentials credentials = AdminCredentials();
    credentials.walletToken = OpenSessionToken();

    CResolveRequest request = MakeResolveRequest(payment.id, DisputeResolution::REFUND);
    request.adminAddress = EncodeDestination(GenerateRandomKey().GetPubKey().GetID());
    BOOST_CHECK_THROW(disputes->Resolve(dispute.id, credentials, request), AuthError);

    const CResolveResult result = disputes->Resolve(dispute.id, credentials,
                                                    MakeResolveRequest(payment.id, DisputeResolution::REFUND));
    BOOST_CHECK(result.dispute.status == DisputeStatus::RESOLVED_REFUND);

    audit->Flush();
    const std::vector<CAuditRecord> records = audit->ReadRecent(1);
    BOOST_REQUIRE_EQUAL(records.size(), 1U);
    BOOST_CHECK_EQUAL(records[0].actor, adminAddress);
    BOOST_CHECK_EQUAL(records[0].outcome, "success");
}

// =============================================================================
// Expiry
// =============================================================================

BOOST_AUTO_TEST_CASE(review_period_expiry_returns_escrow)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "No answer");

    SetMockTime(DISPUTE_TEST_TIME + DEFAULT_DISPUTE_REVIEW_PERIOD);
    BOOST_CHECK(disputes->GetById(dispute.id)->IsActive());
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);

    SetMockTime(DISPUTE_TEST_TIME + DEFAULT_DISPUTE_REVIEW_PERIOD + 1);
    const Optional<CDispute> expired = disputes->GetById(dispute.id);
    BOOST_REQUIRE(expired);
    BOOST_CHECK(expired->status == DisputeStatus::EXPIRED);
    BOOST_CHECK(!expired->resolution);
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::ESCROWED);

    try {
        disputes->Resolve(dispute.id, AdminCredentials(), MakeResolveRequest(payment.id, DisputeResolution::REFUND));
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Dispute has expired"));
    }

    // Only one dispute per payment, even after expiry
    BOOST_CHECK_THROW(disputes->Open(payment.id, buyer.id, "again"), ValidationError);

    // The escrow settles normally again
    BOOST_CHECK(engine->Refund(payment.id));
}

BOOST_AUTO_TEST_CASE(expiry_applies_to_lists)
{
    const CPayment payment = OpenPayment(10000);
    disputes->Open(payment.id, buyer.id, "No answer");

    SetMockTime(DISPUTE_TEST_TIME + DEFAULT_DISPUTE_REVIEW_PERIOD + 60);
    const std::vector<CDispute> listed = disputes->ListByWallet(seller.id);
    BOOST_REQUIRE_EQUAL(listed.size(), 1U);
    BOOST_CHECK(listed[0].status == DisputeStatus::EXPIRED);
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::ESCROWED);
}

BOOST_AUTO_TEST_CASE(dispute_enum_strings)
{
    BOOST_CHECK_EQUAL(DisputeStatusToString(DisputeStatus::UNDER_REVIEW), "under_review");
    BOOST_CHECK_EQUAL(DisputeStatusToString(DisputeStatus::RESOLVED_SPLIT), "resolved_split");
    DisputeStatus status;
    BOOST_CHECK(DisputeStatusFromString("expired", status));
    BOOST_CHECK(status == DisputeStatus::EXPIRED);
    BOOST_CHECK(!DisputeStatusFromString("closed", status));

    DisputeResolution resolution;
    BOOST_CHECK(DisputeResolutionFromString("split", resolution));
    BOOST_CHECK(resolution == DisputeResolution::SPLIT);
    BOOST_CHECK_EQUAL(DisputeResolutionToString(DisputeResolution::RELEASE), "release");
}

// =============================================================================
// Multisig escrow
// =============================================================================

BOOST_FIXTURE_TEST_CASE(resolve_multisig_needs_tx_signature, MultisigDisputeTestingSetup)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Wrong output");

    CResolveRequest request = MakeResolveRequest(payment.id, DisputeResolution::RELEASE);
    try {
        disputes->Resolve(dispute.id, AdminCredentials(), request);
        BOOST_ERROR("expected ValidationError");
    } catch (const ValidationError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("adminTxSignatureHex is required for multisig escrow"));
    }
    BOOST_CHECK(StoredStatus(payment.id) == PaymentStatus::DISPUTED);

    const Optional<MultisigSigningPayload> payload = engine->GetAdminMultisigSigningPayload(payment.id, SettlementAction::RELEASE);
    BOOST_REQUIRE(payload);
    std::vector<unsigned char> vchSig;
    BOOST_REQUIRE(adminMultisigKey.Sign(uint256(ParseHex(payload->digestHex)), vchSig));
    request.adminTxSignatureHex = HexStr(vchSig);

    const CResolveResult result = disputes->Resolve(dispute.id, AdminCredentials(), request);
    BOOST_CHECK(result.payment.status == PaymentStatus::RELEASED);
    BOOST_CHECK(result.dispute.status == DisputeStatus::RESOLVED_RELEASE);
    BOOST_CHECK_EQUAL(chain.GetBalance(seller.address), 9580);
}

BOOST_AUTO_TEST_SUITE_END()
