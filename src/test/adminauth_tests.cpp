// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "admin/adminauth.h"

#include "admin/audit.h"
#include "dispute/dispute.h"
#include "hash.h"
#include "key_io.h"
#include "test/test_agentpay.h"
#include "util/error.h"
#include "util/message.h"
#include "util/time.h"
#include "wallet/db.h"

#include <univalue.h>

#include <boost/test/unit_test.hpp>

static const int64_t ADMIN_TEST_TIME = 1750000000;

struct AdminAuthTestingSetup : public EscrowTestingSetup
{
    explicit AdminAuthTestingSetup(bool fRequireWalletStepUp = false)
        : EscrowTestingSetup(EscrowMode::PLATFORM, fRequireWalletStepUp)
    {
        SetMockTime(ADMIN_TEST_TIME);
    }

    std::string SignChallenge(const CAdminChallenge& challenge, const CKey& key) const
    {
        std::string signature;
        BOOST_REQUIRE(MessageSign(key, challenge.challenge, signature));
        return signature;
    }

    CIssuedSession Login()
    {
        const CAdminChallenge challenge = adminAuth->CreateChallenge(adminAddress);
        return adminAuth->VerifyChallenge(challenge.nonce, adminAddress, SignChallenge(challenge, adminWalletKey));
    }
};

struct StepUpTestingSetup : public AdminAuthTestingSetup
{
    StepUpTestingSetup() : AdminAuthTestingSetup(true) {}
};

static void CheckAuthFailure(CAdminAuth& auth, const std::string& nonce, const std::string& address,
                             const std::string& signature, const std::string& expected)
{
    try {
        auth.VerifyChallenge(nonce, address, signature);
        BOOST_ERROR("expected AuthError: " + expected);
    } catch (const AuthError& e) {
        BOOST_CHECK_EQUAL(e.what(), expected);
        BOOST_CHECK(e.GetCode() == ErrorCode::AUTH_ERROR);
    }
}

BOOST_FIXTURE_TEST_SUITE(adminauth_tests, AdminAuthTestingSetup)

// =============================================================================
// Static admin keys
// =============================================================================

BOOST_AUTO_TEST_CASE(admin_key_slots)
{
    BOOST_CHECK(adminAuth->CheckAdminKey(TEST_ADMIN_KEY));
    BOOST_CHECK(adminAuth->CheckAdminKey(TEST_ADMIN_KEY_PREVIOUS));
    BOOST_CHECK(!adminAuth->CheckAdminKey("test-admin-key"));
    BOOST_CHECK(!adminAuth->CheckAdminKey(std::string(TEST_ADMIN_KEY) + "x"));

    // The unset legacy slot never matches
    BOOST_CHECK(!adminAuth->CheckAdminKey(""));
}

BOOST_AUTO_TEST_CASE(authorize_with_static_key)
{
    BOOST_CHECK_EQUAL(adminAuth->Authorize(AdminCredentials()), ADMIN_ACTOR_STATIC_KEY);

    CAdminCredentials previous;
    previous.adminKey = std::string(TEST_ADMIN_KEY_PREVIOUS);
    BOOST_CHECK_EQUAL(adminAuth->Authorize(previous), ADMIN_ACTOR_STATIC_KEY);

    BOOST_CHECK_THROW(adminAuth->Authorize(CAdminCredentials()), AuthError);

    CAdminCredentials wrong;
    wrong.adminKey = std::string("nope");
    try {
        adminAuth->Authorize(wrong);
        BOOST_ERROR("expected AuthError");
    } catch (const AuthError& e) {
        BOOST_CHECK_EQUAL(e.what(), std::string("Admin authorization failed"));
    }

    // A session alone is never enough
    CAdminCredentials sessionOnly;
    sessionOnly.walletToken = Login().token;
    BOOST_CHECK_THROW(adminAuth->Authorize(sessionOnly), AuthError);
}

// =============================================================================
// Challenges
// =============================================================================

BOOST_AUTO_TEST_CASE(challenge_login)
{
    const CAdminChallenge challenge = adminAuth->CreateChallenge(adminAddress);
    BOOST_CHECK_EQUAL(challenge.nonce.size(), 2U * ADMIN_CHALLENGE_NONCE_BYTES);
    BOOST_CHECK_EQUAL(challenge.nCreateTime, ADMIN_TEST_TIME);
    BOOST_CHECK_EQUAL(challenge.nExpireTime, ADMIN_TEST_TIME + DEFAULT_ADMIN_CHALLENGE_TTL);
    BOOST_CHECK(challenge.challenge.find(challenge.nonce) != std::string::npos);
    BOOST_CHECK(challenge.challenge.find(adminAddress) != std::string::npos);

    const CIssuedSession issued = adminAuth->VerifyChallenge(challenge.nonce, adminAddress,
                                                             SignChallenge(challenge, adminWalletKey));
    BOOST_CHECK_EQUAL(issued.address, adminAddress);
    BOOST_CHECK_EQUAL(issued.token.size(), 2U * ADMIN_SESSION_TOKEN_BYTES);
    BOOST_CHECK_EQUAL(issued.nExpireTime, ADMIN_TEST_TIME + DEFAULT_ADMIN_SESSION_TTL);

    const Optional<CAdminSession> session = adminAuth->VerifySession(issued.token);
    BOOST_REQUIRE(session);
    BOOST_CHECK_EQUAL(session->address, adminAddress);
    BOOST_CHECK_EQUAL(session->challengeNonce, challenge.nonce);

    // Only the token hash is stored
    BOOST_CHECK_EQUAL(session->tokenHash, SHA256Hex(issued.token));
    SQLiteStatement stmt(*db, "SELECT COUNT(*) FROM admin_auth_sessions WHERE tokenHash = ?");
    stmt.Bind(1, issued.token);
    BOOST_REQUIRE(stmt.Step());
    BOOST_CHECK_EQUAL(stmt.ColumnInt64(0), 0);

    CAdminCredentials credentials = AdminCredentials();
    credentials.walletToken = issued.token;
    BOOST_CHECK_EQUAL(adminAuth->Authorize(credentials), adminAddress);
}

BOOST_AUTO_TEST_CASE(challenge_single_use)
{
    const CAdminChallenge challenge = adminAuth->CreateChallenge();
    const std::string signature = SignChallenge(challenge, adminWalletKey);

    adminAuth->VerifyChallenge(challenge.nonce, adminAddress, signature);
    CheckAuthFailure(*adminAuth, challenge.nonce, adminAddress, signature, "Admin challenge already used");
    CheckAuthFailure(*adminAuth, "00112233", adminAddress, signature, "Unknown admin challenge");
}

BOOST_AUTO_TEST_CASE(challenge_failed_attempt_does_not_consume)
{
    const CAdminChallenge challenge = adminAuth->CreateChallenge();

    // Signed by a wallet that is not the claimed address
    CheckAuthFailure(*adminAuth, challenge.nonce, adminAddress, SignChallenge(challenge, GenerateRandomKey()),
                     "Invalid admin challenge signature");

    const CIssuedSession issued = adminAuth->VerifyChallenge(challenge.nonce, adminAddress,
                                                             SignChallenge(challenge, adminWalletKey));
    BOOST_CHECK(adminAuth->VerifySession(issued.token));
}

BOOST_AUTO_TEST_CASE(challenge_rejects)
{
    // Not on the allow-list, even with a valid signature
    const CKey outsider = GenerateRandomKey();
    const std::string outsiderAddress = EncodeDestination(outsider.GetPubKey().GetID());
    const CAdminChallenge open = adminAuth->CreateChallenge();
    CheckAuthFailure(*adminAuth, open.nonce, outsiderAddress, SignChallenge(open, outsider),
                     "Admin wallet is not allow-listed");

    // Bound to another address
    const CAdminChallenge bound = adminAuth->CreateChallenge(outsiderAddress);
    CheckAuthFailure(*adminAuth, bound.nonce, adminAddress, SignChallenge(bound, adminWalletKey),
                     "Admin challenge is bound to another address");

    // Expired
    const CAdminChallenge stale = adminAuth->CreateChallenge(adminAddress);
    SetMockTime(ADMIN_TEST_TIME + DEFAULT_ADMIN_CHALLENGE_TTL + 1);
    CheckAuthFailure(*adminAuth, stale.nonce, adminAddress, SignChallenge(stale, adminWalletKey),
                     "Admin challenge expired");

    audit->Flush();
    const std::vector<CAuditRecord> records = audit->ReadRecent(3);
    BOOST_REQUIRE_EQUAL(records.size(), 3U);
    for (const CAuditRecord& record : records) {
        BOOST_CHECK_EQUAL(record.action, "admin.challenge.verify");
        BOOST_CHECK_EQUAL(record.outcome, "failure");
    }
    BOOST_CHECK_EQUAL(records[0].context["reason"].get_str(), "Admin challenge expired");
    BOOST_CHECK_EQUAL(records[2].actor, outsiderAddress);
}

// =============================================================================
// Sessions
// =============================================================================

BOOST_AUTO_TEST_CASE(session_expiry)
{
    const CIssuedSession issued = Login();

    SetMockTime(issued.nExpireTime);
    BOOST_CHECK(adminAuth->VerifySession(issued.token));

    SetMockTime(issued.nExpireTime + 1);
    BOOST_CHECK(!adminAuth->VerifySession(issued.token));

    BOOST_CHECK(!adminAuth->VerifySession(""));
    BOOST_CHECK(!adminAuth->VerifySession("not-a-token"));
}

BOOST_AUTO_TEST_CASE(session_revoke)
{
    const CIssuedSession issued = Login();
    BOOST_CHECK(adminAuth->RevokeSession(issued.token));
    BOOST_CHECK(!adminAuth->VerifySession(issued.token));
    BOOST_CHECK(!adminAuth->RevokeSession(issued.token));
}

BOOST_AUTO_TEST_CASE(purge_expired)
{
    const CIssuedSession issued = Login();
    adminAuth->CreateChallenge();
    BOOST_CHECK_EQUAL(adminAuth->PurgeExpired(), 0);

    // Both challenges and the session are past their expiry
    SetMockTime(issued.nExpireTime + 1);
    BOOST_CHECK_EQUAL(adminAuth->PurgeExpired(), 3);
    BOOST_CHECK_EQUAL(adminAuth->PurgeExpired(), 0);
}

BOOST_FIXTURE_TEST_CASE(stepup_requires_session, StepUpTestingSetup)
{
    BOOST_CHECK_THROW(adminAuth->Authorize(AdminCredentials()), AuthError);

    CAdminCredentials credentials = AdminCredentials();
    credentials.walletToken = Login().token;
    BOOST_CHECK_EQUAL(adminAuth->Authorize(credentials), adminAddress);

    // A live session without the static key
    CAdminCredentials tokenOnly;
    tokenOnly.walletToken = credentials.walletToken;
    BOOST_CHECK_THROW(adminAuth->Authorize(tokenOnly), AuthError);

    BOOST_REQUIRE(adminAuth->RevokeSession(*credentials.walletToken));
    BOOST_CHECK_THROW(adminAuth->Authorize(credentials), AuthError);
}

BOOST_FIXTURE_TEST_CASE(stepup_gates_dispute_review, StepUpTestingSetup)
{
    const CPayment payment = OpenPayment(10000);
    const CDispute dispute = disputes->Open(payment.id, buyer.id, "Wrong output");

    BOOST_CHECK_THROW(disputes->MarkUnderReview(dispute.id, AdminCredentials()), AuthError);

    CAdminCredentials credentials = AdminCredentials();
    credentials.walletToken = Login().token;
    BOOST_CHECK(disputes->MarkUnderReview(dispute.id, credentials).status == DisputeStatus::UNDER_REVIEW);

    audit->Flush();
    const std::vector<CAuditRecord> records = audit->ReadRecent(1);
    BOOST_REQUIRE_EQUAL(records.size(), 1U);
    BOOST_CHECK_EQUAL(records[0].actor, adminAddress);
    BOOST_CHECK_EQUAL(records[0].action, "dispute.review");
    BOOST_CHECK_EQUAL(records[0].outcome, "success");
}

// =============================================================================
// Audit log
// =============================================================================

BOOST_AUTO_TEST_CASE(audit_log_append_only)
{
    UniValue context(UniValue::VOBJ);
    context.pushKV("paymentId", "p-1");
    audit->Record("admin-key", "test.action", "success", context);
    audit->Flush();

    const std::vector<CAuditRecord> records = audit->ReadRecent(10);
    BOOST_REQUIRE_EQUAL(records.size(), 1U);
    BOOST_CHECK_EQUAL(records[0].actor, "admin-key");
    BOOST_CHECK_EQUAL(records[0].context["paymentId"].get_str(), "p-1");
    BOOST_CHECK_EQUAL(records[0].nCreateTime, ADMIN_TEST_TIME);

    SQLiteStatement update(*db, "UPDATE admin_audit_logs SET outcome = 'failure'");
    BOOST_CHECK_THROW(update.Execute(), std::runtime_error);
    SQLiteStatement remove(*db, "DELETE FROM admin_audit_logs");
    BOOST_CHECK_THROW(remove.Execute(), std::runtime_error);

    BOOST_CHECK_EQUAL(audit->ReadRecent(10)[0].outcome, "success");
}

BOOST_AUTO_TEST_SUITE_END()
