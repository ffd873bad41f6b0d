// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "admin/adminauth.h"

#include "admin/audit.h"
#include "hash.h"
#include "logging.h"
#include "random.h"
#include "util/error.h"
#include "util/message.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "wallet/db.h"

#include <algorithm>

#include <univalue.h>

static bool SecretEquals(const std::string& expected, const std::string& provided)
{
    if (expected.empty()) return false;
    return TimingResistantEqual(expected, provided);
}

static std::string FormatChallenge(const std::string& nonce, const Optional<std::string>& address, int64_t nExpireTime)
{
    return strprintf("AgentPay admin step-up\nAddress: %s\nNonce: %s\nExpires: %d",
                     address ? *address : "any", nonce, nExpireTime);
}

CAdminAuth::CAdminAuth(SQLiteDatabase& db, const CAdminAuthOptions& options, CAuditLog& audit)
    : m_db(db), m_options(options), m_audit(audit)
{
}

bool CAdminAuth::CheckAdminKey(const std::string& key) const
{
    // Evaluate every slot regardless of earlier matches.
    bool fMatch = false;
    fMatch |= SecretEquals(m_options.adminKey, key);
    fMatch |= SecretEquals(m_options.adminKeyPrevious, key);
    fMatch |= SecretEquals(m_options.adminKeyLegacy, key);
    return fMatch;
}

bool CAdminAuth::IsAllowListed(const std::string& address) const
{
    return std::find(m_options.allowList.begin(), m_options.allowList.end(), address) != m_options.allowList.end();
}

CAdminChallenge CAdminAuth::CreateChallenge(const Optional<std::string>& address)
{
    CAdminChallenge challenge;
    challenge.nonce = GetRandHex(ADMIN_CHALLENGE_NONCE_BYTES);
    challenge.address = address;
    challenge.nCreateTime = GetTime();
    challenge.nExpireTime = challenge.nCreateTime + m_options.nChallengeTTL;
    challenge.challenge = FormatChallenge(challenge.nonce, address, challenge.nExpireTime);

    SQLiteBatch batch(m_db);
    CAdminAuthDB(m_db).WriteChallenge(challenge);
    LogPrint(BCLog::ADMIN, "CAdminAuth::%s: nonce %s expires %d\n", __func__, challenge.nonce, challenge.nExpireTime);
    return challenge;
}

CIssuedSession CAdminAuth::VerifyChallenge(const std::string& nonce, const std::string& address, const std::string& signature)
{
    UniValue context(UniValue::VOBJ);
    context.pushKV("nonce", nonce);

    SQLiteBatch batch(m_db);
    CAdminAuthDB authdb(m_db);
    const int64_t now = GetTime();

    auto fail = [&](const std::string& reason) {
        context.pushKV("reason", reason);
        m_audit.Record(address, "admin.challenge.verify", "failure", context);
        return AuthError(reason);
    };

    CAdminChallenge challenge;
    if (!authdb.ReadChallenge(nonce, challenge)) throw fail("Unknown admin challenge");
    if (challenge.nUseTime) throw fail("Admin challenge already used");
    if (now > challenge.nExpireTime) throw fail("Admin challenge expired");
    if (challenge.address && *challenge.address != address) throw fail("Admin challenge is bound to another address");
    if (!IsAllowListed(address)) throw fail("Admin wallet is not allow-listed");
    if (MessageVerify(address, signature, challenge.challenge) != MessageVerificationResult::OK) {
        throw fail("Invalid admin challenge signature");
    }

    if (!batch.TxnBegin()) {
        throw std::runtime_error("CAdminAuth::VerifyChallenge: cannot begin transaction");
    }
    if (!authdb.MarkChallengeUsed(nonce, now)) throw fail("Admin challenge already used");

    CIssuedSession issued;
    issued.token = GetRandHex(ADMIN_SESSION_TOKEN_BYTES);
    issued.address = address;
    issued.nExpireTime = now + m_options.nSessionTTL;

    CAdminSession session;
    session.tokenHash = SHA256Hex(issued.token);
    session.address = address;
    session.challengeNonce = nonce;
    session.nCreateTime = now;
    session.nExpireTime = issued.nExpireTime;
    authdb.WriteSession(session);

    if (!batch.TxnCommit()) {
        throw std::runtime_error("CAdminAuth::VerifyChallenge: cannot commit transaction");
    }

    m_audit.Record(address, "admin.challenge.verify", "success", context);
    LogPrint(BCLog::ADMIN, "CAdminAuth::%s: session for %s until %d\n", __func__, address, issued.nExpireTime);
    return issued;
}

Optional<CAdminSession> CAdminAuth::VerifySession(const std::string& token) const
{
    if (token.empty()) return boost::none;

    CAdminSession session;
    if (!CAdminAuthDB(m_db).ReadSession(SHA256Hex(token), session)) return boost::none;
    if (session.nRevokeTime || GetTime() > session.nExpireTime) return boost::none;
    if (!IsAllowListed(session.address)) return boost::none;
    return session;
}

bool CAdminAuth::RevokeSession(const std::string& token)
{
    const bool fRevoked = CAdminAuthDB(m_db).RevokeSession(SHA256Hex(token), GetTime());
    if (fRevoked) {
        m_audit.Record("admin-session", "admin.session.revoke", "success");
    }
    return fRevoked;
}

std::string CAdminAuth::Authorize(const CAdminCredentials& credentials) const
{
    const bool fKey = credentials.adminKey && CheckAdminKey(*credentials.adminKey);
    Optional<CAdminSession> session;
    if (credentials.walletToken) session = VerifySession(*credentials.walletToken);

    if (!fKey || (m_options.fRequireWalletStepUp && !session)) {
        LogPrint(BCLog::ADMIN, "CAdminAuth::%s: rejected\n", __func__);
        throw AuthError("Admin authorization failed");
    }
    return session ? session->address : ADMIN_ACTOR_STATIC_KEY;
}

int CAdminAuth::PurgeExpired()
{
    SQLiteBatch batch(m_db);
    const int nRemoved = CAdminAuthDB(m_db).PurgeExpired(GetTime());
    if (nRemoved > 0) {
        LogPrint(BCLog::ADMIN, "CAdminAuth::%s: removed %d expired rows\n", __func__, nRemoved);
    }
    return nRemoved;
}
