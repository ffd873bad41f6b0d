// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ADMIN_ADMINAUTH_H
#define AGENTPAY_ADMIN_ADMINAUTH_H

/**
 * Admin step-up authentication
 *
 * Privileged calls carry a static admin key (X-Admin-Key) and, when wallet
 * step-up is required, a session token (X-Admin-Wallet-Token). A session is
 * obtained by signing a one-time challenge with an allow-listed admin
 * wallet. Up to three static keys are accepted at once so a key can be
 * rotated without downtime.
 */

#include "admin/adminauthdb.h"
#include "optional.h"

#include <stdint.h>
#include <string>
#include <vector>

class CAuditLog;
class SQLiteDatabase;

static const char* const ADMIN_KEY_HEADER = "X-Admin-Key";
static const char* const ADMIN_WALLET_TOKEN_HEADER = "X-Admin-Wallet-Token";

static const int64_t DEFAULT_ADMIN_CHALLENGE_TTL = 300;     // seconds
static const int64_t DEFAULT_ADMIN_SESSION_TTL = 3600;      // seconds
static const int ADMIN_CHALLENGE_NONCE_BYTES = 16;
static const int ADMIN_SESSION_TOKEN_BYTES = 32;
static const bool DEFAULT_REQUIRE_WALLET_STEPUP = false;

//! Actor name recorded when no step-up session backs a privileged call.
static const char* const ADMIN_ACTOR_STATIC_KEY = "admin-key";

struct CAdminAuthOptions
{
    std::string adminKey;
    std::string adminKeyPrevious;
    std::string adminKeyLegacy;
    std::vector<std::string> allowList;
    bool fRequireWalletStepUp{DEFAULT_REQUIRE_WALLET_STEPUP};
    int64_t nChallengeTTL{DEFAULT_ADMIN_CHALLENGE_TTL};
    int64_t nSessionTTL{DEFAULT_ADMIN_SESSION_TTL};
};

/** Credentials as presented in the two admin headers. */
struct CAdminCredentials
{
    Optional<std::string> adminKey;
    Optional<std::string> walletToken;
};

/** Returned once by VerifyChallenge(); the token is never stored. */
struct CIssuedSession
{
    std::string token;
    std::string address;
    int64_t nExpireTime{0};
};

class CAdminAuth
{
public:
    CAdminAuth(SQLiteDatabase& db, const CAdminAuthOptions& options, CAuditLog& audit);

    /** Constant-time match against the current, previous and legacy keys. */
    bool CheckAdminKey(const std::string& key) const;

    bool IsAllowListed(const std::string& address) const;

    /** Issue a challenge, optionally bound to one admin address. */
    CAdminChallenge CreateChallenge(const Optional<std::string>& address = boost::none);

    /**
     * Consume a challenge signed by an allow-listed wallet and open a session.
     * @throws AuthError
     */
    CIssuedSession VerifyChallenge(const std::string& nonce, const std::string& address, const std::string& signature);

    /** The live session behind a token, if any. */
    Optional<CAdminSession> VerifySession(const std::string& token) const;

    bool RevokeSession(const std::string& token);

    /**
     * Gate for privileged operations. Requires a valid static key, plus a
     * live session when wallet step-up is required. The error never says
     * which check failed.
     *
     * @return the acting admin: the session's address, or "admin-key"
     * @throws AuthError
     */
    std::string Authorize(const CAdminCredentials& credentials) const;

    int PurgeExpired();

    const CAdminAuthOptions& GetOptions() const { return m_options; }

private:
    SQLiteDatabase& m_db;
    CAdminAuthOptions m_options;
    CAuditLog& m_audit;
};

#endif // AGENTPAY_ADMIN_ADMINAUTH_H
