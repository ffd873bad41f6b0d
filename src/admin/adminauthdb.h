// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ADMIN_ADMINAUTHDB_H
#define AGENTPAY_ADMIN_ADMINAUTHDB_H

#include "optional.h"

#include <stdint.h>
#include <string>

class SQLiteDatabase;

/** A one-time login challenge for an admin wallet. */
struct CAdminChallenge
{
    std::string nonce;
    std::string challenge;          // exact text the wallet signs
    Optional<std::string> address;  // set when bound to one admin address
    int64_t nCreateTime{0};
    int64_t nExpireTime{0};
    Optional<int64_t> nUseTime;
};

/** A step-up session. Only the SHA-256 of the bearer token is stored. */
struct CAdminSession
{
    std::string tokenHash;
    std::string address;
    std::string challengeNonce;
    int64_t nCreateTime{0};
    int64_t nExpireTime{0};
    Optional<int64_t> nRevokeTime;
};

/**
 * Admin Auth Database Layer
 *
 * - WriteChallenge / ReadChallenge / MarkChallengeUsed
 * - WriteSession / ReadSession / RevokeSession
 * - PurgeExpired
 */
class CAdminAuthDB
{
private:
    SQLiteDatabase& m_db;

public:
    explicit CAdminAuthDB(SQLiteDatabase& db) : m_db(db) {}

    void WriteChallenge(const CAdminChallenge& challenge);
    bool ReadChallenge(const std::string& nonce, CAdminChallenge& challenge) const;
    /** Set usedAt once. False if already used or unknown. */
    bool MarkChallengeUsed(const std::string& nonce, int64_t nTime);

    void WriteSession(const CAdminSession& session);
    bool ReadSession(const std::string& tokenHash, CAdminSession& session) const;
    bool RevokeSession(const std::string& tokenHash, int64_t nTime);

    /** Delete challenges and sessions expired before nTime. Returns rows removed. */
    int PurgeExpired(int64_t nTime);
};

#endif // AGENTPAY_ADMIN_ADMINAUTHDB_H
