// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "admin/adminauthdb.h"

#include "wallet/db.h"

void CAdminAuthDB::WriteChallenge(const CAdminChallenge& challenge)
{
    SQLiteStatement stmt(m_db,
        "INSERT INTO admin_auth_challenges (nonce, challenge, address, createdAt, expiresAt, usedAt) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    stmt.Bind(1, challenge.nonce)
        .Bind(2, challenge.challenge)
        .Bind(3, challenge.address)
        .Bind(4, challenge.nCreateTime)
        .Bind(5, challenge.nExpireTime)
        .Bind(6, challenge.nUseTime);
    stmt.Execute();
}

bool CAdminAuthDB::ReadChallenge(const std::string& nonce, CAdminChallenge& challenge) const
{
    SQLiteStatement stmt(m_db,
        "SELECT nonce, challenge, address, createdAt, expiresAt, usedAt FROM admin_auth_challenges WHERE nonce = ?");
    stmt.Bind(1, nonce);
    if (!stmt.Step()) return false;
    challenge.nonce = stmt.ColumnText(0);
    challenge.challenge = stmt.ColumnText(1);
    challenge.address = stmt.ColumnOptionalText(2);
    challenge.nCreateTime = stmt.ColumnInt64(3);
    challenge.nExpireTime = stmt.ColumnInt64(4);
    challenge.nUseTime = stmt.ColumnOptionalInt64(5);
    return true;
}

bool CAdminAuthDB::MarkChallengeUsed(const std::string& nonce, int64_t nTime)
{
    SQLiteStatement stmt(m_db, "UPDATE admin_auth_challenges SET usedAt = ? WHERE nonce = ? AND usedAt IS NULL");
    stmt.Bind(1, nTime).Bind(2, nonce);
    stmt.Execute();
    return stmt.Changes() == 1;
}

void CAdminAuthDB::WriteSession(const CAdminSession& session)
{
    SQLiteStatement stmt(m_db,
        "INSERT INTO admin_auth_sessions (tokenHash, address, challengeNonce, createdAt, expiresAt, revokedAt) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    stmt.Bind(1, session.tokenHash)
        .Bind(2, session.address)
        .Bind(3, session.challengeNonce)
        .Bind(4, session.nCreateTime)
        .Bind(5, session.nExpireTime)
        .Bind(6, session.nRevokeTime);
    stmt.Execute();
}

bool CAdminAuthDB::ReadSession(const std::string& tokenHash, CAdminSession& session) const
{
    SQLiteStatement stmt(m_db,
        "SELECT tokenHash, address, challengeNonce, createdAt, expiresAt, revokedAt "
        "FROM admin_auth_sessions WHERE tokenHash = ?");
    stmt.Bind(1, tokenHash);
    if (!stmt.Step()) return false;
    session.tokenHash = stmt.ColumnText(0);
    session.address = stmt.ColumnText(1);
    session.challengeNonce = stmt.ColumnText(2);
    session.nCreateTime = stmt.ColumnInt64(3);
    session.nExpireTime = stmt.ColumnInt64(4);
    session.nRevokeTime = stmt.ColumnOptionalInt64(5);
    return true;
}

bool CAdminAuthDB::RevokeSession(const std::string& tokenHash, int64_t nTime)
{
    SQLiteStatement stmt(m_db, "UPDATE admin_auth_sessions SET revokedAt = ? WHERE tokenHash = ? AND revokedAt IS NULL");
    stmt.Bind(1, nTime).Bind(2, tokenHash);
    stmt.Execute();
    return stmt.Changes() == 1;
}

int CAdminAuthDB::PurgeExpired(int64_t nTime)
{
    int nRemoved = 0;

    SQLiteStatement challenges(m_db, "DELETE FROM admin_auth_challenges WHERE expiresAt < ?");
    challenges.Bind(1, nTime);
    challenges.Execute();
    nRemoved += challenges.Changes();

    SQLiteStatement sessions(m_db, "DELETE FROM admin_auth_sessions WHERE expiresAt < ?");
    sessions.Bind(1, nTime);
    sessions.Execute();
    nRemoved += sessions.Changes();

    return nRemoved;
}
