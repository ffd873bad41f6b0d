// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/db.h"

#include "logging.h"
#include "util/system.h"

#include <stdexcept>

//
// SQLiteDatabase
//

SQLiteDatabase::SQLiteDatabase(const fs::path& path, bool mock)
    : m_mock(mock)
{
    if (mock) {
        // In-memory database for testing
        int rc = sqlite3_open(":memory:", &m_db);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("SQLiteDatabase: Failed to open in-memory database");
        }
        if (!SetupPragmas() || !SetupSchema()) {
            throw std::runtime_error("SQLiteDatabase: Failed to initialize in-memory database");
        }
        return;
    }

    if (fs::is_directory(path) || path.filename().empty()) {
        m_path = path / DEFAULT_DB_FILENAME;
    } else {
        m_path = path;
    }
    TryCreateDirectories(m_path.parent_path());

    int rc = sqlite3_open(m_path.string().c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string err = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error(strprintf("SQLiteDatabase: Failed to open database %s: %s", m_path.string(), err));
    }

    LogPrintf("Using SQLite store: %s\n", m_path.string());

    if (!SetupPragmas()) {
        throw std::runtime_error("SQLiteDatabase: Failed to set up pragmas");
    }

    if (!SetupSchema()) {
        throw std::runtime_error("SQLiteDatabase: Failed to set up schema");
    }
}

SQLiteDatabase::~SQLiteDatabase()
{
    Flush(true);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

bool SQLiteDatabase::SetupPragmas()
{
    if (!m_db) return false;

    // WAL mode for concurrent reads + crash recovery
    const char* pragmas =
        "PRAGMA journal_mode = WAL;"
        "PRAGMA synchronous = NORMAL;"
        "PRAGMA foreign_keys = ON;"
        "PRAGMA busy_timeout = 5000;";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, pragmas, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: pragma error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteDatabase::SetupSchema()
{
    if (!m_db) return false;

    // Every statement is idempotent; the schema is applied on each open.
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS wallets (
            id TEXT PRIMARY KEY,
            publicKey TEXT NOT NULL,
            address TEXT NOT NULL UNIQUE,
            encryptedPrivateKey TEXT NOT NULL,
            apiKeyHash TEXT,
            createdAt INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS utxos (
            txid TEXT NOT NULL,
            vout INTEGER NOT NULL,
            address TEXT NOT NULL,
            amount INTEGER NOT NULL,
            script TEXT NOT NULL,
            spent INTEGER NOT NULL DEFAULT 0,
            updatedAt INTEGER NOT NULL,
            PRIMARY KEY (txid, vout)
        );
        CREATE INDEX IF NOT EXISTS idx_utxos_address ON utxos(address, spent);

        CREATE TABLE IF NOT EXISTS services (
            id TEXT PRIMARY KEY,
            providerWalletId TEXT NOT NULL,
            name TEXT NOT NULL,
            description TEXT NOT NULL DEFAULT '',
            price INTEGER NOT NULL,
            currency TEXT NOT NULL,
            disputeWindow INTEGER NOT NULL,
            timeout INTEGER NOT NULL,
            active INTEGER NOT NULL DEFAULT 1,
            createdAt INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS payments (
            id TEXT PRIMARY KEY,
            serviceId TEXT NOT NULL,
            contractId TEXT,
            buyerWalletId TEXT NOT NULL,
            sellerWalletId TEXT NOT NULL,
            amount INTEGER NOT NULL,
            platformFee INTEGER NOT NULL,
            currency TEXT NOT NULL,
            escrowMode TEXT NOT NULL,
            status TEXT NOT NULL,
            consumedBy TEXT,
            escrowTxId TEXT,
            escrowVout INTEGER,
            escrowScript TEXT,
            releaseTxId TEXT,
            refundTxId TEXT,
            createdAt INTEGER NOT NULL,
            completedAt INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_payments_buyer ON payments(buyerWalletId);
        CREATE INDEX IF NOT EXISTS idx_payments_seller ON payments(sellerWalletId);

        CREATE TABLE IF NOT EXISTS settlement_approvals (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            paymentId TEXT NOT NULL,
            action TEXT NOT NULL,
            actorType TEXT NOT NULL,
            actorId TEXT NOT NULL,
            signature TEXT,
            message TEXT NOT NULL,
            createdAt INTEGER NOT NULL,
            UNIQUE (paymentId, action, actorType, actorId)
        );

        CREATE TABLE IF NOT EXISTS service_contracts (
            id TEXT PRIMARY KEY,
            serviceId TEXT NOT NULL,
            paymentId TEXT,
            buyerWalletId TEXT NOT NULL,
            providerWalletId TEXT NOT NULL,
            buyerAddress TEXT NOT NULL,
            providerAddress TEXT NOT NULL,
            amount INTEGER NOT NULL,
            currency TEXT NOT NULL,
            termsHash TEXT NOT NULL,
            disputeWindow INTEGER NOT NULL,
            contractHash TEXT NOT NULL,
            buyerSignature TEXT NOT NULL,
            providerSignature TEXT NOT NULL,
            status TEXT NOT NULL,
            contractTxId TEXT,
            settlementTxId TEXT,
            createdAt INTEGER NOT NULL,
            settledAt INTEGER
        );
        CREATE INDEX IF NOT EXISTS idx_contracts_payment ON service_contracts(paymentId);

        CREATE TABLE IF NOT EXISTS disputes (
            id TEXT PRIMARY KEY,
            paymentId TEXT NOT NULL UNIQUE,
            buyerWalletId TEXT NOT NULL,
            providerWalletId TEXT NOT NULL,
            reason TEXT NOT NULL,
            evidence TEXT,
            status TEXT NOT NULL,
            resolution TEXT,
            resolvedBy TEXT,
            resolvedAt INTEGER,
            createdAt INTEGER NOT NULL,
            updatedAt INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS admin_auth_challenges (
            nonce TEXT PRIMARY KEY,
            challenge TEXT NOT NULL,
            address TEXT,
            createdAt INTEGER NOT NULL,
            expiresAt INTEGER NOT NULL,
            usedAt INTEGER
        );

        CREATE TABLE IF NOT EXISTS admin_auth_sessions (
            tokenHash TEXT PRIMARY KEY,
            address TEXT NOT NULL,
            challengeNonce TEXT NOT NULL,
            createdAt INTEGER NOT NULL,
            expiresAt INTEGER NOT NULL,
            revokedAt INTEGER
        );

        CREATE TABLE IF NOT EXISTS admin_audit_logs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            actor TEXT NOT NULL,
            action TEXT NOT NULL,
            outcome TEXT NOT NULL,
            context TEXT NOT NULL,
            createdAt INTEGER NOT NULL
        );

        CREATE TRIGGER IF NOT EXISTS admin_audit_logs_no_update
        BEFORE UPDATE ON admin_audit_logs
        BEGIN
            SELECT RAISE(ABORT, 'admin_audit_logs is append-only');
        END;

        CREATE TRIGGER IF NOT EXISTS admin_audit_logs_no_delete
        BEFORE DELETE ON admin_audit_logs
        BEGIN
            SELECT RAISE(ABORT, 'admin_audit_logs is append-only');
        END;
    )";

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, schema, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("SQLiteDatabase: schema error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }

    return true;
}

void SQLiteDatabase::Flush(bool shutdown)
{
    if (!m_db || m_mock) return;

    // SQLite with WAL mode auto-checkpoints, but we can force it
    if (shutdown) {
        sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    } else {
        sqlite3_wal_checkpoint_v2(m_db, nullptr, SQLITE_CHECKPOINT_PASSIVE, nullptr, nullptr);
    }
}

//
// SQLiteStatement
//

SQLiteStatement::SQLiteStatement(SQLiteDatabase& database, const std::string& sql)
    : m_lock(database.cs_db), m_db(database.m_db), m_sql(sql)
{
    if (!m_db) {
        throw std::runtime_error("SQLiteStatement: database is not open");
    }
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(strprintf("SQLiteStatement: failed to prepare \"%s\": %s", sql, sqlite3_errmsg(m_db)));
    }
}

SQLiteStatement::~SQLiteStatement()
{
    sqlite3_finalize(m_stmt);
}

SQLiteStatement& SQLiteStatement::Bind(int idx, const std::string& value)
{
    if (sqlite3_bind_text(m_stmt, idx, value.data(), (int)value.size(), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw std::runtime_error(strprintf("SQLiteStatement: bind %d failed: %s", idx, sqlite3_errmsg(m_db)));
    }
    return *this;
}

SQLiteStatement& SQLiteStatement::Bind(int idx, int64_t value)
{
    if (sqlite3_bind_int64(m_stmt, idx, value) != SQLITE_OK) {
        throw std::runtime_error(strprintf("SQLiteStatement: bind %d failed: %s", idx, sqlite3_errmsg(m_db)));
    }
    return *this;
}

SQLiteStatement& SQLiteStatement::Bind(int idx, const Optional<std::string>& value)
{
    return value ? Bind(idx, *value) : BindNull(idx);
}

SQLiteStatement& SQLiteStatement::Bind(int idx, const Optional<int64_t>& value)
{
    return value ? Bind(idx, *value) : BindNull(idx);
}

SQLiteStatement& SQLiteStatement::BindNull(int idx)
{
    if (sqlite3_bind_null(m_stmt, idx) != SQLITE_OK) {
        throw std::runtime_error(strprintf("SQLiteStatement: bind %d failed: %s", idx, sqlite3_errmsg(m_db)));
    }
    return *this;
}

bool SQLiteStatement::Step()
{
    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(strprintf("SQLiteStatement: step failed for \"%s\": %s", m_sql, sqlite3_errmsg(m_db)));
}

void SQLiteStatement::Execute()
{
    while (Step()) {
    }
}

void SQLiteStatement::Reset()
{
    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
}

int SQLiteStatement::Changes() const
{
    return sqlite3_changes(m_db);
}

bool SQLiteStatement::ColumnIsNull(int col) const
{
    return sqlite3_column_type(m_stmt, col) == SQLITE_NULL;
}

std::string SQLiteStatement::ColumnText(int col) const
{
    const unsigned char* text = sqlite3_column_text(m_stmt, col);
    if (!text) return std::string();
    return std::string((const char*)text, sqlite3_column_bytes(m_stmt, col));
}

int64_t SQLiteStatement::ColumnInt64(int col) const
{
    return sqlite3_column_int64(m_stmt, col);
}

Optional<std::string> SQLiteStatement::ColumnOptionalText(int col) const
{
    if (ColumnIsNull(col)) return boost::none;
    return ColumnText(col);
}

Optional<int64_t> SQLiteStatement::ColumnOptionalInt64(int col) const
{
    if (ColumnIsNull(col)) return boost::none;
    return ColumnInt64(col);
}

//
// SQLiteBatch
//

SQLiteBatch::SQLiteBatch(SQLiteDatabase& database)
    : m_database(database), m_lock(database.cs_db)
{
}

SQLiteBatch::~SQLiteBatch()
{
    if (m_active) {
        TxnAbort();
    }
}

bool SQLiteBatch::Exec(const std::string& sql)
{
    if (!m_database.m_db) return false;
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_database.m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrint(BCLog::DB, "SQLiteBatch: \"%s\" failed: %s\n", sql, errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteBatch::TxnBegin()
{
    if (m_active) return false;
    m_savepoint = strprintf("agentpay_sp_%d", m_database.m_txn_depth);
    if (!Exec("SAVEPOINT " + m_savepoint)) {
        return false;
    }
    ++m_database.m_txn_depth;
    m_active = true;
    return true;
}

bool SQLiteBatch::TxnCommit()
{
    if (!m_active) return false;
    m_active = false;
    --m_database.m_txn_depth;
    if (!Exec("RELEASE " + m_savepoint)) {
        Exec("ROLLBACK TO " + m_savepoint);
        Exec("RELEASE " + m_savepoint);
        return false;
    }
    return true;
}

bool SQLiteBatch::TxnAbort()
{
    if (!m_active) return false;
    m_active = false;
    --m_database.m_txn_depth;
    // Rolling back to a savepoint keeps it open; release it afterwards.
    bool ok = Exec("ROLLBACK TO " + m_savepoint);
    ok = Exec("RELEASE " + m_savepoint) && ok;
    return ok;
}
