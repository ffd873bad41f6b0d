// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_WALLET_DB_H
#define AGENTPAY_WALLET_DB_H

#include "fs.h"
#include "optional.h"
#include "sync.h"

#include <memory>
#include <stdint.h>
#include <string>

#include <sqlite3.h>

static const char* const DEFAULT_DB_FILENAME = "agentpay.sqlite";

class SQLiteBatch;
class SQLiteStatement;

/**
 * An instance of this class represents the one relational store shared by
 * every escrow component. It is opened once at startup and handed to the
 * components by reference.
 */
class SQLiteDatabase
{
    friend class SQLiteBatch;
    friend class SQLiteStatement;

public:
    /** Open (or create) the database file at path, or an in-memory one when mock is set. */
    explicit SQLiteDatabase(const fs::path& path, bool mock = false);
    ~SQLiteDatabase();

    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    /** Return object for accessing database at specified path. */
    static std::unique_ptr<SQLiteDatabase> Create(const fs::path& path)
    {
        return std::unique_ptr<SQLiteDatabase>(new SQLiteDatabase(path));
    }

    /** Return object for accessing temporary in-memory database. */
    static std::unique_ptr<SQLiteDatabase> CreateMock()
    {
        return std::unique_ptr<SQLiteDatabase>(new SQLiteDatabase("", true /* mock */));
    }

    /** Make sure all changes are flushed to disk. */
    void Flush(bool shutdown);

    /**
     * Serializes units of work against this store. SQLiteBatch holds it for
     * its whole lifetime, so a settlement and a concurrent audit write never
     * interleave inside one SQLite transaction.
     */
    RecursiveMutex cs_db;

private:
    // Note: Declaration order matters for initialization
    sqlite3* m_db{nullptr};
    fs::path m_path;
    bool m_mock{false};
    int m_txn_depth{0};

    bool SetupSchema();
    bool SetupPragmas();
};

/**
 * RAII prepared statement. All failures throw std::runtime_error.
 * Holds SQLiteDatabase::cs_db from prepare to finalize, so Changes() always
 * reports this statement's own writes.
 */
class SQLiteStatement
{
public:
    SQLiteStatement(SQLiteDatabase& database, const std::string& sql);
    ~SQLiteStatement();

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    //! Parameters are 1-based, like sqlite3_bind_*.
    SQLiteStatement& Bind(int idx, const std::string& value);
    SQLiteStatement& Bind(int idx, int64_t value);
    SQLiteStatement& Bind(int idx, const Optional<std::string>& value);
    SQLiteStatement& Bind(int idx, const Optional<int64_t>& value);
    SQLiteStatement& BindNull(int idx);

    /** Advance. Returns true while a row is available. */
    bool Step();
    /** Run a statement that returns no rows. */
    void Execute();
    void Reset();

    /** Rows changed by the last Execute(). */
    int Changes() const;

    //! Columns are 0-based, like sqlite3_column_*.
    bool ColumnIsNull(int col) const;
    std::string ColumnText(int col) const;
    int64_t ColumnInt64(int col) const;
    Optional<std::string> ColumnOptionalText(int col) const;
    Optional<int64_t> ColumnOptionalInt64(int col) const;

private:
    std::unique_lock<RecursiveMutex> m_lock;
    sqlite3* m_db;
    sqlite3_stmt* m_stmt{nullptr};
    std::string m_sql;
};

/**
 * RAII unit of work on a SQLiteDatabase.
 *
 * Holds SQLiteDatabase::cs_db for its lifetime. TxnBegin() opens a
 * savepoint, so batches nest; a batch destroyed with an open transaction
 * rolls it back.
 */
class SQLiteBatch
{
public:
    explicit SQLiteBatch(SQLiteDatabase& database);
    ~SQLiteBatch();

    SQLiteBatch(const SQLiteBatch&) = delete;
    SQLiteBatch& operator=(const SQLiteBatch&) = delete;

    bool TxnBegin();
    bool TxnCommit();
    bool TxnAbort();

    SQLiteDatabase& Database() { return m_database; }

private:
    SQLiteDatabase& m_database;
    std::unique_lock<RecursiveMutex> m_lock;
    std::string m_savepoint;
    bool m_active{false};

    bool Exec(const std::string& sql);
};

#endif // AGENTPAY_WALLET_DB_H
