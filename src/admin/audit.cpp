// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "admin/audit.h"

#include "logging.h"
#include "util/format.h"
#include "util/time.h"
#include "wallet/db.h"

#include <stdexcept>

CAuditLog::CAuditLog(SQLiteDatabase& db) : m_db(db)
{
    m_thread = std::thread(&CAuditLog::ThreadWriter, this);
}

CAuditLog::~CAuditLog()
{
    Stop();
}

void CAuditLog::Record(const std::string& actor, const std::string& action, const std::string& outcome,
                       const UniValue& context) noexcept
{
    try {
        CAuditRecord record;
        record.actor = actor;
        record.action = action;
        record.outcome = outcome;
        record.context = context;
        record.nCreateTime = GetTime();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) {
            LogPrint(BCLog::AUDIT, "CAuditLog::%s: writer stopped, dropping %s/%s\n", __func__, action, outcome);
            return;
        }
        m_queue.push_back(std::move(record));
        m_cond.notify_one();
    } catch (const std::exception& e) {
        LogPrintf("CAuditLog::%s: cannot queue %s: %s\n", __func__, action, e.what());
    }
}

void CAuditLog::Flush()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond_drained.wait(lock, [this] { return (m_queue.empty() && !m_writing) || m_exited; });
}

void CAuditLog::Stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) return;
        m_stop = true;
        m_cond.notify_all();
    }
    if (m_thread.joinable()) m_thread.join();
}

void CAuditLog::ThreadWriter()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_cond.wait(lock, [this] { return m_stop || !m_queue.empty(); });
        if (m_queue.empty() && m_stop) {
            m_exited = true;
            m_cond_drained.notify_all();
            break;
        }

        CAuditRecord record = std::move(m_queue.front());
        m_queue.pop_front();
        m_writing = true;
        lock.unlock();

        try {
            Write(record);
        } catch (const std::exception& e) {
            LogPrintf("CAuditLog: failed to write %s/%s for %s: %s\n", record.action, record.outcome, record.actor, e.what());
        }

        lock.lock();
        m_writing = false;
        if (m_queue.empty()) m_cond_drained.notify_all();
    }
}

void CAuditLog::Write(const CAuditRecord& record)
{
    SQLiteBatch batch(m_db);
    SQLiteStatement stmt(m_db,
        "INSERT INTO admin_audit_logs (actor, action, outcome, context, createdAt) VALUES (?, ?, ?, ?, ?)");
    stmt.Bind(1, record.actor)
        .Bind(2, record.action)
        .Bind(3, record.outcome)
        .Bind(4, record.context.write())
        .Bind(5, record.nCreateTime);
    stmt.Execute();
    LogPrint(BCLog::AUDIT, "audit: %s %s %s\n", record.actor, record.action, record.outcome);
}

std::vector<CAuditRecord> CAuditLog::ReadRecent(int nLimit) const
{
    std::vector<CAuditRecord> records;
    SQLiteBatch batch(m_db);
    SQLiteStatement stmt(m_db,
        "SELECT id, actor, action, outcome, context, createdAt FROM admin_audit_logs ORDER BY id DESC LIMIT ?");
    stmt.Bind(1, (int64_t)nLimit);
    while (stmt.Step()) {
        CAuditRecord record;
        record.id = stmt.ColumnInt64(0);
        record.actor = stmt.ColumnText(1);
        record.action = stmt.ColumnText(2);
        record.outcome = stmt.ColumnText(3);
        if (!record.context.read(stmt.ColumnText(4))) {
            throw std::runtime_error(strprintf("audit record %d: bad context column", record.id));
        }
        record.nCreateTime = stmt.ColumnInt64(5);
        records.push_back(std::move(record));
    }
    return records;
}
