// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ADMIN_AUDIT_H
#define AGENTPAY_ADMIN_AUDIT_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdint.h>
#include <string>
#include <thread>
#include <vector>

#include <univalue.h>

class SQLiteDatabase;

struct CAuditRecord
{
    int64_t id{0};
    std::string actor;
    std::string action;
    std::string outcome;    // "success", "failure", "not_implemented"
    UniValue context{UniValue::VOBJ};
    int64_t nCreateTime{0};
};

/**
 * Append-only trail of privileged actions.
 *
 * Record() only queues; a single writer thread persists the queue into
 * admin_audit_logs. A record that fails to persist is logged and dropped,
 * it never fails the action it describes.
 */
class CAuditLog
{
public:
    explicit CAuditLog(SQLiteDatabase& db);
    ~CAuditLog();

    CAuditLog(const CAuditLog&) = delete;
    CAuditLog& operator=(const CAuditLog&) = delete;

    void Record(const std::string& actor, const std::string& action, const std::string& outcome,
                const UniValue& context = UniValue(UniValue::VOBJ)) noexcept;

    /** Block until everything queued so far has been written (or dropped). */
    void Flush();

    /** Stop the writer after draining the queue. Idempotent. */
    void Stop();

    /** Newest first. */
    std::vector<CAuditRecord> ReadRecent(int nLimit) const;

private:
    SQLiteDatabase& m_db;

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::condition_variable m_cond_drained;
    std::deque<CAuditRecord> m_queue;
    bool m_writing{false};
    bool m_stop{false};
    bool m_exited{false};
    std::thread m_thread;

    void ThreadWriter();
    void Write(const CAuditRecord& record);
};

#endif // AGENTPAY_ADMIN_AUDIT_H
