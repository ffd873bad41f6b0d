// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry/registry.h"

#include "logging.h"
#include "random.h"
#include "util/error.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "wallet/db.h"

static const char* const SERVICE_COLUMNS =
    "id, providerWalletId, name, description, price, currency, disputeWindow, timeout, active, createdAt";

static CService ReadServiceRow(const SQLiteStatement& stmt)
{
    CService service;
    service.id = stmt.ColumnText(0);
    service.providerWalletId = stmt.ColumnText(1);
    service.name = stmt.ColumnText(2);
    service.description = stmt.ColumnText(3);
    service.nPrice = stmt.ColumnInt64(4);
    if (!CurrencyFromString(stmt.ColumnText(5), service.currency)) {
        throw std::runtime_error(strprintf("service %s: bad currency column", service.id));
    }
    service.nDisputeWindow = stmt.ColumnInt64(6);
    service.nTimeout = stmt.ColumnInt64(7);
    service.fActive = stmt.ColumnInt64(8) != 0;
    service.nCreateTime = stmt.ColumnInt64(9);
    return service;
}

CService CServiceRegistry::Register(CService service)
{
    service.name = TrimString(service.name);
    if (service.name.empty() || service.name.size() > MAX_SERVICE_NAME_LENGTH) {
        throw ValidationError(strprintf("Service name must be 1-%u characters", MAX_SERVICE_NAME_LENGTH));
    }
    if (service.providerWalletId.empty()) {
        throw ValidationError("Service needs a provider wallet");
    }
    if (service.nPrice <= 0 || !MoneyRange(service.nPrice)) {
        throw ValidationError("Service price must be a positive amount");
    }
    if (service.nDisputeWindow < 0 || service.nTimeout < 0) {
        throw ValidationError("Dispute window and timeout cannot be negative");
    }
    if (service.nDisputeWindow == 0) service.nDisputeWindow = DEFAULT_DISPUTE_WINDOW_MINUTES;
    if (service.nTimeout == 0) service.nTimeout = DEFAULT_SERVICE_TIMEOUT_SECONDS;

    service.id = GenerateId();
    service.fActive = true;
    service.nCreateTime = GetTime();

    SQLiteStatement stmt(m_db, strprintf("INSERT INTO services (%s) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 1, ?)", SERVICE_COLUMNS));
    stmt.Bind(1, service.id)
        .Bind(2, service.providerWalletId)
        .Bind(3, service.name)
        .Bind(4, service.description)
        .Bind(5, service.nPrice)
        .Bind(6, CurrencyToString(service.currency))
        .Bind(7, service.nDisputeWindow)
        .Bind(8, service.nTimeout)
        .Bind(9, service.nCreateTime);
    stmt.Execute();

    LogPrint(BCLog::ESCROW, "CServiceRegistry::%s: %s \"%s\" by %s, price %d %s\n", __func__,
             service.id, service.name, service.providerWalletId, service.nPrice, CurrencyToString(service.currency));
    return service;
}

Optional<CService> CServiceRegistry::Get(const std::string& id) const
{
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM services WHERE id = ?", SERVICE_COLUMNS));
    stmt.Bind(1, id);
    if (!stmt.Step()) return boost::none;
    return ReadServiceRow(stmt);
}

std::vector<CService> CServiceRegistry::ListByProvider(const std::string& providerWalletId) const
{
    std::vector<CService> services;
    SQLiteStatement stmt(m_db, strprintf("SELECT %s FROM services WHERE providerWalletId = ? ORDER BY createdAt DESC, id", SERVICE_COLUMNS));
    stmt.Bind(1, providerWalletId);
    while (stmt.Step()) {
        services.push_back(ReadServiceRow(stmt));
    }
    return services;
}

bool CServiceRegistry::SetActive(const std::string& id, bool fActive)
{
    SQLiteStatement stmt(m_db, "UPDATE services SET active = ? WHERE id = ?");
    stmt.Bind(1, (int64_t)(fActive ? 1 : 0)).Bind(2, id);
    stmt.Execute();
    return stmt.Changes() == 1;
}
