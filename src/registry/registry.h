// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_REGISTRY_REGISTRY_H
#define AGENTPAY_REGISTRY_REGISTRY_H

#include "amount.h"
#include "escrow/payment.h"
#include "optional.h"

#include <stdint.h>
#include <string>
#include <vector>

class SQLiteDatabase;

static const int64_t DEFAULT_DISPUTE_WINDOW_MINUTES = 30;
static const int64_t DEFAULT_SERVICE_TIMEOUT_SECONDS = 30;
static const size_t MAX_SERVICE_NAME_LENGTH = 100;

/** A paid service offered by a provider wallet. */
struct CService
{
    std::string id;
    std::string providerWalletId;
    std::string name;
    std::string description;
    CAmount nPrice{0};
    Currency currency{Currency::BSV};
    int64_t nDisputeWindow{DEFAULT_DISPUTE_WINDOW_MINUTES};    // minutes
    int64_t nTimeout{DEFAULT_SERVICE_TIMEOUT_SECONDS};         // seconds
    bool fActive{true};
    int64_t nCreateTime{0};
};

/** Service catalogue, the boundary the execution flow prices against. */
class CServiceRegistry
{
public:
    explicit CServiceRegistry(SQLiteDatabase& db) : m_db(db) {}

    /**
     * Register a service. id, fActive and nCreateTime are assigned.
     * A zero dispute window or timeout takes the default.
     * @throws ValidationError
     */
    CService Register(CService service);

    Optional<CService> Get(const std::string& id) const;
    std::vector<CService> ListByProvider(const std::string& providerWalletId) const;
    bool SetActive(const std::string& id, bool fActive);

private:
    SQLiteDatabase& m_db;
};

#endif // AGENTPAY_REGISTRY_REGISTRY_H
