// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_INIT_H
#define AGENTPAY_INIT_H

#include <memory>
#include <string>

class CAdminAuth;
class CAuditLog;
class CChainClient;
class CContractManager;
class CDisputeResolver;
class CExecutionService;
class CServiceRegistry;
class CSettlementEngine;
class CWalletManager;
class ECCVerifyHandle;
class SQLiteDatabase;

static const bool DEFAULT_ANCHOR_CONTRACTS = true;
static const bool DEFAULT_DEMO = false;

/**
 * Every escrow component, wired to the one store. Members are declared in
 * construction order and destroyed in reverse.
 */
struct EscrowContext
{
    std::unique_ptr<ECCVerifyHandle> eccVerifyHandle;
    std::unique_ptr<SQLiteDatabase> db;
    std::unique_ptr<CAuditLog> audit;
    std::unique_ptr<CWalletManager> wallets;
    std::unique_ptr<CServiceRegistry> registry;
    std::unique_ptr<CSettlementEngine> engine;
    std::unique_ptr<CContractManager> contracts;
    std::unique_ptr<CExecutionService> execution;
    std::unique_ptr<CAdminAuth> adminAuth;
    std::unique_ptr<CDisputeResolver> disputes;

    EscrowContext();
    ~EscrowContext();
};

/** Options for the escrow core, for -help. */
std::string GetEscrowHelpString();

/** Console / debug.log sinks and -debug categories. */
void InitLogging();

/**
 * Start elliptic curve support, select the network, open the store under
 * -datadir and build every component from gArgs. The chain client must
 * outlive the context. Call ShutdownEscrowContext() afterwards whether or
 * not this succeeded.
 *
 * @return false with strError set on a configuration error
 */
bool InitEscrowContext(EscrowContext& context, CChainClient& chain, std::string& strError);

/** Drain the audit queue, close the store and stop elliptic curve support. */
void ShutdownEscrowContext(EscrowContext& context);

#endif // AGENTPAY_INIT_H
