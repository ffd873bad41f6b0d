// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "admin/adminauth.h"
#include "admin/audit.h"
#include "chainparams.h"
#include "contract/contract.h"
#include "dispute/dispute.h"
#include "escrow/execution.h"
#include "escrow/settlement.h"
#include "key.h"
#include "key_io.h"
#include "logging.h"
#include "pubkey.h"
#include "registry/registry.h"
#include "util/error.h"
#include "util/strencodings.h"
#include "util/system.h"
#include "wallet/crypter.h"
#include "wallet/db.h"
#include "wallet/wallet.h"

// Only ever used with -demo.
static const char* const DEMO_MASTER_SECRET = "agentpay-demo-master-secret-not-for-production";

EscrowContext::EscrowContext() {}
EscrowContext::~EscrowContext() {}

std::string GetEscrowHelpString()
{
    std::string strUsage = HelpMessageGroup("General options:");
    strUsage += HelpMessageOpt("-conf=<file>", "Specify configuration file (default: agentpay.conf)");
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");
    strUsage += HelpMessageOpt("-network=<net>", strprintf("Ledger network, %s or %s (default: %s)",
                                                          CBaseChainParams::MAIN, CBaseChainParams::TESTNET, CBaseChainParams::MAIN));
    strUsage += HelpMessageOpt("-demo", strprintf("Allow a built-in master key for demonstrations (default: %u)", DEFAULT_DEMO));
    strUsage += HelpMessageOpt("-debug=<category>", "Output debugging information. <category> can be: " + ListLogCategories() + ".");
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console instead of debug.log file");

    strUsage += HelpMessageGroup("Escrow options:");
    strUsage += HelpMessageOpt("-masterkey=<secret>", strprintf("Master secret for wallet key encryption (at least %u characters)", MIN_MASTER_SECRET_LENGTH));
    strUsage += HelpMessageOpt("-escrowmode=<mode>", "platform or multisig (default: platform)");
    strUsage += HelpMessageOpt("-platformwalletkey=<wif>", "Private key of the platform escrow wallet");
    strUsage += HelpMessageOpt("-adminmultisigpubkey=<hex>", "Admin public key of the 2-of-3 escrow script");
    strUsage += HelpMessageOpt("-platformfeebps=<n>", strprintf("Platform fee in basis points (default: %d)", DEFAULT_PLATFORM_FEE_BPS));
    strUsage += HelpMessageOpt("-feeperbyte=<n>", strprintf("Network fee rate in satoshis per byte (default: %d)", DEFAULT_FEE_PER_BYTE));
    strUsage += HelpMessageOpt("-minfee=<n>", strprintf("Minimum network fee in satoshis (default: %d)", DEFAULT_MIN_FEE));
    strUsage += HelpMessageOpt("-anchorcontracts", strprintf("Anchor contract hashes on chain (default: %u)", DEFAULT_ANCHOR_CONTRACTS));
    strUsage += HelpMessageOpt("-disputereviewperiod=<n>", strprintf("Seconds before an unresolved dispute expires (default: %d)", DEFAULT_DISPUTE_REVIEW_PERIOD));

    strUsage += HelpMessageGroup("Admin options:");
    strUsage += HelpMessageOpt("-adminkey=<key>", "Static admin key");
    strUsage += HelpMessageOpt("-adminkeyprevious=<key>", "Previous admin key, still accepted during rotation");
    strUsage += HelpMessageOpt("-adminkeylegacy=<key>", "Legacy admin key, still accepted during rotation");
    strUsage += HelpMessageOpt("-adminwallet=<address>", "Allow-listed admin wallet address (may be repeated)");
    strUsage += HelpMessageOpt("-requirewalletstepup", strprintf("Require an admin wallet session for privileged calls (default: %u)", DEFAULT_REQUIRE_WALLET_STEPUP));
    strUsage += HelpMessageOpt("-adminchallengettl=<n>", strprintf("Admin challenge lifetime in seconds (default: %d)", DEFAULT_ADMIN_CHALLENGE_TTL));
    strUsage += HelpMessageOpt("-adminsessionttl=<n>", strprintf("Admin session lifetime in seconds (default: %d)", DEFAULT_ADMIN_SESSION_TTL));
    return strUsage;
}

void InitLogging()
{
    LogInstance().m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    LogInstance().m_print_to_file = !gArgs.IsArgNegated("-debuglogfile");
    LogInstance().m_file_path = GetDataDir() / gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!LogInstance().EnableCategory(cat)) {
            LogPrintf("Unsupported logging category -debug=%s.\n", cat);
        }
    }

    if (LogInstance().m_print_to_file && !LogInstance().OpenDebugLog()) {
        LogInstance().m_print_to_file = false;
        LogPrintf("Could not open debug log file %s\n", LogInstance().m_file_path.string());
    }
}

bool InitEscrowContext(EscrowContext& context, CChainClient& chain, std::string& strError)
{
    if (!context.eccVerifyHandle) {
        ECC_Start();
        context.eccVerifyHandle.reset(new ECCVerifyHandle());
    }
    if (!ECC_InitSanityCheck()) {
        strError = "Elliptic curve cryptography sanity check failure. Aborting.";
        return false;
    }

    try {
        SelectParams(gArgs.GetArg("-network", CBaseChainParams::MAIN));
    } catch (const std::runtime_error& e) {
        strError = e.what();
        return false;
    }

    std::string masterSecret = gArgs.GetArg("-masterkey", "");
    if (masterSecret.size() < MIN_MASTER_SECRET_LENGTH) {
        if (!gArgs.GetBoolArg("-demo", DEFAULT_DEMO)) {
            strError = strprintf("-masterkey must be at least %u characters", MIN_MASTER_SECRET_LENGTH);
            return false;
        }
        LogPrintf("WARNING: -masterkey missing or short, using the demo master key\n");
        masterSecret = DEMO_MASTER_SECRET;
    }

    CSettlementOptions settlement;
    if (!EscrowModeFromString(gArgs.GetArg("-escrowmode", EscrowModeToString(EscrowMode::PLATFORM)), settlement.escrowMode)) {
        strError = strprintf("Unknown -escrowmode '%s'", gArgs.GetArg("-escrowmode", ""));
        return false;
    }
    settlement.nPlatformFeeBps = gArgs.GetArg("-platformfeebps", DEFAULT_PLATFORM_FEE_BPS);
    if (settlement.nPlatformFeeBps < 0 || settlement.nPlatformFeeBps > 10000) {
        strError = "-platformfeebps must be between 0 and 10000";
        return false;
    }
    settlement.feePolicy.nFeePerK = gArgs.GetArg("-feeperbyte", DEFAULT_FEE_PER_BYTE) * 1000;
    settlement.feePolicy.nMinFee = gArgs.GetArg("-minfee", DEFAULT_MIN_FEE);
    if (settlement.feePolicy.nFeePerK < 0 || settlement.feePolicy.nMinFee < 0) {
        strError = "-feeperbyte and -minfee must not be negative";
        return false;
    }

    const std::string adminPubKey = ToLower(gArgs.GetArg("-adminmultisigpubkey", ""));
    if (!adminPubKey.empty()) {
        const CPubKey pubkey(ParseHex(adminPubKey));
        if (!IsHex(adminPubKey) || !pubkey.IsFullyValid() || !pubkey.IsCompressed()) {
            strError = "-adminmultisigpubkey is not a compressed public key";
            return false;
        }
    }
    if (settlement.escrowMode == EscrowMode::MULTISIG && adminPubKey.empty()) {
        strError = "-adminmultisigpubkey is required with -escrowmode=multisig";
        return false;
    }
    settlement.adminMultisigPubKey = adminPubKey;

    CAdminAuthOptions admin;
    admin.adminKey = gArgs.GetArg("-adminkey", "");
    admin.adminKeyPrevious = gArgs.GetArg("-adminkeyprevious", "");
    admin.adminKeyLegacy = gArgs.GetArg("-adminkeylegacy", "");
    admin.fRequireWalletStepUp = gArgs.GetBoolArg("-requirewalletstepup", DEFAULT_REQUIRE_WALLET_STEPUP);
    admin.nChallengeTTL = gArgs.GetArg("-adminchallengettl", DEFAULT_ADMIN_CHALLENGE_TTL);
    admin.nSessionTTL = gArgs.GetArg("-adminsessionttl", DEFAULT_ADMIN_SESSION_TTL);
    for (const std::string& address : gArgs.GetArgs("-adminwallet")) {
        if (!IsValidDestinationString(address)) {
            strError = strprintf("Invalid -adminwallet address '%s'", address);
            return false;
        }
        admin.allowList.push_back(address);
    }
    if (admin.adminKey.empty()) {
        LogPrintf("WARNING: no -adminkey set, privileged operations are disabled\n");
    }
    settlement.adminAllowList = admin.allowList;

    const fs::path dbPath = GetDataDir() / DEFAULT_DB_FILENAME;
    try {
        context.db.reset(new SQLiteDatabase(dbPath));
        context.audit.reset(new CAuditLog(*context.db));
        context.wallets.reset(new CWalletManager(*context.db, masterSecret, chain));

        const std::string platformKey = gArgs.GetArg("-platformwalletkey", "");
        if (!platformKey.empty()) {
            settlement.platformWalletId = context.wallets->ImportFromWif(platformKey).id;
        } else if (settlement.escrowMode == EscrowMode::PLATFORM) {
            LogPrintf("WARNING: no -platformwalletkey set, platform escrow payments will fail\n");
        }

        context.registry.reset(new CServiceRegistry(*context.db));
        context.engine.reset(new CSettlementEngine(*context.db, *context.wallets, chain, settlement));
        context.contracts.reset(new CContractManager(*context.db, *context.wallets, chain, settlement.feePolicy,
                                                     gArgs.GetBoolArg("-anchorcontracts", DEFAULT_ANCHOR_CONTRACTS)));
        context.execution.reset(new CExecutionService(*context.registry, *context.wallets, *context.contracts, *context.engine));
        context.adminAuth.reset(new CAdminAuth(*context.db, admin, *context.audit));
        context.disputes.reset(new CDisputeResolver(*context.db, *context.engine, *context.registry, *context.adminAuth,
                                                    *context.audit, gArgs.GetArg("-disputereviewperiod", DEFAULT_DISPUTE_REVIEW_PERIOD)));
    } catch (const std::runtime_error& e) {
        strError = strprintf("Cannot initialize escrow core in %s: %s", dbPath.string(), e.what());
        ShutdownEscrowContext(context);
        return false;
    }

    LogPrintf("AgentPay escrow core started: network=%s, escrowmode=%s, db=%s\n", Params().NetworkIDString(),
              EscrowModeToString(settlement.escrowMode), dbPath.string());
    return true;
}

void ShutdownEscrowContext(EscrowContext& context)
{
    LogPrintf("%s: In progress...\n", __func__);
    context.disputes.reset();
    context.adminAuth.reset();
    context.execution.reset();
    context.contracts.reset();
    context.engine.reset();
    context.registry.reset();
    context.wallets.reset();
    if (context.audit) {
        context.audit->Stop();
        context.audit.reset();
    }
    if (context.db) {
        context.db->Flush(true);
        context.db.reset();
    }
    if (context.eccVerifyHandle) {
        context.eccVerifyHandle.reset();
        ECC_Stop();
    }
    LogPrintf("%s: done\n", __func__);
}
