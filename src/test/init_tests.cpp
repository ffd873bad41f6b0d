// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "init.h"

#include "admin/audit.h"
#include "chainparams.h"
#include "escrow/settlement.h"
#include "fs.h"
#include "key.h"
#include "key_io.h"
#include "test/test_agentpay.h"
#include "util/system.h"
#include "util/time.h"
#include "wallet/db.h"
#include "wallet/wallet.h"

#include <boost/test/unit_test.hpp>

namespace {

// Compressed secp256k1 generator point
const char* const VALID_PUBKEY_HEX = "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";
// Testnet WIF of the secret 0x11 repeated 32 times, compressed
const char* const PLATFORM_WIF_TESTNET = "cN9spWsvaxA8taS7DFMxnk1yJD2gaF2PX1npuTpy3vuZFJdwavaw";

/**
 * Starts from a bare process: InitEscrowContext() itself brings up the
 * elliptic curve support, as it must outside the test suite.
 */
struct InitTestingSetup
{
    fs::path pathTemp;
    CMemoryChainClient chain;

    InitTestingSetup()
    {
        SetMockTime(0);
        pathTemp = fs::temp_directory_path() / strprintf("test_agentpay_%s", fs::unique_path().string());
        fs::create_directories(pathTemp);
        gArgs.ForceSetArg("-datadir", pathTemp.string());
        ClearDatadirCache();
    }

    ~InitTestingSetup()
    {
        gArgs.ClearArgs();
        ClearDatadirCache();
        fs::remove_all(pathTemp);
    }

    std::string InitError()
    {
        EscrowContext context;
        std::string strError;
        BOOST_CHECK(!InitEscrowContext(context, chain, strError));
        BOOST_CHECK(!context.db);
        ShutdownEscrowContext(context);
        return strError;
    }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(init_tests, InitTestingSetup)

BOOST_AUTO_TEST_CASE(help_lists_options)
{
    const std::string help = GetEscrowHelpString();
    for (const char* opt : {"-masterkey=", "-escrowmode=", "-adminmultisigpubkey=", "-platformfeebps=",
                            "-disputereviewperiod=", "-requirewalletstepup", "-adminwallet="}) {
        BOOST_CHECK_MESSAGE(help.find(opt) != std::string::npos, opt);
    }
}

BOOST_AUTO_TEST_CASE(rejects_bad_configuration)
{
    gArgs.ForceSetArg("-network", "regtest");
    BOOST_CHECK(InitError().find("regtest") != std::string::npos);
    gArgs.ForceSetArg("-network", CBaseChainParams::TESTNET);

    // Short master secret without -demo
    gArgs.ForceSetArg("-masterkey", "short");
    BOOST_CHECK(InitError().find("-masterkey") != std::string::npos);
    gArgs.ForceSetArg("-masterkey", TEST_MASTER_SECRET);

    gArgs.ForceSetArg("-escrowmode", "custodial");
    BOOST_CHECK(InitError().find("-escrowmode") != std::string::npos);

    gArgs.ForceSetArg("-escrowmode", "multisig");
    BOOST_CHECK(InitError().find("-adminmultisigpubkey is required") != std::string::npos);
    gArgs.ForceSetArg("-adminmultisigpubkey", "02deadbeef");
    BOOST_CHECK(InitError().find("compressed public key") != std::string::npos);
    gArgs.ForceSetArg("-adminmultisigpubkey", VALID_PUBKEY_HEX);

    gArgs.ForceSetArg("-platformfeebps", "10001");
    BOOST_CHECK(InitError().find("-platformfeebps") != std::string::npos);
    gArgs.ForceSetArg("-platformfeebps", "200");

    gArgs.ForceSetArg("-adminwallet", "not-an-address");
    BOOST_CHECK(InitError().find("-adminwallet") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(demo_allows_missing_master_key)
{
    gArgs.ForceSetArg("-demo", "1");
    EscrowContext context;
    std::string strError;
    BOOST_CHECK(InitEscrowContext(context, chain, strError));
    BOOST_CHECK(strError.empty());
    BOOST_CHECK(context.wallets);
    ShutdownEscrowContext(context);
}

BOOST_AUTO_TEST_CASE(builds_every_component)
{
    gArgs.ForceSetArg("-masterkey", TEST_MASTER_SECRET);
    gArgs.ForceSetArg("-network", CBaseChainParams::TESTNET);
    gArgs.ForceSetArg("-platformwalletkey", PLATFORM_WIF_TESTNET);
    gArgs.ForceSetArg("-adminkey", TEST_ADMIN_KEY);

    EscrowContext context;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(InitEscrowContext(context, chain, strError), strError);
    BOOST_CHECK_EQUAL(Params().NetworkIDString(), CBaseChainParams::TESTNET);
    BOOST_CHECK(context.eccVerifyHandle);
    BOOST_CHECK(context.db && context.audit && context.wallets && context.registry && context.engine);
    BOOST_CHECK(context.contracts && context.execution && context.adminAuth && context.disputes);
    BOOST_CHECK(fs::exists(GetDataDir() / DEFAULT_DB_FILENAME));

    const CKey platformKey = DecodeSecret(PLATFORM_WIF_TESTNET);
    BOOST_REQUIRE(platformKey.IsValid());
    BOOST_CHECK(context.wallets->GetByAddress(EncodeDestination(platformKey.GetPubKey().GetID())));

    ShutdownEscrowContext(context);
    BOOST_CHECK(!context.db);
    BOOST_CHECK(!context.wallets);
    BOOST_CHECK(!context.eccVerifyHandle);
}

BOOST_AUTO_TEST_CASE(starts_elliptic_curve_support)
{
    gArgs.ForceSetArg("-masterkey", TEST_MASTER_SECRET);
    gArgs.ForceSetArg("-escrowmode", "multisig");
    gArgs.ForceSetArg("-adminmultisigpubkey", VALID_PUBKEY_HEX);

    EscrowContext context;
    std::string strError;
    BOOST_REQUIRE_MESSAGE(InitEscrowContext(context, chain, strError), strError);

    // Signing and verification both work without any test setup.
    const CNewWallet created = context.wallets->Create();
    const CKey key = context.wallets->GetSigningKey(created.wallet.id);
    BOOST_CHECK(key.VerifyPubKey(key.GetPubKey()));
    BOOST_CHECK(key.GetPubKey().IsFullyValid());
    ShutdownEscrowContext(context);

    // Restartable after shutdown
    EscrowContext restarted;
    BOOST_REQUIRE_MESSAGE(InitEscrowContext(restarted, chain, strError), strError);
    BOOST_CHECK(restarted.wallets->Create().wallet.publicKey != created.wallet.publicKey);
    ShutdownEscrowContext(restarted);
}

BOOST_AUTO_TEST_SUITE_END()
