// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chainparams.h"
#include "hash.h"
#include "key.h"
#include "key_io.h"
#include "test/test_agentpay.h"
#include "test/util/memorychain.h"
#include "util/error.h"
#include "util/message.h"
#include "util/strencodings.h"
#include "wallet/crypter.h"
#include "wallet/db.h"
#include "wallet/wallet.h"

#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(crypto_tests, BasicTestingSetup)

// =============================================================================
// Hashing
// =============================================================================

BOOST_AUTO_TEST_CASE(sha256_hex_vectors)
{
    BOOST_CHECK_EQUAL(SHA256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(SHA256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

// =============================================================================
// At-rest encryption
// =============================================================================

BOOST_AUTO_TEST_CASE(crypter_roundtrip)
{
    const CAtRestCrypter crypter(TEST_MASTER_SECRET);
    const std::string plaintext = "L1aW4aubDFB7yfras2S1mN3bqg9nwySY8nkoLmJebSLD5BWv3ENZ";

    const std::string first = crypter.Encrypt(plaintext);
    const std::string second = crypter.Encrypt(plaintext);
    BOOST_CHECK(first != second); // fresh IV each time
    BOOST_CHECK_EQUAL(crypter.Decrypt(first), plaintext);
    BOOST_CHECK_EQUAL(crypter.Decrypt(second), plaintext);

    std::vector<std::string> parts;
    boost::split(parts, first, boost::is_any_of(":"));
    BOOST_REQUIRE_EQUAL(parts.size(), 3U);
    BOOST_CHECK_EQUAL(parts[0].size(), WALLET_CRYPTO_IV_SIZE * 2);
    BOOST_CHECK_EQUAL(parts[1].size(), WALLET_CRYPTO_TAG_SIZE * 2);
    BOOST_CHECK(IsHex(parts[2]));
    BOOST_CHECK(parts[2].find(plaintext) == std::string::npos);
}

BOOST_AUTO_TEST_CASE(crypter_detects_tampering)
{
    const CAtRestCrypter crypter(TEST_MASTER_SECRET);
    const std::string encoded = crypter.Encrypt("secret key material");

    // Flip one nibble of the ciphertext
    std::string tampered = encoded;
    char& c = tampered[tampered.size() - 1];
    c = (c == '0') ? '1' : '0';
    BOOST_CHECK_THROW(crypter.Decrypt(tampered), CryptoError);

    // Flip one nibble of the tag
    tampered = encoded;
    char& t = tampered[WALLET_CRYPTO_IV_SIZE * 2 + 1];
    t = (t == 'a') ? 'b' : 'a';
    BOOST_CHECK_THROW(crypter.Decrypt(tampered), CryptoError);

    // Another master secret
    const CAtRestCrypter other("another-master-secret-0123456789abcdef");
    BOOST_CHECK_THROW(other.Decrypt(encoded), CryptoError);

    BOOST_CHECK_THROW(crypter.Decrypt("not encrypted"), CryptoError);
    BOOST_CHECK_THROW(crypter.Decrypt("00:11"), CryptoError);
}

BOOST_AUTO_TEST_CASE(crypter_requires_secret)
{
    BOOST_CHECK_THROW(CAtRestCrypter(""), CryptoError);
}

// =============================================================================
// Keys and addresses
// =============================================================================

BOOST_AUTO_TEST_CASE(wif_and_address_roundtrip)
{
    const CKey key = GenerateRandomKey();
    const std::string wif = EncodeSecret(key);
    BOOST_CHECK(wif[0] == 'K' || wif[0] == 'L');

    const CKey decoded = DecodeSecret(wif);
    BOOST_REQUIRE(decoded.IsValid());
    BOOST_CHECK(decoded.GetPubKey() == key.GetPubKey());
    BOOST_CHECK(decoded.IsCompressed());

    const std::string address = EncodeDestination(key.GetPubKey().GetID());
    BOOST_CHECK_EQUAL(address[0], '1');
    CKeyID keyID;
    BOOST_REQUIRE(DecodeDestination(address, keyID));
    BOOST_CHECK(keyID == key.GetPubKey().GetID());

    // A single changed character breaks the checksum
    std::string corrupt = address;
    corrupt[5] = corrupt[5] == 'a' ? 'b' : 'a';
    BOOST_CHECK(!IsValidDestinationString(corrupt));
    BOOST_CHECK(!DecodeSecret("5notawif").IsValid());
}

BOOST_AUTO_TEST_CASE(network_prefixes_do_not_mix)
{
    const CKey key = GenerateRandomKey();

    SelectParams(CBaseChainParams::TESTNET);
    const std::string testWif = EncodeSecret(key);
    const std::string testAddress = EncodeDestination(key.GetPubKey().GetID());
    BOOST_CHECK(testWif[0] == 'c');
    BOOST_CHECK(testAddress[0] == 'm' || testAddress[0] == 'n');

    SelectParams(CBaseChainParams::MAIN);
    BOOST_CHECK(!DecodeSecret(testWif).IsValid());
    BOOST_CHECK(!IsValidDestinationString(testAddress));
}

// =============================================================================
// Message signatures
// =============================================================================

BOOST_AUTO_TEST_CASE(message_sign_verify)
{
    const CKey key = GenerateRandomKey();
    const std::string address = EncodeDestination(key.GetPubKey().GetID());
    const std::string message = "AgentPaySettlement:" + SHA256Hex("payment");

    std::string signature;
    BOOST_REQUIRE(MessageSign(key, message, signature));

    BOOST_CHECK(MessageVerify(address, signature, message) == MessageVerificationResult::OK);
    BOOST_CHECK(MessageVerifyPubKey(key.GetPubKey(), signature, message) == MessageVerificationResult::OK);

    BOOST_CHECK(MessageVerify(address, signature, message + "x") == MessageVerificationResult::ERR_NOT_SIGNED);
    const CKey other = GenerateRandomKey();
    BOOST_CHECK(MessageVerify(EncodeDestination(other.GetPubKey().GetID()), signature, message) == MessageVerificationResult::ERR_NOT_SIGNED);
    BOOST_CHECK(MessageVerifyPubKey(other.GetPubKey(), signature, message) == MessageVerificationResult::ERR_NOT_SIGNED);

    BOOST_CHECK(MessageVerify("not-an-address", signature, message) == MessageVerificationResult::ERR_INVALID_ADDRESS);
    BOOST_CHECK(MessageVerify(address, "!!!", message) == MessageVerificationResult::ERR_MALFORMED_SIGNATURE);
}

// =============================================================================
// Wallet store
// =============================================================================

struct WalletTestingSetup : public BasicTestingSetup
{
    CMemoryChainClient chain;
    std::unique_ptr<SQLiteDatabase> db;
    std::unique_ptr<CWalletManager> wallets;

    WalletTestingSetup()
        : db(SQLiteDatabase::CreateMock()),
          wallets(new CWalletManager(*db, TEST_MASTER_SECRET, chain)) {}
};

BOOST_FIXTURE_TEST_CASE(wallet_create, WalletTestingSetup)
{
    const CNewWallet created = wallets->Create();
    const CAgentWallet& wallet = created.wallet;

    BOOST_CHECK_EQUAL(wallet.publicKey.size(), 66U);
    BOOST_CHECK(IsHex(wallet.publicKey));
    BOOST_CHECK(IsValidDestinationString(wallet.address));
    BOOST_CHECK(boost::starts_with(created.apiKey, "ak_"));

    const CKey wifKey = DecodeSecret(created.privateKeyWif);
    BOOST_REQUIRE(wifKey.IsValid());
    BOOST_CHECK_EQUAL(HexStr(wifKey.GetPubKey()), wallet.publicKey);
    BOOST_CHECK_EQUAL(EncodeDestination(wifKey.GetPubKey().GetID()), wallet.address);

    const CKey signingKey = wallets->GetSigningKey(wallet.id);
    BOOST_CHECK(signingKey.GetPubKey() == wifKey.GetPubKey());

    BOOST_REQUIRE(wallets->GetByAddress(wallet.address));
    BOOST_CHECK_EQUAL(wallets->GetByAddress(wallet.address)->id, wallet.id);
    BOOST_CHECK(!wallets->GetById("missing"));
    BOOST_CHECK_THROW(wallets->GetByIdOrThrow("missing"), NotFoundError);
    BOOST_CHECK_THROW(wallets->GetSigningKey("missing"), NotFoundError);
}

BOOST_FIXTURE_TEST_CASE(wallet_private_key_encrypted_at_rest, WalletTestingSetup)
{
    const CNewWallet created = wallets->Create();

    SQLiteStatement stmt(*db, "SELECT encryptedPrivateKey FROM wallets WHERE id = ?");
    stmt.Bind(1, created.wallet.id);
    BOOST_REQUIRE(stmt.Step());
    const std::string stored = stmt.ColumnText(0);
    BOOST_CHECK(stored.find(created.privateKeyWif) == std::string::npos);
    BOOST_CHECK_EQUAL(CAtRestCrypter(TEST_MASTER_SECRET).Decrypt(stored), created.privateKeyWif);
}

BOOST_FIXTURE_TEST_CASE(wallet_tampered_key_rejected, WalletTestingSetup)
{
    const CNewWallet created = wallets->Create();
    const std::string foreign = CAtRestCrypter(TEST_MASTER_SECRET).Encrypt("garbage");
    {
        SQLiteStatement stmt(*db, "UPDATE wallets SET encryptedPrivateKey = ? WHERE id = ?");
        stmt.Bind(1, foreign).Bind(2, created.wallet.id);
        stmt.Execute();
    }
    BOOST_CHECK_THROW(wallets->GetSigningKey(created.wallet.id), CryptoError);

    // Valid ciphertext under another master secret
    const CNewWallet second = wallets->Create();
    const CWalletManager otherManager(*db, "another-master-secret-0123456789abcdef", chain);
    BOOST_CHECK_THROW(otherManager.GetSigningKey(second.wallet.id), CryptoError);
}

BOOST_FIXTURE_TEST_CASE(wallet_api_key_rotation, WalletTestingSetup)
{
    const CNewWallet created = wallets->Create();

    BOOST_REQUIRE(wallets->GetByApiKey(created.apiKey));
    BOOST_CHECK_EQUAL(wallets->GetByApiKey(created.apiKey)->id, created.wallet.id);

    const std::string rotated = wallets->RotateApiKey(created.wallet.id);
    BOOST_CHECK(rotated != created.apiKey);
    BOOST_CHECK(!wallets->GetByApiKey(created.apiKey));
    BOOST_REQUIRE(wallets->GetByApiKey(rotated));
    BOOST_CHECK_EQUAL(wallets->GetByApiKey(rotated)->id, created.wallet.id);

    BOOST_CHECK_THROW(wallets->RotateApiKey("missing"), NotFoundError);
    BOOST_CHECK_EQUAL(HashApiKey(rotated), SHA256Hex(rotated));
}

BOOST_FIXTURE_TEST_CASE(wallet_import_wif, WalletTestingSetup)
{
    const CKey key = GenerateRandomKey();
    const CAgentWallet imported = wallets->ImportFromWif(EncodeSecret(key));
    BOOST_CHECK_EQUAL(imported.publicKey, HexStr(key.GetPubKey()));

    // Idempotent
    const CAgentWallet again = wallets->ImportFromWif(EncodeSecret(key));
    BOOST_CHECK_EQUAL(again.id, imported.id);
    BOOST_CHECK(wallets->GetSigningKey(imported.id).GetPubKey() == key.GetPubKey());

    SelectParams(CBaseChainParams::TESTNET);
    const std::string testWif = EncodeSecret(GenerateRandomKey());
    SelectParams(CBaseChainParams::MAIN);
    BOOST_CHECK_THROW(wallets->ImportFromWif(testWif), ValidationError);
    BOOST_CHECK_THROW(wallets->ImportFromWif("garbage"), ValidationError);
}

BOOST_FIXTURE_TEST_CASE(wallet_utxo_cache, WalletTestingSetup)
{
    const CAgentWallet wallet = wallets->Create().wallet;
    chain.Fund(wallet.address, 1000);
    chain.Fund(wallet.address, 2500);

    BOOST_CHECK_EQUAL(wallets->GetUtxos(wallet.id).size(), 2U);
    BOOST_CHECK_EQUAL(wallets->GetBalance(wallet.id), 3500);

    // Chain client unreachable: the cached set answers
    chain.fOffline = true;
    BOOST_CHECK_EQUAL(wallets->GetBalance(wallet.id), 3500);

    const std::vector<CUtxo> utxos = wallets->GetUtxos(wallet.id);
    wallets->MarkSpent({utxos[0]});
    BOOST_CHECK_EQUAL(wallets->GetUtxos(wallet.id).size(), 1U);
}

BOOST_AUTO_TEST_SUITE_END()
