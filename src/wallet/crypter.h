// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_WALLET_CRYPTER_H
#define AGENTPAY_WALLET_CRYPTER_H

#include <string>
#include <vector>

static const unsigned int WALLET_CRYPTO_KEY_SIZE = 32;
static const unsigned int WALLET_CRYPTO_IV_SIZE = 16;
static const unsigned int WALLET_CRYPTO_TAG_SIZE = 16;

/** Minimum length of the master secret accepted by -masterkey. */
static const unsigned int MIN_MASTER_SECRET_LENGTH = 32;

/**
 * At-rest encryption of wallet private keys.
 *
 * The AES-256-GCM key is derived once from the master secret with scrypt
 * (N=16384, r=8, p=1, fixed salt). Each Encrypt() draws a fresh random IV.
 * Ciphertext is stored as "iv:tag:ciphertext", all lower-case hex.
 */
class CAtRestCrypter
{
private:
    std::vector<unsigned char> vchKey;

public:
    /** @throws CryptoError if the master secret is empty or derivation fails */
    explicit CAtRestCrypter(const std::string& masterSecret);
    ~CAtRestCrypter();

    CAtRestCrypter(const CAtRestCrypter&) = delete;
    CAtRestCrypter& operator=(const CAtRestCrypter&) = delete;

    /** @throws CryptoError */
    std::string Encrypt(const std::string& plaintext) const;

    /**
     * Authenticated decryption.
     * @throws CryptoError on malformed input or a failed tag check
     */
    std::string Decrypt(const std::string& encoded) const;
};

#endif // AGENTPAY_WALLET_CRYPTER_H
