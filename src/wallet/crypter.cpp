// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wallet/crypter.h"

#include "random.h"
#include "util/error.h"
#include "util/strencodings.h"

#include <cstring>
#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace {

const char* const SCRYPT_SALT = "salt";
const uint64_t SCRYPT_N = 16384;
const uint64_t SCRYPT_R = 8;
const uint64_t SCRYPT_P = 1;
const uint64_t SCRYPT_MAXMEM = 64 * 1024 * 1024;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
typedef std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> CipherCtxPtr;

std::vector<std::string> SplitEncoded(const std::string& encoded)
{
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = encoded.find(':', start);
        if (pos == std::string::npos) {
            parts.push_back(encoded.substr(start));
            break;
        }
        parts.push_back(encoded.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace

CAtRestCrypter::CAtRestCrypter(const std::string& masterSecret)
{
    if (masterSecret.empty()) {
        throw CryptoError("master secret is not configured");
    }
    vchKey.resize(WALLET_CRYPTO_KEY_SIZE);
    if (EVP_PBE_scrypt(masterSecret.data(), masterSecret.size(),
            (const unsigned char*)SCRYPT_SALT, strlen(SCRYPT_SALT),
            SCRYPT_N, SCRYPT_R, SCRYPT_P, SCRYPT_MAXMEM,
            vchKey.data(), vchKey.size()) != 1) {
        throw CryptoError("scrypt key derivation failed");
    }
}

CAtRestCrypter::~CAtRestCrypter()
{
    OPENSSL_cleanse(vchKey.data(), vchKey.size());
}

std::string CAtRestCrypter::Encrypt(const std::string& plaintext) const
{
    unsigned char iv[WALLET_CRYPTO_IV_SIZE];
    GetRandBytes(iv, sizeof(iv));

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");

    std::vector<unsigned char> ciphertext(plaintext.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, sizeof(iv), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, vchKey.data(), iv) != 1) {
        throw CryptoError("AES-256-GCM encrypt init failed");
    }
    if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len, (const unsigned char*)plaintext.data(), plaintext.size()) != 1) {
        throw CryptoError("AES-256-GCM encrypt failed");
    }
    total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + total, &len) != 1) {
        throw CryptoError("AES-256-GCM encrypt final failed");
    }
    total += len;
    ciphertext.resize(total);

    unsigned char tag[WALLET_CRYPTO_TAG_SIZE];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, sizeof(tag), tag) != 1) {
        throw CryptoError("AES-256-GCM tag extraction failed");
    }

    return HexStr(iv, iv + sizeof(iv)) + ":" + HexStr(tag, tag + sizeof(tag)) + ":" + HexStr(ciphertext);
}

std::string CAtRestCrypter::Decrypt(const std::string& encoded) const
{
    std::vector<std::string> parts = SplitEncoded(encoded);
    if (parts.size() != 3 || !IsHex(parts[0]) || !IsHex(parts[1]) || (!parts[2].empty() && !IsHex(parts[2]))) {
        throw CryptoError("malformed encrypted value");
    }
    std::vector<unsigned char> iv = ParseHex(parts[0]);
    std::vector<unsigned char> tag = ParseHex(parts[1]);
    std::vector<unsigned char> ciphertext = ParseHex(parts[2]);
    if (iv.empty() || tag.size() != WALLET_CRYPTO_TAG_SIZE) {
        throw CryptoError("malformed encrypted value");
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) throw CryptoError("EVP_CIPHER_CTX_new failed");

    std::vector<unsigned char> plaintext(ciphertext.size() + 16);
    int len = 0;
    int total = 0;
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, iv.size(), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, vchKey.data(), iv.data()) != 1) {
        throw CryptoError("AES-256-GCM decrypt init failed");
    }
    if (!ciphertext.empty() && EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(), ciphertext.size()) != 1) {
        throw CryptoError("AES-256-GCM decrypt failed");
    }
    total = len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, tag.size(), tag.data()) != 1) {
        throw CryptoError("AES-256-GCM tag setup failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &len) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw CryptoError("authentication tag mismatch");
    }
    total += len;

    std::string result((const char*)plaintext.data(), total);
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return result;
}
