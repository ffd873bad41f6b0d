// Copyright (c) 2013-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include "util/strencodings.h"

#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new())
{
    if (!ctx || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

void CHash256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned char buf[CSHA256::OUTPUT_SIZE];
    sha.Finalize(buf);
    sha.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(hash);
}

uint160 Hash160(const unsigned char* pbegin, const unsigned char* pend)
{
    unsigned char buf[CSHA256::OUTPUT_SIZE];
    CSHA256().Write(pbegin, pend - pbegin).Finalize(buf);

    uint160 result;
    unsigned int len = 0;
    if (EVP_Digest(buf, sizeof(buf), result.begin(), &len, EVP_ripemd160(), nullptr) != 1 || len != result.size()) {
        throw std::runtime_error("Hash160: RIPEMD160 digest unavailable");
    }
    return result;
}

uint256 SHA256Uint256(const unsigned char* data, size_t len)
{
    uint256 result;
    CSHA256().Write(data, len).Finalize(result.begin());
    return result;
}

std::string SHA256Hex(const std::string& str)
{
    uint256 h = SHA256Uint256((const unsigned char*)str.data(), str.size());
    return HexStr(h.begin(), h.end());
}
