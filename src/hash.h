// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_HASH_H
#define AGENTPAY_HASH_H

#include "uint256.h"

#include <string>
#include <vector>

#include <openssl/evp.h>

/** A hasher class for SHA-256 backed by an OpenSSL digest context. */
class CSHA256
{
private:
    EVP_MD_CTX* ctx;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();
    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

/** A hasher class for Bitcoin's 256-bit hash (double SHA-256). */
class CHash256
{
private:
    CSHA256 sha;

public:
    static const size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

    void Finalize(unsigned char hash[OUTPUT_SIZE]);

    CHash256& Write(const unsigned char* data, size_t len)
    {
        sha.Write(data, len);
        return *this;
    }

    CHash256& Reset()
    {
        sha.Reset();
        return *this;
    }
};

/** Compute the 256-bit hash of an object. */
template <typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0])).Finalize((unsigned char*)&result);
    return result;
}

/** Compute the 256-bit hash of the concatenation of two objects. */
template <typename T1, typename T2>
inline uint256 Hash(const T1 p1begin, const T1 p1end, const T2 p2begin, const T2 p2end)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(p1begin == p1end ? pblank : (const unsigned char*)&p1begin[0], (p1end - p1begin) * sizeof(p1begin[0])).Write(p2begin == p2end ? pblank : (const unsigned char*)&p2begin[0], (p2end - p2begin) * sizeof(p2begin[0])).Finalize((unsigned char*)&result);
    return result;
}

/** Compute the 160-bit hash (RIPEMD160 of SHA256) of a byte range. */
uint160 Hash160(const unsigned char* pbegin, const unsigned char* pend);

template <typename T>
inline uint160 Hash160(const T& vch)
{
    return Hash160(vch.data(), vch.data() + vch.size());
}

/** Single SHA-256 of a byte range. */
uint256 SHA256Uint256(const unsigned char* data, size_t len);

/** Lower-case hex of the single SHA-256 of a string. */
std::string SHA256Hex(const std::string& str);

#endif // AGENTPAY_HASH_H
