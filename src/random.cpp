// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.h"

#include "util/strencodings.h"

#include <limits>
#include <stdexcept>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        throw std::runtime_error(std::string("GetRandBytes: RAND_bytes failed: ") + ERR_error_string(ERR_get_error(), nullptr));
    }
}

uint64_t GetRand(uint64_t nMax)
{
    if (nMax == 0)
        return 0;

    // The range of the random source must be a multiple of the modulus
    // to give every possible output value an equal possibility
    uint64_t nRange = (std::numeric_limits<uint64_t>::max() / nMax) * nMax;
    uint64_t nRand = 0;
    do {
        GetRandBytes((unsigned char*)&nRand, sizeof(nRand));
    } while (nRand >= nRange);
    return (nRand % nMax);
}

uint256 GetRandHash()
{
    uint256 hash;
    GetRandBytes((unsigned char*)&hash, sizeof(hash));
    return hash;
}

std::string GetRandHex(int nBytes)
{
    std::vector<unsigned char> buf(nBytes);
    GetRandBytes(buf.data(), nBytes);
    return HexStr(buf);
}

std::string GenerateId()
{
    boost::uuids::uuid id;
    GetRandBytes(id.begin(), id.size());
    // version 4, variant RFC 4122
    id.data[6] = (id.data[6] & 0x0f) | 0x40;
    id.data[8] = (id.data[8] & 0x3f) | 0x80;
    return boost::uuids::to_string(id);
}
