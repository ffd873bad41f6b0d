// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SERIALIZE_H
#define AGENTPAY_SERIALIZE_H

#include <algorithm>
#include <ios>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Little-endian wire encoding for the handful of structures the escrow core
 * serializes by hand (transactions, sighash preimages, signed messages).
 */

/** Growable byte sink. */
class CVectorWriter
{
public:
    explicit CVectorWriter(std::vector<unsigned char>& vchDataIn) : vchData(vchDataIn) {}

    void write(const unsigned char* pch, size_t nSize) { vchData.insert(vchData.end(), pch, pch + nSize); }

private:
    std::vector<unsigned char>& vchData;
};

/** Bounds-checked reader over a byte span. Reading past the end throws. */
class CSpanReader
{
public:
    CSpanReader(const unsigned char* pbegin, const unsigned char* pend) : m_pos(pbegin), m_end(pend) {}

    void read(unsigned char* dst, size_t nSize)
    {
        if ((size_t)(m_end - m_pos) < nSize) {
            throw std::ios_base::failure("CSpanReader::read(): end of data");
        }
        std::copy(m_pos, m_pos + nSize, dst);
        m_pos += nSize;
    }

    bool empty() const { return m_pos == m_end; }

private:
    const unsigned char* m_pos;
    const unsigned char* m_end;
};

template <typename Stream>
inline void ser_writedata8(Stream& s, uint8_t obj)
{
    s.write(&obj, 1);
}
template <typename Stream>
inline void ser_writedata32(Stream& s, uint32_t obj)
{
    unsigned char buf[4] = {(unsigned char)(obj), (unsigned char)(obj >> 8), (unsigned char)(obj >> 16), (unsigned char)(obj >> 24)};
    s.write(buf, 4);
}
template <typename Stream>
inline void ser_writedata64(Stream& s, uint64_t obj)
{
    unsigned char buf[8];
    for (int i = 0; i < 8; i++) buf[i] = (unsigned char)(obj >> (8 * i));
    s.write(buf, 8);
}
template <typename Stream>
inline uint8_t ser_readdata8(Stream& s)
{
    unsigned char c;
    s.read(&c, 1);
    return c;
}
template <typename Stream>
inline uint32_t ser_readdata32(Stream& s)
{
    unsigned char buf[4];
    s.read(buf, 4);
    return (uint32_t)buf[0] | ((uint32_t)buf[1] << 8) | ((uint32_t)buf[2] << 16) | ((uint32_t)buf[3] << 24);
}
template <typename Stream>
inline uint64_t ser_readdata64(Stream& s)
{
    unsigned char buf[8];
    s.read(buf, 8);
    uint64_t v = 0;
    for (int i = 7; i >= 0; i--) v = (v << 8) | buf[i];
    return v;
}

/**
 * Compact Size
 * size <  253        -- 1 byte
 * size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 * size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 * size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
template <typename Stream>
void WriteCompactSize(Stream& os, uint64_t nSize)
{
    if (nSize < 253) {
        ser_writedata8(os, nSize);
    } else if (nSize <= 0xffff) {
        ser_writedata8(os, 253);
        unsigned char buf[2] = {(unsigned char)nSize, (unsigned char)(nSize >> 8)};
        os.write(buf, 2);
    } else if (nSize <= 0xffffffffu) {
        ser_writedata8(os, 254);
        ser_writedata32(os, nSize);
    } else {
        ser_writedata8(os, 255);
        ser_writedata64(os, nSize);
    }
}

template <typename Stream>
uint64_t ReadCompactSize(Stream& is)
{
    uint8_t chSize = ser_readdata8(is);
    if (chSize < 253) return chSize;
    if (chSize == 253) {
        unsigned char buf[2];
        is.read(buf, 2);
        return (uint64_t)buf[0] | ((uint64_t)buf[1] << 8);
    }
    if (chSize == 254) return ser_readdata32(is);
    return ser_readdata64(is);
}

/** Length-prefixed byte string. */
template <typename Stream, typename T>
void WriteVarBytes(Stream& os, const T& v)
{
    WriteCompactSize(os, v.size());
    if (!v.empty()) os.write((const unsigned char*)&v[0], v.size());
}

template <typename Stream>
std::vector<unsigned char> ReadVarBytes(Stream& is)
{
    uint64_t nSize = ReadCompactSize(is);
    if (nSize > 0x02000000) {
        throw std::ios_base::failure("ReadVarBytes(): size too large");
    }
    std::vector<unsigned char> v(nSize);
    if (nSize) is.read(v.data(), nSize);
    return v;
}

#endif // AGENTPAY_SERIALIZE_H
