// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_UTIL_TIME_H
#define AGENTPAY_UTIL_TIME_H

#include <stdint.h>
#include <string>

/**
 * GetTime() returns the system time or the mocked time when SetMockTime()
 * has been called with a non-zero value. All expiry decisions (dispute
 * windows, challenges, sessions) go through it so tests can move the clock.
 */
int64_t GetTime();

int64_t GetTimeMillis();
int64_t GetSystemTimeInSeconds();

/** For testing. Set e.g. with the setmocktime rpc, or -mocktime argument */
void SetMockTime(int64_t nMockTimeIn);
/** For testing */
int64_t GetMockTime();

void MilliSleep(int64_t n);

/** ISO 8601 formatting, e.g. 2025-01-31T17:02:09Z */
std::string FormatISO8601DateTime(int64_t nTime);

#endif // AGENTPAY_UTIL_TIME_H
