// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SYNC_H
#define AGENTPAY_SYNC_H

#include <mutex>

typedef std::recursive_mutex RecursiveMutex;
typedef std::mutex Mutex;

#define PASTE(x, y) x##y
#define PASTE2(x, y) PASTE(x, y)

//! Scoped lock on a (recursive) mutex, released at end of scope.
#define LOCK(cs) std::unique_lock<std::decay<decltype(cs)>::type> PASTE2(criticalblock, __COUNTER__)(cs)

#endif // AGENTPAY_SYNC_H
