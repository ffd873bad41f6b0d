// Copyright (c) 2017-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_FS_H
#define AGENTPAY_FS_H

#include <stdio.h>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

/** Filesystem operations and types */
namespace fs = boost::filesystem;

/** Bridge operations to C stdio */
namespace fsbridge {
    FILE* fopen(const fs::path& p, const char* mode);
} // namespace fsbridge

#endif // AGENTPAY_FS_H
