// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_UTIL_FORMAT_H
#define AGENTPAY_UTIL_FORMAT_H

#include <stdexcept>
#include <string>

namespace tinyformat {
class format_error : public std::runtime_error
{
public:
    explicit format_error(const std::string& what) : std::runtime_error(what) {}
};
} // namespace tinyformat

// Malformed format strings throw instead of asserting.
#define TINYFORMAT_ERROR(reasonString) throw tinyformat::format_error(reasonString)

#include <tinyformat.h>

#define strprintf tfm::format

#endif // AGENTPAY_UTIL_FORMAT_H
