// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/error.h"

std::string ErrorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
    case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
    case ErrorCode::CRYPTO_VERIFICATION_FAILED: return "CRYPTO_VERIFICATION_FAILED";
    case ErrorCode::CRYPTO_ERROR: return "CRYPTO_ERROR";
    case ErrorCode::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
    case ErrorCode::UNSUPPORTED_SIGNATURE_FORMAT: return "UNSUPPORTED_SIGNATURE_FORMAT";
    case ErrorCode::EXTERNAL_SERVICE_ERROR: return "EXTERNAL_SERVICE_ERROR";
    case ErrorCode::NOT_FOUND: return "NOT_FOUND";
    case ErrorCode::NOT_IMPLEMENTED: return "NOT_IMPLEMENTED";
    } // no default case, so the compiler can warn about missing cases
    return "UNKNOWN";
}

int ErrorCodeToHTTPStatus(ErrorCode code)
{
    switch (code) {
    case ErrorCode::VALIDATION_ERROR:
    case ErrorCode::UNSUPPORTED_SIGNATURE_FORMAT:
    case ErrorCode::CRYPTO_VERIFICATION_FAILED:
        return 400;
    case ErrorCode::AUTH_ERROR:
        return 401;
    case ErrorCode::INSUFFICIENT_FUNDS:
        return 402;
    case ErrorCode::NOT_FOUND:
        return 404;
    case ErrorCode::NOT_IMPLEMENTED:
        return 501;
    case ErrorCode::EXTERNAL_SERVICE_ERROR:
        return 502;
    case ErrorCode::CRYPTO_ERROR:
        return 500;
    }
    return 500;
}
