// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_UTIL_ERROR_H
#define AGENTPAY_UTIL_ERROR_H

#include <stdexcept>
#include <string>

/**
 * Error taxonomy for the escrow core. Every failure that crosses a module
 * boundary is one of these, so callers can map it to a stable code and an
 * HTTP status without parsing messages.
 */
enum class ErrorCode {
    VALIDATION_ERROR,
    AUTH_ERROR,
    CRYPTO_VERIFICATION_FAILED,
    CRYPTO_ERROR,
    INSUFFICIENT_FUNDS,
    UNSUPPORTED_SIGNATURE_FORMAT,
    EXTERNAL_SERVICE_ERROR,
    NOT_FOUND,
    NOT_IMPLEMENTED,
};

std::string ErrorCodeToString(ErrorCode code);

/** HTTP status the outer surface reports for a code. */
int ErrorCodeToHTTPStatus(ErrorCode code);

class AgentPayError : public std::runtime_error
{
public:
    AgentPayError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), m_code(code) {}

    ErrorCode GetCode() const { return m_code; }

private:
    ErrorCode m_code;
};

#define AGENTPAY_DEFINE_ERROR(Name, Code)                                      \
    class Name : public AgentPayError                                          \
    {                                                                          \
    public:                                                                    \
        explicit Name(const std::string& msg) : AgentPayError(Code, msg) {}    \
    }

/** Malformed input, illegal state or a broken invariant the caller can fix. */
AGENTPAY_DEFINE_ERROR(ValidationError, ErrorCode::VALIDATION_ERROR);
/** Missing or invalid credential. Messages never reveal which check failed. */
AGENTPAY_DEFINE_ERROR(AuthError, ErrorCode::AUTH_ERROR);
/** A signature did not verify against the expected key and digest. */
AGENTPAY_DEFINE_ERROR(CryptoVerificationError, ErrorCode::CRYPTO_VERIFICATION_FAILED);
/** Key handling or at-rest encryption failed. */
AGENTPAY_DEFINE_ERROR(CryptoError, ErrorCode::CRYPTO_ERROR);
AGENTPAY_DEFINE_ERROR(InsufficientFundsError, ErrorCode::INSUFFICIENT_FUNDS);
/** No signature parser accepted the input. */
AGENTPAY_DEFINE_ERROR(UnsupportedSignatureFormat, ErrorCode::UNSUPPORTED_SIGNATURE_FORMAT);
/** The chain client (or another remote) failed or timed out. */
AGENTPAY_DEFINE_ERROR(ExternalServiceError, ErrorCode::EXTERNAL_SERVICE_ERROR);
AGENTPAY_DEFINE_ERROR(NotFoundError, ErrorCode::NOT_FOUND);
AGENTPAY_DEFINE_ERROR(NotImplementedError, ErrorCode::NOT_IMPLEMENTED);

#undef AGENTPAY_DEFINE_ERROR

#endif // AGENTPAY_UTIL_ERROR_H
