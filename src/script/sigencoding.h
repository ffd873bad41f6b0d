// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_SCRIPT_SIGENCODING_H
#define AGENTPAY_SCRIPT_SIGENCODING_H

#include "optional.h"
#include "script/sighash.h"

#include <string>
#include <vector>

/** Input encodings accepted for externally produced ECDSA signatures. */
enum class SignatureFormat {
    CHECKSIG_HEX,   //!< DER + trailing sighash byte, hex
    DER_HEX,
    DER_BASE64,
    COMPACT_HEX,    //!< 64-byte r||s, or 65 bytes with a recovery header
    COMPACT_BASE64,
};

std::string SignatureFormatName(SignatureFormat format);

struct SignatureNormalizeOptions
{
    //! Scope appended to DER and compact inputs (checksig-hex carries its own).
    int nSigHashType = SIGHASH_ALL_FORKID;
    //! When both are set the normalized signature must verify against them.
    Optional<std::string> digestHex;
    Optional<std::string> publicKeyHex;
};

struct NormalizedSignature
{
    //! Low-S DER followed by the scope byte, lower-case hex.
    std::string checksigHex;
    int nSigHashType;
    SignatureFormat inputFormat;
    //! Set only when verification was requested.
    Optional<bool> verified;
};

/**
 * Normalize an external signature into the checksig encoding used in
 * unlocking scripts.
 *
 * Parsers are tried in a fixed order (checksig-hex, DER-hex, DER-base64,
 * compact-hex, compact-base64) and the first that accepts the input wins.
 * High-S values are flipped to low-S.
 *
 * @throws UnsupportedSignatureFormat if no parser accepts the input
 * @throws ValidationError on a bad sighash scope, digest or public key
 * @throws CryptoVerificationError if verification was requested and fails
 */
NormalizedSignature NormalizeSignatureToChecksig(const std::string& raw, const SignatureNormalizeOptions& options = SignatureNormalizeOptions());

#endif // AGENTPAY_SCRIPT_SIGENCODING_H
