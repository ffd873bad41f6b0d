// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_UTIL_MESSAGE_H
#define AGENTPAY_UTIL_MESSAGE_H

#include "key.h"
#include "pubkey.h"
#include "uint256.h"

#include <string>

extern const std::string MESSAGE_MAGIC;

/** The result of a signed message verification.
 * Message verification takes as an input:
 * - address (with whose private key the message is supposed to have been signed)
 * - signature
 * - message
 */
enum class MessageVerificationResult {
    //! The provided address is invalid.
    ERR_INVALID_ADDRESS,

    //! The provided signature couldn't be parsed (maybe invalid base64).
    ERR_MALFORMED_SIGNATURE,

    //! A public key could not be recovered from the provided signature and message.
    ERR_PUBKEY_NOT_RECOVERED,

    //! The message was not signed with the private key of the provided address.
    ERR_NOT_SIGNED,

    //! The message verification was successful.
    OK
};

/** Verify a signed message (base64 compact signature) against an address. */
MessageVerificationResult MessageVerify(
    const std::string& address,
    const std::string& signature,
    const std::string& message);

/** Verify a signed message against a declared public key. */
MessageVerificationResult MessageVerifyPubKey(
    const CPubKey& pubkey,
    const std::string& signature,
    const std::string& message);

/** Sign a message with a private key.
 * @param[in] privkey The private key to sign with.
 * @param[in] message The message to sign.
 * @param[out] signature Base64 encoded compact signature.
 * @return true on success
 */
bool MessageSign(
    const CKey& privkey,
    const std::string& message,
    std::string& signature);

/**
 * Hashes a message for signing and verification in a manner that prevents
 * inadvertently signing a transaction.
 */
uint256 MessageHash(const std::string& message);

std::string MessageVerificationResultString(MessageVerificationResult res);

#endif // AGENTPAY_UTIL_MESSAGE_H
