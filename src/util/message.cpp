// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2021 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/message.h"

#include "hash.h"
#include "key_io.h"
#include "serialize.h"
#include "util/strencodings.h"

#include <vector>

/**
 * Text used to signify that a signed message follows and to prevent
 * inadvertently signing a transaction.
 */
const std::string MESSAGE_MAGIC = "Bitcoin Signed Message:\n";

static MessageVerificationResult RecoverSigner(const std::string& signature, const std::string& message, CPubKey& pubkey)
{
    bool invalid = false;
    std::vector<unsigned char> signature_bytes = DecodeBase64(signature.c_str(), &invalid);
    if (invalid || signature_bytes.size() != CPubKey::COMPACT_SIGNATURE_SIZE) {
        return MessageVerificationResult::ERR_MALFORMED_SIGNATURE;
    }

    if (!pubkey.RecoverCompact(MessageHash(message), signature_bytes)) {
        return MessageVerificationResult::ERR_PUBKEY_NOT_RECOVERED;
    }
    return MessageVerificationResult::OK;
}

MessageVerificationResult MessageVerify(
    const std::string& address,
    const std::string& signature,
    const std::string& message)
{
    CKeyID keyID;
    if (!DecodeDestination(address, keyID)) {
        return MessageVerificationResult::ERR_INVALID_ADDRESS;
    }

    CPubKey pubkey;
    MessageVerificationResult res = RecoverSigner(signature, message, pubkey);
    if (res != MessageVerificationResult::OK) {
        return res;
    }

    if (!(pubkey.GetID() == keyID)) {
        return MessageVerificationResult::ERR_NOT_SIGNED;
    }

    return MessageVerificationResult::OK;
}

MessageVerificationResult MessageVerifyPubKey(
    const CPubKey& expected,
    const std::string& signature,
    const std::string& message)
{
    CPubKey pubkey;
    MessageVerificationResult res = RecoverSigner(signature, message, pubkey);
    if (res != MessageVerificationResult::OK) {
        return res;
    }
    // The recovered encoding must match the declared key, not just its hash.
    if (pubkey != expected) {
        return MessageVerificationResult::ERR_NOT_SIGNED;
    }
    return MessageVerificationResult::OK;
}

bool MessageSign(
    const CKey& privkey,
    const std::string& message,
    std::string& signature)
{
    std::vector<unsigned char> signature_bytes;

    if (!privkey.SignCompact(MessageHash(message), signature_bytes)) {
        return false;
    }

    signature = EncodeBase64(signature_bytes.data(), signature_bytes.size());

    return true;
}

uint256 MessageHash(const std::string& message)
{
    std::vector<unsigned char> vch;
    CVectorWriter ss(vch);
    WriteVarBytes(ss, MESSAGE_MAGIC);
    WriteVarBytes(ss, message);
    return Hash(vch.begin(), vch.end());
}

std::string MessageVerificationResultString(MessageVerificationResult res)
{
    switch (res) {
    case MessageVerificationResult::ERR_INVALID_ADDRESS:
        return "Invalid address";
    case MessageVerificationResult::ERR_MALFORMED_SIGNATURE:
        return "Malformed base64 encoding";
    case MessageVerificationResult::ERR_PUBKEY_NOT_RECOVERED:
        return "Unable to recover public key from signature";
    case MessageVerificationResult::ERR_NOT_SIGNED:
        return "Message not signed by the expected key";
    case MessageVerificationResult::OK:
        return "Message verified";
    }
    return "Unknown verification result";
}
