// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "script/sigencoding.h"

#include "logging.h"
#include "pubkey.h"
#include "util/error.h"
#include "util/strencodings.h"

#include <secp256k1.h>

namespace {

struct ParsedSignature
{
    secp256k1_ecdsa_signature sig;
    int nSigHashType;
};

typedef bool (*SignatureParser)(const std::vector<unsigned char>& bytes, int nDefaultType, ParsedSignature& out);

bool ParseDER(const std::vector<unsigned char>& der, ParsedSignature& out)
{
    if (der.empty()) return false;
    return secp256k1_ecdsa_signature_parse_der(secp256k1_context_no_precomp, &out.sig, der.data(), der.size()) == 1;
}

bool ParseChecksigBytes(const std::vector<unsigned char>& bytes, int nDefaultType, ParsedSignature& out)
{
    // Shortest strict DER is 8 bytes, plus the scope byte.
    if (bytes.size() < 9) return false;
    std::vector<unsigned char> der(bytes.begin(), bytes.end() - 1);
    if (!ParseDER(der, out)) return false;
    out.nSigHashType = bytes.back();
    return true;
}

bool ParseDERBytes(const std::vector<unsigned char>& bytes, int nDefaultType, ParsedSignature& out)
{
    if (!ParseDER(bytes, out)) return false;
    out.nSigHashType = nDefaultType;
    return true;
}

bool ParseCompactBytes(const std::vector<unsigned char>& bytes, int nDefaultType, ParsedSignature& out)
{
    const unsigned char* rs = nullptr;
    if (bytes.size() == 64) {
        rs = bytes.data();
    } else if (bytes.size() == 65 && bytes[0] >= 27 && bytes[0] <= 34) {
        // Recovery header from message-signing wallets.
        rs = bytes.data() + 1;
    } else {
        return false;
    }
    if (!secp256k1_ecdsa_signature_parse_compact(secp256k1_context_no_precomp, &out.sig, rs)) return false;
    out.nSigHashType = nDefaultType;
    return true;
}

bool DecodeHexStrict(const std::string& str, std::vector<unsigned char>& out)
{
    if (!IsHex(str)) return false;
    out = ParseHex(str);
    return true;
}

bool DecodeBase64Strict(const std::string& str, std::vector<unsigned char>& out)
{
    bool invalid = false;
    out = DecodeBase64(str.c_str(), &invalid);
    return !invalid && !out.empty();
}

struct ParserEntry
{
    SignatureFormat format;
    bool fBase64;
    SignatureParser parser;
};

// Order matters: hex strings are also valid base64 alphabets.
const ParserEntry PARSER_CHAIN[] = {
    {SignatureFormat::CHECKSIG_HEX, false, ParseChecksigBytes},
    {SignatureFormat::DER_HEX, false, ParseDERBytes},
    {SignatureFormat::DER_BASE64, true, ParseDERBytes},
    {SignatureFormat::COMPACT_HEX, false, ParseCompactBytes},
    {SignatureFormat::COMPACT_BASE64, true, ParseCompactBytes},
};

} // namespace

std::string SignatureFormatName(SignatureFormat format)
{
    switch (format) {
    case SignatureFormat::CHECKSIG_HEX: return "checksig-hex";
    case SignatureFormat::DER_HEX: return "der-hex";
    case SignatureFormat::DER_BASE64: return "der-base64";
    case SignatureFormat::COMPACT_HEX: return "compact-hex";
    case SignatureFormat::COMPACT_BASE64: return "compact-base64";
    }
    return "unknown";
}

NormalizedSignature NormalizeSignatureToChecksig(const std::string& raw, const SignatureNormalizeOptions& options)
{
    const std::string input = TrimString(raw);
    if (input.empty()) {
        throw UnsupportedSignatureFormat("Signature is empty");
    }
    if (!IsValidForkIdSigHashType(options.nSigHashType)) {
        throw ValidationError(strprintf("Unsupported sighash type 0x%02x", options.nSigHashType));
    }

    std::vector<unsigned char> hexBytes;
    std::vector<unsigned char> base64Bytes;
    const bool fHex = DecodeHexStrict(input, hexBytes);
    const bool fBase64 = DecodeBase64Strict(input, base64Bytes);

    ParsedSignature parsed;
    const ParserEntry* match = nullptr;
    for (const ParserEntry& entry : PARSER_CHAIN) {
        if (entry.fBase64 ? !fBase64 : !fHex) continue;
        if (entry.parser(entry.fBase64 ? base64Bytes : hexBytes, options.nSigHashType, parsed)) {
            match = &entry;
            break;
        }
    }
    if (!match) {
        throw UnsupportedSignatureFormat("Unsupported signature format (expected checksig-hex, DER hex/base64 or compact hex/base64)");
    }
    if (!IsValidForkIdSigHashType(parsed.nSigHashType)) {
        throw ValidationError(strprintf("Signature scope 0x%02x lacks SIGHASH_FORKID", parsed.nSigHashType));
    }

    secp256k1_ecdsa_signature_normalize(secp256k1_context_no_precomp, &parsed.sig, &parsed.sig);

    std::vector<unsigned char> der(CPubKey::SIGNATURE_SIZE);
    size_t derLen = der.size();
    secp256k1_ecdsa_signature_serialize_der(secp256k1_context_no_precomp, der.data(), &derLen, &parsed.sig);
    der.resize(derLen);

    NormalizedSignature result;
    result.nSigHashType = parsed.nSigHashType;
    result.inputFormat = match->format;
    std::vector<unsigned char> checksig(der);
    checksig.push_back((unsigned char)parsed.nSigHashType);
    result.checksigHex = HexStr(checksig);

    if (options.digestHex && options.publicKeyHex) {
        std::vector<unsigned char> digest;
        if (!DecodeHexStrict(*options.digestHex, digest) || digest.size() != 32) {
            throw ValidationError("Digest must be 32 bytes of hex");
        }
        std::vector<unsigned char> pubkeyBytes;
        if (!DecodeHexStrict(*options.publicKeyHex, pubkeyBytes)) {
            throw ValidationError("Public key must be hex");
        }
        CPubKey pubkey(pubkeyBytes);
        if (!pubkey.IsFullyValid()) {
            throw ValidationError("Invalid public key");
        }
        if (!pubkey.Verify(uint256(digest), der)) {
            LogPrint(BCLog::CRYPTO, "%s: %s signature does not verify for %s\n", __func__, SignatureFormatName(match->format), *options.publicKeyHex);
            throw CryptoVerificationError("Signature does not verify against the transaction digest");
        }
        result.verified = true;
    }

    LogPrint(BCLog::CRYPTO, "%s: normalized %s signature, scope 0x%02x\n", __func__, SignatureFormatName(match->format), result.nSigHashType);
    return result;
}
