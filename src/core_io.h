// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_CORE_IO_H
#define AGENTPAY_CORE_IO_H

#include <string>

class CScript;
class CDispute;
class CPayment;
class CServiceContract;
class CSettlementApproval;
class UniValue;
struct CAgentWallet;
struct NormalizedSignature;
class AgentPayError;

// core_write.cpp
std::string ScriptToAsmStr(const CScript& script, const bool fAttemptSighashDecode = false);
void ScriptPubKeyToUniv(const CScript& scriptPubKey, UniValue& out, bool fIncludeHex);

UniValue WalletToUniv(const CAgentWallet& wallet);
UniValue PaymentToUniv(const CPayment& payment);
UniValue ApprovalToUniv(const CSettlementApproval& approval);
UniValue ContractToUniv(const CServiceContract& contract);
UniValue DisputeToUniv(const CDispute& dispute);
UniValue NormalizedSignatureToUniv(const NormalizedSignature& sig);
/** {code, status, message}, the error body of the outer surface. */
UniValue ErrorToUniv(const AgentPayError& error);

#endif // AGENTPAY_CORE_IO_H
