// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "contract/contract.h"

#include "chain/chainclient.h"
#include "contract/contractdb.h"
#include "hash.h"
#include "key.h"
#include "key_io.h"
#include "logging.h"
#include "random.h"
#include "script/standard.h"
#include "util/error.h"
#include "util/message.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "wallet/db.h"
#include "wallet/wallet.h"

#include <univalue.h>

std::string ContractStatusToString(ContractStatus status)
{
    switch (status) {
    case ContractStatus::ACTIVE: return "active";
    case ContractStatus::RELEASED: return "released";
    case ContractStatus::REFUNDED: return "refunded";
    case ContractStatus::DISPUTED: return "disputed";
    }
    return "unknown";
}

bool ContractStatusFromString(const std::string& str, ContractStatus& status)
{
    if (str == "active") status = ContractStatus::ACTIVE;
    else if (str == "released") status = ContractStatus::RELEASED;
    else if (str == "refunded") status = ContractStatus::REFUNDED;
    else if (str == "disputed") status = ContractStatus::DISPUTED;
    else return false;
    return true;
}

std::string CanonicalContractPayload(const CContractTerms& terms)
{
    // UniValue objects keep insertion order.
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("version", CONTRACT_VERSION);
    obj.pushKV("domain", CONTRACT_DOMAIN);
    obj.pushKV("serviceId", terms.serviceId);
    obj.pushKV("buyerWalletId", terms.buyerWalletId);
    obj.pushKV("providerWalletId", terms.providerWalletId);
    obj.pushKV("buyerAddress", terms.buyerAddress);
    obj.pushKV("providerAddress", terms.providerAddress);
    obj.pushKV("amount", (int64_t)terms.nAmount);
    obj.pushKV("currency", CurrencyToString(terms.currency));
    obj.pushKV("termsHash", terms.termsHash);
    obj.pushKV("disputeWindow", (int64_t)terms.nDisputeWindow);
    return obj.write();
}

std::string ComputeContractHash(const CContractTerms& terms)
{
    return SHA256Hex(CanonicalContractPayload(terms));
}

std::string GetContractMessage(const std::string& contractHash)
{
    return CONTRACT_MESSAGE_PREFIX + contractHash;
}

static bool VerifyPartySignature(const std::string& publicKeyHex, const std::string& signature, const std::string& message)
{
    const CPubKey pubkey(ParseHex(publicKeyHex));
    if (!pubkey.IsFullyValid()) return false;
    return MessageVerifyPubKey(pubkey, signature, message) == MessageVerificationResult::OK;
}

CContractManager::CContractManager(SQLiteDatabase& db, CWalletManager& wallets, CChainClient& chain,
                                   const FeePolicy& feePolicy, bool fAnchor)
    : m_db(db), m_wallets(wallets), m_chain(chain), m_feePolicy(feePolicy), m_fAnchor(fAnchor)
{
}

CServiceContract CContractManager::CreateAndAnchor(const CContractTerms& terms, const CKey& buyerKey, const CKey& providerKey)
{
    if (terms.serviceId.empty() || terms.buyerWalletId.empty() || terms.providerWalletId.empty()) {
        throw ValidationError("Contract terms need a service, a buyer and a provider");
    }
    if (terms.nAmount <= 0) {
        throw ValidationError("Contract amount must be positive");
    }
    if (!IsValidDestinationString(terms.buyerAddress) || !IsValidDestinationString(terms.providerAddress)) {
        throw ValidationError("Contract party address is invalid for this network");
    }

    const CAgentWallet buyer = m_wallets.GetByIdOrThrow(terms.buyerWalletId);
    const CAgentWallet provider = m_wallets.GetByIdOrThrow(terms.providerWalletId);

    CServiceContract contract;
    contract.id = GenerateId();
    contract.terms = terms;
    contract.contractHash = ComputeContractHash(terms);
    contract.status = ContractStatus::ACTIVE;
    contract.nCreateTime = GetTime();

    const std::string message = GetContractMessage(contract.contractHash);
    if (!MessageSign(buyerKey, message, contract.buyerSignature) ||
        !MessageSign(providerKey, message, contract.providerSignature)) {
        throw CryptoError("Contract signing failed");
    }
    if (!VerifyPartySignature(buyer.publicKey, contract.buyerSignature, message)) {
        throw CryptoVerificationError("Buyer signature verification failed");
    }
    if (!VerifyPartySignature(provider.publicKey, contract.providerSignature, message)) {
        throw CryptoVerificationError("Provider signature verification failed");
    }

    CContractDB(m_db).WriteContract(contract);
    LogPrint(BCLog::CONTRACT, "CContractManager::%s: contract %s hash %s\n", __func__, contract.id, contract.contractHash);

    if (m_fAnchor) {
        contract.contractTxId = Anchor(terms, contract.contractHash, buyerKey);
        if (contract.contractTxId) {
            CContractDB(m_db).WriteAnchor(contract.id, *contract.contractTxId);
        }
    }
    return contract;
}

Optional<std::string> CContractManager::Anchor(const CContractTerms& terms, const std::string& contractHash, const CKey& key)
{
    try {
        const std::vector<CUtxo> utxos = m_wallets.GetUtxos(terms.buyerWalletId);
        CKeyID keyID;
        if (!DecodeDestination(terms.buyerAddress, keyID)) {
            throw ValidationError("Invalid buyer address");
        }
        const TxBuildResult result = BuildAnchorTransaction(utxos, ParseHex(contractHash),
                                                            GetScriptForDestination(keyID), key, m_feePolicy);
        if (!result.success) {
            LogPrint(BCLog::CONTRACT, "CContractManager::%s: anchor not built: %s\n", __func__, result.error);
            return boost::none;
        }
        const std::string txid = m_chain.Broadcast(EncodeHexTx(result.mtx));
        m_wallets.MarkSpent(utxos);
        LogPrint(BCLog::CONTRACT, "CContractManager::%s: anchored %s in %s\n", __func__, contractHash, txid);
        return txid;
    } catch (const std::runtime_error& e) {
        LogPrintf("CContractManager::%s: anchoring %s failed: %s\n", __func__, contractHash, e.what());
    }
    return boost::none;
}

CContractVerification CContractManager::VerifyContract(const std::string& contractId) const
{
    CContractVerification verification;

    CServiceContract contract;
    if (!CContractDB(m_db).ReadContract(contractId, contract)) {
        verification.errors.push_back(CONTRACT_ERR_NOT_FOUND);
        return verification;
    }

    const Optional<CAgentWallet> buyer = m_wallets.GetById(contract.terms.buyerWalletId);
    const Optional<CAgentWallet> provider = m_wallets.GetById(contract.terms.providerWalletId);

    // Signatures cover the stored hash, so a terms edit shows up only as a hash mismatch.
    const std::string message = GetContractMessage(contract.contractHash);
    if (ComputeContractHash(contract.terms) != contract.contractHash) {
        verification.errors.push_back(CONTRACT_ERR_HASH_MISMATCH);
    }
    if (!buyer || !VerifyPartySignature(buyer->publicKey, contract.buyerSignature, message)) {
        verification.errors.push_back(CONTRACT_ERR_BUYER_SIGNATURE);
    }
    if (!provider || !VerifyPartySignature(provider->publicKey, contract.providerSignature, message)) {
        verification.errors.push_back(CONTRACT_ERR_PROVIDER_SIGNATURE);
    }

    verification.fValid = verification.errors.empty();
    verification.contract = contract;
    return verification;
}

Optional<CServiceContract> CContractManager::GetById(const std::string& contractId) const
{
    CServiceContract contract;
    if (!CContractDB(m_db).ReadContract(contractId, contract)) return boost::none;
    return contract;
}

Optional<CServiceContract> CContractManager::GetByPaymentId(const std::string& paymentId) const
{
    CServiceContract contract;
    if (!CContractDB(m_db).ReadByPaymentId(paymentId, contract)) return boost::none;
    return contract;
}

bool CContractManager::LinkPayment(const std::string& contractId, const std::string& paymentId)
{
    return CContractDB(m_db).LinkPayment(contractId, paymentId);
}

void CContractManager::SetStatusByPaymentId(const std::string& paymentId, ContractStatus status,
                                            const Optional<std::string>& settlementTxId)
{
    CContractDB(m_db).UpdateStatusByPaymentId(paymentId, status, settlementTxId, GetTime());
}
