// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/settlement.h"

#include "chain/chainclient.h"
#include "chainparams.h"
#include "contract/contractdb.h"
#include "escrow/multisig.h"
#include "hash.h"
#include "logging.h"
#include "random.h"
#include "script/standard.h"
#include "util/error.h"
#include "util/message.h"
#include "util/strencodings.h"
#include "util/time.h"
#include "wallet/db.h"
#include "wallet/wallet.h"

#include <algorithm>
#include <limits>

#include <univalue.h>

// Refunds of tiny multisig escrows keep a smaller fee so the buyer gets something back.
static const CAmount MULTISIG_SMALL_REFUND_LIMIT = 600;
static const CAmount MULTISIG_SMALL_REFUND_FEE = 200;

static void ThrowBuildError(const TxBuildResult& result)
{
    switch (result.code) {
    case ErrorCode::INSUFFICIENT_FUNDS: throw InsufficientFundsError(result.error);
    case ErrorCode::CRYPTO_ERROR: throw CryptoError(result.error);
    default: throw ValidationError(result.error);
    }
}

static ContractStatus ContractStatusForAction(SettlementAction action)
{
    return action == SettlementAction::RELEASE ? ContractStatus::RELEASED : ContractStatus::REFUNDED;
}

std::string ComputeSettlementMessage(const CPayment& payment, SettlementAction action)
{
    // Keys in lexicographic order.
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("action", SettlementActionToString(action));
    obj.pushKV("amount", (int64_t)payment.nAmount);
    obj.pushKV("buyerWalletId", payment.buyerWalletId);
    obj.pushKV("contractId", payment.contractId ? UniValue(*payment.contractId) : UniValue(UniValue::VNULL));
    obj.pushKV("currency", CurrencyToString(payment.currency));
    obj.pushKV("domain", SETTLEMENT_DOMAIN);
    obj.pushKV("paymentId", payment.id);
    obj.pushKV("platformFee", (int64_t)payment.nPlatformFee);
    obj.pushKV("sellerWalletId", payment.sellerWalletId);
    obj.pushKV("serviceId", payment.serviceId);
    obj.pushKV("version", SETTLEMENT_MESSAGE_VERSION);
    return SETTLEMENT_MESSAGE_PREFIX + SHA256Hex(obj.write());
}

CSettlementEngine::CSettlementEngine(SQLiteDatabase& db, CWalletManager& wallets, CChainClient& chain, const CSettlementOptions& options)
    : m_db(db), m_wallets(wallets), m_chain(chain), m_options(options)
{
}

CAmount CSettlementEngine::CalculatePlatformFee(CAmount nAmount) const
{
    // Split at the basis point scale so amounts up to MAX_MONEY cannot overflow.
    const CAmount nBps = m_options.nPlatformFeeBps;
    return nAmount / 10000 * nBps + (nAmount % 10000 * nBps + 9999) / 10000;
}

CPayment CSettlementEngine::ReadPaymentOrThrow(const std::string& paymentId) const
{
    CPayment payment;
    if (!CPaymentDB(m_db).ReadPayment(paymentId, payment)) {
        throw NotFoundError("Payment not found");
    }
    return payment;
}

std::string CSettlementEngine::GetPlatformWalletId() const
{
    if (!m_options.platformWalletId) {
        throw ValidationError("Platform escrow wallet is not configured (-platformwalletkey)");
    }
    return *m_options.platformWalletId;
}

bool CSettlementEngine::IsAllowListedAdmin(const std::string& address) const
{
    return std::find(m_options.adminAllowList.begin(), m_options.adminAllowList.end(), address) != m_options.adminAllowList.end();
}

CPayment CSettlementEngine::Create(const CPaymentRequest& request)
{
    if (request.nAmount <= 0 || !MoneyRange(request.nAmount)) {
        throw ValidationError(strprintf("Invalid %s amount", CurrencyToString(request.currency)));
    }
    if (request.buyerWalletId == request.sellerWalletId) {
        throw ValidationError("Buyer and seller must be different wallets");
    }
    m_wallets.GetByIdOrThrow(request.buyerWalletId);
    m_wallets.GetByIdOrThrow(request.sellerWalletId);

    CPayment payment;
    payment.id = GenerateId();
    payment.serviceId = request.serviceId;
    payment.contractId = request.contractId;
    payment.buyerWalletId = request.buyerWalletId;
    payment.sellerWalletId = request.sellerWalletId;
    payment.nAmount = request.nAmount;
    payment.nPlatformFee = CalculatePlatformFee(request.nAmount);
    payment.currency = request.currency;
    // Tokens are always held by the platform.
    payment.escrowMode = request.currency == Currency::MNEE ? EscrowMode::PLATFORM : m_options.escrowMode;
    payment.status = PaymentStatus::PENDING;
    payment.nCreateTime = GetTime();
    if (payment.currency == Currency::BSV && payment.escrowMode == EscrowMode::MULTISIG) {
        // Stored with the pending row so an external funding can still be settled.
        payment.escrowScriptHex = HexStr(BuildMultisigEscrowScript(payment));
    }

    CPaymentDB(m_db).WritePayment(payment);
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: %s\n", __func__, payment.ToString());

    FundEscrow(payment);
    SeedDefaultApprovals(payment.id);

    return ReadPaymentOrThrow(payment.id);
}

CScript CSettlementEngine::BuildMultisigEscrowScript(const CPayment& payment) const
{
    if (m_options.adminMultisigPubKey.empty()) {
        throw ValidationError("-adminmultisigpubkey is required for multisig escrow mode");
    }
    const CAgentWallet buyer = m_wallets.GetByIdOrThrow(payment.buyerWalletId);
    const CAgentWallet seller = m_wallets.GetByIdOrThrow(payment.sellerWalletId);

    CScript lockingScript;
    std::string strError;
    if (!CreateMultisigScript({buyer.publicKey, seller.publicKey, m_options.adminMultisigPubKey}, 2, lockingScript, strError)) {
        throw ValidationError(strprintf("Cannot build escrow script: %s", strError));
    }
    return lockingScript;
}

CScript CSettlementEngine::GetEscrowLockingScript(const CPayment& payment) const
{
    if (payment.escrowMode == EscrowMode::MULTISIG) {
        if (!payment.escrowScriptHex) {
            throw ValidationError("Missing multisig escrow script on payment");
        }
        const std::vector<unsigned char> script = ParseHex(*payment.escrowScriptHex);
        return CScript(script.begin(), script.end());
    }
    return GetScriptForDestination(m_wallets.GetByIdOrThrow(GetPlatformWalletId()).GetKeyID());
}

void CSettlementEngine::FundEscrow(CPayment& payment)
{
    const CAgentWallet buyer = m_wallets.GetByIdOrThrow(payment.buyerWalletId);
    const CKey buyerKey = m_wallets.GetSigningKey(buyer.id);

    std::string txid;
    Optional<int64_t> nVout;

    if (payment.currency == Currency::MNEE) {
        const CAgentWallet platform = m_wallets.GetByIdOrThrow(GetPlatformWalletId());
        txid = m_chain.TransferToken(buyer.address, platform.address, payment.nAmount, buyerKey);
    } else {
        const CScript lockingScript = GetEscrowLockingScript(payment);
        const std::vector<CUtxo> utxos = m_wallets.GetUtxos(buyer.id);
        const TxBuildResult result = BuildFundingTransaction(utxos, lockingScript, payment.nAmount,
                                                             GetScriptForDestination(buyer.GetKeyID()), buyerKey,
                                                             m_options.feePolicy);
        if (!result.success) {
            LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: funding %s failed: %s\n", __func__, payment.id, result.error);
            ThrowBuildError(result);
        }
        txid = m_chain.Broadcast(EncodeHexTx(result.mtx));
        m_wallets.MarkSpent(utxos);
        nVout = 0;
    }

    if (!CPaymentDB(m_db).MarkEscrowed(payment.id, txid, nVout)) {
        LogPrintf("CSettlementEngine::%s: payment %s left pending before funding %s was recorded\n", __func__, payment.id, txid);
        return;
    }
    payment.status = PaymentStatus::ESCROWED;
    payment.escrowTxId = txid;
    payment.nEscrowVout = nVout;
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s escrowed in %s\n", __func__, payment.id, txid);
}

void CSettlementEngine::CheckEscrowOutput(const CPayment& payment, const std::string& txid, int64_t nVout)
{
    if (txid.size() != 64 || !IsHex(txid)) {
        throw ValidationError("Escrow txid must be 32 bytes of hex");
    }
    if (nVout < 0 || nVout > std::numeric_limits<uint32_t>::max()) {
        throw ValidationError("Escrow output index out of range");
    }
    const COutPoint outpoint(uint256S(txid), (uint32_t)nVout);
    const Optional<CUtxo> utxo = m_chain.GetTxOut(outpoint);
    if (!utxo) {
        throw ValidationError(strprintf("Escrow output %s is missing or spent", outpoint.ToString()));
    }
    if (utxo->scriptPubKey != GetEscrowLockingScript(payment)) {
        throw ValidationError(strprintf("Escrow output %s does not pay the payment's escrow script", outpoint.ToString()));
    }
    if (utxo->nValue < payment.nAmount) {
        throw ValidationError(strprintf("Escrow output %s holds %d, payment requires %d", outpoint.ToString(),
                                        utxo->nValue, payment.nAmount));
    }
}

Optional<CPayment> CSettlementEngine::MarkEscrowed(const std::string& paymentId, const std::string& txid,
                                                   const Optional<int64_t>& nVout)
{
    if (txid.empty()) {
        throw ValidationError("Escrow txid is required");
    }
    const Optional<CPayment> payment = GetPayment(paymentId);
    if (!payment || payment->status != PaymentStatus::PENDING) {
        return boost::none;
    }
    if (payment->currency == Currency::BSV) {
        if (!nVout) {
            throw ValidationError("Escrow output index is required");
        }
        CheckEscrowOutput(*payment, txid, *nVout);
    }
    if (!CPaymentDB(m_db).MarkEscrowed(paymentId, txid, nVout)) {
        return boost::none;
    }
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s escrowed in %s:%d\n", __func__, paymentId, txid,
             nVout ? *nVout : -1);
    SeedDefaultApprovals(paymentId);
    return GetPayment(paymentId);
}

Optional<CPayment> CSettlementEngine::Release(const std::string& paymentId, const Optional<std::string>& adminTxSignature)
{
    return Settle(paymentId, SettlementAction::RELEASE, PaymentStatus::ESCROWED, adminTxSignature);
}

Optional<CPayment> CSettlementEngine::Refund(const std::string& paymentId, const Optional<std::string>& adminTxSignature)
{
    return Settle(paymentId, SettlementAction::REFUND, PaymentStatus::ESCROWED, adminTxSignature);
}

Optional<CPayment> CSettlementEngine::SettleDisputed(const std::string& paymentId, SettlementAction action,
                                                     const Optional<std::string>& adminTxSignature)
{
    return Settle(paymentId, action, PaymentStatus::DISPUTED, adminTxSignature);
}

Optional<CPayment> CSettlementEngine::Settle(const std::string& paymentId, SettlementAction action, PaymentStatus expected,
                                             const Optional<std::string>& adminTxSignature)
{
    SQLiteBatch batch(m_db);
    CPaymentDB paymentdb(m_db);
    const bool fRelease = action == SettlementAction::RELEASE;

    CPayment payment;
    if (!paymentdb.ReadPayment(paymentId, payment) || payment.status != expected) {
        LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: %s ignored, payment %s is not %s\n", __func__,
                 SettlementActionToString(action), paymentId, PaymentStatusToString(expected));
        return boost::none;
    }

    const Optional<std::string>& otherTxId = fRelease ? payment.refundTxId : payment.releaseTxId;
    if (otherTxId) {
        throw ValidationError(strprintf("Payment %s already has a %s broadcast in %s", paymentId,
                                        fRelease ? "refund" : "release", *otherTxId));
    }

    // A txid stored while the payment is still open means an earlier attempt
    // broadcast the payout but did not complete; finish it without paying twice.
    std::string txid;
    const Optional<std::string>& recordedTxId = fRelease ? payment.releaseTxId : payment.refundTxId;
    if (recordedTxId) {
        txid = *recordedTxId;
        LogPrintf("CSettlementEngine::%s: payment %s %s already broadcast in %s, completing\n", __func__,
                  paymentId, SettlementActionToString(action), txid);
    } else {
        EnsureSettlementQuorum(payment, action);

        std::vector<CUtxo> spent;
        txid = ExecuteSettlementTransfer(payment, action, adminTxSignature, spent);
        try {
            if (!paymentdb.RecordSettlementTx(paymentId, expected, action, txid)) {
                throw std::runtime_error(strprintf("payment is no longer %s", PaymentStatusToString(expected)));
            }
        } catch (const std::runtime_error& e) {
            LogPrintf("CSettlementEngine::%s: payment %s %s broadcast in %s but not recorded: %s\n", __func__,
                      paymentId, SettlementActionToString(action), txid, e.what());
            throw std::runtime_error(strprintf("Settlement of payment %s was broadcast in %s but could not be recorded: %s",
                                               paymentId, txid, e.what()));
        }
        m_wallets.MarkSpent(spent);
    }

    if (!batch.TxnBegin()) {
        throw std::runtime_error("CSettlementEngine::Settle: cannot begin transaction");
    }
    const int64_t now = GetTime();
    if (!paymentdb.CompleteSettlement(paymentId, expected, action, txid, now)) {
        LogPrintf("CSettlementEngine::%s: payment %s changed state during %s (tx %s)\n", __func__,
                  paymentId, SettlementActionToString(action), txid);
        return boost::none;
    }
    CContractDB(m_db).UpdateStatusByPaymentId(paymentId, ContractStatusForAction(action), txid, now);

    if (!batch.TxnCommit()) {
        throw std::runtime_error("CSettlementEngine::Settle: cannot commit transaction");
    }

    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s %s in %s\n", __func__, paymentId,
             fRelease ? "released" : "refunded", txid);
    return GetPayment(paymentId);
}

std::string CSettlementEngine::ExecuteSettlementTransfer(const CPayment& payment, SettlementAction action,
                                                         const Optional<std::string>& adminTxSignature,
                                                         std::vector<CUtxo>& spent)
{
    if (payment.currency == Currency::BSV && payment.escrowMode == EscrowMode::MULTISIG) {
        return ExecuteMultisigSpend(payment, action, adminTxSignature);
    }
    return ExecutePlatformTransfer(payment, action, spent);
}

std::string CSettlementEngine::ExecutePlatformTransfer(const CPayment& payment, SettlementAction action,
                                                       std::vector<CUtxo>& spent)
{
    const bool fRelease = action == SettlementAction::RELEASE;
    const std::string platformId = GetPlatformWalletId();
    const CAgentWallet platform = m_wallets.GetByIdOrThrow(platformId);
    const CAgentWallet recipient = m_wallets.GetByIdOrThrow(fRelease ? payment.sellerWalletId : payment.buyerWalletId);
    const CAmount nPayout = fRelease ? payment.GetSellerPayout() : payment.nAmount;
    const CKey platformKey = m_wallets.GetSigningKey(platformId);

    if (payment.currency == Currency::MNEE) {
        return m_chain.TransferToken(platform.address, recipient.address, nPayout, platformKey);
    }

    const std::vector<CUtxo> utxos = m_wallets.GetUtxos(platformId);
    const TxBuildResult result = BuildTransaction(utxos, {{GetScriptForDestination(recipient.GetKeyID()), nPayout}},
                                                  GetScriptForDestination(platform.GetKeyID()), platformKey,
                                                  m_options.feePolicy);
    if (!result.success) {
        ThrowBuildError(result);
    }
    const std::string txid = m_chain.Broadcast(EncodeHexTx(result.mtx));
    spent = utxos;
    return txid;
}

CUtxo CSettlementEngine::GetEscrowUtxo(const CPayment& payment) const
{
    if (!payment.escrowTxId || !payment.nEscrowVout || !payment.escrowScriptHex) {
        throw ValidationError("Missing multisig escrow metadata on payment");
    }

    CUtxo utxo;
    utxo.outpoint = COutPoint(uint256S(*payment.escrowTxId), (uint32_t)*payment.nEscrowVout);
    utxo.nValue = payment.nAmount;
    utxo.scriptPubKey = GetEscrowLockingScript(payment);
    return utxo;
}

std::vector<CRecipient> CSettlementEngine::GetMultisigOutputs(const CPayment& payment, SettlementAction action) const
{
    std::vector<CRecipient> outputs;

    if (action == SettlementAction::REFUND) {
        const CAgentWallet buyer = m_wallets.GetByIdOrThrow(payment.buyerWalletId);
        const CAmount nRefund = payment.nAmount > MULTISIG_SMALL_REFUND_LIMIT
            ? payment.nAmount - MULTISIG_SPEND_FEE
            : std::max<CAmount>(1, payment.nAmount - MULTISIG_SMALL_REFUND_FEE);
        outputs.push_back({GetScriptForDestination(buyer.GetKeyID()), nRefund});
        return outputs;
    }

    const CAgentWallet seller = m_wallets.GetByIdOrThrow(payment.sellerWalletId);
    const CAmount nSpendable = std::max<CAmount>(0, payment.nAmount - MULTISIG_SPEND_FEE);
    const CAmount nSeller = std::min(payment.GetSellerPayout(), nSpendable);
    if (nSeller <= 0) {
        throw ValidationError("Insufficient escrow amount for release after fee");
    }
    outputs.push_back({GetScriptForDestination(seller.GetKeyID()), nSeller});

    // The platform fee goes to the platform wallet when it clears dust.
    const CAmount nLeftover = nSpendable - nSeller;
    if (nLeftover > Params().DustThreshold() && m_options.platformWalletId) {
        const CAgentWallet platform = m_wallets.GetByIdOrThrow(*m_options.platformWalletId);
        outputs.push_back({GetScriptForDestination(platform.GetKeyID()), nLeftover});
    } else if (nLeftover > 0) {
        outputs[0].nAmount += nLeftover;
    }
    return outputs;
}

std::string CSettlementEngine::ExecuteMultisigSpend(const CPayment& payment, SettlementAction action,
                                                    const Optional<std::string>& adminTxSignature)
{
    const bool fRelease = action == SettlementAction::RELEASE;
    const CUtxo escrow = GetEscrowUtxo(payment);

    MultisigSpendRequest request;
    request.utxo = escrow;
    request.lockingScript = escrow.scriptPubKey;
    request.outputs = GetMultisigOutputs(payment, action);

    // The receiving side always signs; the admin or the counterparty co-signs.
    request.signerKeys.push_back(m_wallets.GetSigningKey(fRelease ? payment.sellerWalletId : payment.buyerWalletId));
    if (adminTxSignature) {
        request.externalSignatures.push_back({m_options.adminMultisigPubKey, *adminTxSignature});
    } else {
        request.signerKeys.push_back(m_wallets.GetSigningKey(fRelease ? payment.buyerWalletId : payment.sellerWalletId));
    }

    const CMutableTransaction mtx = SpendMultisigUtxo(request);
    return m_chain.Broadcast(EncodeHexTx(mtx));
}

Optional<MultisigSigningPayload> CSettlementEngine::GetAdminMultisigSigningPayload(const std::string& paymentId,
                                                                                   SettlementAction action) const
{
    const CPayment payment = ReadPaymentOrThrow(paymentId);
    if (payment.currency != Currency::BSV || payment.escrowMode != EscrowMode::MULTISIG) {
        return boost::none;
    }
    const CUtxo escrow = GetEscrowUtxo(payment);
    return GetMultisigSigningPayload(escrow, escrow.scriptPubKey, GetMultisigOutputs(payment, action));
}

Optional<CPayment> CSettlementEngine::GetPayment(const std::string& paymentId) const
{
    CPayment payment;
    if (!CPaymentDB(m_db).ReadPayment(paymentId, payment)) return boost::none;
    return payment;
}

std::vector<CPayment> CSettlementEngine::ListByWallet(const std::string& walletId, PaymentRole role) const
{
    return CPaymentDB(m_db).ListByWallet(walletId, role);
}

std::string CSettlementEngine::GetSettlementMessage(const std::string& paymentId, SettlementAction action) const
{
    return ComputeSettlementMessage(ReadPaymentOrThrow(paymentId), action);
}

CSettlementQuorum CSettlementEngine::GetSettlementQuorum(const std::string& paymentId, SettlementAction action) const
{
    const CPayment payment = ReadPaymentOrThrow(paymentId);
    CPaymentDB paymentdb(m_db);

    CSettlementQuorum quorum;
    quorum.action = action;
    quorum.nRequired = SETTLEMENT_QUORUM_SIZE;
    quorum.actorTypes = paymentdb.ReadApprovalActorTypes(paymentId, action);
    quorum.approvals = paymentdb.ReadApprovals(paymentId, action);
    quorum.fReady = quorum.actorTypes.size() >= (size_t)SETTLEMENT_QUORUM_SIZE;
    quorum.fTxSignatureRequired = payment.currency == Currency::BSV && payment.escrowMode == EscrowMode::MULTISIG;
    return quorum;
}

std::vector<CSettlementApproval> CSettlementEngine::GetSettlementApprovals(const std::string& paymentId,
                                                                           const Optional<SettlementAction>& action) const
{
    return CPaymentDB(m_db).ReadApprovals(paymentId, action);
}

CSettlementApproval CSettlementEngine::RecordApproval(const CPayment& payment, SettlementAction action, SettlementActorType actorType,
                                                      const std::string& actorId, const std::string& signature)
{
    CSettlementApproval approval;
    approval.paymentId = payment.id;
    approval.action = action;
    approval.actorType = actorType;
    approval.actorId = actorId;
    approval.signature = signature;
    approval.message = ComputeSettlementMessage(payment, action);
    approval.nCreateTime = GetTime();

    const CSettlementApproval stored = CPaymentDB(m_db).WriteApproval(approval);
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: %s %s approval for %s by %s\n", __func__,
             SettlementActorTypeToString(actorType), SettlementActionToString(action), payment.id, actorId);
    return stored;
}

CSettlementApproval CSettlementEngine::CreateAutoWalletApproval(const std::string& paymentId, SettlementAction action,
                                                                SettlementActorType actorType)
{
    if (actorType == SettlementActorType::ADMIN) {
        throw ValidationError("Automatic approvals are for buyer or seller only");
    }
    const CPayment payment = ReadPaymentOrThrow(paymentId);
    const std::string walletId = actorType == SettlementActorType::BUYER ? payment.buyerWalletId : payment.sellerWalletId;
    const CAgentWallet wallet = m_wallets.GetByIdOrThrow(walletId);
    const CKey key = m_wallets.GetSigningKey(walletId);

    const std::string message = ComputeSettlementMessage(payment, action);
    std::string signature;
    if (!MessageSign(key, message, signature)) {
        throw CryptoError("Settlement message signing failed");
    }
    if (MessageVerifyPubKey(CPubKey(ParseHex(wallet.publicKey)), signature, message) != MessageVerificationResult::OK) {
        throw CryptoVerificationError(strprintf("Invalid %s settlement signature", SettlementActorTypeToString(actorType)));
    }
    return RecordApproval(payment, action, actorType, walletId, signature);
}

CSettlementApproval CSettlementEngine::CreateWalletApproval(const std::string& paymentId, SettlementAction action,
                                                            const std::string& walletId, const std::string& signature)
{
    const CPayment payment = ReadPaymentOrThrow(paymentId);

    SettlementActorType actorType;
    if (walletId == payment.buyerWalletId) {
        actorType = SettlementActorType::BUYER;
    } else if (walletId == payment.sellerWalletId) {
        actorType = SettlementActorType::SELLER;
    } else {
        throw AuthError("Only buyer or seller can approve settlement");
    }

    const CAgentWallet wallet = m_wallets.GetByIdOrThrow(walletId);
    const std::string message = ComputeSettlementMessage(payment, action);
    if (MessageVerifyPubKey(CPubKey(ParseHex(wallet.publicKey)), signature, message) != MessageVerificationResult::OK) {
        throw CryptoVerificationError("Invalid wallet settlement signature");
    }
    return RecordApproval(payment, action, actorType, walletId, signature);
}

CSettlementApproval CSettlementEngine::CreateAdminApproval(const std::string& paymentId, SettlementAction action,
                                                           const std::string& adminAddress, const std::string& signature)
{
    const CPayment payment = ReadPaymentOrThrow(paymentId);
    if (!IsAllowListedAdmin(adminAddress)) {
        throw AuthError("Admin wallet is not allow-listed");
    }
    const std::string message = ComputeSettlementMessage(payment, action);
    const MessageVerificationResult res = MessageVerify(adminAddress, signature, message);
    if (res != MessageVerificationResult::OK) {
        throw CryptoVerificationError(strprintf("Invalid admin settlement signature: %s", MessageVerificationResultString(res)));
    }
    return RecordApproval(payment, action, SettlementActorType::ADMIN, adminAddress, signature);
}

void CSettlementEngine::SeedDefaultApprovals(const std::string& paymentId)
{
    try {
        CreateAutoWalletApproval(paymentId, SettlementAction::RELEASE, SettlementActorType::BUYER);
        CreateAutoWalletApproval(paymentId, SettlementAction::REFUND, SettlementActorType::BUYER);
        CreateAutoWalletApproval(paymentId, SettlementAction::REFUND, SettlementActorType::SELLER);
    } catch (const std::runtime_error& e) {
        LogPrintf("CSettlementEngine::%s: failed to seed default approvals for %s: %s\n", __func__, paymentId, e.what());
    }
}

void CSettlementEngine::EnsureSettlementQuorum(const CPayment& payment, SettlementAction action)
{
    CPaymentDB paymentdb(m_db);
    std::vector<SettlementActorType> actorTypes = paymentdb.ReadApprovalActorTypes(payment.id, action);
    if (actorTypes.size() >= (size_t)SETTLEMENT_QUORUM_SIZE) return;

    SeedDefaultApprovals(payment.id);
    actorTypes = paymentdb.ReadApprovalActorTypes(payment.id, action);
    if (actorTypes.size() >= (size_t)SETTLEMENT_QUORUM_SIZE) return;

    throw AuthError(strprintf("Settlement quorum not met for '%s'. Need %d of buyer/seller/admin, have %u.",
                              SettlementActionToString(action), SETTLEMENT_QUORUM_SIZE, actorTypes.size()));
}

std::string CSettlementEngine::BindConsumption(const std::string& paymentId, const std::string& consumerRef)
{
    if (consumerRef.empty()) {
        throw ValidationError("Consumer reference is required");
    }
    SQLiteBatch batch(m_db);
    CPaymentDB paymentdb(m_db);
    if (paymentdb.BindConsumption(paymentId, consumerRef)) {
        LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s consumed by %s\n", __func__, paymentId, consumerRef);
    }
    const CPayment payment = ReadPaymentOrThrow(paymentId);
    if (!payment.consumedBy) {
        throw std::runtime_error("CSettlementEngine::BindConsumption: binding not stored");
    }
    return *payment.consumedBy;
}

bool CSettlementEngine::MarkDisputed(const std::string& paymentId)
{
    SQLiteBatch batch(m_db);
    CPaymentDB paymentdb(m_db);
    CPayment payment;
    if (!paymentdb.ReadPayment(paymentId, payment)) return false;
    if (payment.status == PaymentStatus::DISPUTED) return true;
    if (!paymentdb.UpdateStatus(paymentId, PaymentStatus::ESCROWED, PaymentStatus::DISPUTED)) return false;
    CContractDB(m_db).UpdateStatusByPaymentId(paymentId, ContractStatus::DISPUTED, boost::none, GetTime());
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s disputed\n", __func__, paymentId);
    return true;
}

bool CSettlementEngine::ReturnToEscrow(const std::string& paymentId)
{
    SQLiteBatch batch(m_db);
    if (!CPaymentDB(m_db).UpdateStatus(paymentId, PaymentStatus::DISPUTED, PaymentStatus::ESCROWED)) return false;
    CContractDB(m_db).UpdateStatusByPaymentId(paymentId, ContractStatus::ACTIVE, boost::none, GetTime());
    LogPrint(BCLog::ESCROW, "CSettlementEngine::%s: payment %s back in escrow\n", __func__, paymentId);
    return true;
}
