// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_PAYMENT_H
#define AGENTPAY_ESCROW_PAYMENT_H

#include "amount.h"
#include "optional.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class PaymentStatus {
    PENDING,
    ESCROWED,
    RELEASED,
    REFUNDED,
    DISPUTED,
};

enum class EscrowMode {
    PLATFORM,   // funds held by the platform wallet
    MULTISIG,   // 2-of-3 bare multisig of buyer, seller and admin keys
};

enum class Currency {
    BSV,        // satoshis
    MNEE,       // token units (USD cents)
};

enum class SettlementAction {
    RELEASE,
    REFUND,
};

enum class SettlementActorType {
    BUYER,
    SELLER,
    ADMIN,
};

std::string PaymentStatusToString(PaymentStatus status);
bool PaymentStatusFromString(const std::string& str, PaymentStatus& status);
std::string EscrowModeToString(EscrowMode mode);
bool EscrowModeFromString(const std::string& str, EscrowMode& mode);
std::string CurrencyToString(Currency currency);
bool CurrencyFromString(const std::string& str, Currency& currency);
std::string SettlementActionToString(SettlementAction action);
bool SettlementActionFromString(const std::string& str, SettlementAction& action);
std::string SettlementActorTypeToString(SettlementActorType type);
bool SettlementActorTypeFromString(const std::string& str, SettlementActorType& type);

/** released and refunded are final. */
bool IsFinalPaymentStatus(PaymentStatus status);

class CPayment
{
public:
    std::string id;
    std::string serviceId;
    Optional<std::string> contractId;
    std::string buyerWalletId;
    std::string sellerWalletId;
    CAmount nAmount{0};
    CAmount nPlatformFee{0};
    Currency currency{Currency::BSV};
    EscrowMode escrowMode{EscrowMode::PLATFORM};
    PaymentStatus status{PaymentStatus::PENDING};

    //! Downstream job bound to this payment, set at most once.
    Optional<std::string> consumedBy;

    Optional<std::string> escrowTxId;
    Optional<int64_t> nEscrowVout;
    Optional<std::string> escrowScriptHex;
    Optional<std::string> releaseTxId;
    Optional<std::string> refundTxId;

    int64_t nCreateTime{0};
    Optional<int64_t> nCompleteTime;

    /** Payout to the seller on release. */
    CAmount GetSellerPayout() const { return nAmount - nPlatformFee; }

    std::string ToString() const;
};

class CSettlementApproval
{
public:
    int64_t id{0};
    std::string paymentId;
    SettlementAction action{SettlementAction::RELEASE};
    SettlementActorType actorType{SettlementActorType::BUYER};
    std::string actorId;        // wallet id, or admin address
    std::string signature;      // base64 compact message signature
    std::string message;        // the settlement message that was signed
    int64_t nCreateTime{0};
};

/** Approval progress for one (payment, action). */
struct CSettlementQuorum
{
    SettlementAction action{SettlementAction::RELEASE};
    int nRequired{2};
    bool fReady{false};
    bool fTxSignatureRequired{false};
    std::vector<SettlementActorType> actorTypes;
    std::vector<CSettlementApproval> approvals;
};

#endif // AGENTPAY_ESCROW_PAYMENT_H
