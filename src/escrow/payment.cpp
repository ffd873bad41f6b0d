// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "escrow/payment.h"

#include "util/format.h"

std::string PaymentStatusToString(PaymentStatus status)
{
    switch (status) {
    case PaymentStatus::PENDING: return "pending";
    case PaymentStatus::ESCROWED: return "escrowed";
    case PaymentStatus::RELEASED: return "released";
    case PaymentStatus::REFUNDED: return "refunded";
    case PaymentStatus::DISPUTED: return "disputed";
    } // no default case, so the compiler can warn about missing cases
    return "unknown";
}

bool PaymentStatusFromString(const std::string& str, PaymentStatus& status)
{
    if (str == "pending") status = PaymentStatus::PENDING;
    else if (str == "escrowed") status = PaymentStatus::ESCROWED;
    else if (str == "released") status = PaymentStatus::RELEASED;
    else if (str == "refunded") status = PaymentStatus::REFUNDED;
    else if (str == "disputed") status = PaymentStatus::DISPUTED;
    else return false;
    return true;
}

std::string EscrowModeToString(EscrowMode mode)
{
    switch (mode) {
    case EscrowMode::PLATFORM: return "platform";
    case EscrowMode::MULTISIG: return "multisig";
    }
    return "unknown";
}

bool EscrowModeFromString(const std::string& str, EscrowMode& mode)
{
    if (str == "platform") mode = EscrowMode::PLATFORM;
    else if (str == "multisig") mode = EscrowMode::MULTISIG;
    else return false;
    return true;
}

std::string CurrencyToString(Currency currency)
{
    switch (currency) {
    case Currency::BSV: return "BSV";
    case Currency::MNEE: return "MNEE";
    }
    return "unknown";
}

bool CurrencyFromString(const std::string& str, Currency& currency)
{
    if (str == "BSV") currency = Currency::BSV;
    else if (str == "MNEE") currency = Currency::MNEE;
    else return false;
    return true;
}

std::string SettlementActionToString(SettlementAction action)
{
    switch (action) {
    case SettlementAction::RELEASE: return "release";
    case SettlementAction::REFUND: return "refund";
    }
    return "unknown";
}

bool SettlementActionFromString(const std::string& str, SettlementAction& action)
{
    if (str == "release") action = SettlementAction::RELEASE;
    else if (str == "refund") action = SettlementAction::REFUND;
    else return false;
    return true;
}

std::string SettlementActorTypeToString(SettlementActorType type)
{
    switch (type) {
    case SettlementActorType::BUYER: return "buyer";
    case SettlementActorType::SELLER: return "seller";
    case SettlementActorType::ADMIN: return "admin";
    }
    return "unknown";
}

bool SettlementActorTypeFromString(const std::string& str, SettlementActorType& type)
{
    if (str == "buyer") type = SettlementActorType::BUYER;
    else if (str == "seller") type = SettlementActorType::SELLER;
    else if (str == "admin") type = SettlementActorType::ADMIN;
    else return false;
    return true;
}

bool IsFinalPaymentStatus(PaymentStatus status)
{
    return status == PaymentStatus::RELEASED || status == PaymentStatus::REFUNDED;
}

std::string CPayment::ToString() const
{
    return strprintf("CPayment(id=%s, status=%s, mode=%s, amount=%d %s, fee=%d)",
                     id, PaymentStatusToString(status), EscrowModeToString(escrowMode),
                     nAmount, CurrencyToString(currency), nPlatformFee);
}
