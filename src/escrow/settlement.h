// Copyright (c) 2025 The AgentPay developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGENTPAY_ESCROW_SETTLEMENT_H
#define AGENTPAY_ESCROW_SETTLEMENT_H

/**
 * Settlement engine: the payment state machine.
 *
 *   pending  -> escrowed             funds verified
 *   escrowed -> released | refunded  quorum for the action is ready
 *   escrowed -> disputed             buyer opened a dispute
 *   disputed -> released | refunded  dispute resolver, same quorum rules
 *   disputed -> escrowed             dispute resolver, on dispute expiry
 *
 * Release and refund apply only from the expected state and return
 * boost::none otherwise, so they are safe to retry. The final write of each
 * transition is conditional on the state read at its start.
 *
 * A quorum is two distinct actor types among buyer, seller and admin, each
 * backed by a signature over GetSettlementMessage().
 */

#include "escrow/payment.h"
#include "escrow/paymentdb.h"
#include "escrow/txbuilder.h"
#include "optional.h"

#include <string>
#include <vector>

class CChainClient;
class CDisputeResolver;
class CKey;
class CWalletManager;
class SQLiteDatabase;

static const int64_t DEFAULT_PLATFORM_FEE_BPS = 200;
static const int SETTLEMENT_QUORUM_SIZE = 2;
static const int SETTLEMENT_MESSAGE_VERSION = 1;
static const char* const SETTLEMENT_DOMAIN = "agentpay.settlement.approval";
static const char* const SETTLEMENT_MESSAGE_PREFIX = "AgentPaySettlement:";

struct CSettlementOptions
{
    EscrowMode escrowMode{EscrowMode::PLATFORM};
    //! Wallet holding platform escrow; required for platform custody.
    Optional<std::string> platformWalletId;
    //! Third key of the 2-of-3 escrow script; required in multisig mode.
    std::string adminMultisigPubKey;
    //! Admin addresses whose settlement signatures are accepted.
    std::vector<std::string> adminAllowList;
    int64_t nPlatformFeeBps{DEFAULT_PLATFORM_FEE_BPS};
    FeePolicy feePolicy;
};

struct CPaymentRequest
{
    std::string serviceId;
    std::string buyerWalletId;
    std::string sellerWalletId;
    CAmount nAmount{0};
    Currency currency{Currency::BSV};
    Optional<std::string> contractId;
};

class CSettlementEngine
{
    friend class CDisputeResolver;

public:
    CSettlementEngine(SQLiteDatabase& db, CWalletManager& wallets, CChainClient& chain, const CSettlementOptions& options);

    const CSettlementOptions& GetOptions() const { return m_options; }

    /** ceil(amount * bps / 10000) */
    CAmount CalculatePlatformFee(CAmount nAmount) const;

    /**
     * Open a payment and fund its escrow from the buyer's wallet.
     *
     * The payment is stored as pending first and marked escrowed once the
     * funding transaction is accepted, after which the default approvals
     * are seeded. A funding failure leaves the pending record for a later
     * MarkEscrowed().
     *
     * @throws ValidationError, NotFoundError, InsufficientFundsError, ExternalServiceError
     */
    CPayment Create(const CPaymentRequest& request);

    /**
     * External funding confirmation. boost::none unless the payment was pending.
     *
     * For BSV payments the output txid:nVout must be unspent on chain, pay
     * the payment's escrow script and hold at least its amount.
     *
     * @throws ValidationError when nVout is missing or the output does not fund the escrow
     */
    Optional<CPayment> MarkEscrowed(const std::string& paymentId, const std::string& txid,
                                    const Optional<int64_t>& nVout = boost::none);

    /**
     * Pay the seller. Returns boost::none unless the payment is escrowed.
     *
     * @param adminTxSignature admin co-signature of the multisig spend, any
     *        accepted encoding; without it the buyer's key co-signs
     * @throws AuthError when the release quorum is not ready
     */
    Optional<CPayment> Release(const std::string& paymentId,
                               const Optional<std::string>& adminTxSignature = boost::none);

    /** Return the funds to the buyer. Same contract as Release(). */
    Optional<CPayment> Refund(const std::string& paymentId,
                              const Optional<std::string>& adminTxSignature = boost::none);

    Optional<CPayment> GetPayment(const std::string& paymentId) const;
    std::vector<CPayment> ListByWallet(const std::string& walletId, PaymentRole role = PaymentRole::ANY) const;

    /**
     * Domain separated message binding a payment and an action:
     * "AgentPaySettlement:" + sha256(sorted-key JSON of the payment identity).
     * @throws NotFoundError
     */
    std::string GetSettlementMessage(const std::string& paymentId, SettlementAction action) const;

    CSettlementQuorum GetSettlementQuorum(const std::string& paymentId, SettlementAction action) const;

    std::vector<CSettlementApproval> GetSettlementApprovals(const std::string& paymentId,
                                                            const Optional<SettlementAction>& action = boost::none) const;

    /** Sign and record an approval with a party's own stored key. */
    CSettlementApproval CreateAutoWalletApproval(const std::string& paymentId, SettlementAction action,
                                                 SettlementActorType actorType);

    /**
     * Record a party's externally produced approval.
     * @throws AuthError if walletId is neither buyer nor seller
     * @throws CryptoVerificationError if the signature does not verify
     */
    CSettlementApproval CreateWalletApproval(const std::string& paymentId, SettlementAction action,
                                             const std::string& walletId, const std::string& signature);

    /**
     * Record an admin approval. The signature must recover to adminAddress,
     * which must be on the allow-list.
     * @throws AuthError, CryptoVerificationError
     */
    CSettlementApproval CreateAdminApproval(const std::string& paymentId, SettlementAction action,
                                            const std::string& adminAddress, const std::string& signature);

    /**
     * Unsigned multisig spend for the admin to co-sign.
     * boost::none unless the payment is a BSV multisig escrow.
     */
    Optional<MultisigSigningPayload> GetAdminMultisigSigningPayload(const std::string& paymentId,
                                                                    SettlementAction action) const;

    /**
     * Bind a downstream consumer to the payment, set-if-absent.
     * @return the reference bound after the call (the first one ever bound)
     */
    std::string BindConsumption(const std::string& paymentId, const std::string& consumerRef);

    /** Whether addr is an allow-listed admin address. */
    bool IsAllowListedAdmin(const std::string& address) const;

private:
    SQLiteDatabase& m_db;
    CWalletManager& m_wallets;
    CChainClient& m_chain;
    CSettlementOptions m_options;

    // Dispute resolver hooks
    bool MarkDisputed(const std::string& paymentId);
    Optional<CPayment> SettleDisputed(const std::string& paymentId, SettlementAction action,
                                      const Optional<std::string>& adminTxSignature);
    bool ReturnToEscrow(const std::string& paymentId);

    Optional<CPayment> Settle(const std::string& paymentId, SettlementAction action, PaymentStatus expected,
                              const Optional<std::string>& adminTxSignature);

    //! spent receives the platform coins a transfer consumed
    std::string ExecuteSettlementTransfer(const CPayment& payment, SettlementAction action,
                                          const Optional<std::string>& adminTxSignature, std::vector<CUtxo>& spent);
    std::string ExecutePlatformTransfer(const CPayment& payment, SettlementAction action, std::vector<CUtxo>& spent);
    std::string ExecuteMultisigSpend(const CPayment& payment, SettlementAction action,
                                     const Optional<std::string>& adminTxSignature);

    CScript BuildMultisigEscrowScript(const CPayment& payment) const;
    CScript GetEscrowLockingScript(const CPayment& payment) const;
    void FundEscrow(CPayment& payment);
    void CheckEscrowOutput(const CPayment& payment, const std::string& txid, int64_t nVout);

    std::vector<CRecipient> GetMultisigOutputs(const CPayment& payment, SettlementAction action) const;
    CUtxo GetEscrowUtxo(const CPayment& payment) const;

    void EnsureSettlementQuorum(const CPayment& payment, SettlementAction action);
    void SeedDefaultApprovals(const std::string& paymentId);
    CSettlementApproval RecordApproval(const CPayment& payment, SettlementAction action, SettlementActorType actorType,
                                       const std::string& actorId, const std::string& signature);

    CPayment ReadPaymentOrThrow(const std::string& paymentId) const;
    std::string GetPlatformWalletId() const;
};

/** The settlement message for a payment record. */
std::string ComputeSettlementMessage(const CPayment& payment, SettlementAction action);

#endif // AGENTPAY_ESCROW_SETTLEMENT_H
