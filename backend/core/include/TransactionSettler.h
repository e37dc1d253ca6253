#pragma once

#include "ChainConnection.h"
#include "KeyMaterial.h"
#include "SolanaTransaction.h"
#include "WalletTypes.h"

#include <functional>
#include <string>

namespace WalletAPI {

enum class SettlementStage {
    Signing,
    Sending,
    Confirming
};

const char* SettlementStageToString(SettlementStage stage);

/**
 * @brief Terminal state of one settlement attempt
 *
 * `signature` is set whenever the transaction reached the node, so a ConfirmationFailed
 * or TradeFailed outcome still names the transaction to look up.
 */
struct SettlementOutcome {
    bool confirmed;
    std::string signature;
    ErrorCode errorCode;
    std::string reason;

    SettlementOutcome() : confirmed(false), errorCode(ErrorCode::None) {}

    static SettlementOutcome Confirmed(const std::string& signature);
    static SettlementOutcome Failed(ErrorCode code, const std::string& reason, const std::string& signature = "");

    bool IsConfirmed() const { return confirmed; }
};

using SettlementProgressCallback = std::function<void(SettlementStage)>;

/**
 * @brief Signs, submits and confirms one unsigned transaction
 *
 * Stages run strictly in order and each failure is terminal. Nothing is retried; a
 * ConfirmationFailed outcome means the transaction may still have landed.
 */
class TransactionSettler {
public:
    static constexpr const char* TRADE_FAILED_REASON = "Trade failed";

    explicit TransactionSettler(SolanaService::Commitment commitment = SolanaService::Commitment::Confirmed)
        : m_commitment(commitment) {}

    SettlementOutcome Settle(SolanaService::UnsignedTransaction&& unsignedTx,
                             const KeyMaterial::Keypair* keypair,
                             SolanaService::ChainConnection* connection,
                             const SettlementProgressCallback& onProgress = nullptr) const;

private:
    SolanaService::Commitment m_commitment;
};

} // namespace WalletAPI
