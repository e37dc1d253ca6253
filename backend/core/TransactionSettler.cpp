#include "TransactionSettler.h"
#include "Logger.h"

namespace WalletAPI {

const char* SettlementStageToString(SettlementStage stage) {
    switch (stage) {
        case SettlementStage::Signing:
            return "signing";
        case SettlementStage::Sending:
            return "sending";
        case SettlementStage::Confirming:
            return "confirming";
        default:
            return "unknown";
    }
}

SettlementOutcome SettlementOutcome::Confirmed(const std::string& signature) {
    SettlementOutcome outcome;
    outcome.confirmed = true;
    outcome.signature = signature;
    return outcome;
}

SettlementOutcome SettlementOutcome::Failed(ErrorCode code, const std::string& reason,
                                            const std::string& signature) {
    SettlementOutcome outcome;
    outcome.errorCode = code;
    outcome.reason = reason;
    outcome.signature = signature;
    return outcome;
}

SettlementOutcome TransactionSettler::Settle(SolanaService::UnsignedTransaction&& unsignedTx,
                                             const KeyMaterial::Keypair* keypair,
                                             SolanaService::ChainConnection* connection,
                                             const SettlementProgressCallback& onProgress) const {
    auto report = [&onProgress](SettlementStage stage) {
        if (onProgress) {
            onProgress(stage);
        }
    };

    if (keypair == nullptr || !keypair->IsValid() || connection == nullptr) {
        SOLDESK_LOG_WARNING("TransactionSettler", "Settlement rejected, wallet not initialized");
        return SettlementOutcome::Failed(ErrorCode::WalletNotInitialized,
                                         "Wallet not initialized. Configure the RPC URL and private key.");
    }

    SOLDESK_SCOPED_LOG("TransactionSettler", "Settle");
    _scopedLogger.addContext("wallet", keypair->PublicKeyBase58());

    // Sign
    report(SettlementStage::Signing);
    auto signed_tx = SolanaService::SignTransaction(std::move(unsignedTx), *keypair);
    if (!signed_tx) {
        std::string reason = "Sign failed: " + signed_tx.errorMessage;
        _scopedLogger.failure(reason);
        return SettlementOutcome::Failed(ErrorCode::SignFailed, reason);
    }

    // Submit
    report(SettlementStage::Sending);
    auto submitted = connection->SendTransaction(*signed_tx);
    if (!submitted) {
        std::string reason = "Submit failed: " + submitted.errorMessage;
        _scopedLogger.failure(reason);
        return SettlementOutcome::Failed(ErrorCode::SubmitFailed, reason);
    }
    std::string signature = *submitted;
    _scopedLogger.addContext("signature", signature);

    // Confirm
    report(SettlementStage::Confirming);
    auto blockhash = connection->GetLatestBlockhash();
    if (!blockhash) {
        std::string reason = "Confirmation failed: " + blockhash.errorMessage +
                             ". The transaction may still have landed";
        _scopedLogger.failure(reason);
        return SettlementOutcome::Failed(ErrorCode::ConfirmationFailed, reason, signature);
    }

    auto confirmation = connection->ConfirmTransaction(signature, *blockhash, m_commitment);
    if (!confirmation) {
        std::string reason = "Confirmation failed: " + confirmation.errorMessage +
                             ". The transaction may still have landed";
        _scopedLogger.failure(reason);
        return SettlementOutcome::Failed(ErrorCode::ConfirmationFailed, reason, signature);
    }

    // Evaluate
    if (confirmation->executionError.has_value()) {
        _scopedLogger.failure(TRADE_FAILED_REASON, *confirmation->executionError);
        return SettlementOutcome::Failed(ErrorCode::TradeFailed, TRADE_FAILED_REASON, signature);
    }

    _scopedLogger.success("Slot: " + std::to_string(confirmation->slot));
    return SettlementOutcome::Confirmed(signature);
}

} // namespace WalletAPI
