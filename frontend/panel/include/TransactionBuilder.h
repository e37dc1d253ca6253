#pragma once

#include "SolanaTransaction.h"
#include "WalletTypes.h"

#include <string>

namespace Frontend {

enum class TradeDirection {
    Buy,
    Sell
};

const char* TradeDirectionToString(TradeDirection direction);

/**
 * @brief What the operator asked for; `value` is a SOL amount for buys, a percentage for sells
 */
struct TradeRequest {
    TradeDirection direction;
    double value;
    std::string signer;  // Base58 wallet address that must sign
};

/**
 * @brief External service that turns a trade request into an unsigned transaction
 */
class TransactionBuilder {
public:
    virtual ~TransactionBuilder() = default;

    virtual WalletAPI::Result<SolanaService::UnsignedTransaction> Build(const TradeRequest& request) = 0;
};

} // namespace Frontend
