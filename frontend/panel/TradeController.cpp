#include "TradeController.h"
#include "Logger.h"

#include <cmath>
#include <thread>

namespace Frontend {

using WalletAPI::ErrorCode;
using WalletAPI::SettlementOutcome;
using WalletAPI::SettlementStage;

const char* TradeDirectionToString(TradeDirection direction) {
    return direction == TradeDirection::Buy ? "buy" : "sell";
}

namespace {

class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag) : m_flag(flag) {}
    ~InFlightGuard() { m_flag.store(false); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<bool>& m_flag;
};

} // namespace

TradeController::TradeController(const WalletAPI::TradingSession& session,
                                 TransactionBuilder& builder,
                                 BalanceRefresh onRefresh,
                                 std::chrono::milliseconds refreshDelay)
    : m_session(session),
      m_builder(builder),
      m_onRefresh(std::move(onRefresh)),
      m_refreshDelay(refreshDelay),
      m_inFlight(false) {}

std::string TradeController::ProgressMessage(SettlementStage stage) {
    switch (stage) {
        case SettlementStage::Signing:
            return "Signing transaction...";
        case SettlementStage::Sending:
            return "Sending transaction...";
        case SettlementStage::Confirming:
            return "Confirming transaction...";
        default:
            return "";
    }
}

std::string TradeController::SuccessMessage(const std::string& signature) {
    return "Trade successful! TX: " + signature.substr(0, 8) + "...";
}

SettlementOutcome TradeController::ExecuteTrade(TradeDirection direction, double value,
                                                const ProgressNotifier& notify) {
    auto emit = [&notify](const std::string& message) {
        if (notify) {
            notify(message);
        }
    };

    if (!m_session.IsTradingEnabled()) {
        SettlementOutcome outcome = SettlementOutcome::Failed(
            ErrorCode::WalletNotInitialized,
            "Wallet not initialized. Please check your SOLDESK_PRIVATE_KEY and SOLDESK_RPC_URL configuration.");
        emit(outcome.reason);
        return outcome;
    }

    bool expected = false;
    if (!m_inFlight.compare_exchange_strong(expected, true)) {
        SOLDESK_LOG_WARNING("TradeController", "Trade rejected, settlement already in progress");
        SettlementOutcome outcome =
            SettlementOutcome::Failed(ErrorCode::SettlementInProgress, "A trade is already being settled");
        emit(outcome.reason);
        return outcome;
    }
    InFlightGuard guard(m_inFlight);

    if (!std::isfinite(value) || value <= 0.0 ||
        (direction == TradeDirection::Sell && value > MAX_SELL_PERCENTAGE)) {
        SettlementOutcome outcome =
            SettlementOutcome::Failed(ErrorCode::BuildFailed, "Build failed: invalid trade amount");
        emit(outcome.reason);
        return outcome;
    }

    emit("Submitting trade request...");
    TradeRequest request{direction, value, m_session.WalletAddress()};
    SOLDESK_LOG_INFO("TradeController", "Requesting transaction",
                     std::string("Direction: ") + TradeDirectionToString(direction) +
                         " | Value: " + std::to_string(value));

    auto built = m_builder.Build(request);
    if (!built) {
        SettlementOutcome outcome =
            SettlementOutcome::Failed(ErrorCode::BuildFailed, "Build failed: " + built.errorMessage);
        SOLDESK_LOG_ERROR("TradeController", "Transaction builder failed", built.errorMessage);
        emit(outcome.reason);
        return outcome;
    }

    SettlementOutcome outcome = m_settler.Settle(std::move(built.data), m_session.GetKeypair(),
                                                 m_session.GetConnection(),
                                                 [&emit](SettlementStage stage) { emit(ProgressMessage(stage)); });

    if (!outcome.IsConfirmed()) {
        emit(outcome.reason);
        return outcome;
    }

    emit(SuccessMessage(outcome.signature));

    if (m_onRefresh) {
        std::this_thread::sleep_for(m_refreshDelay);
        m_onRefresh();
    }
    return outcome;
}

} // namespace Frontend
