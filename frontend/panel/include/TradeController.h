#pragma once

#include "TradingSession.h"
#include "TransactionBuilder.h"
#include "TransactionSettler.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace Frontend {

using ProgressNotifier = std::function<void(const std::string& message)>;
using BalanceRefresh = std::function<void()>;

/**
 * @brief The trading panel's trade action: build, settle, then refresh balances once
 */
class TradeController {
public:
    static constexpr int DEFAULT_REFRESH_DELAY_MS = 1000;
    static constexpr double MAX_SELL_PERCENTAGE = 100.0;

    TradeController(const WalletAPI::TradingSession& session,
                    TransactionBuilder& builder,
                    BalanceRefresh onRefresh,
                    std::chrono::milliseconds refreshDelay = std::chrono::milliseconds(DEFAULT_REFRESH_DELAY_MS));

    /**
     * @brief Run one trade to a terminal outcome
     *
     * Rejected without any builder or network call when trading is disabled or another
     * settlement is still in flight. `notify` receives the progress and final messages.
     */
    WalletAPI::SettlementOutcome ExecuteTrade(TradeDirection direction, double value,
                                              const ProgressNotifier& notify = nullptr);

    bool IsSettling() const { return m_inFlight.load(); }

    static std::string ProgressMessage(WalletAPI::SettlementStage stage);
    static std::string SuccessMessage(const std::string& signature);

private:
    const WalletAPI::TradingSession& m_session;
    TransactionBuilder& m_builder;
    BalanceRefresh m_onRefresh;
    std::chrono::milliseconds m_refreshDelay;
    WalletAPI::TransactionSettler m_settler;
    std::atomic<bool> m_inFlight;
};

} // namespace Frontend
