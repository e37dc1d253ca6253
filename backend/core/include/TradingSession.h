#pragma once

#include "BalanceResolver.h"
#include "ChainConnection.h"
#include "EnvironmentConfig.h"
#include "KeyMaterial.h"

#include <memory>
#include <optional>
#include <string>

namespace WalletAPI {

/**
 * @brief Keypair and chain connection shared by the operations of one trading session
 *
 * Built once from configuration and read-only afterwards. A missing key or RPC URL is a
 * normal state: the session then answers IsTradingEnabled() == false.
 */
class TradingSession {
public:
    TradingSession() = default;
    TradingSession(std::optional<KeyMaterial::Keypair> keypair,
                   std::unique_ptr<SolanaService::ChainConnection> connection);

    TradingSession(TradingSession&&) = default;
    TradingSession& operator=(TradingSession&&) = default;

    /**
     * @brief Decode the configured key once and open the configured endpoint
     */
    static TradingSession FromConfig(const Config::EnvironmentConfig& config);

    const KeyMaterial::Keypair* GetKeypair() const;
    SolanaService::ChainConnection* GetConnection() const { return m_connection.get(); }

    bool IsTradingEnabled() const { return GetKeypair() != nullptr && m_connection != nullptr; }

    // Empty when no key is loaded
    std::string WalletAddress() const;

    // Decoder diagnostic when the configured key was rejected
    const std::string& KeyError() const { return m_keyError; }

    BalanceSnapshot RefreshBalances(const std::string& tokenAddress, int tokenDecimals,
                                    int networkId = SOLANA_MAINNET_NETWORK_ID) const;

private:
    std::optional<KeyMaterial::Keypair> m_keypair;
    std::unique_ptr<SolanaService::ChainConnection> m_connection;
    std::string m_keyError;
};

} // namespace WalletAPI
