#include "TradingSession.h"
#include "Logger.h"
#include "SolanaService.h"

namespace WalletAPI {

TradingSession::TradingSession(std::optional<KeyMaterial::Keypair> keypair,
                               std::unique_ptr<SolanaService::ChainConnection> connection)
    : m_keypair(std::move(keypair)), m_connection(std::move(connection)) {}

TradingSession TradingSession::FromConfig(const Config::EnvironmentConfig& config) {
    TradingSession session;

    if (!config.privateKey.empty()) {
        auto decoded = KeyMaterial::Decode(config.privateKey);
        if (decoded) {
            session.m_keypair = std::move(decoded.data);
            SOLDESK_LOG_INFO("TradingSession", "Signing key loaded",
                             "Wallet: " + session.m_keypair->PublicKeyBase58() + " | Format: " +
                                 KeyMaterial::KeyFormatToString(session.m_keypair->SourceFormat()));
        } else {
            session.m_keyError = decoded.errorMessage;
            SOLDESK_LOG_ERROR("TradingSession", "Configured private key rejected, trading disabled");
        }
    }

    if (config.HasRpcUrl()) {
        session.m_connection = std::make_unique<SolanaService::SolanaRpcClient>(config.rpcUrl);
        SOLDESK_LOG_INFO("TradingSession", "RPC endpoint configured", config.rpcUrl);
    }

    return session;
}

const KeyMaterial::Keypair* TradingSession::GetKeypair() const {
    if (!m_keypair.has_value() || !m_keypair->IsValid()) {
        return nullptr;
    }
    return &(*m_keypair);
}

std::string TradingSession::WalletAddress() const {
    const KeyMaterial::Keypair* keypair = GetKeypair();
    return keypair != nullptr ? keypair->PublicKeyBase58() : std::string();
}

BalanceSnapshot TradingSession::RefreshBalances(const std::string& tokenAddress, int tokenDecimals,
                                                int networkId) const {
    if (!IsTradingEnabled()) {
        SOLDESK_LOG_WARNING("TradingSession", "Balance refresh skipped, wallet not initialized");
        BalanceSnapshot empty;
        empty.tokenFormat = ClassifyAddress(tokenAddress);
        return empty;
    }

    BalanceResolver resolver;
    return resolver.Resolve(WalletAddress(), tokenAddress, *m_connection, tokenDecimals,
                            SOLANA_NATIVE_DECIMALS, networkId);
}

} // namespace WalletAPI
