#include "BalanceResolver.h"
#include "Logger.h"
#include "TokenAccounts.h"

namespace WalletAPI {

using SolanaService::PublicKey;

const char* TokenBalanceStatusToString(TokenBalanceStatus status) {
    switch (status) {
        case TokenBalanceStatus::Resolved:
            return "resolved";
        case TokenBalanceStatus::AccountNotFound:
            return "account-not-found";
        case TokenBalanceStatus::ForeignChain:
            return "foreign-chain";
        case TokenBalanceStatus::MalformedAddress:
            return "malformed-address";
        case TokenBalanceStatus::MintNotFound:
            return "mint-not-found";
        case TokenBalanceStatus::QueryFailed:
            return "query-failed";
        case TokenBalanceStatus::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

BalanceSnapshot BalanceResolver::Resolve(const std::string& walletAddress,
                                         const std::string& tokenAddress,
                                         SolanaService::ChainConnection& connection,
                                         int tokenDecimals,
                                         int nativeDecimals,
                                         int networkId) const {
    BalanceSnapshot snapshot;
    snapshot.tokenFormat = ClassifyAddress(tokenAddress);

    if (networkId != SOLANA_MAINNET_NETWORK_ID) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Unsupported network, balances not queried",
                            "Network ID: " + std::to_string(networkId));
        return snapshot;
    }

    PublicKey owner{};
    if (!SolanaService::DecodePublicKey(walletAddress, owner)) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Malformed wallet address, balances not queried",
                            "Wallet: " + walletAddress);
        return snapshot;
    }

    auto native = connection.GetBalance(walletAddress);
    if (native) {
        snapshot.nativeAtomic = *native;
    } else {
        SOLDESK_LOG_ERROR("BalanceResolver", "Native balance query failed", native.errorMessage);
    }
    snapshot.nativeBalance = snapshot.nativeAtomic.ToDecimalString(nativeDecimals);

    if (IsForeignChainFormat(snapshot.tokenFormat)) {
        SOLDESK_LOG_INFO("BalanceResolver", "Foreign chain token address, token balance not queried",
                         std::string("Format: ") + AddressFormatToString(snapshot.tokenFormat) +
                             " | Token: " + tokenAddress);
        snapshot.tokenStatus = TokenBalanceStatus::ForeignChain;
    } else if (snapshot.tokenFormat == AddressFormat::Malformed) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Malformed token address, token balance not queried",
                            "Token: '" + tokenAddress + "'");
        snapshot.tokenStatus = TokenBalanceStatus::MalformedAddress;
    } else {
        snapshot.tokenStatus = resolveToken(owner, tokenAddress, connection, snapshot.tokenAtomic);
    }

    snapshot.tokenBalance = snapshot.tokenAtomic.ToDecimalString(tokenDecimals);

    SOLDESK_LOG_DEBUG("BalanceResolver", "Balances resolved",
                      "Native: " + snapshot.nativeBalance + " | Token: " + snapshot.tokenBalance +
                          " (" + TokenBalanceStatusToString(snapshot.tokenStatus) + ")");
    return snapshot;
}

TokenBalanceStatus BalanceResolver::resolveToken(const PublicKey& owner,
                                                 const std::string& tokenAddress,
                                                 SolanaService::ChainConnection& connection,
                                                 AtomicAmount& amount) const {
    amount = AtomicAmount::Zero();

    PublicKey mint{};
    if (!SolanaService::DecodePublicKey(tokenAddress, mint)) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Malformed token address, mint is not 32 bytes",
                            "Token: " + tokenAddress);
        return TokenBalanceStatus::MalformedAddress;
    }

    auto mint_info = connection.GetAccountInfo(tokenAddress);
    if (!mint_info) {
        SOLDESK_LOG_ERROR("BalanceResolver", "Mint lookup failed", mint_info.errorMessage);
        return TokenBalanceStatus::QueryFailed;
    }
    if (!mint_info->has_value()) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Mint not found", "Token: " + tokenAddress);
        return TokenBalanceStatus::MintNotFound;
    }

    const std::string& token_program_id = (*mint_info)->owner;
    if (!SolanaService::TokenAccounts::IsTokenProgram(token_program_id)) {
        SOLDESK_LOG_WARNING("BalanceResolver", "Mint is not owned by a token program",
                            "Token: " + tokenAddress + " | Owner: " + token_program_id);
        return TokenBalanceStatus::MintNotFound;
    }

    PublicKey token_program{};
    if (!SolanaService::DecodePublicKey(token_program_id, token_program)) {
        return TokenBalanceStatus::MintNotFound;
    }

    auto ata = SolanaService::TokenAccounts::GetAssociatedTokenAddress(owner, mint, token_program);
    if (!ata.has_value()) {
        SOLDESK_LOG_ERROR("BalanceResolver", "Could not derive associated token account",
                          "Token: " + tokenAddress);
        return TokenBalanceStatus::QueryFailed;
    }
    std::string ata_address = SolanaService::EncodePublicKey(*ata);

    auto balance = connection.GetTokenAccountBalance(ata_address);
    if (!balance) {
        SOLDESK_LOG_ERROR("BalanceResolver", "Token balance query failed",
                          "Account: " + ata_address + " | " + balance.errorMessage);
        return TokenBalanceStatus::QueryFailed;
    }
    if (!balance->has_value()) {
        SOLDESK_LOG_INFO("BalanceResolver", "Token account does not exist, balance is zero",
                         "Account: " + ata_address);
        return TokenBalanceStatus::AccountNotFound;
    }

    amount = **balance;
    return TokenBalanceStatus::Resolved;
}

} // namespace WalletAPI
