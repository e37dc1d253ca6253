#pragma once

#include "AddressFormat.h"
#include "AtomicAmount.h"
#include "ChainConnection.h"

#include <string>

namespace WalletAPI {

constexpr int SOLANA_MAINNET_NETWORK_ID = 101;
constexpr int SOLANA_NATIVE_DECIMALS = 9;

/**
 * @brief Why a token balance came out the way it did
 */
enum class TokenBalanceStatus {
    Resolved,            // Read from the wallet's associated token account
    AccountNotFound,     // Associated token account does not exist yet
    ForeignChain,        // Module-qualified or hex address; never queried
    MalformedAddress,    // Token address is not a usable Base58 mint
    MintNotFound,        // Mint account missing or not owned by a token program
    QueryFailed,         // RPC failure while resolving
    Skipped              // Wallet malformed or network unsupported
};

const char* TokenBalanceStatusToString(TokenBalanceStatus status);

struct BalanceSnapshot {
    AtomicAmount nativeAtomic;
    std::string nativeBalance;
    AtomicAmount tokenAtomic;
    std::string tokenBalance;
    AddressFormat tokenFormat;
    TokenBalanceStatus tokenStatus;

    BalanceSnapshot()
        : nativeBalance("0.0"),
          tokenBalance("0.0"),
          tokenFormat(AddressFormat::Malformed),
          tokenStatus(TokenBalanceStatus::Skipped) {}
};

/**
 * @brief Reads native and token balances for one wallet
 *
 * Never fails: every error path degrades to a zero balance and one log line. Nothing is
 * cached; each call queries the chain again.
 */
class BalanceResolver {
public:
    BalanceSnapshot Resolve(const std::string& walletAddress,
                            const std::string& tokenAddress,
                            SolanaService::ChainConnection& connection,
                            int tokenDecimals,
                            int nativeDecimals,
                            int networkId = SOLANA_MAINNET_NETWORK_ID) const;

private:
    TokenBalanceStatus resolveToken(const SolanaService::PublicKey& owner,
                                    const std::string& tokenAddress,
                                    SolanaService::ChainConnection& connection,
                                    AtomicAmount& amount) const;
};

} // namespace WalletAPI
