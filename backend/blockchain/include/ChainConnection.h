#pragma once

#include "AtomicAmount.h"
#include "SolanaTransaction.h"
#include "WalletTypes.h"

#include <cstdint>
#include <optional>
#include <string>

namespace SolanaService {

/**
 * @brief Confirmation depth requested from the cluster
 */
enum class Commitment {
    Processed,
    Confirmed,
    Finalized
};

const char* CommitmentToString(Commitment commitment);

/**
 * @brief Subset of an account's metadata needed to route token queries
 */
struct AccountInfo {
    std::string owner;  // Base58 id of the owning program
    uint64_t lamports;
    bool executable;

    AccountInfo() : lamports(0), executable(false) {}
};

/**
 * @brief Recent blockhash and the last block height at which it is still accepted
 */
struct BlockhashContext {
    std::string blockhash;
    uint64_t lastValidBlockHeight;

    BlockhashContext() : lastValidBlockHeight(0) {}
};

struct ConfirmationResult {
    uint64_t slot;
    std::optional<std::string> executionError;  // Serialized on-chain error, if the transaction failed

    ConfirmationResult() : slot(0) {}
};

/**
 * @brief Long-lived handle to one Solana RPC endpoint
 *
 * Stateless per call. Every operation reports transport and JSON-RPC failures through
 * Result; "account does not exist" is a successful empty optional, not an error.
 */
class ChainConnection {
public:
    virtual ~ChainConnection() = default;

    virtual WalletAPI::Result<WalletAPI::AtomicAmount> GetBalance(const std::string& address) = 0;

    virtual WalletAPI::Result<std::optional<AccountInfo>> GetAccountInfo(const std::string& address) = 0;

    virtual WalletAPI::Result<std::optional<WalletAPI::AtomicAmount>> GetTokenAccountBalance(
        const std::string& tokenAccount) = 0;

    /**
     * @return Signature reported by the node
     */
    virtual WalletAPI::Result<std::string> SendTransaction(const SignedTransaction& transaction) = 0;

    virtual WalletAPI::Result<BlockhashContext> GetLatestBlockhash() = 0;

    /**
     * @brief Wait until the signature reaches `commitment` or the blockhash expires
     */
    virtual WalletAPI::Result<ConfirmationResult> ConfirmTransaction(const std::string& signature,
                                                                     const BlockhashContext& context,
                                                                     Commitment commitment) = 0;
};

} // namespace SolanaService
