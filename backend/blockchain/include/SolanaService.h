#pragma once

#include "ChainConnection.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace SolanaService {

struct HttpResponse {
    long statusCode;
    std::string body;
    std::string error;  // Transport failure (DNS, TLS, timeout); empty when a response arrived

    HttpResponse() : statusCode(0) {}
};

/**
 * @brief Performs one HTTP POST of a JSON body; replaceable for offline use
 */
using HttpTransport = std::function<HttpResponse(const std::string& url, const std::string& body)>;

/**
 * @brief JSON-RPC 2.0 client for a Solana cluster
 *
 * Uses cpr over HTTPS with certificate validation and a 10 second request timeout.
 */
class SolanaRpcClient : public ChainConnection {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 10000;
    static constexpr int DEFAULT_POLL_INTERVAL_MS = 500;

    explicit SolanaRpcClient(const std::string& rpcUrl, Commitment commitment = Commitment::Confirmed);

    void SetTransport(HttpTransport transport);
    void SetPollInterval(std::chrono::milliseconds interval);

    WalletAPI::Result<WalletAPI::AtomicAmount> GetBalance(const std::string& address) override;
    WalletAPI::Result<std::optional<AccountInfo>> GetAccountInfo(const std::string& address) override;
    WalletAPI::Result<std::optional<WalletAPI::AtomicAmount>> GetTokenAccountBalance(
        const std::string& tokenAccount) override;
    WalletAPI::Result<std::string> SendTransaction(const SignedTransaction& transaction) override;
    WalletAPI::Result<BlockhashContext> GetLatestBlockhash() override;
    WalletAPI::Result<ConfirmationResult> ConfirmTransaction(const std::string& signature,
                                                             const BlockhashContext& context,
                                                             Commitment commitment) override;

    WalletAPI::Result<uint64_t> GetBlockHeight();

    /**
     * @brief Build a JSON-RPC 2.0 request body
     */
    static std::string BuildRequest(uint64_t id, const std::string& method, const nlohmann::json& params);

    /**
     * @brief True if a JSON-RPC error means the queried account does not exist
     */
    static bool IsAccountNotFoundError(const std::string& message);

    /**
     * @brief True once `status` (processed/confirmed/finalized) satisfies `requested`
     */
    static bool MeetsCommitment(const std::string& status, Commitment requested);

private:
    WalletAPI::Result<nlohmann::json> call(const std::string& method, const nlohmann::json& params);
    HttpResponse postJson(const std::string& body) const;

    std::string m_rpcUrl;
    Commitment m_commitment;
    HttpTransport m_transport;
    std::chrono::milliseconds m_pollInterval;
    std::chrono::milliseconds m_requestTimeout;
    std::atomic<uint64_t> m_nextId;
};

} // namespace SolanaService
