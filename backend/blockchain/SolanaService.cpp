#include "SolanaService.h"
#include "Logger.h"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>
#include <thread>

using json = nlohmann::json;

namespace SolanaService {

using WalletAPI::AtomicAmount;
using WalletAPI::ErrorCode;
using WalletAPI::Result;

const char* CommitmentToString(Commitment commitment) {
    switch (commitment) {
        case Commitment::Processed:
            return "processed";
        case Commitment::Confirmed:
            return "confirmed";
        case Commitment::Finalized:
            return "finalized";
        default:
            return "confirmed";
    }
}

namespace {

int CommitmentRank(const std::string& status) {
    if (status == "processed")
        return 0;
    if (status == "confirmed")
        return 1;
    if (status == "finalized")
        return 2;
    return -1;
}

template<typename T>
Result<T> Forward(const Result<json>& failed) {
    return Result<T>(failed.errorCode, failed.errorMessage);
}

} // namespace

SolanaRpcClient::SolanaRpcClient(const std::string& rpcUrl, Commitment commitment)
    : m_rpcUrl(rpcUrl),
      m_commitment(commitment),
      m_pollInterval(DEFAULT_POLL_INTERVAL_MS),
      m_requestTimeout(DEFAULT_TIMEOUT_MS),
      m_nextId(1) {
    m_transport = [this](const std::string&, const std::string& body) { return postJson(body); };
}

void SolanaRpcClient::SetTransport(HttpTransport transport) {
    m_transport = std::move(transport);
}

void SolanaRpcClient::SetPollInterval(std::chrono::milliseconds interval) {
    m_pollInterval = interval;
}

std::string SolanaRpcClient::BuildRequest(uint64_t id, const std::string& method, const json& params) {
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params},
    };
    return request.dump();
}

bool SolanaRpcClient::IsAccountNotFoundError(const std::string& message) {
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("could not find account") != std::string::npos;
}

bool SolanaRpcClient::MeetsCommitment(const std::string& status, Commitment requested) {
    int rank = CommitmentRank(status);
    return rank >= 0 && rank >= CommitmentRank(CommitmentToString(requested));
}

HttpResponse SolanaRpcClient::postJson(const std::string& body) const {
    HttpResponse result;

    cpr::Header headers{{"Content-Type", "application/json"}, {"User-Agent", "SolDesk/1.0"}};

    try {
        cpr::Response response = cpr::Post(cpr::Url{m_rpcUrl},
                                           cpr::Body{body},
                                           headers,
                                           cpr::Timeout{static_cast<int32_t>(m_requestTimeout.count())},
                                           cpr::VerifySsl{true});

        if (response.error) {
            result.error = response.error.message;
            return result;
        }
        result.statusCode = response.status_code;
        result.body = response.text;
    } catch (const std::exception& e) {
        result.error = e.what();
    }

    return result;
}

Result<json> SolanaRpcClient::call(const std::string& method, const json& params) {
    std::string body = BuildRequest(m_nextId++, method, params);
    HttpResponse response = m_transport(m_rpcUrl, body);

    if (!response.error.empty()) {
        SOLDESK_LOG_ERROR("SolanaRpc", "Request failed", method + ": " + response.error);
        return Result<json>(ErrorCode::RpcError, method + " request failed: " + response.error);
    }

    json parsed = json::parse(response.body, nullptr, false);
    if (response.statusCode != 200 && (parsed.is_discarded() || !parsed.contains("error"))) {
        SOLDESK_LOG_ERROR("SolanaRpc", "Unexpected HTTP status",
                          method + ": HTTP " + std::to_string(response.statusCode));
        return Result<json>(ErrorCode::RpcError,
                            method + " returned HTTP " + std::to_string(response.statusCode));
    }
    if (parsed.is_discarded() || !parsed.is_object()) {
        SOLDESK_LOG_ERROR("SolanaRpc", "Malformed JSON-RPC response", method);
        return Result<json>(ErrorCode::RpcError, method + " returned a malformed response");
    }

    if (parsed.contains("error") && !parsed["error"].is_null()) {
        const json& error = parsed["error"];
        int64_t code = 0;
        std::string message = "unknown error";
        if (error.is_object()) {
            if (error.contains("code") && error["code"].is_number_integer()) {
                code = error["code"].get<int64_t>();
            }
            if (error.contains("message") && error["message"].is_string()) {
                message = error["message"].get<std::string>();
            }
        }
        return Result<json>(ErrorCode::RpcError,
                            "RPC error " + std::to_string(code) + ": " + message);
    }

    if (!parsed.contains("result")) {
        return Result<json>(ErrorCode::RpcError, method + " response has no result");
    }
    return Result<json>(parsed["result"]);
}

Result<AtomicAmount> SolanaRpcClient::GetBalance(const std::string& address) {
    auto result = call("getBalance", json::array({address, {{"commitment", CommitmentToString(m_commitment)}}}));
    if (!result) {
        return Forward<AtomicAmount>(result);
    }

    try {
        const json& value = (*result).at("value");
        if (!value.is_number_unsigned() && !value.is_number_integer()) {
            return Result<AtomicAmount>(ErrorCode::RpcError, "getBalance value is not an integer");
        }
        return Result<AtomicAmount>(AtomicAmount::FromUInt64(value.get<uint64_t>()));
    } catch (const json::exception& e) {
        return Result<AtomicAmount>(ErrorCode::RpcError, std::string("getBalance parse error: ") + e.what());
    }
}

Result<std::optional<AccountInfo>> SolanaRpcClient::GetAccountInfo(const std::string& address) {
    auto result = call("getAccountInfo",
                       json::array({address,
                                    {{"encoding", "base64"}, {"commitment", CommitmentToString(m_commitment)}}}));
    if (!result) {
        return Forward<std::optional<AccountInfo>>(result);
    }

    try {
        const json& value = (*result).at("value");
        if (value.is_null()) {
            return Result<std::optional<AccountInfo>>(std::optional<AccountInfo>());
        }

        AccountInfo info;
        info.owner = value.at("owner").get<std::string>();
        info.lamports = value.value("lamports", static_cast<uint64_t>(0));
        info.executable = value.value("executable", false);
        return Result<std::optional<AccountInfo>>(std::optional<AccountInfo>(info));
    } catch (const json::exception& e) {
        return Result<std::optional<AccountInfo>>(ErrorCode::RpcError,
                                                  std::string("getAccountInfo parse error: ") + e.what());
    }
}

Result<std::optional<AtomicAmount>> SolanaRpcClient::GetTokenAccountBalance(const std::string& tokenAccount) {
    auto result = call("getTokenAccountBalance",
                       json::array({tokenAccount, {{"commitment", CommitmentToString(m_commitment)}}}));
    if (!result) {
        if (IsAccountNotFoundError(result.errorMessage)) {
            return Result<std::optional<AtomicAmount>>(std::optional<AtomicAmount>());
        }
        return Forward<std::optional<AtomicAmount>>(result);
    }

    try {
        const json& value = (*result).at("value");
        if (value.is_null()) {
            return Result<std::optional<AtomicAmount>>(std::optional<AtomicAmount>());
        }
        auto amount = AtomicAmount::FromString(value.at("amount").get<std::string>());
        if (!amount.has_value()) {
            return Result<std::optional<AtomicAmount>>(ErrorCode::RpcError,
                                                       "getTokenAccountBalance amount is not a digit string");
        }
        return Result<std::optional<AtomicAmount>>(std::optional<AtomicAmount>(*amount));
    } catch (const json::exception& e) {
        return Result<std::optional<AtomicAmount>>(ErrorCode::RpcError,
                                                   std::string("getTokenAccountBalance parse error: ") + e.what());
    }
}

Result<std::string> SolanaRpcClient::SendTransaction(const SignedTransaction& transaction) {
    json options = {
        {"encoding", "base64"},
        {"preflightCommitment", CommitmentToString(m_commitment)},
    };
    auto result = call("sendTransaction", json::array({transaction.ToBase64(), options}));
    if (!result) {
        return Forward<std::string>(result);
    }
    if (!(*result).is_string()) {
        return Result<std::string>(ErrorCode::RpcError, "sendTransaction result is not a signature");
    }

    std::string signature = (*result).get<std::string>();
    SOLDESK_LOG_INFO("SolanaRpc", "Transaction submitted",
                     "Signature: " + signature + " | Size: " + std::to_string(transaction.Bytes().size()) + " bytes");
    return Result<std::string>(signature);
}

Result<BlockhashContext> SolanaRpcClient::GetLatestBlockhash() {
    auto result = call("getLatestBlockhash", json::array({{{"commitment", CommitmentToString(m_commitment)}}}));
    if (!result) {
        return Forward<BlockhashContext>(result);
    }

    try {
        const json& value = (*result).at("value");
        BlockhashContext context;
        context.blockhash = value.at("blockhash").get<std::string>();
        context.lastValidBlockHeight = value.at("lastValidBlockHeight").get<uint64_t>();
        return Result<BlockhashContext>(context);
    } catch (const json::exception& e) {
        return Result<BlockhashContext>(ErrorCode::RpcError,
                                        std::string("getLatestBlockhash parse error: ") + e.what());
    }
}

Result<uint64_t> SolanaRpcClient::GetBlockHeight() {
    auto result = call("getBlockHeight", json::array({{{"commitment", CommitmentToString(m_commitment)}}}));
    if (!result) {
        return Forward<uint64_t>(result);
    }
    if (!(*result).is_number_unsigned() && !(*result).is_number_integer()) {
        return Result<uint64_t>(ErrorCode::RpcError, "getBlockHeight result is not an integer");
    }
    return Result<uint64_t>((*result).get<uint64_t>());
}

Result<ConfirmationResult> SolanaRpcClient::ConfirmTransaction(const std::string& signature,
                                                               const BlockhashContext& context,
                                                               Commitment commitment) {
    SOLDESK_SCOPED_LOG("SolanaRpc", "ConfirmTransaction");
    _scopedLogger.addContext("signature", signature);
    _scopedLogger.addContext("commitment", CommitmentToString(commitment));

    while (true) {
        auto statuses = call("getSignatureStatuses",
                             json::array({json::array({signature}), {{"searchTransactionHistory", false}}}));
        if (!statuses) {
            _scopedLogger.failure(statuses.errorMessage);
            return Forward<ConfirmationResult>(statuses);
        }

        try {
            const json& value = (*statuses).at("value");
            if (value.is_array() && !value.empty() && !value[0].is_null()) {
                const json& status = value[0];
                std::string level = status.value("confirmationStatus", "");
                if (MeetsCommitment(level, commitment)) {
                    ConfirmationResult confirmation;
                    confirmation.slot = status.value("slot", static_cast<uint64_t>(0));
                    if (status.contains("err") && !status["err"].is_null()) {
                        confirmation.executionError = status["err"].dump();
                    }
                    _scopedLogger.success("Slot: " + std::to_string(confirmation.slot));
                    return Result<ConfirmationResult>(confirmation);
                }
            }
        } catch (const json::exception& e) {
            _scopedLogger.failure(e.what());
            return Result<ConfirmationResult>(ErrorCode::RpcError,
                                              std::string("getSignatureStatuses parse error: ") + e.what());
        }

        auto height = GetBlockHeight();
        if (!height) {
            _scopedLogger.failure(height.errorMessage);
            return Result<ConfirmationResult>(height.errorCode, height.errorMessage);
        }
        if (*height > context.lastValidBlockHeight) {
            std::string message = "Blockhash expired at block height " + std::to_string(*height) +
                                  " (last valid " + std::to_string(context.lastValidBlockHeight) + ")";
            _scopedLogger.failure(message);
            return Result<ConfirmationResult>(ErrorCode::ConfirmationFailed, message);
        }

        std::this_thread::sleep_for(m_pollInterval);
    }
}

} // namespace SolanaService
