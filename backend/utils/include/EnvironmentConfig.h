#pragma once

#include "Logger.h"

#include <functional>
#include <optional>
#include <string>

namespace Config {

/**
 * @brief Returns the variable's value, or std::nullopt when it is unset
 */
using EnvironmentLookup = std::function<std::optional<std::string>(const char* name)>;

std::optional<std::string> GetEnvironmentVariable(const char* name);

/**
 * @brief Runtime settings read from SOLDESK_* environment variables
 *
 * Every variable is optional. Without credentials the wallet runs read-only and the
 * trading panel stays disabled.
 *
 * Expected variables:
 *   SOLDESK_RPC_URL           Solana JSON-RPC endpoint (https://...)
 *   SOLDESK_PRIVATE_KEY       Signing key: Base58, JSON byte array or hex
 *   SOLDESK_REFERRAL_ACCOUNT  Account the external transaction builder credits
 *   SOLDESK_LOG_FILE          Log file path (default soldesk.log)
 *   SOLDESK_LOG_LEVEL         debug | info | warning | error | critical (default info)
 */
struct EnvironmentConfig {
    static constexpr const char* DEFAULT_LOG_FILE = "soldesk.log";

    std::string rpcUrl;
    std::string privateKey;
    std::string referralAccount;
    std::string logFile = DEFAULT_LOG_FILE;
    Logging::LogLevel logLevel = Logging::LogLevel::INFO;

    static EnvironmentConfig Load(const EnvironmentLookup& lookup = GetEnvironmentVariable);

    bool HasRpcUrl() const { return !rpcUrl.empty(); }
    bool HasTradingCredentials() const { return !rpcUrl.empty() && !privateKey.empty(); }
    bool IsPanelEnabled() const { return HasTradingCredentials() && !referralAccount.empty(); }
};

} // namespace Config
