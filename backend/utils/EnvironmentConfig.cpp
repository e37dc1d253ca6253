#include "EnvironmentConfig.h"

#include <cstdlib>

namespace Config {

namespace {

std::string Trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    size_t first = value.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = value.find_last_not_of(whitespace);
    return value.substr(first, last - first + 1);
}

} // namespace

std::optional<std::string> GetEnvironmentVariable(const char* name) {
#ifdef _WIN32
#pragma warning(push)
#pragma warning(disable : 4996)
#endif
    const char* value = std::getenv(name);
#ifdef _WIN32
#pragma warning(pop)
#endif
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

EnvironmentConfig EnvironmentConfig::Load(const EnvironmentLookup& lookup) {
    EnvironmentConfig config;

    if (auto url = lookup("SOLDESK_RPC_URL")) {
        config.rpcUrl = Trim(*url);
    }
    if (auto key = lookup("SOLDESK_PRIVATE_KEY")) {
        // Left untrimmed; the key decoder does its own cleaning
        config.privateKey = *key;
    }
    if (auto referral = lookup("SOLDESK_REFERRAL_ACCOUNT")) {
        config.referralAccount = Trim(*referral);
    }
    if (auto log_file = lookup("SOLDESK_LOG_FILE")) {
        std::string trimmed = Trim(*log_file);
        if (!trimmed.empty()) {
            config.logFile = trimmed;
        }
    }
    if (auto log_level = lookup("SOLDESK_LOG_LEVEL")) {
        auto parsed = Logging::ParseLogLevel(Trim(*log_level));
        if (parsed.has_value()) {
            config.logLevel = *parsed;
        } else {
            SOLDESK_LOG_WARNING("Config", "Unknown SOLDESK_LOG_LEVEL, using info", "Value: " + *log_level);
        }
    }

    if (config.rpcUrl.empty()) {
        SOLDESK_LOG_INFO("Config", "SOLDESK_RPC_URL not set, trading disabled");
    } else if (config.privateKey.empty()) {
        SOLDESK_LOG_INFO("Config", "SOLDESK_PRIVATE_KEY not set, trading disabled");
    }

    return config;
}

} // namespace Config
