#pragma once

#include <string>
#include <utility>

namespace WalletAPI {

/**
 * @brief Typed failure reasons surfaced by the settlement core
 */
enum class ErrorCode {
    None = 0,
    InvalidKeyMaterial,      // Operator secret could not be decoded; fix configuration
    WalletNotInitialized,    // No keypair or RPC endpoint configured; trading disabled
    SettlementInProgress,    // A settlement for this session is still outstanding
    BuildFailed,             // External transaction builder refused the trade
    SignFailed,              // Unsigned transaction malformed or keypair is not a signer
    SubmitFailed,            // Transaction never reached the ledger; resubmission is safe
    ConfirmationFailed,      // Submitted, confirmation not observed; may have landed
    TradeFailed,             // Confirmed with an on-chain execution error
    RpcError,                // Endpoint unreachable or returned a JSON-RPC error
    InvalidAddress,          // Address failed the lexical or length check
    InvalidTransaction       // Wire payload could not be parsed
};

const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Result wrapper for core operations
 */
template<typename T>
struct Result {
    bool success;
    std::string errorMessage;
    T data;
    ErrorCode errorCode;

    Result() : success(false), data(), errorCode(ErrorCode::None) {}
    Result(const T& value) : success(true), data(value), errorCode(ErrorCode::None) {}
    Result(T&& value) : success(true), data(std::move(value)), errorCode(ErrorCode::None) {}
    Result(ErrorCode code, const std::string& error)
        : success(false), errorMessage(error), data(), errorCode(code) {}

    explicit operator bool() const { return success; }
    const T& operator*() const { return data; }
    T& operator*() { return data; }
    const T* operator->() const { return &data; }
    T* operator->() { return &data; }
};

} // namespace WalletAPI
