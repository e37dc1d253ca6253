#include "WalletTypes.h"

namespace WalletAPI {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::InvalidKeyMaterial:
            return "InvalidKeyMaterial";
        case ErrorCode::WalletNotInitialized:
            return "WalletNotInitialized";
        case ErrorCode::SettlementInProgress:
            return "SettlementInProgress";
        case ErrorCode::BuildFailed:
            return "BuildFailed";
        case ErrorCode::SignFailed:
            return "SignFailed";
        case ErrorCode::SubmitFailed:
            return "SubmitFailed";
        case ErrorCode::ConfirmationFailed:
            return "ConfirmationFailed";
        case ErrorCode::TradeFailed:
            return "TradeFailed";
        case ErrorCode::RpcError:
            return "RpcError";
        case ErrorCode::InvalidAddress:
            return "InvalidAddress";
        case ErrorCode::InvalidTransaction:
            return "InvalidTransaction";
        default:
            return "Unknown";
    }
}

} // namespace WalletAPI
