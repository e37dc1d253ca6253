#include "AddressFormat.h"
#include "Crypto.h"

#include <algorithm>

namespace WalletAPI {

namespace {

const char* MODULE_SEPARATOR = "::";

bool HasHexPrefix(const std::string& address) {
    return address.size() >= 2 && address[0] == '0' && (address[1] == 'x' || address[1] == 'X');
}

bool HasBase58Shape(const std::string& address) {
    if (address.length() < BASE58_ADDRESS_MIN_LENGTH || address.length() > BASE58_ADDRESS_MAX_LENGTH) {
        return false;
    }
    return std::all_of(address.begin(), address.end(), Crypto::IsBase58Char);
}

} // namespace

AddressFormat ClassifyAddress(const std::string& address) {
    if (address.find(MODULE_SEPARATOR) != std::string::npos) {
        return AddressFormat::ModuleQualified;
    }
    if (HasHexPrefix(address)) {
        return AddressFormat::Hex;
    }
    if (HasBase58Shape(address)) {
        return AddressFormat::Base58;
    }
    return AddressFormat::Malformed;
}

bool IsForeignChainFormat(AddressFormat format) {
    return format == AddressFormat::ModuleQualified || format == AddressFormat::Hex;
}

const char* AddressFormatToString(AddressFormat format) {
    switch (format) {
        case AddressFormat::ModuleQualified:
            return "module-qualified";
        case AddressFormat::Hex:
            return "hex";
        case AddressFormat::Base58:
            return "base58";
        case AddressFormat::Malformed:
            return "malformed";
        default:
            return "unknown";
    }
}

} // namespace WalletAPI
