#pragma once

#include <cstddef>
#include <string>

namespace WalletAPI {

/**
 * @brief Lexical address classes; decided by shape alone, never by where the address came from
 */
enum class AddressFormat {
    ModuleQualified,  // "<package>::<module>::<type>" style coin types
    Hex,              // 0x-prefixed; bare hex digits without the prefix are malformed
    Base58,           // 32-44 characters of the Base58 alphabet
    Malformed         // anything else, including the empty string
};

constexpr size_t BASE58_ADDRESS_MIN_LENGTH = 32;
constexpr size_t BASE58_ADDRESS_MAX_LENGTH = 44;

/**
 * @brief Classify an address; pure and total, performs no chain I/O
 *
 * Priority: module-qualified separator first, then the 0x prefix, then Base58 shape.
 */
AddressFormat ClassifyAddress(const std::string& address);

// Formats that belong to chains this wallet never queries
bool IsForeignChainFormat(AddressFormat format);

const char* AddressFormatToString(AddressFormat format);

} // namespace WalletAPI
