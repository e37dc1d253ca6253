#pragma once

#include "KeyMaterial.h"
#include "TokenAccounts.h"
#include "WalletTypes.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace SolanaService {

constexpr uint8_t VERSIONED_MESSAGE_PREFIX = 0x80;
constexpr size_t MAX_TRANSACTION_SIZE = 1232;

/**
 * @brief Compact-u16 ("shortvec") length prefix used throughout the wire format
 */
std::vector<uint8_t> EncodeCompactU16(uint16_t value);
bool DecodeCompactU16(const std::vector<uint8_t>& data, size_t offset, uint16_t& value, size_t& consumed);

struct MessageHeader {
    uint8_t numRequiredSignatures = 0;
    uint8_t numReadonlySigned = 0;
    uint8_t numReadonlyUnsigned = 0;
};

/**
 * @brief Offsets and signer keys located while parsing a wire transaction
 */
struct TransactionLayout {
    size_t signatureCount = 0;
    size_t signaturesOffset = 0;
    size_t messageOffset = 0;
    bool versioned = false;
    uint8_t version = 0;
    MessageHeader header;
    std::vector<PublicKey> accountKeys;
};

class SignedTransaction;

/**
 * @brief Wire transaction as produced by the external builder, signature slots unfilled
 *
 * Move-only; signing consumes it so one attempt yields at most one SignedTransaction.
 */
class UnsignedTransaction {
public:
    UnsignedTransaction() = default;
    UnsignedTransaction(UnsignedTransaction&&) = default;
    UnsignedTransaction& operator=(UnsignedTransaction&&) = default;
    UnsignedTransaction(const UnsignedTransaction&) = delete;
    UnsignedTransaction& operator=(const UnsignedTransaction&) = delete;

    static WalletAPI::Result<UnsignedTransaction> FromBytes(std::vector<uint8_t> bytes);
    static WalletAPI::Result<UnsignedTransaction> FromBase64(const std::string& encoded);

    bool IsEmpty() const { return m_bytes.empty(); }
    const std::vector<uint8_t>& Bytes() const { return m_bytes; }
    const TransactionLayout& Layout() const { return m_layout; }
    std::vector<uint8_t> MessageBytes() const;

private:
    std::vector<uint8_t> m_bytes;
    TransactionLayout m_layout;

    friend WalletAPI::Result<SignedTransaction> SignTransaction(UnsignedTransaction&& unsignedTx,
                                                                const KeyMaterial::Keypair& keypair);
};

class SignedTransaction {
public:
    SignedTransaction() = default;

    /**
     * @brief Base58 of the first signature, which is the transaction id
     */
    std::string Signature() const;
    std::string ToBase64() const;

    const std::vector<uint8_t>& Bytes() const { return m_bytes; }
    std::vector<uint8_t> MessageBytes() const;
    Crypto::SignatureBytes SignatureAt(size_t index) const;

private:
    SignedTransaction(std::vector<uint8_t> bytes, TransactionLayout layout)
        : m_bytes(std::move(bytes)), m_layout(std::move(layout)) {}

    std::vector<uint8_t> m_bytes;
    TransactionLayout m_layout;

    friend WalletAPI::Result<SignedTransaction> SignTransaction(UnsignedTransaction&& unsignedTx,
                                                                const KeyMaterial::Keypair& keypair);
};

/**
 * @brief Sign the message with the keypair and place the signature in its signer slot
 *
 * Fails with SignFailed when the keypair is not one of the message's required signers.
 */
WalletAPI::Result<SignedTransaction> SignTransaction(UnsignedTransaction&& unsignedTx,
                                                     const KeyMaterial::Keypair& keypair);

} // namespace SolanaService
