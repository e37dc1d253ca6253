#include "SolanaTransaction.h"
#include "Logger.h"

#include <algorithm>
#include <cstring>

namespace SolanaService {

using WalletAPI::ErrorCode;
using WalletAPI::Result;

std::vector<uint8_t> EncodeCompactU16(uint16_t value) {
    std::vector<uint8_t> out;
    uint32_t remaining = value;
    while (true) {
        uint8_t byte = remaining & 0x7f;
        remaining >>= 7;
        if (remaining == 0) {
            out.push_back(byte);
            break;
        }
        out.push_back(byte | 0x80);
    }
    return out;
}

bool DecodeCompactU16(const std::vector<uint8_t>& data, size_t offset, uint16_t& value, size_t& consumed) {
    uint32_t result = 0;
    for (size_t i = 0; i < 3; ++i) {
        if (offset + i >= data.size()) {
            return false;
        }
        uint8_t byte = data[offset + i];
        // Third byte may only carry the top two bits
        if (i == 2 && byte > 0x03) {
            return false;
        }
        result |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            // Reject non-minimal encodings such as 0x80 0x00
            if (i > 0 && byte == 0) {
                return false;
            }
            value = static_cast<uint16_t>(result);
            consumed = i + 1;
            return true;
        }
    }
    return false;
}

namespace {

bool ParseLayout(const std::vector<uint8_t>& bytes, TransactionLayout& layout, std::string& error) {
    if (bytes.empty()) {
        error = "Transaction is empty";
        return false;
    }
    if (bytes.size() > MAX_TRANSACTION_SIZE) {
        error = "Transaction is " + std::to_string(bytes.size()) + " bytes, limit is " +
                std::to_string(MAX_TRANSACTION_SIZE);
        return false;
    }

    uint16_t signature_count = 0;
    size_t consumed = 0;
    if (!DecodeCompactU16(bytes, 0, signature_count, consumed)) {
        error = "Invalid signature count prefix";
        return false;
    }
    layout.signatureCount = signature_count;
    layout.signaturesOffset = consumed;
    layout.messageOffset = consumed + static_cast<size_t>(signature_count) * Crypto::ED25519_SIGNATURE_SIZE;
    if (layout.messageOffset >= bytes.size()) {
        error = "Transaction truncated before message";
        return false;
    }

    size_t pos = layout.messageOffset;
    if (bytes[pos] & VERSIONED_MESSAGE_PREFIX) {
        layout.versioned = true;
        layout.version = bytes[pos] & 0x7f;
        if (layout.version != 0) {
            error = "Unsupported message version " + std::to_string(layout.version);
            return false;
        }
        ++pos;
    }

    if (pos + 3 > bytes.size()) {
        error = "Message header truncated";
        return false;
    }
    layout.header.numRequiredSignatures = bytes[pos];
    layout.header.numReadonlySigned = bytes[pos + 1];
    layout.header.numReadonlyUnsigned = bytes[pos + 2];
    pos += 3;

    uint16_t key_count = 0;
    if (!DecodeCompactU16(bytes, pos, key_count, consumed)) {
        error = "Invalid account key count prefix";
        return false;
    }
    pos += consumed;
    if (pos + static_cast<size_t>(key_count) * sizeof(PublicKey) > bytes.size()) {
        error = "Account keys truncated";
        return false;
    }

    layout.accountKeys.clear();
    layout.accountKeys.reserve(key_count);
    for (uint16_t i = 0; i < key_count; ++i) {
        PublicKey key{};
        std::memcpy(key.data(), bytes.data() + pos, key.size());
        layout.accountKeys.push_back(key);
        pos += key.size();
    }

    if (layout.header.numRequiredSignatures != layout.signatureCount) {
        error = "Signature count " + std::to_string(layout.signatureCount) +
                " does not match required signers " +
                std::to_string(layout.header.numRequiredSignatures);
        return false;
    }
    if (layout.header.numRequiredSignatures > layout.accountKeys.size()) {
        error = "More required signers than account keys";
        return false;
    }
    return true;
}

std::vector<uint8_t> SliceMessage(const std::vector<uint8_t>& bytes, const TransactionLayout& layout) {
    if (layout.messageOffset >= bytes.size()) {
        return {};
    }
    return std::vector<uint8_t>(bytes.begin() + layout.messageOffset, bytes.end());
}

} // namespace

// === UnsignedTransaction ===

Result<UnsignedTransaction> UnsignedTransaction::FromBytes(std::vector<uint8_t> bytes) {
    TransactionLayout layout;
    std::string error;
    if (!ParseLayout(bytes, layout, error)) {
        SOLDESK_LOG_WARNING("SolanaTransaction", "Rejected unsigned transaction", error);
        return Result<UnsignedTransaction>(ErrorCode::InvalidTransaction, error);
    }

    UnsignedTransaction tx;
    tx.m_bytes = std::move(bytes);
    tx.m_layout = std::move(layout);
    return Result<UnsignedTransaction>(std::move(tx));
}

Result<UnsignedTransaction> UnsignedTransaction::FromBase64(const std::string& encoded) {
    std::string trimmed;
    trimmed.reserve(encoded.size());
    for (char c : encoded) {
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
            trimmed.push_back(c);
        }
    }

    std::vector<uint8_t> bytes;
    if (trimmed.empty() || !Crypto::B64Decode(trimmed, bytes)) {
        return Result<UnsignedTransaction>(ErrorCode::InvalidTransaction, "Transaction is not valid base64");
    }
    return FromBytes(std::move(bytes));
}

std::vector<uint8_t> UnsignedTransaction::MessageBytes() const {
    return SliceMessage(m_bytes, m_layout);
}

// === SignedTransaction ===

std::string SignedTransaction::Signature() const {
    if (m_layout.signatureCount == 0) {
        return "";
    }
    Crypto::SignatureBytes first = SignatureAt(0);
    return Crypto::EncodeBase58(first.data(), first.size());
}

std::string SignedTransaction::ToBase64() const {
    return Crypto::B64Encode(m_bytes);
}

std::vector<uint8_t> SignedTransaction::MessageBytes() const {
    return SliceMessage(m_bytes, m_layout);
}

Crypto::SignatureBytes SignedTransaction::SignatureAt(size_t index) const {
    Crypto::SignatureBytes signature{};
    if (index < m_layout.signatureCount) {
        size_t offset = m_layout.signaturesOffset + index * Crypto::ED25519_SIGNATURE_SIZE;
        std::memcpy(signature.data(), m_bytes.data() + offset, signature.size());
    }
    return signature;
}

// === Signing ===

Result<SignedTransaction> SignTransaction(UnsignedTransaction&& unsignedTx, const KeyMaterial::Keypair& keypair) {
    UnsignedTransaction tx(std::move(unsignedTx));

    if (tx.IsEmpty()) {
        return Result<SignedTransaction>(ErrorCode::SignFailed, "Transaction is empty");
    }
    if (!keypair.IsValid()) {
        return Result<SignedTransaction>(ErrorCode::SignFailed, "Keypair is not loaded");
    }

    const TransactionLayout& layout = tx.m_layout;
    const PublicKey signer = keypair.PublicKey();
    auto signers_end = layout.accountKeys.begin() + layout.header.numRequiredSignatures;
    auto found = std::find(layout.accountKeys.begin(), signers_end, signer);
    if (found == signers_end) {
        return Result<SignedTransaction>(ErrorCode::SignFailed,
                                         "Wallet " + EncodePublicKey(signer) +
                                             " is not a required signer of this transaction");
    }
    size_t signer_index = static_cast<size_t>(found - layout.accountKeys.begin());

    std::vector<uint8_t> message = tx.MessageBytes();
    Crypto::SignatureBytes signature{};
    if (!keypair.Sign(message.data(), message.size(), signature)) {
        return Result<SignedTransaction>(ErrorCode::SignFailed, "Ed25519 signing failed");
    }

    std::vector<uint8_t> bytes = std::move(tx.m_bytes);
    size_t offset = layout.signaturesOffset + signer_index * Crypto::ED25519_SIGNATURE_SIZE;
    std::copy(signature.begin(), signature.end(), bytes.begin() + offset);

    SOLDESK_LOG_DEBUG("SolanaTransaction", "Signed transaction",
                      "Signer slot: " + std::to_string(signer_index));
    return Result<SignedTransaction>(SignedTransaction(std::move(bytes), std::move(tx.m_layout)));
}

} // namespace SolanaService
