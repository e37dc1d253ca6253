#pragma once

#include "Crypto.h"
#include "WalletTypes.h"

#include <cstdint>
#include <string>
#include <vector>

namespace KeyMaterial {

/**
 * @brief Encodings accepted for an operator-supplied secret key, in decode order
 */
enum class KeyFormat {
    Base58,
    JsonArray,
    Hex
};

const char* KeyFormatToString(KeyFormat format);

/**
 * @brief Ed25519 signing keypair held for one trading session
 *
 * Holds the 64-byte secret key (32-byte seed followed by the 32-byte public key).
 * Move-only; the secret bytes are wiped on destruction and never persisted.
 */
class Keypair {
public:
    Keypair() : m_source(KeyFormat::Base58) {}
    Keypair(std::vector<uint8_t> secretKey, KeyFormat source);
    ~Keypair();

    Keypair(Keypair&& other) noexcept;
    Keypair& operator=(Keypair&& other) noexcept;
    Keypair(const Keypair&) = delete;
    Keypair& operator=(const Keypair&) = delete;

    bool IsValid() const { return m_secret.size() == Crypto::ED25519_SECRET_KEY_SIZE; }

    Crypto::PublicKeyBytes PublicKey() const;
    std::string PublicKeyBase58() const;

    /**
     * @brief Raw 64-byte secret key; only for signing and key comparison
     */
    const std::vector<uint8_t>& SecretKeyBytes() const { return m_secret; }

    KeyFormat SourceFormat() const { return m_source; }

    /**
     * @brief True when the public half equals the key derived from the seed half
     */
    bool HasConsistentPublicKey() const;

    bool Sign(const uint8_t* message, size_t len, Crypto::SignatureBytes& signature) const;

private:
    std::vector<uint8_t> m_secret;
    KeyFormat m_source;
};

/**
 * @brief Outcome of one decode attempt; `bytes` is only meaningful on success
 */
struct DecodeAttempt {
    bool success;
    std::vector<uint8_t> bytes;
    std::string detail;  // Failure reason, safe to show to the operator
};

using DecodeFunction = DecodeAttempt (*)(const std::string& cleanedSecret);

struct DecodeStep {
    KeyFormat format;
    DecodeFunction attempt;
};

/**
 * @brief Fixed decode order: Base58, then JSON byte array, then hex
 */
const std::vector<DecodeStep>& DecodeChain();

DecodeAttempt DecodeBase58Key(const std::string& cleanedSecret);
DecodeAttempt DecodeJsonArrayKey(const std::string& cleanedSecret);
DecodeAttempt DecodeHexKey(const std::string& cleanedSecret);

/**
 * @brief Remove all whitespace (including newlines) and every ' or " character
 */
std::string CleanSecret(const std::string& secret);

/**
 * @brief Decode an operator secret into a signing keypair
 *
 * Tries each step of DecodeChain() in order and returns the first one that yields
 * exactly 64 bytes. Fails with ErrorCode::InvalidKeyMaterial carrying the Base58
 * failure detail, the cleaned length and the first 20 characters, never the full
 * secret or any decoded bytes.
 */
WalletAPI::Result<Keypair> Decode(const std::string& secret);

} // namespace KeyMaterial
