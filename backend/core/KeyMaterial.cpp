#include "KeyMaterial.h"
#include "Logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace KeyMaterial {

namespace {

constexpr size_t DIAGNOSTIC_PREFIX_LENGTH = 20;

DecodeAttempt Failure(const std::string& detail) {
    return DecodeAttempt{false, {}, detail};
}

// Overwrites every element of a parsed key array before releasing it
void WipeJson(json& value) {
    if (value.is_array()) {
        for (auto& element : value) {
            element = 0;
        }
    }
    value.clear();
}

DecodeAttempt CheckLength(std::vector<uint8_t> bytes, const std::string& what) {
    if (bytes.size() == Crypto::ED25519_SECRET_KEY_SIZE) {
        return DecodeAttempt{true, std::move(bytes), ""};
    }
    std::string detail = what + " is " + std::to_string(bytes.size()) + ", expected " +
                         std::to_string(Crypto::ED25519_SECRET_KEY_SIZE) + " bytes";
    Crypto::SecureWipeVector(bytes);
    return Failure(detail);
}

} // namespace

const char* KeyFormatToString(KeyFormat format) {
    switch (format) {
        case KeyFormat::Base58:
            return "base58";
        case KeyFormat::JsonArray:
            return "json-array";
        case KeyFormat::Hex:
            return "hex";
        default:
            return "unknown";
    }
}

// === Keypair ===

Keypair::Keypair(std::vector<uint8_t> secretKey, KeyFormat source)
    : m_secret(std::move(secretKey)), m_source(source) {}

Keypair::~Keypair() {
    Crypto::SecureWipeVector(m_secret);
}

Keypair::Keypair(Keypair&& other) noexcept
    : m_secret(std::move(other.m_secret)), m_source(other.m_source) {
    other.m_secret.clear();
}

Keypair& Keypair::operator=(Keypair&& other) noexcept {
    if (this != &other) {
        Crypto::SecureWipeVector(m_secret);
        m_secret = std::move(other.m_secret);
        m_source = other.m_source;
        other.m_secret.clear();
    }
    return *this;
}

Crypto::PublicKeyBytes Keypair::PublicKey() const {
    Crypto::PublicKeyBytes public_key{};
    if (IsValid()) {
        std::copy(m_secret.begin() + Crypto::ED25519_SEED_SIZE, m_secret.end(), public_key.begin());
    }
    return public_key;
}

std::string Keypair::PublicKeyBase58() const {
    if (!IsValid()) {
        return "";
    }
    Crypto::PublicKeyBytes public_key = PublicKey();
    return Crypto::EncodeBase58(public_key.data(), public_key.size());
}

bool Keypair::HasConsistentPublicKey() const {
    if (!IsValid()) {
        return false;
    }
    Crypto::PublicKeyBytes derived{};
    if (!Crypto::Ed25519_PublicKeyFromSeed(m_secret.data(), derived)) {
        return false;
    }
    return derived == PublicKey();
}

bool Keypair::Sign(const uint8_t* message, size_t len, Crypto::SignatureBytes& signature) const {
    if (!IsValid()) {
        return false;
    }
    return Crypto::Ed25519_Sign(m_secret, message, len, signature);
}

// === Decode chain ===

DecodeAttempt DecodeBase58Key(const std::string& cleanedSecret) {
    std::vector<uint8_t> bytes;
    std::string error;
    if (!Crypto::DecodeBase58(cleanedSecret, bytes, &error)) {
        return Failure(error);
    }
    return CheckLength(std::move(bytes), "Base58 decoded key length");
}

DecodeAttempt DecodeJsonArrayKey(const std::string& cleanedSecret) {
    json parsed = json::parse(cleanedSecret, nullptr, false);
    if (parsed.is_discarded()) {
        return Failure("not valid JSON");
    }
    if (!parsed.is_array()) {
        WipeJson(parsed);
        return Failure("JSON value is not an array");
    }
    if (parsed.size() != Crypto::ED25519_SECRET_KEY_SIZE) {
        std::string detail = "JSON array length is " + std::to_string(parsed.size()) + ", expected " +
                             std::to_string(Crypto::ED25519_SECRET_KEY_SIZE) + " numbers";
        WipeJson(parsed);
        return Failure(detail);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(parsed.size());
    for (const auto& element : parsed) {
        if (!element.is_number_integer()) {
            Crypto::SecureWipeVector(bytes);
            WipeJson(parsed);
            return Failure("JSON array element is not an integer");
        }
        int64_t value = element.get<int64_t>();
        if (value < 0 || value > 255) {
            Crypto::SecureWipeVector(bytes);
            WipeJson(parsed);
            return Failure("JSON array element is outside the byte range 0-255");
        }
        bytes.push_back(static_cast<uint8_t>(value));
    }
    WipeJson(parsed);
    return CheckLength(std::move(bytes), "JSON array key length");
}

DecodeAttempt DecodeHexKey(const std::string& cleanedSecret) {
    std::string hex = cleanedSecret;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.erase(0, 2);
    }

    if (!Crypto::IsHexString(hex)) {
        Crypto::SecureWipeString(hex);
        return Failure("Invalid hex characters");
    }
    if (hex.size() % 2 != 0) {
        Crypto::SecureWipeString(hex);
        return Failure("Odd number of hex characters");
    }

    std::vector<uint8_t> bytes;
    bool decoded = Crypto::HexToBytes(hex, bytes);
    Crypto::SecureWipeString(hex);
    if (!decoded) {
        return Failure("Invalid hex characters");
    }
    return CheckLength(std::move(bytes), "Hex decoded key length");
}

const std::vector<DecodeStep>& DecodeChain() {
    static const std::vector<DecodeStep> chain = {
        {KeyFormat::Base58, &DecodeBase58Key},
        {KeyFormat::JsonArray, &DecodeJsonArrayKey},
        {KeyFormat::Hex, &DecodeHexKey},
    };
    return chain;
}

std::string CleanSecret(const std::string& secret) {
    std::string cleaned;
    cleaned.reserve(secret.size());
    for (char c : secret) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'') {
            continue;
        }
        cleaned.push_back(c);
    }
    return cleaned;
}

WalletAPI::Result<Keypair> Decode(const std::string& secret) {
    using WalletAPI::ErrorCode;

    if (secret.empty()) {
        return WalletAPI::Result<Keypair>(ErrorCode::InvalidKeyMaterial, "Private key is required");
    }

    std::string cleaned = CleanSecret(secret);
    if (cleaned.empty()) {
        return WalletAPI::Result<Keypair>(ErrorCode::InvalidKeyMaterial,
                                          "Private key is empty after removing whitespace and quotes");
    }

    std::string base58_detail;
    for (const DecodeStep& step : DecodeChain()) {
        DecodeAttempt attempt = step.attempt(cleaned);
        if (attempt.success) {
            Crypto::SecureWipeString(cleaned);

            Keypair keypair(std::move(attempt.bytes), step.format);
            SOLDESK_LOG_DEBUG("KeyMaterial", "Decoded signing key",
                              std::string("Format: ") + KeyFormatToString(step.format));
            if (!keypair.HasConsistentPublicKey()) {
                SOLDESK_LOG_WARNING("KeyMaterial",
                                    "Public key half does not match the key derived from the seed",
                                    "Signatures made with this key will not verify");
            }
            return WalletAPI::Result<Keypair>(std::move(keypair));
        }
        if (step.format == KeyFormat::Base58) {
            base58_detail = attempt.detail;
        }
    }

    std::string message =
        "Invalid private key format. Expected a Base58 string (about 88 characters), "
        "a JSON array of 64 numbers, or 128 hexadecimal characters (optional 0x prefix). "
        "Base58 error: " + base58_detail +
        ". Key length: " + std::to_string(cleaned.size()) + " characters" +
        ". First " + std::to_string(DIAGNOSTIC_PREFIX_LENGTH) + " characters: " +
        cleaned.substr(0, DIAGNOSTIC_PREFIX_LENGTH) + "...";

    SOLDESK_LOG_ERROR("KeyMaterial", "Failed to decode private key",
                      "Length: " + std::to_string(cleaned.size()));
    Crypto::SecureWipeString(cleaned);
    return WalletAPI::Result<Keypair>(ErrorCode::InvalidKeyMaterial, message);
}

} // namespace KeyMaterial
