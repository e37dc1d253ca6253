#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Crypto {

constexpr size_t ED25519_SEED_SIZE = 32;
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // seed || public key
constexpr size_t ED25519_SIGNATURE_SIZE = 64;

using PublicKeyBytes = std::array<uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using SignatureBytes = std::array<uint8_t, ED25519_SIGNATURE_SIZE>;

// === Library Initialization ===
// Initializes libsodium. Safe to call repeatedly; returns false if the library is unusable.
bool Initialize();

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t> &data);
bool B64Decode(const std::string &s, std::vector<uint8_t> &out);

// === Base58 Encoding/Decoding (Bitcoin alphabet, no checksum) ===
std::string EncodeBase58(const std::vector<uint8_t> &data);
std::string EncodeBase58(const uint8_t *data, size_t len);

// On failure `error` (when given) receives a human-readable reason.
bool DecodeBase58(const std::string &str, std::vector<uint8_t> &out, std::string *error = nullptr);
bool IsBase58Char(char c);

// === Hex Encoding/Decoding ===
std::string BytesToHex(const std::vector<uint8_t> &bytes);

// Strict: even length, hex digits only, no prefix.
bool HexToBytes(const std::string &hex, std::vector<uint8_t> &out);
bool IsHexString(const std::string &s);

// === Hash Functions ===
bool SHA256(const uint8_t *data, size_t len, std::array<uint8_t, 32> &out);

// === Ed25519 ===

// Derive the public key belonging to a 32-byte seed
bool Ed25519_PublicKeyFromSeed(const uint8_t *seed, PublicKeyBytes &public_key);

// Detached signature with a 64-byte (seed || public key) secret key
bool Ed25519_Sign(const std::vector<uint8_t> &secret_key, const uint8_t *message, size_t len,
                  SignatureBytes &signature);

bool Ed25519_Verify(const PublicKeyBytes &public_key, const uint8_t *message, size_t len,
                    const SignatureBytes &signature);

// Tests whether a compressed Edwards-Y encoding decompresses to a curve point.
// Returns false only when the arithmetic itself fails; the answer goes to on_curve.
bool Ed25519_IsOnCurve(const PublicKeyBytes &point, bool &on_curve);

// === Memory Security Functions ===
void SecureClear(void *ptr, size_t size);
void SecureWipeVector(std::vector<uint8_t> &vec);
void SecureWipeString(std::string &str);

} // namespace Crypto
