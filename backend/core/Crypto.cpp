#include <openssl/bn.h>
#include <openssl/evp.h>
#include <sodium.h>

// Standard library headers
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Project headers
#include "Crypto.h"

namespace Crypto {

// === Library Initialization ===
bool Initialize() {
    // sodium_init() returns 1 when the library was already initialized
    static const bool initialized = sodium_init() >= 0;
    return initialized;
}

// === Base64 Encoding/Decoding ===
std::string B64Encode(const std::vector<uint8_t>& data) {
    if (data.empty())
        return {};

    int outLen = 4 * ((data.size() + 2) / 3);
    std::string out(outLen, '\0');
    int ret = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                              static_cast<int>(data.size()));
    if (ret < 0)
        return {};
    out.resize(ret);
    return out;
}

bool B64Decode(const std::string& s, std::vector<uint8_t>& out) {
    out.clear();
    if (s.empty())
        return true;
    if (s.size() % 4 != 0)
        return false;

    std::vector<uint8_t> decoded(3 * (s.size() / 4));
    int ret = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(s.c_str()),
                              static_cast<int>(s.size()));
    if (ret < 0)
        return false;

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    int padding = 0;
    if (s[s.size() - 1] == '=')
        padding++;
    if (s[s.size() - 2] == '=')
        padding++;
    decoded.resize(ret - padding);
    out = std::move(decoded);
    return true;
}

// === Base58 Encoding/Decoding ===
static const char* BASE58_ALPHABET = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int Base58Value(char c) {
    const char* pos = std::strchr(BASE58_ALPHABET, c);
    if (c == '\0' || pos == nullptr)
        return -1;
    return static_cast<int>(pos - BASE58_ALPHABET);
}

bool IsBase58Char(char c) {
    return Base58Value(c) >= 0;
}

std::string EncodeBase58(const uint8_t* data, size_t len) {
    // Count leading zeros
    size_t leading_zeros = 0;
    while (leading_zeros < len && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // Little-endian base58 digits
    std::vector<uint8_t> b58;
    b58.reserve((len - leading_zeros) * 138 / 100 + 1);

    for (size_t i = leading_zeros; i < len; ++i) {
        int carry = data[i];
        for (size_t j = 0; j < b58.size(); ++j) {
            carry += 256 * b58[j];
            b58[j] = carry % 58;
            carry /= 58;
        }
        while (carry > 0) {
            b58.push_back(carry % 58);
            carry /= 58;
        }
    }

    std::string result;
    result.reserve(leading_zeros + b58.size());
    result.assign(leading_zeros, '1');
    for (auto it = b58.rbegin(); it != b58.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::string EncodeBase58(const std::vector<uint8_t>& data) {
    return EncodeBase58(data.data(), data.size());
}

bool DecodeBase58(const std::string& str, std::vector<uint8_t>& out, std::string* error) {
    out.clear();

    // Skip and count leading '1's
    size_t i = 0;
    size_t zeroes = 0;
    while (i < str.length() && str[i] == '1') {
        zeroes++;
        i++;
    }

    // Big-endian base256 representation, log(58) / log(256) rounded up
    std::vector<uint8_t> b256((str.length() - i) * 733 / 1000 + 1);
    for (; i < str.length(); ++i) {
        int carry = Base58Value(str[i]);
        if (carry < 0) {
            if (error) {
                *error = "Non-base58 character at position " + std::to_string(i);
            }
            SecureWipeVector(b256);
            return false;
        }
        for (auto it = b256.rbegin(); it != b256.rend(); ++it) {
            carry += 58 * (*it);
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        while (carry > 0) {
            b256.insert(b256.begin(), static_cast<uint8_t>(carry % 256));
            carry /= 256;
        }
    }

    // Skip leading zeroes in b256
    auto it = std::find_if(b256.begin(), b256.end(), [](uint8_t b) { return b != 0; });

    out.reserve(zeroes + (b256.end() - it));
    out.assign(zeroes, 0x00);
    out.insert(out.end(), it, b256.end());
    SecureWipeVector(b256);
    return true;
}

// === Hex Encoding/Decoding ===
std::string BytesToHex(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    for (uint8_t byte : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

bool IsHexString(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool HexToBytes(const std::string& hex, std::vector<uint8_t>& out) {
    out.clear();
    if (hex.size() % 2 != 0 || !IsHexString(hex)) {
        return false;
    }

    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        std::string byte_str = hex.substr(i, 2);
        out.push_back(static_cast<uint8_t>(std::strtoul(byte_str.c_str(), nullptr, 16)));
    }
    return true;
}

// === Hash Functions ===
bool SHA256(const uint8_t* data, size_t len, std::array<uint8_t, 32>& out) {
    out.fill(uint8_t(0));
    unsigned int hashLen = 0;
    if (EVP_Digest(data, len, out.data(), &hashLen, EVP_sha256(), nullptr) != 1) {
        return false;
    }
    return hashLen == out.size();
}

// === Ed25519 ===
bool Ed25519_PublicKeyFromSeed(const uint8_t* seed, PublicKeyBytes& public_key) {
    if (!Initialize() || seed == nullptr) {
        return false;
    }

    std::array<uint8_t, crypto_sign_SECRETKEYBYTES> secret{};
    int rc = crypto_sign_seed_keypair(public_key.data(), secret.data(), seed);
    sodium_memzero(secret.data(), secret.size());
    return rc == 0;
}

bool Ed25519_Sign(const std::vector<uint8_t>& secret_key, const uint8_t* message, size_t len,
                  SignatureBytes& signature) {
    if (!Initialize() || secret_key.size() != ED25519_SECRET_KEY_SIZE) {
        return false;
    }

    unsigned long long sig_len = 0;
    if (crypto_sign_detached(signature.data(), &sig_len, message, len, secret_key.data()) != 0) {
        return false;
    }
    return sig_len == ED25519_SIGNATURE_SIZE;
}

bool Ed25519_Verify(const PublicKeyBytes& public_key, const uint8_t* message, size_t len,
                    const SignatureBytes& signature) {
    if (!Initialize()) {
        return false;
    }
    return crypto_sign_verify_detached(signature.data(), message, len, public_key.data()) == 0;
}

namespace {

struct BnCtxDeleter {
    void operator()(BN_CTX* ctx) const {
        BN_CTX_end(ctx);
        BN_CTX_free(ctx);
    }
};

} // namespace

// Decompression succeeds iff (y^2 - 1) / (d*y^2 + 1) is a square mod p = 2^255 - 19.
// The sign bit is ignored and y is reduced mod p, matching curve25519-dalek.
bool Ed25519_IsOnCurve(const PublicKeyBytes& point, bool& on_curve) {
    on_curve = false;

    PublicKeyBytes y_bytes = point;
    y_bytes[31] &= 0x7F;

    BN_CTX* raw_ctx = BN_CTX_new();
    if (!raw_ctx) {
        return false;
    }
    BN_CTX_start(raw_ctx);
    std::unique_ptr<BN_CTX, BnCtxDeleter> ctx(raw_ctx);

    BIGNUM* p = BN_CTX_get(raw_ctx);
    BIGNUM* d = BN_CTX_get(raw_ctx);
    BIGNUM* one = BN_CTX_get(raw_ctx);
    BIGNUM* tmp = BN_CTX_get(raw_ctx);
    BIGNUM* y = BN_CTX_get(raw_ctx);
    BIGNUM* y2 = BN_CTX_get(raw_ctx);
    BIGNUM* u = BN_CTX_get(raw_ctx);
    BIGNUM* v = BN_CTX_get(raw_ctx);
    BIGNUM* w = BN_CTX_get(raw_ctx);
    BIGNUM* exponent = BN_CTX_get(raw_ctx);
    if (exponent == nullptr) {
        return false;
    }

    // p = 2^255 - 19
    if (!BN_set_word(p, 0) || !BN_set_bit(p, 255) || !BN_sub_word(p, 19) || !BN_one(one)) {
        return false;
    }

    // d = -121665 / 121666 mod p
    if (!BN_set_word(tmp, 121666) || !BN_mod_inverse(d, tmp, p, raw_ctx) ||
        !BN_set_word(tmp, 121665) || !BN_mod_mul(d, d, tmp, p, raw_ctx) ||
        !BN_sub(d, p, d)) {
        return false;
    }

    if (!BN_lebin2bn(y_bytes.data(), static_cast<int>(y_bytes.size()), y) ||
        !BN_nnmod(y, y, p, raw_ctx) || !BN_mod_sqr(y2, y, p, raw_ctx)) {
        return false;
    }

    // u = y^2 - 1, v = d*y^2 + 1 (v is never zero because -1/d is not a square)
    if (!BN_mod_sub(u, y2, one, p, raw_ctx) || !BN_mod_mul(v, d, y2, p, raw_ctx) ||
        !BN_mod_add(v, v, one, p, raw_ctx)) {
        return false;
    }

    if (!BN_mod_inverse(tmp, v, p, raw_ctx) || !BN_mod_mul(w, u, tmp, p, raw_ctx)) {
        return false;
    }

    if (BN_is_zero(w)) {
        on_curve = true;
        return true;
    }

    // Euler's criterion: w^((p-1)/2) == 1
    if (!BN_copy(exponent, p) || !BN_sub_word(exponent, 1) || !BN_rshift1(exponent, exponent) ||
        !BN_mod_exp(tmp, w, exponent, p, raw_ctx)) {
        return false;
    }

    on_curve = BN_is_one(tmp);
    return true;
}

// === Memory Security Functions ===
void SecureClear(void* ptr, size_t size) {
    if (!ptr || size == 0)
        return;

    if (!Initialize()) {
        volatile uint8_t* vptr = static_cast<volatile uint8_t*>(ptr);
        for (size_t i = 0; i < size; ++i) {
            vptr[i] = 0;
        }
        return;
    }
    sodium_memzero(ptr, size);
}

void SecureWipeVector(std::vector<uint8_t>& vec) {
    if (!vec.empty()) {
        SecureClear(vec.data(), vec.size());
        vec.clear();
        vec.shrink_to_fit();
    }
}

void SecureWipeString(std::string& str) {
    if (!str.empty()) {
        SecureClear(&str[0], str.size());
        str.clear();
        str.shrink_to_fit();
    }
}

} // namespace Crypto
