#pragma once

#include "Crypto.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SolanaService {

using PublicKey = Crypto::PublicKeyBytes;

constexpr const char* SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
constexpr const char* TOKEN_PROGRAM_ID = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
constexpr const char* TOKEN_2022_PROGRAM_ID = "TokenzQdBNbLqP5VEhdkAS6EPFLC1PHnBqCXEpPxuEb";
constexpr const char* ASSOCIATED_TOKEN_PROGRAM_ID = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNsLJA8knL";

/**
 * @brief Decode a Base58 account address; false unless it is exactly 32 bytes
 */
bool DecodePublicKey(const std::string& address, PublicKey& out);

std::string EncodePublicKey(const PublicKey& key);

namespace TokenAccounts {

constexpr size_t MAX_SEEDS = 16;
constexpr size_t MAX_SEED_LENGTH = 32;

struct ProgramAddress {
    PublicKey address;
    uint8_t bump;
};

/**
 * @brief True if the 32 bytes decompress to an Ed25519 point
 *
 * Program derived addresses are valid only when this is false.
 */
std::optional<bool> IsOnCurve(const PublicKey& key);

/**
 * @brief SHA-256(seeds || programId || "ProgramDerivedAddress") if the digest is off-curve
 */
std::optional<PublicKey> CreateProgramAddress(const std::vector<std::vector<uint8_t>>& seeds,
                                              const PublicKey& programId);

/**
 * @brief First off-curve address, trying bump seeds from 255 down to 0
 */
std::optional<ProgramAddress> FindProgramAddress(const std::vector<std::vector<uint8_t>>& seeds,
                                                 const PublicKey& programId);

/**
 * @brief Associated token account of (owner, mint) under the given token program
 */
std::optional<PublicKey> GetAssociatedTokenAddress(const PublicKey& owner, const PublicKey& mint,
                                                   const PublicKey& tokenProgram);

// SPL Token or Token-2022
bool IsTokenProgram(const std::string& programId);

} // namespace TokenAccounts
} // namespace SolanaService
